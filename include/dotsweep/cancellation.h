#pragma once

#include <atomic>

namespace dotsweep {

// Monotonic stop request. request() may be called from a signal handler.
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void request() noexcept { requested_.store(true, std::memory_order_relaxed); }
    bool requested() const noexcept { return requested_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> requested_{false};
    static_assert(std::atomic<bool>::is_always_lock_free);
};

// Routes SIGINT and SIGTERM to token.request() until the guard is destroyed,
// then reinstalls the handlers that were active before. Only one guard may be
// alive at a time; a second one throws std::logic_error.
class InterruptGuard {
public:
    explicit InterruptGuard(CancellationToken& token);
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    using Handler = void (*)(int);

    Handler previous_interrupt_;
    Handler previous_terminate_;
};

} // namespace dotsweep
