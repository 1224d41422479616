#include "dotsweep/cancellation.h"

#include <csignal>
#include <stdexcept>

namespace dotsweep {

namespace {
std::atomic<CancellationToken*> g_active_token{nullptr};

void on_interrupt(int) {
    if (auto* token = g_active_token.load()) {
        token->request();
    }
}

using SignalHandler = void (*)(int);

// SIG_ERR means nothing usable was installed before; fall back to the default.
SignalHandler restorable(SignalHandler handler) {
    return handler == SIG_ERR ? SIG_DFL : handler;
}
} // namespace

InterruptGuard::InterruptGuard(CancellationToken& token) {
    CancellationToken* expected = nullptr;
    if (!g_active_token.compare_exchange_strong(expected, &token)) {
        throw std::logic_error("an interrupt guard is already installed");
    }
    previous_interrupt_ = restorable(std::signal(SIGINT, on_interrupt));
    previous_terminate_ = restorable(std::signal(SIGTERM, on_interrupt));
}

InterruptGuard::~InterruptGuard() {
    std::signal(SIGINT, previous_interrupt_);
    std::signal(SIGTERM, previous_terminate_);
    g_active_token.store(nullptr);
}

} // namespace dotsweep
