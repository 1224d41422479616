#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

#include "dotsweep/cancellation.h"
#include "dotsweep/config.h"
#include "dotsweep/reporter.h"
#include "dotsweep/worker.h"
#include "dotsweep/xattr.h"

namespace dotsweep {

// Receives the outcome stream on the thread that called Scheduler::run.
class RunObserver {
public:
    virtual ~RunObserver() = default;

    virtual void on_start(std::size_t /*total*/) {}
    virtual void on_outcome(const std::filesystem::path& /*path*/, const Outcome& /*outcome*/) {}
    virtual void on_finish(const RunResult& /*result*/) {}
};

class ObserverList : public RunObserver {
public:
    void add(RunObserver& observer);

    void on_start(std::size_t total) override;
    void on_outcome(const std::filesystem::path& path, const Outcome& outcome) override;
    void on_finish(const RunResult& result) override;

private:
    std::vector<RunObserver*> observers_;
};

// Runs process_file over a file list on a fixed-size thread pool and
// aggregates outcomes in completion order.
//
// The token is checked before every result is aggregated and at least every
// poll interval while waiting. Once it is set, no further result is
// aggregated, workers stop picking up tasks and in-flight tasks are
// abandoned rather than joined. A non-zero task_timeout in the options
// abandons the run the same way when no result arrives for that long.
//
// If a pool thread cannot be started the run continues with the threads
// already running, or on the calling thread when none could be started.
class Scheduler {
public:
    using ThreadFactory = std::function<std::thread(std::function<void()>)>;

    Scheduler(const Config::Options& options, std::shared_ptr<const XattrBackend> backend,
              CancellationToken& token);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    RunResult run(const std::vector<std::filesystem::path>& files, RunObserver* observer = nullptr);

    void set_poll_interval(std::chrono::milliseconds interval) noexcept { poll_interval_ = interval; }
    void set_thread_factory(ThreadFactory factory) { thread_factory_ = std::move(factory); }

private:
    struct State;

    static void work(const std::shared_ptr<State>& state);

    Config::Options options_;
    std::shared_ptr<const XattrBackend> backend_;
    CancellationToken& token_;
    std::chrono::milliseconds poll_interval_{50};
    ThreadFactory thread_factory_;
};

} // namespace dotsweep
