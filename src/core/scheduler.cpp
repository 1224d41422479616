#include "dotsweep/scheduler.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

#include "dotsweep/logger.h"
#include "dotsweep/perf.h"

namespace dotsweep {

// Owned jointly by the pool threads and Scheduler::run, so threads abandoned
// after an interrupt never outlive the data they read.
struct Scheduler::State {
    State(const std::vector<std::filesystem::path>& files, Config::Options run_options,
          std::shared_ptr<const XattrBackend> run_backend)
        : options{std::move(run_options)}, backend{std::move(run_backend)} {
        tasks.reserve(files.size());
        for (const auto& file : files) {
            tasks.push_back(FileTask{file, &options});
        }
    }

    const Config::Options options;
    const std::shared_ptr<const XattrBackend> backend;
    std::vector<FileTask> tasks;

    std::atomic<std::size_t> next{0};
    std::atomic<bool> stop{false};

    std::mutex mutex;
    std::condition_variable ready;
    std::deque<std::pair<std::size_t, Outcome>> results;
    std::size_t active = 0; // pool threads still inside work(), guarded by mutex
};

namespace {

// Started pool threads. Whatever is still joinable when the pool goes out of
// scope is told to stop and detached, so an exception leaving run() never
// destroys a joinable std::thread.
class WorkerPool {
public:
    explicit WorkerPool(std::atomic<bool>& stop) : stop_{stop} {}

    ~WorkerPool() {
        stop_.store(true);
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.detach();
            }
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void reserve(std::size_t count) { threads_.reserve(count); }
    void add(std::thread thread) { threads_.push_back(std::move(thread)); }
    std::size_t size() const noexcept { return threads_.size(); }
    bool empty() const noexcept { return threads_.empty(); }

    void join() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

private:
    std::atomic<bool>& stop_;
    std::vector<std::thread> threads_;
};

} // namespace

void ObserverList::add(RunObserver& observer) {
    observers_.push_back(&observer);
}

void ObserverList::on_start(std::size_t total) {
    for (auto* observer : observers_) {
        observer->on_start(total);
    }
}

void ObserverList::on_outcome(const std::filesystem::path& path, const Outcome& outcome) {
    for (auto* observer : observers_) {
        observer->on_outcome(path, outcome);
    }
}

void ObserverList::on_finish(const RunResult& result) {
    for (auto* observer : observers_) {
        observer->on_finish(result);
    }
}

Scheduler::Scheduler(const Config::Options& options, std::shared_ptr<const XattrBackend> backend,
                     CancellationToken& token)
    : options_{options}, backend_{std::move(backend)}, token_{token} {
    if (!backend_) {
        backend_ = std::make_shared<NullXattrBackend>();
    }
}

void Scheduler::work(const std::shared_ptr<State>& state) {
    while (!state->stop.load()) {
        const std::size_t index = state->next.fetch_add(1);
        if (index >= state->tasks.size()) {
            return;
        }

        Outcome outcome;
        try {
            outcome = process_file(state->tasks[index], *state->backend);
        } catch (const std::exception& ex) {
            if (!state->stop.load()) {
                Logger::instance().error("{}: {}", state->tasks[index].path.string(), ex.what());
            }
        }

        {
            std::scoped_lock lock{state->mutex};
            state->results.emplace_back(index, std::move(outcome));
        }
        state->ready.notify_one();
    }
}

RunResult Scheduler::run(const std::vector<std::filesystem::path>& files, RunObserver* observer) {
    perf::ScopedTimer timer{"sweep"};
    auto& log = Logger::instance();
    auto state = std::make_shared<State>(files, options_, backend_);

    RunResult result;
    result.total = state->tasks.size();
    if (observer != nullptr) {
        observer->on_start(result.total);
    }

    const std::size_t jobs = std::min<std::size_t>(effective_jobs(options_), result.total);
    log.info("processing {} files with {} workers, backend {}", result.total, jobs, backend_->name());

    WorkerPool pool{state->stop};
    pool.reserve(jobs);
    auto body = [state] {
        work(state);
        {
            std::scoped_lock lock{state->mutex};
            --state->active;
        }
        state->ready.notify_all();
    };
    for (std::size_t i = 0; i < jobs; ++i) {
        {
            std::scoped_lock lock{state->mutex};
            ++state->active;
        }
        try {
            pool.add(thread_factory_ ? thread_factory_(body) : std::thread{body});
        } catch (const std::system_error& ex) {
            {
                std::scoped_lock lock{state->mutex};
                --state->active;
            }
            log.warn("started {} of {} workers: {}", pool.size(), jobs, ex.what());
            break;
        }
    }
    if (pool.empty() && result.total > 0) {
        log.warn("no worker thread available, processing on the calling thread");
        work(state);
    }

    const auto timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(options_.task_timeout);
    auto last_arrival = std::chrono::steady_clock::now();
    std::deque<std::pair<std::size_t, Outcome>> batch;

    while (result.report.processed() < result.total && !result.partial()) {
        if (batch.empty()) {
            std::unique_lock lock{state->mutex};
            state->ready.wait_for(lock, poll_interval_, [&state] { return !state->results.empty(); });
            batch.swap(state->results);
        }

        if (token_.requested()) {
            result.interrupted = true;
            break;
        }

        const auto now = std::chrono::steady_clock::now();
        if (batch.empty()) {
            if (timeout.count() > 0 && now - last_arrival >= timeout) {
                result.stalled = true;
            }
            continue;
        }
        last_arrival = now;

        auto [index, outcome] = std::move(batch.front());
        batch.pop_front();
        const auto& path = state->tasks[index].path;
        result.report.add(path, outcome);
        if (observer != nullptr) {
            observer->on_outcome(path, outcome);
        }
    }

    state->stop.store(true);
    result.dispatched = std::min(state->next.load(), result.total);
    if (result.partial()) {
        log.warn("abandoning {} unfinished tasks", result.dispatched - result.report.processed());
        // Give in-flight tasks one poll interval to wind down before the
        // pool is detached.
        std::unique_lock lock{state->mutex};
        state->ready.wait_for(lock, poll_interval_, [&state] { return state->active == 0; });
    } else {
        pool.join();
    }

    if (observer != nullptr) {
        observer->on_finish(result);
    }
    return result;
}

} // namespace dotsweep
