#include "iftpfm/ParallelScheduler.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <numeric>
#include <random>
#include <thread>

namespace iftpfm {

ParallelScheduler::ParallelScheduler(SchedulerOptions opt,
                                     ShutdownCoordinator& shutdown,
                                     LogSink log)
    : opt_(opt), shutdown_(shutdown), log_(std::move(log)) {
    if (opt_.workers < 1)
        opt_.workers = 1;
}

void ParallelScheduler::emit(LogLevel level, Stage stage, const std::string& message) const {
    if (!log_)
        return;
    LogEvent ev;
    ev.level = level;
    ev.stage = stage;
    ev.message = message;
    log_(ev);
}

RunSummary ParallelScheduler::run(std::vector<ConfigEntry> entries, const EntryRunner& runner) {
    RunSummary summary;
    order_.resize(entries.size());
    std::iota(order_.begin(), order_.end(), std::size_t{0});
    if (opt_.randomize && order_.size() > 1) {
        std::mt19937 rng(std::random_device{}());
        std::shuffle(order_.begin(), order_.end(), rng);
    }

    std::atomic<std::size_t> next{0};
    std::atomic<int> total{0};
    std::atomic<int> started{0};
    std::atomic<int> skipped{0};
    std::mutex mtx;
    std::condition_variable cv;
    int running = 0;

    const int workerCount =
        static_cast<int>(std::min<std::size_t>(static_cast<std::size_t>(opt_.workers),
                                               std::max<std::size_t>(entries.size(), 1)));
    auto work = [&](int worker) {
        for (;;) {
            const std::size_t slot = next.fetch_add(1);
            if (slot >= order_.size())
                break;
            if (shutdown_.shutdownRequested()) {
                skipped.fetch_add(1);
                continue;
            }
            started.fetch_add(1);
            total.fetch_add(runner(entries[order_[slot]], worker));
        }
        std::lock_guard<std::mutex> lk(mtx);
        --running;
        cv.notify_all();
    };

    std::vector<std::thread> threads;
    threads.reserve(static_cast<std::size_t>(workerCount));
    {
        std::lock_guard<std::mutex> lk(mtx);
        running = workerCount;
    }
    for (int i = 0; i < workerCount; ++i)
        threads.emplace_back(work, i + 1);

    // The main thread only reports signals; the workers observe the flag.
    {
        std::unique_lock<std::mutex> lk(mtx);
        while (running > 0) {
            cv.wait_for(lk, opt_.poll_interval);
            int signo = 0;
            if (shutdown_.takeUnreportedSignal(signo)) {
                emit(LogLevel::Warning, Stage::Shutdown,
                     std::string("Received ") + signalName(signo) +
                         ", finishing current transfers before exit");
            }
        }
    }
    for (auto& t : threads)
        t.join();
    int lateSignal = 0;
    if (shutdown_.takeUnreportedSignal(lateSignal)) {
        emit(LogLevel::Warning, Stage::Shutdown,
             std::string("Received ") + signalName(lateSignal));
    }

    summary.transferred = total.load();
    summary.entries_started = started.load();
    summary.entries_skipped = skipped.load();
    summary.interrupted = shutdown_.shutdownRequested();
    if (summary.entries_skipped > 0) {
        emit(LogLevel::Warning, Stage::Shutdown,
             std::to_string(summary.entries_skipped) + " entries not started because of shutdown");
    }
    if (summary.interrupted)
        shutdown_.markTerminated();
    return summary;
}

} // namespace iftpfm
