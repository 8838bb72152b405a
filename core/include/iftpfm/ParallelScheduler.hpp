// Runs configuration entries on a bounded pool of worker threads, one entry
// per worker at a time, and sums the per-entry transfer counts.
#pragma once
#include "RuntimeLogging.hpp"
#include "ShutdownCoordinator.hpp"
#include "TransferTypes.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

namespace iftpfm {

struct SchedulerOptions {
    int workers = 1;
    bool randomize = false;
    // Main thread poll period for shutdown reporting.
    std::chrono::milliseconds poll_interval{200};
};

struct RunSummary {
    int transferred = 0;
    int entries_started = 0;
    int entries_skipped = 0; // not started because of shutdown
    bool interrupted = false;
};

class ParallelScheduler {
public:
    // Processes one entry on worker `worker` (1-based) and returns its count.
    using EntryRunner = std::function<int(const ConfigEntry&, int worker)>;

    ParallelScheduler(SchedulerOptions opt,
                      ShutdownCoordinator& shutdown,
                      LogSink log);

    RunSummary run(std::vector<ConfigEntry> entries, const EntryRunner& runner);

    // Dispatch order actually used by the last run(), for diagnostics.
    const std::vector<std::size_t>& lastOrder() const { return order_; }

private:
    void emit(LogLevel level, Stage stage, const std::string& message) const;

    SchedulerOptions opt_;
    ShutdownCoordinator& shutdown_;
    LogSink log_;
    std::vector<std::size_t> order_;
};

} // namespace iftpfm
