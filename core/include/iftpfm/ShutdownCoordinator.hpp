// Cooperative shutdown. SIGINT/SIGTERM only store the signal number and raise
// a flag; workers poll the flag between entries and between files, and all
// logging about the signal happens on ordinary threads.
#pragma once
#include <atomic>

namespace iftpfm {

class ShutdownCoordinator {
public:
    enum class State { Running, ShutdownRequested, Terminated };

    ShutdownCoordinator() = default;
    ~ShutdownCoordinator();
    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    // Routes SIGINT and SIGTERM to this instance. One coordinator per process
    // may be installed at a time; the destructor restores default handlers.
    bool installSignalHandlers();
    void uninstallSignalHandlers();

    // Safe to call from a signal handler: two lock-free atomic stores.
    void onSignal(int signo) noexcept;

    // Programmatic request (tests, internal shutdown paths).
    void requestShutdown() noexcept;

    bool shutdownRequested() const noexcept {
        return requested_.load(std::memory_order_acquire);
    }
    // 0 when the request was not caused by a signal.
    int signalNumber() const noexcept {
        return signal_.load(std::memory_order_acquire);
    }

    // Reports the pending signal once; returns false if there is nothing new
    // to report. Called from polling threads, never from the handler.
    bool takeUnreportedSignal(int& signo) noexcept;

    void markTerminated() noexcept;
    State state() const noexcept;

private:
    std::atomic<bool> requested_{false};
    std::atomic<int> signal_{0};
    std::atomic<bool> reported_{false};
    std::atomic<bool> terminated_{false};
    bool installed_ = false;
};

const char* signalName(int signo);

} // namespace iftpfm
