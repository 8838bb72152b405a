#include "iftpfm/ShutdownCoordinator.hpp"

#include <signal.h>

namespace iftpfm {

namespace {

std::atomic<ShutdownCoordinator*> g_active{nullptr};

void handleTerminationSignal(int signo) {
    ShutdownCoordinator* c = g_active.load(std::memory_order_acquire);
    if (c)
        c->onSignal(signo);
}

} // namespace

ShutdownCoordinator::~ShutdownCoordinator() {
    uninstallSignalHandlers();
}

bool ShutdownCoordinator::installSignalHandlers() {
    ShutdownCoordinator* expected = nullptr;
    if (!g_active.compare_exchange_strong(expected, this, std::memory_order_acq_rel))
        return expected == this;

    struct sigaction sa {};
    sa.sa_handler = handleTerminationSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0 || ::sigaction(SIGTERM, &sa, nullptr) != 0) {
        g_active.store(nullptr, std::memory_order_release);
        return false;
    }
    installed_ = true;
    return true;
}

void ShutdownCoordinator::uninstallSignalHandlers() {
    if (!installed_)
        return;
    struct sigaction sa {};
    sa.sa_handler = SIG_DFL;
    sigemptyset(&sa.sa_mask);
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);
    ShutdownCoordinator* self = this;
    g_active.compare_exchange_strong(self, nullptr, std::memory_order_acq_rel);
    installed_ = false;
}

void ShutdownCoordinator::onSignal(int signo) noexcept {
    signal_.store(signo, std::memory_order_release);
    requested_.store(true, std::memory_order_release);
}

void ShutdownCoordinator::requestShutdown() noexcept {
    requested_.store(true, std::memory_order_release);
}

bool ShutdownCoordinator::takeUnreportedSignal(int& signo) noexcept {
    const int s = signal_.load(std::memory_order_acquire);
    if (s == 0)
        return false;
    if (reported_.exchange(true, std::memory_order_acq_rel))
        return false;
    signo = s;
    return true;
}

void ShutdownCoordinator::markTerminated() noexcept {
    if (requested_.load(std::memory_order_acquire))
        terminated_.store(true, std::memory_order_release);
}

ShutdownCoordinator::State ShutdownCoordinator::state() const noexcept {
    if (terminated_.load(std::memory_order_acquire))
        return State::Terminated;
    if (requested_.load(std::memory_order_acquire))
        return State::ShutdownRequested;
    return State::Running;
}

const char* signalName(int signo) {
    switch (signo) {
    case SIGINT:
        return "SIGINT";
    case SIGTERM:
        return "SIGTERM";
    case 0:
        return "none";
    }
    return "signal";
}

} // namespace iftpfm
