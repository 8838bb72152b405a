// Single-instance ownership: an flock()-ed PID file per effective user. A new
// process asks the live owner to terminate (SIGTERM, then SIGKILL after the
// grace period) and takes over the lock.
#pragma once
#include "RuntimeLogging.hpp"
#include <chrono>
#include <string>
#include <sys/types.h>

namespace iftpfm {

struct InstanceOptions {
    std::string lock_path; // empty: defaultLockPath()
    std::chrono::seconds grace{30};
    // Extra wait for the lock after the old owner was signalled.
    std::chrono::milliseconds lock_wait{5000};
    std::chrono::milliseconds poll_interval{100};
};

class InstanceGuard {
public:
    InstanceGuard() = default;
    ~InstanceGuard();
    InstanceGuard(const InstanceGuard&) = delete;
    InstanceGuard& operator=(const InstanceGuard&) = delete;

    // Preempts a live owner if any, takes the lock and records our PID.
    // Returns false (fatal for the run) if the lock cannot be obtained.
    bool acquire(const InstanceOptions& opt, const LogSink& log, std::string& err);

    // Removes the lock file and drops the lock. Idempotent.
    void release();

    bool held() const { return fd_ != -1; }
    const std::string& path() const { return path_; }

private:
    bool openLockFile(std::string& err);
    void preemptOwner(const InstanceOptions& opt, const LogSink& log);
    bool lockAndVerify(const InstanceOptions& opt, std::string& err);
    bool writeOwnPid(std::string& err);

    int fd_ = -1;
    std::string path_;
};

std::string defaultLockPath();

// PID stored in the file at path, or -1.
pid_t readLockOwner(const std::string& path);

bool processAlive(pid_t pid);

} // namespace iftpfm
