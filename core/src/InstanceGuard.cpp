#include "iftpfm/InstanceGuard.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <string>
#include <sys/file.h>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace iftpfm {

namespace {

void emitInstance(const LogSink& log, LogLevel level, const std::string& msg) {
    if (!log)
        return;
    LogEvent ev;
    ev.level = level;
    ev.stage = Stage::Instance;
    ev.message = msg;
    log(ev);
}

pid_t parsePid(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size() && (text[i] == ' ' || text[i] == '\t'))
        ++i;
    if (i == text.size())
        return -1;
    long v = 0;
    for (; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\n' || c == '\r' || c == ' ')
            break;
        if (c < '0' || c > '9')
            return -1;
        v = v * 10 + (c - '0');
        if (v > 0x7fffffffL)
            return -1;
    }
    return v > 0 ? static_cast<pid_t>(v) : -1;
}

pid_t readPidFromFd(int fd) {
    char buf[32] = {};
    const ssize_t n = ::pread(fd, buf, sizeof(buf) - 1, 0);
    if (n <= 0)
        return -1;
    return parsePid(std::string(buf, static_cast<std::size_t>(n)));
}

} // namespace

std::string defaultLockPath() {
    const std::string name = "iftpfm-" + std::to_string(::geteuid()) + ".pid";
    const char* runtime = std::getenv("XDG_RUNTIME_DIR");
    if (runtime && *runtime) {
        struct stat st {};
        if (::stat(runtime, &st) == 0 && S_ISDIR(st.st_mode))
            return std::string(runtime) + "/" + name;
    }
    return "/tmp/" + name;
}

pid_t readLockOwner(const std::string& path) {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1)
        return -1;
    const pid_t pid = readPidFromFd(fd);
    ::close(fd);
    return pid;
}

bool processAlive(pid_t pid) {
    if (pid <= 0)
        return false;
    if (::kill(pid, 0) == 0)
        return true;
    return errno == EPERM;
}

InstanceGuard::~InstanceGuard() {
    release();
}

bool InstanceGuard::openLockFile(std::string& err) {
    // No O_TRUNC: the current owner's PID must stay readable until we hold
    // the lock ourselves.
    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ == -1) {
        err = "cannot open lock file " + path_ + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

void InstanceGuard::preemptOwner(const InstanceOptions& opt, const LogSink& log) {
    // Give a freshly started owner a moment to record its PID.
    pid_t owner = -1;
    for (int attempt = 0; attempt < 10; ++attempt) {
        owner = readPidFromFd(fd_);
        if (owner > 0)
            break;
        std::this_thread::sleep_for(opt.poll_interval);
        if (::flock(fd_, LOCK_EX | LOCK_NB) == 0)
            return;
    }
    if (owner <= 0 || owner == ::getpid()) {
        emitInstance(log, LogLevel::Warning,
                     "lock " + path_ + " is held but no owner PID is recorded, waiting");
        return;
    }
    if (!processAlive(owner)) {
        emitInstance(log, LogLevel::Info,
                     "recorded owner " + std::to_string(owner) + " is gone, waiting for lock");
        return;
    }

    emitInstance(log, LogLevel::Info,
                 "another instance (PID " + std::to_string(owner) + ") is running, sending SIGTERM");
    if (::kill(owner, SIGTERM) != 0 && errno != ESRCH) {
        emitInstance(log, LogLevel::Warning,
                     "cannot signal PID " + std::to_string(owner) + ": " + std::strerror(errno));
        return;
    }

    const auto deadline = std::chrono::steady_clock::now() + opt.grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (::flock(fd_, LOCK_EX | LOCK_NB) == 0)
            return;
        if (!processAlive(owner))
            return;
        std::this_thread::sleep_for(opt.poll_interval);
    }
    if (processAlive(owner)) {
        emitInstance(log, LogLevel::Warning,
                     "PID " + std::to_string(owner) + " did not exit within " +
                         std::to_string(opt.grace.count()) + "s, sending SIGKILL");
        ::kill(owner, SIGKILL);
    }
}

bool InstanceGuard::lockAndVerify(const InstanceOptions& opt, std::string& err) {
    const auto deadline = std::chrono::steady_clock::now() + opt.lock_wait;
    for (;;) {
        if (::flock(fd_, LOCK_EX | LOCK_NB) == 0) {
            // The previous owner may have unlinked the file between our
            // open() and flock(); then we hold a lock nobody else sees.
            struct stat held {};
            struct stat onDisk {};
            if (::fstat(fd_, &held) == 0 && ::stat(path_.c_str(), &onDisk) == 0 &&
                held.st_dev == onDisk.st_dev && held.st_ino == onDisk.st_ino)
                return true;
            ::close(fd_);
            fd_ = -1;
            if (!openLockFile(err))
                return false;
            continue;
        }
        if (errno != EWOULDBLOCK && errno != EINTR) {
            err = "flock(" + path_ + ") failed: " + std::strerror(errno);
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            err = "timed out waiting for lock " + path_;
            return false;
        }
        std::this_thread::sleep_for(opt.poll_interval);
    }
}

bool InstanceGuard::writeOwnPid(std::string& err) {
    const std::string text = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd_, 0) != 0) {
        err = "cannot truncate lock file " + path_ + ": " + std::strerror(errno);
        return false;
    }
    if (::pwrite(fd_, text.data(), text.size(), 0) != static_cast<ssize_t>(text.size())) {
        err = "cannot write PID to " + path_ + ": " + std::strerror(errno);
        return false;
    }
    ::fsync(fd_);
    return true;
}

bool InstanceGuard::acquire(const InstanceOptions& opt, const LogSink& log, std::string& err) {
    if (held())
        return true;
    path_ = opt.lock_path.empty() ? defaultLockPath() : opt.lock_path;
    if (!openLockFile(err))
        return false;

    // A PID is only signalled while somebody actually holds the lock; an
    // unlocked file with a PID in it is left over from a crash.
    if (::flock(fd_, LOCK_EX | LOCK_NB) != 0)
        preemptOwner(opt, log);
    // flock() on a descriptor that already holds the lock succeeds, so this
    // also covers the case where preemption handed it to us.
    if (!lockAndVerify(opt, err) || !writeOwnPid(err)) {
        if (fd_ != -1) {
            ::close(fd_);
            fd_ = -1;
        }
        return false;
    }
    emitInstance(log, LogLevel::Debug,
                 "instance lock " + path_ + " held by PID " + std::to_string(::getpid()));
    return true;
}

void InstanceGuard::release() {
    if (fd_ == -1)
        return;
    ::unlink(path_.c_str());
    ::close(fd_);
    fd_ = -1;
}

} // namespace iftpfm
