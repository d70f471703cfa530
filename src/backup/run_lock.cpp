#include "backup/run_lock.hpp"
#include "common/logger.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

RunLock::RunLock(const std::string& backupRoot)
    : path_(backupRoot + "/" + kLockFileName) {
}

RunLock::~RunLock() {
    release();
}

bool RunLock::acquire() {
    if (fd_ >= 0) {
        return true;
    }
    heldElsewhere_ = false;
    holder_.clear();
    lastError_.clear();

    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        lastError_ = "cannot open lock file " + path_ + ": " + std::strerror(errno);
        return false;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        if (err == EWOULDBLOCK) {
            heldElsewhere_ = true;
            char buf[32] = {0};
            ssize_t n = ::read(fd, buf, sizeof(buf) - 1);
            if (n > 0) {
                holder_.assign(buf, static_cast<size_t>(n));
                while (!holder_.empty() && (holder_.back() == '\n' || holder_.back() == ' ')) {
                    holder_.pop_back();
                }
            }
            lastError_ = "backup root is locked by another run" +
                         (holder_.empty() ? std::string() : " (PID " + holder_ + ")");
        } else {
            lastError_ = "cannot lock " + path_ + ": " + std::strerror(err);
        }
        ::close(fd);
        return false;
    }

    char pid[32];
    int len = std::snprintf(pid, sizeof(pid), "%d\n", static_cast<int>(getpid()));
    if (ftruncate(fd, 0) != 0 || ::write(fd, pid, static_cast<size_t>(len)) != len) {
        Logger::warning("Failed to record PID in lock file " + path_ + ": " + std::strerror(errno));
    }
    fd_ = fd;
    Logger::debug("Acquired lock " + path_);
    return true;
}

void RunLock::release() {
    if (fd_ < 0) {
        return;
    }
    if (ftruncate(fd_, 0) != 0) {
        Logger::warning("Failed to clear lock file " + path_ + ": " + std::strerror(errno));
    }
    flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}
