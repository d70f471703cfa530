#pragma once

#include <string>

// Exclusive, non-blocking lock on a backup root, held for the lifetime of
// the object. The lock file keeps the PID of the holder.
class RunLock {
public:
    static constexpr const char* kLockFileName = ".backupbrace.lock";

    explicit RunLock(const std::string& backupRoot);
    ~RunLock();

    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;

    // Returns false if another process holds the lock or the lock file
    // cannot be opened; see isHeldElsewhere() and getLastError().
    bool acquire();
    void release();

    bool isHeld() const { return fd_ >= 0; }
    bool isHeldElsewhere() const { return heldElsewhere_; }
    std::string getHolder() const { return holder_; }
    std::string getLastError() const { return lastError_; }
    const std::string& getPath() const { return path_; }

private:
    std::string path_;
    int fd_ = -1;
    bool heldElsewhere_ = false;
    std::string holder_;
    std::string lastError_;
};
