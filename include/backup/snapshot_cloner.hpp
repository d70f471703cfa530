#pragma once

#include <functional>
#include <optional>
#include <string>
#include <sys/stat.h>

// Device a path lives on, given its stat result.
using DeviceResolver = std::function<dev_t(const std::string& path, const struct stat& st)>;

struct CloneStats {
    size_t directories = 0;
    size_t hardlinks = 0;
    size_t symlinks = 0;
    size_t specialFiles = 0;
};

// Recreates a previous snapshot tree at a new location. Directories are
// created fresh, regular files become hard links to the previous inodes,
// symbolic links and device/fifo/socket nodes are recreated as copies.
// The previous tree is only read, never modified.
class SnapshotCloner {
public:
    SnapshotCloner();

    // Without a previous tree only the (empty) destination is created.
    // Returns false on the first failure; the partially cloned destination
    // is left in place and must not be synchronized.
    bool clone(const std::optional<std::string>& previous, const std::string& destination);

    const CloneStats& getStats() const { return stats_; }
    std::string getLastError() const { return lastError_; }

    void setDeviceResolver(DeviceResolver resolver) { deviceResolver_ = resolver; }

private:
    bool prepareDestination(const std::string& destination);
    bool cloneDirectory(const std::string& src, const std::string& dst, const struct stat& srcStat, bool create);
    bool cloneEntry(const std::string& src, const std::string& dst, const struct stat& srcStat);
    bool cloneSymlink(const std::string& src, const std::string& dst, const struct stat& srcStat);
    bool copyOwnership(const std::string& dst, const struct stat& srcStat);
    bool copyTimes(const std::string& dst, const struct stat& srcStat, bool noFollow);
    bool fail(const std::string& message);
    bool failErrno(const std::string& what, const std::string& path);

    std::string lastError_;
    CloneStats stats_;
    DeviceResolver deviceResolver_;
};
