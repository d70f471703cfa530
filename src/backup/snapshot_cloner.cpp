#include "backup/snapshot_cloner.hpp"
#include "common/logger.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <memory>
#include <vector>
#include <dirent.h>
#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

using DirHandle = std::unique_ptr<DIR, int (*)(DIR*)>;

std::string parentOf(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    return parent.empty() ? std::string(".") : parent.string();
}

} // namespace

SnapshotCloner::SnapshotCloner()
    : deviceResolver_([](const std::string&, const struct stat& st) { return st.st_dev; }) {
}

bool SnapshotCloner::fail(const std::string& message) {
    lastError_ = message;
    Logger::error(message);
    return false;
}

bool SnapshotCloner::failErrno(const std::string& what, const std::string& path) {
    int err = errno;
    std::string message = what + " " + path + ": " + std::strerror(err);
    if (err == EXDEV) {
        message += " (previous snapshot and destination are on different filesystems)";
    }
    return fail(message);
}

bool SnapshotCloner::clone(const std::optional<std::string>& previous, const std::string& destination) {
    lastError_.clear();
    stats_ = CloneStats();

    struct stat prevStat;
    if (previous) {
        if (lstat(previous->c_str(), &prevStat) != 0) {
            return failErrno("cannot access previous snapshot", *previous);
        }
        if (!S_ISDIR(prevStat.st_mode)) {
            return fail("previous snapshot " + *previous + " is not a directory");
        }
        std::string parent = parentOf(destination);
        struct stat parentStat;
        if (stat(parent.c_str(), &parentStat) != 0) {
            return failErrno("cannot access destination parent", parent);
        }
        if (deviceResolver_(parent, parentStat) != deviceResolver_(*previous, prevStat)) {
            return fail("cannot hard link from " + *previous + " into " + destination +
                        ": previous snapshot and destination are on different filesystems");
        }
    }

    if (!prepareDestination(destination)) {
        return false;
    }

    if (!previous) {
        stats_.directories = 1;
        return true;
    }

    Logger::debug("Cloning " + *previous + " to " + destination);
    if (!cloneDirectory(*previous, destination, prevStat, false)) {
        return false;
    }
    Logger::debug("Cloned " + std::to_string(stats_.directories) + " directories, " +
                  std::to_string(stats_.hardlinks) + " hard links, " +
                  std::to_string(stats_.symlinks) + " symbolic links, " +
                  std::to_string(stats_.specialFiles) + " special files");
    return true;
}

bool SnapshotCloner::prepareDestination(const std::string& destination) {
    std::error_code ec;
    fs::file_status status = fs::symlink_status(destination, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return fail("cannot access destination " + destination + ": " + ec.message());
    }
    if (fs::exists(status)) {
        if (!fs::is_directory(status)) {
            return fail("destination " + destination + " exists and is not a directory");
        }
        bool empty = fs::is_empty(destination, ec);
        if (ec) {
            return fail("cannot read destination " + destination + ": " + ec.message());
        }
        if (!empty) {
            return fail("destination " + destination + " already exists and is not empty");
        }
        return true;
    }
    if (mkdir(destination.c_str(), 0755) != 0) {
        return failErrno("cannot create directory", destination);
    }
    return true;
}

bool SnapshotCloner::cloneDirectory(const std::string& src, const std::string& dst,
                                    const struct stat& srcStat, bool create) {
    // Owner-only until populated; the final mode is applied afterwards.
    if (create && mkdir(dst.c_str(), 0700) != 0) {
        return failErrno("cannot create directory", dst);
    }
    stats_.directories++;

    DirHandle dir(opendir(src.c_str()), closedir);
    if (!dir) {
        return failErrno("cannot read directory", src);
    }

    std::vector<std::string> names;
    errno = 0;
    struct dirent* entry;
    while ((entry = readdir(dir.get())) != nullptr) {
        if (std::strcmp(entry->d_name, ".") == 0 || std::strcmp(entry->d_name, "..") == 0) {
            continue;
        }
        names.emplace_back(entry->d_name);
    }
    if (errno != 0) {
        return failErrno("cannot read directory", src);
    }
    dir.reset();

    for (const auto& name : names) {
        std::string srcPath = src + "/" + name;
        std::string dstPath = dst + "/" + name;
        struct stat childStat;
        if (lstat(srcPath.c_str(), &childStat) != 0) {
            return failErrno("cannot stat", srcPath);
        }
        if (!cloneEntry(srcPath, dstPath, childStat)) {
            return false;
        }
    }

    if (!copyOwnership(dst, srcStat)) {
        return false;
    }
    if (chmod(dst.c_str(), srcStat.st_mode & 07777) != 0) {
        return failErrno("cannot set mode of", dst);
    }
    return copyTimes(dst, srcStat, false);
}

bool SnapshotCloner::cloneEntry(const std::string& src, const std::string& dst, const struct stat& srcStat) {
    if (S_ISDIR(srcStat.st_mode)) {
        return cloneDirectory(src, dst, srcStat, true);
    }
    if (S_ISREG(srcStat.st_mode)) {
        if (link(src.c_str(), dst.c_str()) != 0) {
            return failErrno("cannot hard link " + src + " to", dst);
        }
        stats_.hardlinks++;
        return true;
    }
    if (S_ISLNK(srcStat.st_mode)) {
        return cloneSymlink(src, dst, srcStat);
    }

    // FIFOs, sockets and device nodes get a node of their own.
    if (mknod(dst.c_str(), srcStat.st_mode, srcStat.st_rdev) != 0) {
        return failErrno("cannot create node", dst);
    }
    stats_.specialFiles++;
    if (!copyOwnership(dst, srcStat)) {
        return false;
    }
    if (chmod(dst.c_str(), srcStat.st_mode & 07777) != 0) {
        return failErrno("cannot set mode of", dst);
    }
    return copyTimes(dst, srcStat, true);
}

bool SnapshotCloner::cloneSymlink(const std::string& src, const std::string& dst, const struct stat& srcStat) {
    std::vector<char> target(static_cast<size_t>(srcStat.st_size) + 1);
    ssize_t len = readlink(src.c_str(), target.data(), target.size());
    if (len < 0) {
        return failErrno("cannot read symbolic link", src);
    }
    if (static_cast<size_t>(len) >= target.size()) {
        return fail("symbolic link " + src + " changed while cloning");
    }
    target[static_cast<size_t>(len)] = '\0';

    if (symlink(target.data(), dst.c_str()) != 0) {
        return failErrno("cannot create symbolic link", dst);
    }
    stats_.symlinks++;
    if (!copyOwnership(dst, srcStat)) {
        return false;
    }
    return copyTimes(dst, srcStat, true);
}

bool SnapshotCloner::copyOwnership(const std::string& dst, const struct stat& srcStat) {
    struct stat dstStat;
    if (lstat(dst.c_str(), &dstStat) != 0) {
        return failErrno("cannot stat", dst);
    }
    if (dstStat.st_uid == srcStat.st_uid && dstStat.st_gid == srcStat.st_gid) {
        return true;
    }
    if (lchown(dst.c_str(), srcStat.st_uid, srcStat.st_gid) != 0) {
        return failErrno("cannot change owner of", dst);
    }
    return true;
}

bool SnapshotCloner::copyTimes(const std::string& dst, const struct stat& srcStat, bool noFollow) {
    struct timespec times[2];
    times[0] = srcStat.st_atim;
    times[1] = srcStat.st_mtim;
    if (utimensat(AT_FDCWD, dst.c_str(), times, noFollow ? AT_SYMLINK_NOFOLLOW : 0) != 0) {
        return failErrno("cannot set times of", dst);
    }
    return true;
}
