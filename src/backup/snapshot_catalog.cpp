#include "backup/snapshot_catalog.hpp"
#include "backup/run_record.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <map>

namespace fs = std::filesystem;

std::optional<std::string> selectPreviousRun(std::vector<std::string> runs,
                                             const std::string& currentRun,
                                             const std::string& setName,
                                             const SetLookup& hasSet) {
    std::sort(runs.begin(), runs.end(), std::greater<std::string>());
    for (const auto& run : runs) {
        if (run >= currentRun) {
            continue;
        }
        if (hasSet(run, setName)) {
            return run;
        }
    }
    return std::nullopt;
}

FilesystemSnapshotCatalog::FilesystemSnapshotCatalog(const std::string& backupRoot)
    : backupRoot_(backupRoot) {
}

std::vector<std::string> FilesystemSnapshotCatalog::listRuns() const {
    std::vector<std::string> runs;
    std::error_code ec;
    for (fs::directory_iterator it(backupRoot_, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (!utils::isRunTimestamp(name)) {
            continue;
        }
        std::error_code typeEc;
        if (it->is_directory(typeEc) && !it->is_symlink(typeEc)) {
            runs.push_back(name);
        }
    }
    if (ec) {
        Logger::warning("Failed to list runs in " + backupRoot_ + ": " + ec.message());
    }
    return runs;
}

bool FilesystemSnapshotCatalog::hasUsableSet(const std::string& run, const std::string& setName) const {
    std::error_code ec;
    fs::file_status status = fs::symlink_status(snapshotPath(run, setName), ec);
    if (ec || !fs::is_directory(status)) {
        return false;
    }

    // A set whose clone never completed is not a trustworthy source. Runs
    // without a state file are judged by the directory alone.
    std::string timestamp;
    std::map<std::string, SetPhase> phases;
    if (!RunRecord::load(backupRoot_ + "/" + run, timestamp, phases)) {
        return true;
    }
    auto it = phases.find(setName);
    if (it == phases.end()) {
        return true;
    }
    if (it->second == SetPhase::CONFIGURED || it->second == SetPhase::CLONING) {
        Logger::debug("Skipping " + run + "/" + setName + ": recorded in phase " +
                      setPhaseToString(it->second));
        return false;
    }
    return true;
}

std::string FilesystemSnapshotCatalog::snapshotPath(const std::string& run, const std::string& setName) const {
    return backupRoot_ + "/" + run + "/" + setName;
}
