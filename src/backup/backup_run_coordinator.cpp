#include "backup/backup_run_coordinator.hpp"
#include "backup/run_lock.hpp"
#include "backup/run_record.hpp"
#include "backup/snapshot_catalog.hpp"
#include "common/backup_error.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <sys/types.h>

namespace {

// Detaches the per-run log file however the run ends.
struct RunLogGuard {
    ~RunLogGuard() { Logger::closeRunLog(); }
};

} // namespace

BackupRunCoordinator::BackupRunCoordinator(std::shared_ptr<SyncExecutor> executor,
                                           const CancellationFlag* cancellation)
    : executor_(executor)
    , cancellation_(cancellation)
    , clock_([]() { return std::chrono::system_clock::now(); }) {
}

RunContext BackupRunCoordinator::createContext(const BackupConfig& config) const {
    RunContext context;
    context.backupRoot = config.backupDir;
    context.runTimestamp = utils::formatRunTimestamp(clock_());
    return context;
}

RunResult BackupRunCoordinator::run(const BackupConfig& config) {
    const RunContext context = createContext(config);

    struct stat rootStat;
    if (stat(context.backupRoot.c_str(), &rootStat) != 0 || !S_ISDIR(rootStat.st_mode)) {
        throw ConfigurationError("Cannot manage backups in non-existent directory '" +
                                 context.backupRoot + "'");
    }

    RunLock lock(context.backupRoot);
    if (!lock.acquire()) {
        if (lock.isHeldElsewhere()) {
            throw ConcurrentRunError(lock.getLastError());
        }
        throw ConfigurationError(lock.getLastError());
    }

    const std::string runDirectory = context.runDirectory();
    if (mkdir(runDirectory.c_str(), 0755) != 0) {
        int err = errno;
        if (err == EEXIST) {
            throw ConfigurationError("Backup directory '" + runDirectory + "' already exists");
        }
        throw ConfigurationError("Cannot create backup directory '" + runDirectory + "': " +
                                 std::strerror(err));
    }

    RunLogGuard logGuard;
    if (!Logger::openRunLog(runDirectory + "/" + RunRecord::kLogFileName)) {
        Logger::warning("Logging of this run goes to the console only");
    }
    Logger::info("Backup started in " + runDirectory);

    RunRecord record(runDirectory, context.runTimestamp);
    for (const auto& set : config.backupSets) {
        record.registerSet(set.name);
    }
    if (!record.save()) {
        Logger::warning("Continuing without state file: " + record.getLastError());
    }

    BackupSetProcessor processor(std::make_shared<FilesystemSnapshotCatalog>(context.backupRoot), executor_);
    processor.setPhaseCallback([&record](const std::string& setName, SetPhase phase) {
        if (!record.setPhase(setName, phase)) {
            Logger::warning("Failed to record phase " + std::string(setPhaseToString(phase)) +
                            " of set '" + setName + "'");
        }
    });

    RunResult result;
    result.runTimestamp = context.runTimestamp;
    result.runDirectory = runDirectory;

    for (const auto& set : config.backupSets) {
        Logger::info("===================================================");
        if (cancellation_ && cancellation_->isCancelled()) {
            SetResult skipped;
            skipped.setName = set.name;
            skipped.status = SetStatus::Skipped;
            skipped.cause = ErrorKind::Interrupted;
            skipped.detail = "run cancelled before the set was started";
            Logger::warning("Skipping backup set '" + set.name + "': run cancelled");
            result.sets.push_back(skipped);
            continue;
        }
        result.sets.push_back(processor.process(set, context));
    }
    result.interrupted = cancellation_ && cancellation_->isCancelled();

    logSummary(result);
    return result;
}

void BackupRunCoordinator::logSummary(const RunResult& result) const {
    Logger::info("===================================================");
    for (const auto& set : result.sets) {
        std::string line = "Set '" + set.setName + "': " + setStatusToString(set.status);
        if (set.status != SetStatus::Succeeded) {
            line += " (" + std::string(errorKindToString(set.cause)) + ")";
            if (!set.detail.empty()) {
                line += ": " + set.detail;
            }
            Logger::error(line);
        } else {
            Logger::info(line);
        }
    }
    std::string summary = "Backup " + result.runTimestamp + " finished: " +
                          std::to_string(result.countWithStatus(SetStatus::Succeeded)) + " succeeded, " +
                          std::to_string(result.countWithStatus(SetStatus::Failed)) + " failed, " +
                          std::to_string(result.countWithStatus(SetStatus::Skipped)) + " skipped";
    if (result.interrupted) {
        summary += " (interrupted)";
    }
    if (result.succeeded()) {
        Logger::info(summary);
    } else {
        Logger::error(summary);
    }
}
