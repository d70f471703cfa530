#pragma once

#include "backup/backup_config.hpp"
#include "backup/snapshot_catalog.hpp"
#include "backup/snapshot_cloner.hpp"
#include "backup/sync_executor.hpp"
#include "common/backup_status.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

// Fixed for the whole run and shared by every backup set.
struct RunContext {
    std::string backupRoot;
    std::string runTimestamp;

    std::string runDirectory() const { return backupRoot + "/" + runTimestamp; }
    std::string destinationFor(const std::string& setName) const { return runDirectory() + "/" + setName; }
};

using PhaseCallback = std::function<void(const std::string& setName, SetPhase phase)>;

// Produces the snapshot of one backup set: clone the previous snapshot of
// the set, then let the synchronizer bring the clone up to date. Every
// failure ends up in the returned SetResult.
class BackupSetProcessor {
public:
    BackupSetProcessor(std::shared_ptr<SnapshotCatalog> catalog,
                       std::shared_ptr<SyncExecutor> executor);
    ~BackupSetProcessor() = default;

    SetResult process(const BackupSetConfig& set, const RunContext& context);

    std::optional<std::string> findPreviousSnapshot(const std::string& setName,
                                                    const RunContext& context) const;

    void setPhaseCallback(PhaseCallback callback) { phaseCallback_ = callback; }

private:
    SetResult execute(const BackupSetConfig& set, const RunContext& context);
    void reportPhase(const std::string& setName, SetPhase phase);

    std::shared_ptr<SnapshotCatalog> catalog_;
    std::shared_ptr<SyncExecutor> executor_;
    SnapshotCloner cloner_;
    PhaseCallback phaseCallback_;
    SetPhase lastPhase_ = SetPhase::CONFIGURED;
};
