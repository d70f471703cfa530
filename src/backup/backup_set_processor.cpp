#include "backup/backup_set_processor.hpp"
#include "backup/exclusion_filter.hpp"
#include "common/logger.hpp"
#include <stdexcept>

BackupSetProcessor::BackupSetProcessor(std::shared_ptr<SnapshotCatalog> catalog,
                                       std::shared_ptr<SyncExecutor> executor)
    : catalog_(catalog)
    , executor_(executor) {
    if (!catalog_ || !executor_) {
        throw std::invalid_argument("BackupSetProcessor needs a catalog and an executor");
    }
}

std::optional<std::string> BackupSetProcessor::findPreviousSnapshot(const std::string& setName,
                                                                    const RunContext& context) const {
    auto run = selectPreviousRun(catalog_->listRuns(), context.runTimestamp, setName,
        [this](const std::string& candidate, const std::string& name) {
            return catalog_->hasUsableSet(candidate, name);
        });
    if (!run) {
        return std::nullopt;
    }
    return catalog_->snapshotPath(*run, setName);
}

void BackupSetProcessor::reportPhase(const std::string& setName, SetPhase phase) {
    lastPhase_ = phase;
    if (phaseCallback_) {
        phaseCallback_(setName, phase);
    }
}

SetResult BackupSetProcessor::process(const BackupSetConfig& set, const RunContext& context) {
    lastPhase_ = SetPhase::CONFIGURED;
    try {
        return execute(set, context);
    } catch (const std::exception& e) {
        Logger::error("Error making backup of set '" + set.name + "' in phase " +
                      setPhaseToString(lastPhase_) + ": " + e.what());
        SetResult result;
        result.setName = set.name;
        result.status = SetStatus::Failed;
        // Anything before synchronization started leaves no usable clone.
        result.cause = lastPhase_ == SetPhase::SYNCHRONIZING || lastPhase_ == SetPhase::FINISHED
                           ? ErrorKind::Transfer
                           : ErrorKind::Clone;
        result.detail = e.what();
        result.snapshotPath = context.destinationFor(set.name);
        return result;
    }
}

SetResult BackupSetProcessor::execute(const BackupSetConfig& set, const RunContext& context) {
    SetResult result;
    result.setName = set.name;
    result.snapshotPath = context.destinationFor(set.name);
    reportPhase(set.name, SetPhase::CONFIGURED);

    auto previous = findPreviousSnapshot(set.name, context);
    if (previous) {
        result.previousSnapshot = *previous;
        Logger::info("Cloning backup set '" + set.name + "' from " + *previous);
    } else {
        Logger::info("No previous backup of set '" + set.name + "', starting a full copy");
    }

    reportPhase(set.name, SetPhase::CLONING);
    if (!cloner_.clone(previous, result.snapshotPath)) {
        result.status = SetStatus::Failed;
        result.cause = ErrorKind::Clone;
        result.detail = cloner_.getLastError();
        Logger::error("Cloning backup set '" + set.name + "' failed: " + result.detail);
        return result;
    }
    reportPhase(set.name, SetPhase::CLONED);

    ExclusionFilter exclusions = ExclusionFilter::compile(set.skipEntries);
    if (!exclusions.empty()) {
        Logger::debug("Skipping " + std::to_string(exclusions.entries().size()) + " entries in set '" +
                      set.name + "'");
    }

    Logger::info("Making backup of set '" + set.name + "' from " + describeSource(set.source) +
                 " with " + executor_->name());
    reportPhase(set.name, SetPhase::SYNCHRONIZING);
    SyncOutcome outcome = executor_->reconcile(set.source, result.snapshotPath, exclusions);
    if (!outcome.succeeded()) {
        result.status = SetStatus::Failed;
        result.cause = outcome.error;
        result.detail = outcome.message;
        Logger::error("Error making backup of set '" + set.name + "' (" +
                      errorKindToString(outcome.error) + "): " + outcome.message);
        return result;
    }

    reportPhase(set.name, SetPhase::FINISHED);
    result.status = SetStatus::Succeeded;
    Logger::info("Finished backup of set '" + set.name + "'");
    return result;
}
