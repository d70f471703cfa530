#pragma once

#include "backup/backup_config.hpp"
#include "backup/backup_set_processor.hpp"
#include "backup/sync_executor.hpp"
#include "common/backup_status.hpp"
#include "common/cancellation.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

using Clock = std::function<std::chrono::system_clock::time_point()>;

// Executes one run: every configured backup set is snapshotted below
// <backup-dir>/<run-timestamp>/ in declaration order.
class BackupRunCoordinator {
public:
    explicit BackupRunCoordinator(std::shared_ptr<SyncExecutor> executor,
                                  const CancellationFlag* cancellation = nullptr);
    ~BackupRunCoordinator() = default;

    // Throws ConfigurationError when the backup root is missing or the run
    // directory cannot be created, and ConcurrentRunError when another run
    // holds the backup root. Per-set failures are reported in the result.
    RunResult run(const BackupConfig& config);

    void setClock(Clock clock) { clock_ = clock; }

private:
    RunContext createContext(const BackupConfig& config) const;
    void logSummary(const RunResult& result) const;

    std::shared_ptr<SyncExecutor> executor_;
    const CancellationFlag* cancellation_;
    Clock clock_;
};
