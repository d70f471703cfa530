#pragma once

#include <string>
#include <vector>

enum class ErrorKind {
    None,
    Configuration,
    ConcurrentRun,
    Clone,
    SourceUnreachable,
    Transfer,
    Permission,
    Interrupted
};

// Phases a backup set goes through inside one run. Persisted in backup.state.
enum class SetPhase {
    CONFIGURED,
    CLONING,
    CLONED,
    SYNCHRONIZING,
    FINISHED
};

enum class SetStatus {
    Succeeded,
    Failed,
    Skipped
};

enum class ExitCode : int {
    Success = 0,
    PartialFailure = 1,
    ConfigurationError = 2,
    ConcurrentRun = 3
};

struct SetResult {
    std::string setName;
    SetStatus status = SetStatus::Skipped;
    ErrorKind cause = ErrorKind::None;
    std::string detail;
    std::string snapshotPath;
    std::string previousSnapshot;  // empty on a first backup
};

struct RunResult {
    std::string runTimestamp;
    std::string runDirectory;
    std::vector<SetResult> sets;
    bool interrupted = false;

    bool succeeded() const;
    size_t countWithStatus(SetStatus status) const;
    ExitCode exitCode() const;
};

const char* errorKindToString(ErrorKind kind);
const char* setPhaseToString(SetPhase phase);
bool setPhaseFromString(const std::string& name, SetPhase& phase);
const char* setStatusToString(SetStatus status);
