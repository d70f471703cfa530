#include "common/backup_status.hpp"
#include <algorithm>

bool RunResult::succeeded() const {
    return std::all_of(sets.begin(), sets.end(), [](const SetResult& set) {
        return set.status == SetStatus::Succeeded;
    });
}

size_t RunResult::countWithStatus(SetStatus status) const {
    return static_cast<size_t>(std::count_if(sets.begin(), sets.end(), [status](const SetResult& set) {
        return set.status == status;
    }));
}

ExitCode RunResult::exitCode() const {
    return succeeded() ? ExitCode::Success : ExitCode::PartialFailure;
}

const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "none";
        case ErrorKind::Configuration:     return "ConfigurationError";
        case ErrorKind::ConcurrentRun:     return "ConcurrentRunError";
        case ErrorKind::Clone:             return "CloneError";
        case ErrorKind::SourceUnreachable: return "SourceUnreachable";
        case ErrorKind::Transfer:          return "TransferError";
        case ErrorKind::Permission:        return "PermissionError";
        case ErrorKind::Interrupted:       return "Interrupted";
        default:                           return "unknown";
    }
}

const char* setPhaseToString(SetPhase phase) {
    switch (phase) {
        case SetPhase::CONFIGURED:    return "CONFIGURED";
        case SetPhase::CLONING:       return "CLONING";
        case SetPhase::CLONED:        return "CLONED";
        case SetPhase::SYNCHRONIZING: return "SYNCHRONIZING";
        case SetPhase::FINISHED:      return "FINISHED";
        default:                      return "UNKNOWN";
    }
}

bool setPhaseFromString(const std::string& name, SetPhase& phase) {
    for (SetPhase candidate : {SetPhase::CONFIGURED, SetPhase::CLONING, SetPhase::CLONED,
                               SetPhase::SYNCHRONIZING, SetPhase::FINISHED}) {
        if (name == setPhaseToString(candidate)) {
            phase = candidate;
            return true;
        }
    }
    return false;
}

const char* setStatusToString(SetStatus status) {
    switch (status) {
        case SetStatus::Succeeded: return "succeeded";
        case SetStatus::Failed:    return "failed";
        case SetStatus::Skipped:   return "skipped";
        default:                   return "unknown";
    }
}
