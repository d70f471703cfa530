#pragma once

#include "common/backup_status.hpp"
#include <stdexcept>
#include <string>

// Errors that abort a whole run. Failures local to one backup set are
// reported through SetResult instead.
class BackupError : public std::runtime_error {
public:
    BackupError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ConfigurationError : public BackupError {
public:
    explicit ConfigurationError(const std::string& message)
        : BackupError(ErrorKind::Configuration, message) {}
};

class ConcurrentRunError : public BackupError {
public:
    explicit ConcurrentRunError(const std::string& message)
        : BackupError(ErrorKind::ConcurrentRun, message) {}
};
