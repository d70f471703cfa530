#pragma once

#include "common/logger.hpp"
#include <string>
#include <variant>
#include <vector>

struct LocalSource {
    std::string path;
};

struct RemoteSource {
    std::string shell;  // command line used to reach the host, e.g. "ssh -l backup"
    std::string host;   // may carry a user, "user@host"
    std::string path;
};

using SourceLocator = std::variant<LocalSource, RemoteSource>;

struct BackupSetConfig {
    std::string name;
    SourceLocator source;
    std::vector<std::string> skipEntries;
};

struct BackupConfig {
    std::string version;
    std::string backupDir;
    LogLevel logLevel = LogLevel::INFO;
    std::vector<BackupSetConfig> backupSets;
};

constexpr const char* kDefaultConfigPath = "/etc/backupbrace.conf";

// Throws ConfigurationError when the file cannot be read, parsed or validated.
BackupConfig loadBackupConfig(const std::string& path);
BackupConfig parseBackupConfig(const std::string& text);

void printConfigurationFormat();

std::string describeSource(const SourceLocator& source);
