#pragma once

#include <string>

constexpr const char* kProgramName = "backupbrace";
constexpr const char* kProgramVersion = "0.3";

// Print the command usage information
void printUsage();

// Load the configuration at configPath and make one backup run.
// Returns the process exit status.
int backupMain(const std::string& configPath);

// Set up console logging around backupMain. A logger that cannot be
// initialized is a setup error and yields ExitCode::ConfigurationError.
int startBackup(const std::string& configPath);
