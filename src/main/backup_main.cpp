#include "main/backup_main.hpp"
#include "backup/backup_config.hpp"
#include "backup/backup_run_coordinator.hpp"
#include "backup/rsync_executor.hpp"
#include "common/backup_error.hpp"
#include "common/cancellation.hpp"
#include "common/logger.hpp"
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

namespace {

CancellationFlag cancellation;

void handleSignal(int signum) {
    (void)signum;
    cancellation.cancel();
}

void installSignalHandlers() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = handleSignal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

} // namespace

void printUsage() {
    std::cout << "Usage: " << kProgramName << " [options]\n"
              << "Make a backup of the system.\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help           Show this help message and exit\n"
              << "  -f, --conf-format    Show help about the configuration file format and exit\n"
              << "  -c, --config PATH    Configuration file (default: " << kDefaultConfigPath << ")\n"
              << "  -v, --version        Show version information and exit\n";
}

int backupMain(const std::string& configPath) {
    BackupConfig config;
    try {
        config = loadBackupConfig(configPath);
    } catch (const ConfigurationError& e) {
        Logger::error("Failed to load configuration " + configPath + ": " + e.what());
        return static_cast<int>(ExitCode::ConfigurationError);
    }
    Logger::setLogLevel(config.logLevel);
    Logger::debug("Loaded configuration " + configPath + " with " +
                  std::to_string(config.backupSets.size()) + " backup set(s)");

    installSignalHandlers();

    auto executor = std::make_shared<RsyncExecutor>(&cancellation);
    BackupRunCoordinator coordinator(executor, &cancellation);
    try {
        RunResult result = coordinator.run(config);
        return static_cast<int>(result.exitCode());
    } catch (const ConcurrentRunError& e) {
        Logger::error("Backup not started: " + std::string(e.what()));
        return static_cast<int>(ExitCode::ConcurrentRun);
    } catch (const ConfigurationError& e) {
        Logger::error("Backup incomplete due to error: " + std::string(e.what()));
        return static_cast<int>(ExitCode::ConfigurationError);
    }
}

int startBackup(const std::string& configPath) {
    if (!Logger::initialize("", LogLevel::INFO)) {
        std::cerr << "Failed to initialize logger" << std::endl;
        return static_cast<int>(ExitCode::ConfigurationError);
    }

    int status = static_cast<int>(ExitCode::PartialFailure);
    try {
        status = backupMain(configPath);
    } catch (const std::exception& e) {
        Logger::fatal("Error in main: " + std::string(e.what()));
    }
    Logger::shutdown();
    return status;
}
