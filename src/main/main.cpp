#include "main/backup_main.hpp"
#include "backup/backup_config.hpp"
#include "common/backup_status.hpp"
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    std::string configPath = kDefaultConfigPath;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << kProgramName << " v" << kProgramVersion << std::endl;
            return 0;
        } else if (arg == "-f" || arg == "--conf-format") {
            printConfigurationFormat();
            return 0;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a path" << std::endl;
                printUsage();
                return static_cast<int>(ExitCode::ConfigurationError);
            }
            configPath = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            configPath = arg.substr(9);
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            printUsage();
            return static_cast<int>(ExitCode::ConfigurationError);
        }
    }

    return startBackup(configPath);
}
