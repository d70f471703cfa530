#include "common/logger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cstring>  // for strerror
#include <cerrno>   // for errno

std::mutex Logger::mutex_;
LogLevel Logger::currentLevel_ = LogLevel::INFO;
bool Logger::initialized_ = false;
std::FILE* Logger::logFile_ = nullptr;
std::FILE* Logger::runLogFile_ = nullptr;

bool Logger::initialize(const std::string& logPath, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return false;
    }

    if (!logPath.empty()) {
        logFile_ = std::fopen(logPath.c_str(), "a");
        if (!logFile_) {
            std::cerr << "Failed to open log file " << logPath << ": " << strerror(errno) << std::endl;
            return false;
        }
    }

    currentLevel_ = level;
    initialized_ = true;
    return true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (runLogFile_) {
        std::fclose(runLogFile_);
        runLogFile_ = nullptr;
    }
    if (logFile_) {
        std::fclose(logFile_);
        logFile_ = nullptr;
    }
    initialized_ = false;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

bool Logger::openRunLog(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (runLogFile_) {
        std::fclose(runLogFile_);
    }
    runLogFile_ = std::fopen(path.c_str(), "a");
    if (!runLogFile_) {
        std::cerr << "Failed to open run log " << path << ": " << strerror(errno) << std::endl;
        return false;
    }
    return true;
}

void Logger::closeRunLog() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (runLogFile_) {
        std::fclose(runLogFile_);
        runLogFile_ = nullptr;
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < currentLevel_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    std::string logMessage = ss.str() + " [" + levelToString(level) + "] " + message + "\n";

    if (level >= LogLevel::WARNING) {
        std::cerr << logMessage;
        std::cerr.flush();
    } else {
        std::cout << logMessage;
        std::cout.flush();
    }

    for (std::FILE* file : {logFile_, runLogFile_}) {
        if (file) {
            std::fputs(logMessage.c_str(), file);
            std::fflush(file);
        }
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::fatal(const std::string& message) {
    log(LogLevel::FATAL, message);
}

bool Logger::parseLogLevel(const std::string& name, LogLevel& level) {
    if (name == "debug") {
        level = LogLevel::DEBUG;
    } else if (name == "info") {
        level = LogLevel::INFO;
    } else if (name == "warning") {
        level = LogLevel::WARNING;
    } else if (name == "error") {
        level = LogLevel::ERROR;
    } else if (name == "fatal") {
        level = LogLevel::FATAL;
    } else {
        return false;
    }
    return true;
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:            return "UNKNOWN";
    }
}
