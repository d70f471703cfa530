#pragma once

#include <chrono>
#include <cctype>
#include <ctime>
#include <string>
#include <vector>

namespace utils {

// Run directories are named after the local start time of the run, e.g.
// "2020-03-14T02:30:00". The format sorts lexically in chronological order.
constexpr const char* kRunTimestampFormat = "%Y-%m-%dT%H:%M:%S";

inline std::string formatRunTimestamp(std::chrono::system_clock::time_point when) {
    std::time_t time = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&time, &tm);
    char buf[32];
    size_t len = std::strftime(buf, sizeof(buf), kRunTimestampFormat, &tm);
    return std::string(buf, len);
}

inline bool isRunTimestamp(const std::string& name) {
    static const char pattern[] = "dddd-dd-ddTdd:dd:dd";
    if (name.size() != sizeof(pattern) - 1) {
        return false;
    }
    for (size_t i = 0; i < name.size(); ++i) {
        if (pattern[i] == 'd') {
            if (!std::isdigit(static_cast<unsigned char>(name[i]))) {
                return false;
            }
        } else if (name[i] != pattern[i]) {
            return false;
        }
    }
    return true;
}

inline std::string joinCommand(const std::vector<std::string>& argv) {
    std::string line;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            line += ' ';
        }
        line += argv[i];
    }
    return line;
}

} // namespace utils
