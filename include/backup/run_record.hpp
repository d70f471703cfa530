#pragma once

#include "common/backup_status.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>

// The backup.state file of one run: the run timestamp and, per backup set,
// the last phase that set reached.
//
//   { "timestamp": "2020-03-14T02:30:00", "sets": { "home": "FINISHED" } }
class RunRecord {
public:
    static constexpr const char* kStateFileName = "backup.state";
    static constexpr const char* kLogFileName = "backup.log";

    RunRecord(const std::string& runDirectory, const std::string& timestamp);

    // Writes the state file; returns false and sets the last error on failure.
    bool save();
    bool setPhase(const std::string& setName, SetPhase phase);

    // Lists a set as CONFIGURED without writing the file.
    void registerSet(const std::string& setName);

    std::optional<SetPhase> getPhase(const std::string& setName) const;
    std::string getLastError() const;

    // Reads the phases recorded in runDirectory. Returns false when the file
    // is missing or unreadable.
    static bool load(const std::string& runDirectory, std::string& timestamp,
                     std::map<std::string, SetPhase>& phases);

private:
    std::string runDirectory_;
    std::string timestamp_;
    std::map<std::string, SetPhase> phases_;
    std::string lastError_;
    mutable std::mutex mutex_;
};
