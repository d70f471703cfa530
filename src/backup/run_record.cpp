#include "backup/run_record.hpp"
#include "common/logger.hpp"
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

RunRecord::RunRecord(const std::string& runDirectory, const std::string& timestamp)
    : runDirectory_(runDirectory)
    , timestamp_(timestamp) {
}

bool RunRecord::setPhase(const std::string& setName, SetPhase phase) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        phases_[setName] = phase;
    }
    return save();
}

void RunRecord::registerSet(const std::string& setName) {
    std::lock_guard<std::mutex> lock(mutex_);
    phases_.emplace(setName, SetPhase::CONFIGURED);
}

std::optional<SetPhase> RunRecord::getPhase(const std::string& setName) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = phases_.find(setName);
    if (it == phases_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string RunRecord::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

bool RunRecord::save() {
    std::lock_guard<std::mutex> lock(mutex_);
    json sets = json::object();
    for (const auto& entry : phases_) {
        sets[entry.first] = setPhaseToString(entry.second);
    }
    json state;
    state["timestamp"] = timestamp_;
    state["sets"] = sets;

    // Write next to the file and rename so a crash never leaves half a file.
    std::string path = runDirectory_ + "/" + kStateFileName;
    std::string tmpPath = path + ".tmp";
    {
        std::ofstream file(tmpPath, std::ios::trunc);
        if (!file.is_open()) {
            lastError_ = "Failed to open state file for writing: " + tmpPath;
            Logger::error(lastError_);
            return false;
        }
        file << state.dump(4) << "\n";
        if (!file.good()) {
            lastError_ = "Failed to write state file: " + tmpPath;
            Logger::error(lastError_);
            return false;
        }
    }
    if (std::rename(tmpPath.c_str(), path.c_str()) != 0) {
        lastError_ = "Failed to replace state file: " + path;
        Logger::error(lastError_);
        return false;
    }
    return true;
}

bool RunRecord::load(const std::string& runDirectory, std::string& timestamp,
                     std::map<std::string, SetPhase>& phases) {
    std::string path = runDirectory + "/" + kStateFileName;
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    try {
        json state;
        file >> state;
        if (!state.is_object()) {
            return false;
        }
        timestamp = state.value("timestamp", std::string());
        phases.clear();
        auto sets = state.find("sets");
        if (sets != state.end() && sets->is_object()) {
            for (auto it = sets->begin(); it != sets->end(); ++it) {
                SetPhase phase;
                if (it->is_string() && setPhaseFromString(it->get<std::string>(), phase)) {
                    phases[it.key()] = phase;
                }
            }
        }
        return true;
    } catch (const json::exception& e) {
        Logger::warning("Ignoring unreadable state file " + path + ": " + e.what());
        return false;
    }
}
