#include "backup/exclusion_filter.hpp"

ExclusionFilter ExclusionFilter::compile(const std::vector<std::string>& skipEntries) {
    std::set<std::string> entries;
    for (const auto& entry : skipEntries) {
        if (!entry.empty()) {
            entries.insert(entry);
        }
    }
    return ExclusionFilter(std::move(entries));
}

bool ExclusionFilter::matchesName(const std::string& name) const {
    return entries_.count(name) > 0;
}

bool ExclusionFilter::matches(const std::string& path) const {
    if (entries_.empty()) {
        return false;
    }
    size_t i = 0;
    while (i < path.size()) {
        while (i < path.size() && path[i] == '/') i++;
        if (i >= path.size()) break;
        size_t start = i;
        while (i < path.size() && path[i] != '/') i++;
        if (entries_.count(path.substr(start, i - start)) > 0) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> ExclusionFilter::toRsyncPatterns() const {
    std::vector<std::string> patterns;
    patterns.reserve(entries_.size());
    for (const auto& entry : entries_) {
        // rsync only honours backslash escapes in patterns that contain a
        // wildcard, so plain names are passed through untouched.
        if (entry.find_first_of("*?[") == std::string::npos) {
            patterns.push_back(entry);
            continue;
        }
        std::string escaped;
        for (char c : entry) {
            if (c == '*' || c == '?' || c == '[' || c == '\\') {
                escaped += '\\';
            }
            escaped += c;
        }
        patterns.push_back(escaped);
    }
    return patterns;
}
