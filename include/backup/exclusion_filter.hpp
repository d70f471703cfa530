#pragma once

#include <set>
#include <utility>
#include <string>
#include <vector>

// Matches file and directory names at any depth below a source directory.
// Matching is exact basename equality: no globbing, no path prefixes.
class ExclusionFilter {
public:
    ExclusionFilter() = default;

    static ExclusionFilter compile(const std::vector<std::string>& skipEntries);

    // True iff one of the '/'-separated segments of path is a skip entry.
    bool matches(const std::string& path) const;
    bool matchesName(const std::string& name) const;

    bool empty() const { return entries_.empty(); }
    const std::set<std::string>& entries() const { return entries_; }

    // Patterns for rsync's --exclude, which without a '/' already match a
    // name anywhere in the tree. Wildcard characters are escaped.
    std::vector<std::string> toRsyncPatterns() const;

private:
    explicit ExclusionFilter(std::set<std::string> entries) : entries_(std::move(entries)) {}

    std::set<std::string> entries_;
};
