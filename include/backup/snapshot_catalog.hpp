#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

// Read-only view of the runs already stored below a backup root.
class SnapshotCatalog {
public:
    virtual ~SnapshotCatalog() = default;

    // Names of the entries below the backup root that look like runs.
    virtual std::vector<std::string> listRuns() const = 0;

    // True when run holds a snapshot of setName that may serve as the
    // source of a clone.
    virtual bool hasUsableSet(const std::string& run, const std::string& setName) const = 0;

    virtual std::string snapshotPath(const std::string& run, const std::string& setName) const = 0;
};

using SetLookup = std::function<bool(const std::string& run, const std::string& setName)>;

// Picks the newest run before currentRun that holds setName. Runs are
// compared by name, which for run timestamps is chronological order.
std::optional<std::string> selectPreviousRun(std::vector<std::string> runs,
                                             const std::string& currentRun,
                                             const std::string& setName,
                                             const SetLookup& hasSet);

class FilesystemSnapshotCatalog : public SnapshotCatalog {
public:
    explicit FilesystemSnapshotCatalog(const std::string& backupRoot);

    std::vector<std::string> listRuns() const override;
    bool hasUsableSet(const std::string& run, const std::string& setName) const override;
    std::string snapshotPath(const std::string& run, const std::string& setName) const override;

private:
    std::string backupRoot_;
};
