#pragma once

#include "backup/sync_executor.hpp"
#include "common/cancellation.hpp"
#include <chrono>
#include <string>
#include <vector>

// Runs rsync as a child process. rsync's default update strategy writes a
// changed file to a temporary name and renames it over the old one, which
// breaks the hard link to the previous snapshot instead of modifying it.
class RsyncExecutor : public SyncExecutor {
public:
    explicit RsyncExecutor(const CancellationFlag* cancellation = nullptr,
                           const std::string& program = "rsync");
    ~RsyncExecutor() override = default;

    SyncOutcome reconcile(const SourceLocator& source,
                          const std::string& destination,
                          const ExclusionFilter& exclusions) override;
    std::string name() const override { return "rsync"; }

    std::vector<std::string> buildCommand(const SourceLocator& source,
                                          const std::string& destination,
                                          const ExclusionFilter& exclusions) const;

    static ErrorKind classifyExitCode(int exitCode, bool permissionDenied);

    // Receives every output line of rsync. Defaults to Logger::info.
    void setOutputCallback(OutputCallback callback) { outputCallback_ = callback; }

    // Time a cancelled child gets to exit after SIGTERM before it is killed.
    void setKillGracePeriod(std::chrono::milliseconds period) { killGracePeriod_ = period; }

private:
    SyncOutcome runCommand(const std::vector<std::string>& argv);
    void emitLine(const std::string& line, bool& permissionDenied);

    const CancellationFlag* cancellation_;
    std::string program_;
    OutputCallback outputCallback_;
    std::chrono::milliseconds killGracePeriod_;
};
