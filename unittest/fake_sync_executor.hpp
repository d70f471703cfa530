#pragma once

#include "backup/sync_executor.hpp"
#include <algorithm>
#include <filesystem>
#include <functional>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Deterministic in-process synchronizer for local sources. It honours the
// SyncExecutor contract the way rsync does: changed files are written to a
// temporary name and renamed into place, identical files are not touched,
// extra and excluded destination entries are deleted. Remote sources are
// never contacted; they return the outcome configured per host, or
// SourceUnreachable.
class FakeSyncExecutor : public SyncExecutor {
public:
    struct Call {
        std::string source;
        std::string destination;
    };

    SyncOutcome reconcile(const SourceLocator& source,
                          const std::string& destination,
                          const ExclusionFilter& exclusions) override {
        calls_.push_back({describeSource(source), destination});
        if (onReconcile_) {
            onReconcile_();
        }
        if (forcedOutcome_) {
            return *forcedOutcome_;
        }
        if (const auto* remote = std::get_if<RemoteSource>(&source)) {
            auto it = remoteOutcomes_.find(remote->host);
            if (it != remoteOutcomes_.end()) {
                return it->second;
            }
            return SyncOutcome::failure(ErrorKind::SourceUnreachable, 255,
                                        "ssh: Could not resolve hostname " + remote->host);
        }
        const auto& local = std::get<LocalSource>(source);
        if (!std::filesystem::is_directory(local.path)) {
            return SyncOutcome::failure(ErrorKind::Transfer, 23, "change_dir " + local.path + " failed");
        }
        reconcileDirectory(local.path, destination, exclusions);
        return SyncOutcome::success();
    }

    std::string name() const override { return "fake"; }

    void setForcedOutcome(const SyncOutcome& outcome) { forcedOutcome_ = outcome; }
    void setRemoteOutcome(const std::string& host, const SyncOutcome& outcome) { remoteOutcomes_[host] = outcome; }
    void setOnReconcile(std::function<void()> hook) { onReconcile_ = hook; }

    const std::vector<Call>& calls() const { return calls_; }
    size_t copiedFiles() const { return copiedFiles_; }
    size_t removedEntries() const { return removedEntries_; }
    void resetCounters() { copiedFiles_ = 0; removedEntries_ = 0; }

private:
    static bool sameContent(const std::filesystem::path& a, const std::filesystem::path& b) {
        if (std::filesystem::file_size(a) != std::filesystem::file_size(b)) {
            return false;
        }
        std::ifstream fa(a, std::ios::binary);
        std::ifstream fb(b, std::ios::binary);
        return std::equal(std::istreambuf_iterator<char>(fa), std::istreambuf_iterator<char>(),
                          std::istreambuf_iterator<char>(fb));
    }

    void reconcileDirectory(const std::filesystem::path& src, const std::filesystem::path& dst,
                            const ExclusionFilter& exclusions) {
        namespace fs = std::filesystem;

        std::vector<fs::path> existing;
        for (const auto& entry : fs::directory_iterator(dst)) {
            existing.push_back(entry.path());
        }
        for (const auto& path : existing) {
            std::string name = path.filename().string();
            fs::file_status srcStatus = fs::symlink_status(src / name);
            if (exclusions.matchesName(name) || !fs::exists(srcStatus) ||
                srcStatus.type() != fs::symlink_status(path).type()) {
                fs::remove_all(path);
                removedEntries_++;
            }
        }

        for (const auto& entry : fs::directory_iterator(src)) {
            std::string name = entry.path().filename().string();
            if (exclusions.matchesName(name)) {
                continue;
            }
            fs::path target = dst / name;
            fs::file_status status = entry.symlink_status();
            if (fs::is_directory(status)) {
                if (!fs::exists(fs::symlink_status(target))) {
                    fs::create_directory(target);
                }
                reconcileDirectory(entry.path(), target, exclusions);
            } else if (fs::is_symlink(status)) {
                fs::path linkTarget = fs::read_symlink(entry.path());
                if (fs::is_symlink(fs::symlink_status(target)) && fs::read_symlink(target) == linkTarget) {
                    continue;
                }
                fs::remove(target);
                fs::create_symlink(linkTarget, target);
            } else if (fs::is_regular_file(status)) {
                if (fs::is_regular_file(fs::symlink_status(target)) && sameContent(entry.path(), target)) {
                    continue;
                }
                fs::path tmp = dst / ("." + name + ".fake-tmp");
                fs::copy_file(entry.path(), tmp, fs::copy_options::overwrite_existing);
                fs::rename(tmp, target);
                copiedFiles_++;
            }
        }
    }

    std::vector<Call> calls_;
    std::optional<SyncOutcome> forcedOutcome_;
    std::map<std::string, SyncOutcome> remoteOutcomes_;
    std::function<void()> onReconcile_;
    size_t copiedFiles_ = 0;
    size_t removedEntries_ = 0;
};
