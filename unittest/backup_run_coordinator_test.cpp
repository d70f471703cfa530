#include <gtest/gtest.h>
#include "backup/backup_run_coordinator.hpp"
#include "backup/run_lock.hpp"
#include "backup/run_record.hpp"
#include "common/backup_error.hpp"
#include "common/logger.hpp"
#include "fake_sync_executor.hpp"
#include "test_helpers.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <map>

namespace fs = std::filesystem;

namespace {

std::chrono::system_clock::time_point localTime(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

} // namespace

class BackupRunCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = sourceDir_ / "home";
        testutil::writeFile(source_ + "/notes.txt", "remember the milk");
        testutil::writeFile(source_ + "/projects/plan.md", "# plan");

        executor_ = std::make_shared<FakeSyncExecutor>();
        coordinator_ = std::make_unique<BackupRunCoordinator>(executor_, &cancellation_);
        now_ = localTime(2020, 3, 14, 12, 30, 0);
        coordinator_->setClock([this]() { return now_; });

        config_.version = "2.0";
        config_.backupDir = root_.path();
    }

    void addLocalSet(const std::string& name) {
        BackupSetConfig set;
        set.name = name;
        set.source = LocalSource{source_};
        config_.backupSets.push_back(set);
    }

    void addRemoteSet(const std::string& name, const std::string& host) {
        BackupSetConfig set;
        set.name = name;
        set.source = RemoteSource{"ssh", host, "/srv"};
        config_.backupSets.push_back(set);
    }

    std::string runDir(const std::string& timestamp) const {
        return root_.path() + "/" + timestamp;
    }

    testutil::TempDir root_;
    testutil::TempDir sourceDir_;
    std::string source_;
    CancellationFlag cancellation_;
    std::shared_ptr<FakeSyncExecutor> executor_;
    std::unique_ptr<BackupRunCoordinator> coordinator_;
    std::chrono::system_clock::time_point now_;
    BackupConfig config_;
};

// Test that all sets succeeding gives exit code 0 and a complete state file
TEST_F(BackupRunCoordinatorTest, AllSetsSucceed) {
    addLocalSet("home");
    addLocalSet("home-again");

    RunResult result = coordinator_->run(config_);
    EXPECT_EQ(result.runTimestamp, "2020-03-14T12:30:00");
    EXPECT_EQ(result.runDirectory, runDir("2020-03-14T12:30:00"));
    EXPECT_TRUE(result.succeeded());
    EXPECT_FALSE(result.interrupted);
    EXPECT_EQ(result.exitCode(), ExitCode::Success);
    ASSERT_EQ(result.sets.size(), 2u);

    std::string timestamp;
    std::map<std::string, SetPhase> phases;
    ASSERT_TRUE(RunRecord::load(result.runDirectory, timestamp, phases));
    EXPECT_EQ(timestamp, "2020-03-14T12:30:00");
    EXPECT_EQ(phases["home"], SetPhase::FINISHED);
    EXPECT_EQ(phases["home-again"], SetPhase::FINISHED);
    EXPECT_TRUE(fs::exists(result.runDirectory + "/backup.log"));
    EXPECT_EQ(testutil::readFile(result.runDirectory + "/home/notes.txt"), "remember the milk");
}

// Test that an unreachable set does not stop the others
TEST_F(BackupRunCoordinatorTest, FailingSetIsIsolated) {
    addRemoteSet("web", "web.example.org");
    addLocalSet("home");

    RunResult result = coordinator_->run(config_);
    ASSERT_EQ(result.sets.size(), 2u);
    EXPECT_EQ(result.sets[0].setName, "web");
    EXPECT_EQ(result.sets[0].status, SetStatus::Failed);
    EXPECT_EQ(result.sets[0].cause, ErrorKind::SourceUnreachable);
    EXPECT_EQ(result.sets[1].setName, "home");
    EXPECT_EQ(result.sets[1].status, SetStatus::Succeeded);
    EXPECT_EQ(result.exitCode(), ExitCode::PartialFailure);
    EXPECT_TRUE(fs::exists(result.runDirectory + "/home/projects/plan.md"));

    std::string timestamp;
    std::map<std::string, SetPhase> phases;
    ASSERT_TRUE(RunRecord::load(result.runDirectory, timestamp, phases));
    EXPECT_EQ(phases["web"], SetPhase::SYNCHRONIZING);
    EXPECT_EQ(phases["home"], SetPhase::FINISHED);
}

TEST_F(BackupRunCoordinatorTest, MissingBackupRoot) {
    config_.backupDir = root_ / "missing";
    addLocalSet("home");
    EXPECT_THROW(coordinator_->run(config_), ConfigurationError);
    EXPECT_FALSE(fs::exists(root_ / "missing"));
    EXPECT_TRUE(executor_->calls().empty());
}

TEST_F(BackupRunCoordinatorTest, ConcurrentRunIsRefused) {
    addLocalSet("home");
    RunLock other(root_.path());
    ASSERT_TRUE(other.acquire());

    EXPECT_THROW(coordinator_->run(config_), ConcurrentRunError);
    EXPECT_FALSE(fs::exists(runDir("2020-03-14T12:30:00")));
    EXPECT_TRUE(executor_->calls().empty());
}

TEST_F(BackupRunCoordinatorTest, ExistingRunDirectoryIsRefused) {
    addLocalSet("home");
    fs::create_directory(runDir("2020-03-14T12:30:00"));
    EXPECT_THROW(coordinator_->run(config_), ConfigurationError);
    EXPECT_TRUE(fs::is_empty(runDir("2020-03-14T12:30:00")));
}

// Test that sets not yet started when the run is cancelled are skipped
TEST_F(BackupRunCoordinatorTest, CancellationSkipsRemainingSets) {
    addLocalSet("home");
    addLocalSet("later");
    executor_->setOnReconcile([this]() { cancellation_.cancel(); });

    RunResult result = coordinator_->run(config_);
    ASSERT_EQ(result.sets.size(), 2u);
    EXPECT_EQ(result.sets[0].status, SetStatus::Succeeded);
    EXPECT_EQ(result.sets[1].status, SetStatus::Skipped);
    EXPECT_EQ(result.sets[1].cause, ErrorKind::Interrupted);
    EXPECT_TRUE(result.interrupted);
    EXPECT_EQ(result.exitCode(), ExitCode::PartialFailure);
    EXPECT_EQ(executor_->calls().size(), 1u);
    EXPECT_FALSE(fs::exists(result.runDirectory + "/later"));

    std::string timestamp;
    std::map<std::string, SetPhase> phases;
    ASSERT_TRUE(RunRecord::load(result.runDirectory, timestamp, phases));
    EXPECT_EQ(phases["home"], SetPhase::FINISHED);
    ASSERT_EQ(phases.count("later"), 1u);
    EXPECT_EQ(phases["later"], SetPhase::CONFIGURED);
}

// Test that a set interrupted during synchronization is failed and kept
TEST_F(BackupRunCoordinatorTest, SetInterruptedDuringSync) {
    addLocalSet("home");
    addLocalSet("later");
    executor_->setOnReconcile([this]() { cancellation_.cancel(); });
    executor_->setForcedOutcome(SyncOutcome::failure(ErrorKind::Interrupted, 20, "rsync stopped by cancellation"));

    RunResult result = coordinator_->run(config_);
    ASSERT_EQ(result.sets.size(), 2u);
    EXPECT_EQ(result.sets[0].status, SetStatus::Failed);
    EXPECT_EQ(result.sets[0].cause, ErrorKind::Interrupted);
    EXPECT_EQ(result.sets[1].status, SetStatus::Skipped);
    EXPECT_TRUE(result.interrupted);
    EXPECT_TRUE(fs::is_directory(result.runDirectory + "/home"));

    std::string timestamp;
    std::map<std::string, SetPhase> phases;
    ASSERT_TRUE(RunRecord::load(result.runDirectory, timestamp, phases));
    EXPECT_EQ(phases["home"], SetPhase::SYNCHRONIZING);
    EXPECT_EQ(phases["later"], SetPhase::CONFIGURED);
}

// Test that the state file lists every set before the first one starts
TEST_F(BackupRunCoordinatorTest, StateListsAllSetsUpFront) {
    addLocalSet("home");
    addLocalSet("second");
    std::map<std::string, SetPhase> seen;
    executor_->setOnReconcile([this, &seen]() {
        if (seen.empty()) {
            std::string timestamp;
            EXPECT_TRUE(RunRecord::load(runDir("2020-03-14T12:30:00"), timestamp, seen));
        }
    });

    ASSERT_TRUE(coordinator_->run(config_).succeeded());
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen["home"], SetPhase::SYNCHRONIZING);
    EXPECT_EQ(seen["second"], SetPhase::CONFIGURED);
}

// Test that consecutive runs share unchanged files
TEST_F(BackupRunCoordinatorTest, ConsecutiveRunsShareFiles) {
    addLocalSet("home");
    RunResult first = coordinator_->run(config_);
    ASSERT_TRUE(first.succeeded());

    now_ = localTime(2020, 3, 15, 12, 30, 0);
    testutil::writeFile(source_ + "/notes.txt", "milk bought");
    RunResult second = coordinator_->run(config_);
    ASSERT_TRUE(second.succeeded());
    EXPECT_EQ(second.runTimestamp, "2020-03-15T12:30:00");
    EXPECT_EQ(second.sets[0].previousSnapshot, first.runDirectory + "/home");

    EXPECT_EQ(testutil::inodeOf(first.runDirectory + "/home/projects/plan.md"),
              testutil::inodeOf(second.runDirectory + "/home/projects/plan.md"));
    EXPECT_NE(testutil::inodeOf(first.runDirectory + "/home/notes.txt"),
              testutil::inodeOf(second.runDirectory + "/home/notes.txt"));
    EXPECT_EQ(testutil::readFile(first.runDirectory + "/home/notes.txt"), "remember the milk");
}

TEST_F(BackupRunCoordinatorTest, EmptyConfigurationSucceeds) {
    RunResult result = coordinator_->run(config_);
    EXPECT_TRUE(result.sets.empty());
    EXPECT_EQ(result.exitCode(), ExitCode::Success);
    EXPECT_TRUE(fs::is_directory(result.runDirectory));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    Logger::initialize("", LogLevel::WARNING);
    int result = RUN_ALL_TESTS();
    Logger::shutdown();
    return result;
}
