#include <gtest/gtest.h>
#include "backup/backup_config.hpp"
#include "common/backup_error.hpp"
#include "test_helpers.hpp"
#include <string>

namespace {

std::string configWithSets(const std::string& sets) {
    return R"({ "version": "2.0", "backup-dir": "/srv/backup", "backup-sets": [ )" + sets + " ] }";
}

} // namespace

TEST(BackupConfigTest, ParsesLocalAndRemoteSets) {
    BackupConfig config = parseBackupConfig(R"({
        "version": "2.0",
        "backup-dir": "/srv/backup/",
        "backup-sets": [
            { "set-name": "home", "type": "local dir", "source-dir": "/home",
              "skip-entries": [ ".cache", "node_modules" ] },
            { "set-name": "web", "type": "remote dir", "source-dir": "/var/www",
              "remote-shell": "ssh -l backup -p 2222", "remote-host": "web01" }
        ]
    })");

    EXPECT_EQ(config.version, "2.0");
    EXPECT_EQ(config.backupDir, "/srv/backup");
    EXPECT_EQ(config.logLevel, LogLevel::INFO);
    ASSERT_EQ(config.backupSets.size(), 2u);

    const auto& home = config.backupSets[0];
    EXPECT_EQ(home.name, "home");
    ASSERT_TRUE(std::holds_alternative<LocalSource>(home.source));
    EXPECT_EQ(std::get<LocalSource>(home.source).path, "/home");
    EXPECT_EQ(home.skipEntries, (std::vector<std::string>{".cache", "node_modules"}));

    const auto& web = config.backupSets[1];
    ASSERT_TRUE(std::holds_alternative<RemoteSource>(web.source));
    const auto& remote = std::get<RemoteSource>(web.source);
    EXPECT_EQ(remote.shell, "ssh -l backup -p 2222");
    EXPECT_EQ(remote.host, "web01");
    EXPECT_EQ(remote.path, "/var/www");
    EXPECT_TRUE(web.skipEntries.empty());
}

TEST(BackupConfigTest, AcceptsAnyMinorVersionOfTwo) {
    BackupConfig config = parseBackupConfig(R"({ "version": "2.7", "backup-dir": "/b", "backup-sets": [] })");
    EXPECT_EQ(config.version, "2.7");
    EXPECT_TRUE(config.backupSets.empty());
}

TEST(BackupConfigTest, RejectsUnsupportedVersions) {
    EXPECT_THROW(parseBackupConfig(R"({ "version": "3.0", "backup-dir": "/b", "backup-sets": [] })"),
                 ConfigurationError);
    EXPECT_THROW(parseBackupConfig(R"({ "version": "1.9", "backup-dir": "/b", "backup-sets": [] })"),
                 ConfigurationError);
    EXPECT_THROW(parseBackupConfig(R"({ "version": "2", "backup-dir": "/b", "backup-sets": [] })"),
                 ConfigurationError);
    EXPECT_THROW(parseBackupConfig(R"({ "version": "2.x", "backup-dir": "/b", "backup-sets": [] })"),
                 ConfigurationError);
    EXPECT_THROW(parseBackupConfig(R"({ "version": 2.0, "backup-dir": "/b", "backup-sets": [] })"),
                 ConfigurationError);
    EXPECT_THROW(parseBackupConfig(R"({ "backup-dir": "/b", "backup-sets": [] })"), ConfigurationError);
}

TEST(BackupConfigTest, RequiresAbsoluteBackupDir) {
    EXPECT_THROW(parseBackupConfig(R"({ "version": "2.0", "backup-sets": [] })"), ConfigurationError);
    EXPECT_THROW(parseBackupConfig(R"({ "version": "2.0", "backup-dir": "backups", "backup-sets": [] })"),
                 ConfigurationError);
}

TEST(BackupConfigTest, RequiresBackupSetsArray) {
    EXPECT_THROW(parseBackupConfig(R"({ "version": "2.0", "backup-dir": "/b" })"), ConfigurationError);
    EXPECT_THROW(parseBackupConfig(R"({ "version": "2.0", "backup-dir": "/b", "backup-sets": {} })"),
                 ConfigurationError);
}

TEST(BackupConfigTest, RejectsMalformedJson) {
    EXPECT_THROW(parseBackupConfig("{ \"version\": \"2.0\", "), ConfigurationError);
    EXPECT_THROW(parseBackupConfig("[]"), ConfigurationError);
}

TEST(BackupConfigTest, RemoteSetNeedsShellAndHost) {
    EXPECT_THROW(parseBackupConfig(configWithSets(
        R"({ "set-name": "r", "type": "remote dir", "source-dir": "/x", "remote-host": "h" })")),
        ConfigurationError);
    EXPECT_THROW(parseBackupConfig(configWithSets(
        R"({ "set-name": "r", "type": "remote dir", "source-dir": "/x", "remote-shell": "ssh" })")),
        ConfigurationError);
}

TEST(BackupConfigTest, RejectsUnknownType) {
    EXPECT_THROW(parseBackupConfig(configWithSets(
        R"({ "set-name": "s", "type": "tape", "source-dir": "/x" })")),
        ConfigurationError);
}

TEST(BackupConfigTest, RejectsRelativeSourceDir) {
    EXPECT_THROW(parseBackupConfig(configWithSets(
        R"({ "set-name": "s", "type": "local dir", "source-dir": "home" })")),
        ConfigurationError);
}

TEST(BackupConfigTest, RejectsInvalidSetNames) {
    const char* names[] = {"", ".", "..", "a/b", "backup.state", "backup.log"};
    for (const char* name : names) {
        std::string set = std::string(R"({ "set-name": ")") + name +
                          R"(", "type": "local dir", "source-dir": "/x" })";
        EXPECT_THROW(parseBackupConfig(configWithSets(set)), ConfigurationError) << "name: " << name;
    }
}

TEST(BackupConfigTest, RejectsDuplicateSetNames) {
    EXPECT_THROW(parseBackupConfig(configWithSets(
        R"({ "set-name": "s", "type": "local dir", "source-dir": "/x" },
           { "set-name": "s", "type": "local dir", "source-dir": "/y" })")),
        ConfigurationError);
}

TEST(BackupConfigTest, RejectsSkipEntriesWithSlash) {
    EXPECT_THROW(parseBackupConfig(configWithSets(
        R"({ "set-name": "s", "type": "local dir", "source-dir": "/x", "skip-entries": [ "a/b" ] })")),
        ConfigurationError);
    EXPECT_THROW(parseBackupConfig(configWithSets(
        R"({ "set-name": "s", "type": "local dir", "source-dir": "/x", "skip-entries": "tmp" })")),
        ConfigurationError);
}

TEST(BackupConfigTest, ParsesLogLevel) {
    BackupConfig config = parseBackupConfig(
        R"({ "version": "2.0", "backup-dir": "/b", "log-level": "debug", "backup-sets": [] })");
    EXPECT_EQ(config.logLevel, LogLevel::DEBUG);
    EXPECT_THROW(parseBackupConfig(
        R"({ "version": "2.0", "backup-dir": "/b", "log-level": "loud", "backup-sets": [] })"),
        ConfigurationError);
}

TEST(BackupConfigTest, LoadsFromFile) {
    testutil::TempDir dir;
    std::string path = dir / "backupbrace.conf";
    testutil::writeFile(path, configWithSets(R"({ "set-name": "etc", "type": "local dir", "source-dir": "/etc" })"));

    BackupConfig config = loadBackupConfig(path);
    ASSERT_EQ(config.backupSets.size(), 1u);
    EXPECT_EQ(config.backupSets[0].name, "etc");
}

TEST(BackupConfigTest, MissingFileIsConfigurationError) {
    testutil::TempDir dir;
    EXPECT_THROW(loadBackupConfig(dir / "missing.conf"), ConfigurationError);
}

TEST(BackupConfigTest, DescribesSources) {
    EXPECT_EQ(describeSource(LocalSource{"/home"}), "/home");
    EXPECT_EQ(describeSource(RemoteSource{"ssh", "web01", "/var/www"}), "web01:/var/www (via 'ssh')");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
