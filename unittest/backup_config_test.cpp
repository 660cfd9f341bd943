#include <gtest/gtest.h>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include "backup_config.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

TEST(BackupConfigTest, DefaultsMatchDocumentedValues) {
    BackupConfig config;
    EXPECT_EQ(config.cronExpression, "0 0 */7 * *");
    EXPECT_EQ(config.maxBackups, 5);
    EXPECT_EQ(config.checkInterval, std::chrono::seconds(60));
    EXPECT_TRUE(config.backupPath.empty());
    EXPECT_EQ(fs::path(config.sourcePath), fs::current_path());
    EXPECT_TRUE(config.telegramConfig.empty());
}

TEST(BackupConfigTest, LoadsValuesFromFile) {
    TempDir temp;
    fs::path file = temp.path() / "autobackup_config.json";
    writeFile(file, R"({
        "source_path": "/srv/bot",
        "backup_path": "/var/backups/bot",
        "cron_expression": "30 2 * * *",
        "max_backups": 3,
        "exclude_dirs": ["build"],
        "exclude_extensions": [".bak"],
        "check_interval_seconds": 15
    })");

    BackupConfig config(file.string());
    EXPECT_EQ(config.sourcePath, "/srv/bot");
    EXPECT_EQ(config.getBackupDir(), "/var/backups/bot");
    EXPECT_EQ(config.cronExpression, "30 2 * * *");
    EXPECT_EQ(config.maxBackups, 3);
    EXPECT_EQ(config.checkInterval, std::chrono::seconds(15));

    auto rules = config.getExclusionRules();
    EXPECT_TRUE(rules.directoryNames.contains("build"));
    EXPECT_TRUE(rules.directoryNames.contains(".venv"));
    EXPECT_TRUE(rules.fileSuffixes.contains(".bak"));
    EXPECT_TRUE(rules.fileSuffixes.contains(".pyc"));
}

TEST(BackupConfigTest, MissingKeysKeepDefaults) {
    Json::Value json(Json::objectValue);
    json["source_path"] = "/srv/bot";

    BackupConfig config = BackupConfig::fromJson(json);
    EXPECT_EQ(config.cronExpression, "0 0 */7 * *");
    EXPECT_EQ(config.maxBackups, 5);
    EXPECT_TRUE(config.excludeDirs.empty());
}

TEST(BackupConfigTest, RejectsInvalidValues) {
    Json::Value zeroBackups(Json::objectValue);
    zeroBackups["max_backups"] = 0;
    EXPECT_THROW(BackupConfig::fromJson(zeroBackups), std::runtime_error);

    Json::Value zeroInterval(Json::objectValue);
    zeroInterval["check_interval_seconds"] = 0;
    EXPECT_THROW(BackupConfig::fromJson(zeroInterval), std::runtime_error);

    EXPECT_THROW(BackupConfig::fromJson(Json::Value(Json::arrayValue)), std::runtime_error);
}

TEST(BackupConfigTest, RejectsUnreadableOrMalformedFile) {
    TempDir temp;
    EXPECT_THROW(BackupConfig((temp.path() / "missing.json").string()), std::runtime_error);

    fs::path file = temp.path() / "broken.json";
    writeFile(file, "{ \"max_backups\": ");
    EXPECT_THROW(BackupConfig(file.string()), std::runtime_error);
}

TEST(BackupConfigTest, BackupDirDefaultsToParentOfSource) {
    BackupConfig config;
    config.sourcePath = "/srv/bot";
    EXPECT_EQ(config.getBackupDir(), "/srv");

    config.sourcePath = "/srv/bot/";
    EXPECT_EQ(config.getBackupDir(), "/srv");

    config.backupPath = "archives";
    EXPECT_EQ(config.getBackupDir(), "/srv/archives");

    config.backupPath = "/mnt/backups/";
    EXPECT_EQ(fs::path(config.getBackupDir()), fs::path("/mnt/backups/"));
}

TEST(BackupConfigTest, WritesLogEntriesToConfiguredFiles) {
    TempDir temp;
    BackupConfig config;
    config.logFile = (temp.path() / "backup.log").string();
    config.errorLogFile = (temp.path() / "errors.log").string();

    config.logMessage("hello");
    config.logWarning("careful");
    config.logError("broken");

    std::ifstream log(config.logFile);
    std::string contents((std::istreambuf_iterator<char>(log)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("hello"), std::string::npos);
    EXPECT_NE(contents.find("WARNING: careful"), std::string::npos);
    EXPECT_EQ(contents.find("broken"), std::string::npos);

    std::ifstream errors(config.errorLogFile);
    std::string errorContents((std::istreambuf_iterator<char>(errors)), std::istreambuf_iterator<char>());
    EXPECT_NE(errorContents.find("ERROR: broken"), std::string::npos);
}
