/**
 * @file test_organizerconfig.cpp
 * @brief Unit tests for the YAML configuration
 *
 * ## Test Coverage
 *
 * - Defaults for missing sections and keys
 * - Parsing of every section
 * - Rejection of invalid values
 * - saveConfig / loadConfig keeps the values
 */

#include <gtest/gtest.h>
#include "organizerconfig.hpp"
#include "organizererrors.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class OrganizerConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "mediasort_config_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    void createFile(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream file(path);
        file << content;
    }
};

TEST_F(OrganizerConfigTest, EmptyDocumentKeepsDefaults) {
    OrganizerConfig cfg = configFromYaml(YAML::Load(""));

    EXPECT_EQ(cfg.safety.defaultMode, SafetyMode::Normal);
    EXPECT_TRUE(cfg.safety.backupEnabled);
    EXPECT_EQ(cfg.backup.defaultStrategy, BackupStrategy::Copy);
    EXPECT_EQ(cfg.backup.compressionLevel, 6);
    EXPECT_EQ(cfg.interruption.pollInterval, 100ms);
    EXPECT_EQ(cfg.namingStrategy, "standard");
    EXPECT_EQ(cfg.maxHistorySize, 100u);
    EXPECT_EQ(cfg.logging.level, "info");
}

/**
 * @test ParsesAllSections
 * @brief Every section of a full document reaches its component config
 */
TEST_F(OrganizerConfigTest, ParsesAllSections) {
    OrganizerConfig cfg = configFromYaml(YAML::Load(R"(
safety:
  default_mode: safe
  backup_enabled: false
  confirmation_required: true
  confirmation_timeout_seconds: 1.5
  low_risk_threshold: 5
  medium_risk_threshold: 50
  high_risk_threshold: 500
  low_risk_extensions: [MKV, mp4]
  max_operation_history: 50
backup:
  directory: /srv/media/backups
  default_strategy: zip
  compression_level: 9
  max_backup_count: 7
  verify_backups: true
interruption:
  poll_interval_ms: 25
  graceful_shutdown_timeout_seconds: 2
  force_interrupt_after_timeout: false
naming:
  strategy: Anime
  max_unique_attempts: 10
  enable_timestamp_fallback: false
organizer:
  video_extensions: [mkv, .avi]
  min_file_size: 1048576
  create_directories: false
  max_history_size: 20
logging:
  level: debug
  file: /var/log/mediasort.log
  console: false
)"));

    EXPECT_EQ(cfg.safety.defaultMode, SafetyMode::Safe);
    EXPECT_FALSE(cfg.safety.backupEnabled);
    EXPECT_TRUE(cfg.safety.confirmationRequired);
    EXPECT_EQ(cfg.safety.confirmationTimeout, 1500ms);
    EXPECT_EQ(cfg.confirmation.defaultTimeout, 1500ms);
    EXPECT_EQ(cfg.safety.lowRiskThreshold, 5);
    EXPECT_EQ(cfg.safety.lowRiskExtensions, (std::set<std::string>{".mkv", ".mp4"}));
    EXPECT_EQ(cfg.safety.maxOperationHistory, 50u);

    EXPECT_EQ(cfg.backup.backupRoot, fs::path("/srv/media/backups"));
    EXPECT_EQ(cfg.backup.defaultStrategy, BackupStrategy::Zip);
    EXPECT_EQ(cfg.backup.compressionLevel, 9);
    EXPECT_EQ(cfg.backup.maxBackupCount, 7u);
    EXPECT_TRUE(cfg.backup.verifyAfterCreate);

    EXPECT_EQ(cfg.interruption.pollInterval, 25ms);
    EXPECT_EQ(cfg.interruption.gracefulShutdownTimeout, 2000ms);
    EXPECT_FALSE(cfg.interruption.forceInterruptAfterTimeout);

    EXPECT_EQ(cfg.namingStrategy, "anime");
    EXPECT_EQ(cfg.naming.maxUniqueAttempts, 10);
    EXPECT_FALSE(cfg.naming.enableTimestampFallback);

    EXPECT_EQ(cfg.planner.videoExtensions, (std::set<std::string>{".avi", ".mkv"}));
    EXPECT_EQ(cfg.planner.minFileSize, 1048576u);
    EXPECT_FALSE(cfg.executor.createDirectories);
    EXPECT_EQ(cfg.maxHistorySize, 20u);

    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.logging.file, fs::path("/var/log/mediasort.log"));
    EXPECT_FALSE(cfg.logging.console);
}

TEST_F(OrganizerConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(configFromYaml(YAML::Load("safety: {default_mode: reckless}")), ValidationError);
    EXPECT_THROW(configFromYaml(YAML::Load("safety: {low_risk_threshold: 500, medium_risk_threshold: 50}")),
                 ValidationError);
    EXPECT_THROW(configFromYaml(YAML::Load("backup: {compression_level: 12}")), ValidationError);
    EXPECT_THROW(configFromYaml(YAML::Load("backup: {default_strategy: tape}")), ValidationError);
    EXPECT_THROW(configFromYaml(YAML::Load("interruption: {poll_interval_ms: 0}")), ValidationError);
    EXPECT_THROW(configFromYaml(YAML::Load("naming: {strategy: fancy}")), ValidationError);
    EXPECT_THROW(configFromYaml(YAML::Load("organizer: {max_history_size: 0}")), ValidationError);
    EXPECT_THROW(configFromYaml(YAML::Load("safety: {max_operation_history: 0}")), ValidationError);
    EXPECT_THROW(configFromYaml(YAML::Load("organizer: {min_file_size: lots}")), ValidationError);
    EXPECT_THROW(configFromYaml(YAML::Load("- just\n- a list\n")), ValidationError);
}

TEST_F(OrganizerConfigTest, LoadConfigReportsUnreadableFiles) {
    EXPECT_THROW(loadConfig(test_dir / "missing.yaml"), ValidationError);

    createFile(test_dir / "broken.yaml", "safety: [unclosed\n");
    EXPECT_THROW(loadConfig(test_dir / "broken.yaml"), ValidationError);
}

/**
 * @test SavedConfigLoadsBack
 * @brief Values written by saveConfig() are read back by loadConfig()
 */
TEST_F(OrganizerConfigTest, SavedConfigLoadsBack) {
    OrganizerConfig cfg;
    cfg.safety.defaultMode = SafetyMode::Simulation;
    cfg.backup.defaultStrategy = BackupStrategy::Incremental;
    cfg.backup.backupRoot = test_dir / "backups";
    cfg.interruption.pollInterval = 50ms;
    cfg.namingStrategy = "movie";
    cfg.planner.minFileSize = 4096;
    cfg.maxHistorySize = 3;

    const fs::path path = test_dir / "config.yaml";
    ASSERT_TRUE(saveConfig(cfg, path));

    OrganizerConfig loaded = loadConfig(path);
    EXPECT_EQ(loaded.safety.defaultMode, SafetyMode::Simulation);
    EXPECT_EQ(loaded.backup.defaultStrategy, BackupStrategy::Incremental);
    EXPECT_EQ(loaded.backup.backupRoot, test_dir / "backups");
    EXPECT_EQ(loaded.interruption.pollInterval, 50ms);
    EXPECT_EQ(loaded.namingStrategy, "movie");
    EXPECT_EQ(loaded.planner.minFileSize, 4096u);
    EXPECT_EQ(loaded.maxHistorySize, 3u);
    EXPECT_EQ(loaded.planner.videoExtensions, cfg.planner.videoExtensions);
}

TEST_F(OrganizerConfigTest, SaveConfigFailsForMissingDirectory) {
    EXPECT_FALSE(saveConfig(OrganizerConfig{}, test_dir / "no" / "such" / "dir" / "config.yaml"));
}
