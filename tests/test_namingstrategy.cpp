/**
 * @file test_namingstrategy.cpp
 * @brief Unit tests for the naming strategies and conflict resolution
 *
 * ## Test Coverage
 *
 * ### Layouts
 * - Standard, minimal, detailed, anime and movie target paths
 * - Unknown fields default or drop out
 *
 * ### Sanitizing
 * - Invalid characters, whitespace collapsing, truncation
 *
 * ### Conflict Resolution
 * - Rename tiers: numbered, timestamp, random suffix
 * - Reserved paths are treated as taken
 * - BackupAndOverwrite snapshot, Skip and Overwrite passthrough
 *
 * ### Factory
 * - Case-insensitive creation, unknown names, descriptions
 *
 * @see NamingStrategy
 * @see NamingStrategyFactory
 */

#include <gtest/gtest.h>
#include "namingstrategy.hpp"
#include "organizererrors.hpp"

#include <filesystem>
#include <fstream>
#include <regex>

namespace fs = std::filesystem;

class NamingStrategyTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "mediasort_naming_test";
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

    static MediaMetadata episode() {
        MediaMetadata meta;
        meta.title = "Show Name";
        meta.season = 1;
        meta.episode = 2;
        meta.resolution = "1080p";
        meta.group = "Group";
        return meta;
    }
};

/**
 * @test StandardLayout
 * @brief Title/Season01/Title - S01E02 - [1080p].ext
 */
TEST_F(NamingStrategyTest, StandardLayout) {
    StandardNamingStrategy strategy;
    auto path = strategy.generateTargetPath("/in/x.mkv", episode(), "/lib");

    EXPECT_EQ(path, fs::path("/lib/Show Name/Season01/Show Name - S01E02 - [1080p].mkv"));
}

TEST_F(NamingStrategyTest, StandardLayoutWithYear) {
    MediaMetadata meta = episode();
    meta.year = 2020;

    StandardNamingStrategy strategy;
    auto path = strategy.generateTargetPath("/in/x.mkv", meta, "/lib");

    EXPECT_EQ(path, fs::path("/lib/Show Name/2020/Season01/Show Name - S01E02 - [1080p] - (2020).mkv"));
}

TEST_F(NamingStrategyTest, MinimalLayout) {
    MinimalNamingStrategy strategy;
    auto path = strategy.generateTargetPath("/in/x.mp4", episode(), "/lib");

    EXPECT_EQ(path, fs::path("/lib/Show Name/Season01/Show Name S01E02.mp4"));
}

TEST_F(NamingStrategyTest, DetailedLayoutAddsGroup) {
    DetailedNamingStrategy strategy;
    auto path = strategy.generateTargetPath("/in/x.mkv", episode(), "/lib");

    EXPECT_EQ(path.filename(), fs::path("Show Name - S01E02 - [1080p] - [Group].mkv"));
}

TEST_F(NamingStrategyTest, AnimeLayout) {
    MediaMetadata meta = episode();
    meta.title = "Frieren";
    meta.season.reset();
    meta.episode = 5;

    AnimeNamingStrategy strategy;
    auto path = strategy.generateTargetPath("/in/x.mkv", meta, "/lib");

    EXPECT_EQ(path, fs::path("/lib/Frieren/Season 1/Frieren - Episode 05 - [1080p] - [Group].mkv"));
}

TEST_F(NamingStrategyTest, MovieLayout) {
    MediaMetadata meta;
    meta.title = "Movie Title";
    meta.year = 2020;
    meta.resolution = "2160p";

    MovieNamingStrategy strategy;
    auto path = strategy.generateTargetPath("/in/m.mp4", meta, "/lib");

    EXPECT_EQ(path, fs::path("/lib/Movie Title/2020/Movie Title (2020) [2160p].mp4"));
}

/**
 * @test UnknownFieldsDefault
 * @brief Empty title is "Unknown"; missing season and episode are 1
 */
TEST_F(NamingStrategyTest, UnknownFieldsDefault) {
    StandardNamingStrategy strategy;
    auto path = strategy.generateTargetPath("/in/x.mkv", MediaMetadata{}, "/lib");

    EXPECT_EQ(path, fs::path("/lib/Unknown/Season01/Unknown - S01E01.mkv"));
}

TEST_F(NamingStrategyTest, SanitizesTitle) {
    StandardNamingStrategy strategy;

    EXPECT_EQ(strategy.sanitizeTitle("What? A/B: \"C\""), "What_ A_B_ _C_");
    EXPECT_EQ(strategy.sanitizeTitle("  many   spaces  "), "many spaces");
    EXPECT_EQ(strategy.sanitizeTitle(""), "Unknown");
}

TEST_F(NamingStrategyTest, TruncatesLongTitles) {
    NamingConfig config;
    config.maxTitleLength = 5;
    StandardNamingStrategy strategy(config);

    EXPECT_EQ(strategy.sanitizeTitle("Long Title"), "Long");
}

TEST_F(NamingStrategyTest, FreePathIsUnchanged) {
    StandardNamingStrategy strategy;
    fs::path target = test_dir / "free.mkv";

    for (auto resolution : {ConflictResolution::Skip, ConflictResolution::Rename,
                            ConflictResolution::Overwrite, ConflictResolution::BackupAndOverwrite}) {
        EXPECT_EQ(strategy.resolveConflict(target, resolution), target);
    }
}

/**
 * @test RenameUsesNumberedSuffix
 * @brief The first free "stem_N" wins
 */
TEST_F(NamingStrategyTest, RenameUsesNumberedSuffix) {
    StandardNamingStrategy strategy;
    fs::path target = test_dir / "ep.mkv";
    createFile(target, "a");
    createFile(test_dir / "ep_1.mkv", "b");

    EXPECT_EQ(strategy.resolveConflict(target, ConflictResolution::Rename), test_dir / "ep_2.mkv");
}

/**
 * @test RenameFallsBackToTimestamp
 * @brief Exhausted numbered names fall back to "stem_<unix time>"
 */
TEST_F(NamingStrategyTest, RenameFallsBackToTimestamp) {
    NamingConfig config;
    config.maxUniqueAttempts = 2;
    StandardNamingStrategy strategy(config);

    createFile(test_dir / "ep.mkv", "a");
    createFile(test_dir / "ep_1.mkv", "b");
    createFile(test_dir / "ep_2.mkv", "c");

    fs::path resolved = strategy.resolveConflict(test_dir / "ep.mkv", ConflictResolution::Rename);

    EXPECT_EQ(resolved.parent_path(), test_dir);
    EXPECT_TRUE(std::regex_match(resolved.filename().string(), std::regex(R"(ep_\d{9,}\.mkv)")))
        << resolved;
    EXPECT_FALSE(fs::exists(resolved));
}

TEST_F(NamingStrategyTest, RenameFallsBackToRandomSuffix) {
    NamingConfig config;
    config.maxUniqueAttempts = 1;
    config.enableTimestampFallback = false;
    StandardNamingStrategy strategy(config);

    createFile(test_dir / "ep.mkv", "a");
    createFile(test_dir / "ep_1.mkv", "b");

    fs::path resolved = strategy.resolveConflict(test_dir / "ep.mkv", ConflictResolution::Rename);

    EXPECT_TRUE(std::regex_match(resolved.filename().string(), std::regex(R"(ep_[0-9a-f]{8}\.mkv)")))
        << resolved;
}

TEST_F(NamingStrategyTest, ReservedPathsCountAsTaken) {
    StandardNamingStrategy strategy;
    fs::path target = test_dir / "ep.mkv";

    auto resolved = strategy.uniquePath(target, {target, test_dir / "ep_1.mkv"});

    EXPECT_EQ(resolved, test_dir / "ep_2.mkv");
}

TEST_F(NamingStrategyTest, SkipAndOverwriteKeepPath) {
    StandardNamingStrategy strategy;
    fs::path target = test_dir / "ep.mkv";
    createFile(target, "a");

    EXPECT_EQ(strategy.resolveConflict(target, ConflictResolution::Skip), target);
    EXPECT_EQ(strategy.resolveConflict(target, ConflictResolution::Overwrite), target);
}

/**
 * @test BackupAndOverwriteSnapshots
 * @brief The existing file is copied to "name.ext.backup_<unix time>"
 */
TEST_F(NamingStrategyTest, BackupAndOverwriteSnapshots) {
    StandardNamingStrategy strategy;
    fs::path target = test_dir / "ep.mkv";
    createFile(target, "original");

    EXPECT_EQ(strategy.resolveConflict(target, ConflictResolution::BackupAndOverwrite), target);

    int snapshots = 0;
    for (const auto& entry : fs::directory_iterator(test_dir)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind("ep.mkv.backup_", 0) == 0) {
            ++snapshots;
            std::ifstream in(entry.path());
            std::string content;
            std::getline(in, content);
            EXPECT_EQ(content, "original");
        }
    }
    EXPECT_EQ(snapshots, 1);
    EXPECT_TRUE(fs::exists(target));
}

TEST_F(NamingStrategyTest, FactoryIsCaseInsensitive) {
    auto strategy = NamingStrategyFactory::create("AnImE");
    EXPECT_EQ(strategy->name(), "anime");

    for (const auto& name : NamingStrategyFactory::availableStrategies()) {
        EXPECT_EQ(NamingStrategyFactory::create(name)->name(), name);
        EXPECT_NE(NamingStrategyFactory::description(name), "Unknown strategy");
    }
}

TEST_F(NamingStrategyTest, FactoryRejectsUnknownName) {
    EXPECT_THROW(NamingStrategyFactory::create("fancy"), ValidationError);
}

/**
 * @test FactoryAppliesLimits
 * @brief Attempt limits come from the overrides, layout from the strategy
 */
TEST_F(NamingStrategyTest, FactoryAppliesLimits) {
    NamingConfig overrides;
    overrides.maxUniqueAttempts = 3;
    overrides.useGroup = true;

    auto strategy = NamingStrategyFactory::create("minimal", overrides);

    EXPECT_EQ(strategy->config().maxUniqueAttempts, 3);
    EXPECT_FALSE(strategy->config().useGroup);
}
