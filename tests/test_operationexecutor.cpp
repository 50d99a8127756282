/**
 * @file test_operationexecutor.cpp
 * @brief Unit tests for OperationExecutor
 *
 * ## Test Coverage
 *
 * ### Single Plans
 * - Copy, move and rename outcomes on disk
 * - A cross-device move that cannot remove its source drops the copy
 * - Missing source and missing target directory errors
 * - Skip, disallowed overwrite (re-resolved), allowed overwrite
 * - Snapshot of an overwritten target
 *
 * ### Batches
 * - Progress callback per item, counters
 * - Cancellation leaves the remaining plans untouched
 *
 * ### Simulation
 * - Classification without touching the filesystem
 *
 * @see OperationExecutor
 */

#include <gtest/gtest.h>
#include "operationexecutor.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

class OperationExecutorTest : public ::testing::Test {
protected:
    fs::path test_dir;
    StandardNamingStrategy strategy;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "mediasort_executor_test";
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

    static std::string readFile(const fs::path& path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    OperationPlan makePlan(const std::string& source, const std::string& target,
                           OperationType type,
                           ConflictResolution resolution = ConflictResolution::Rename) {
        OperationPlan plan;
        plan.sourcePath = test_dir / source;
        plan.targetPath = test_dir / target;
        plan.operationType = type;
        plan.conflictResolution = resolution;
        std::error_code ec;
        auto size = fs::file_size(plan.sourcePath, ec);
        plan.estimatedSizeBytes = ec ? 0 : size;
        return plan;
    }
};

TEST_F(OperationExecutorTest, CopiesFile) {
    createFile(test_dir / "in" / "a.mkv", "payload");

    OperationExecutor executor(strategy);
    auto result = executor.execute(makePlan("in/a.mkv", "lib/Show/a.mkv", OperationType::Copy));

    ASSERT_TRUE(result.success) << result.errorMessage.value_or("");
    EXPECT_FALSE(result.skipped);
    EXPECT_TRUE(fs::exists(test_dir / "in" / "a.mkv"));
    EXPECT_EQ(readFile(test_dir / "lib" / "Show" / "a.mkv"), "payload");
    EXPECT_EQ(result.actualSizeBytes, 7u);
    EXPECT_EQ(result.targetPath, test_dir / "lib" / "Show" / "a.mkv");
}

TEST_F(OperationExecutorTest, MovesFile) {
    createFile(test_dir / "in" / "a.mkv", "payload");

    OperationExecutor executor(strategy);
    auto result = executor.execute(makePlan("in/a.mkv", "lib/a.mkv", OperationType::Move));

    ASSERT_TRUE(result.success);
    EXPECT_FALSE(fs::exists(test_dir / "in" / "a.mkv"));
    EXPECT_EQ(readFile(test_dir / "lib" / "a.mkv"), "payload");
}

TEST_F(OperationExecutorTest, CopyThenRemoveMovesFile) {
    createFile(test_dir / "a.mkv", "payload");

    copyThenRemove(test_dir / "a.mkv", test_dir / "b.mkv",
                   [](const fs::path& path) { fs::remove(path); });

    EXPECT_FALSE(fs::exists(test_dir / "a.mkv"));
    EXPECT_EQ(readFile(test_dir / "b.mkv"), "payload");
}

/**
 * @test CopyThenRemoveKeepsOnlySourceWhenRemoveFails
 * @brief A source that cannot be removed leaves no second copy behind
 */
TEST_F(OperationExecutorTest, CopyThenRemoveKeepsOnlySourceWhenRemoveFails) {
    createFile(test_dir / "a.mkv", "payload");

    auto refuse = [](const fs::path& path) {
        throw fs::filesystem_error("remove", path,
                                   std::make_error_code(std::errc::permission_denied));
    };
    EXPECT_THROW(copyThenRemove(test_dir / "a.mkv", test_dir / "b.mkv", refuse),
                 fs::filesystem_error);

    EXPECT_EQ(readFile(test_dir / "a.mkv"), "payload");
    EXPECT_FALSE(fs::exists(test_dir / "b.mkv"));
}

TEST_F(OperationExecutorTest, RenamesFile) {
    createFile(test_dir / "a.mkv", "payload");

    OperationExecutor executor(strategy);
    auto result = executor.execute(makePlan("a.mkv", "b.mkv", OperationType::Rename));

    ASSERT_TRUE(result.success);
    EXPECT_FALSE(fs::exists(test_dir / "a.mkv"));
    EXPECT_TRUE(fs::exists(test_dir / "b.mkv"));
}

TEST_F(OperationExecutorTest, ReportsMissingSource) {
    OperationExecutor executor(strategy);
    auto result = executor.execute(makePlan("nope.mkv", "lib/nope.mkv", OperationType::Copy));

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.errorKind.has_value());
    EXPECT_EQ(*result.errorKind, ErrorKind::Validation);
    EXPECT_TRUE(result.errorMessage.has_value());
}

TEST_F(OperationExecutorTest, RequiresTargetDirectoryWhenNotCreating) {
    createFile(test_dir / "a.mkv", "x");

    ExecutorConfig config;
    config.createDirectories = false;
    OperationExecutor executor(strategy, config);
    auto result = executor.execute(makePlan("a.mkv", "missing/a.mkv", OperationType::Copy));

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.errorKind == ErrorKind::Validation);
    EXPECT_FALSE(fs::exists(test_dir / "missing"));
}

TEST_F(OperationExecutorTest, SkipsExistingTarget) {
    createFile(test_dir / "a.mkv", "new");
    createFile(test_dir / "lib" / "a.mkv", "old");

    OperationExecutor executor(strategy);
    auto result = executor.execute(
        makePlan("a.mkv", "lib/a.mkv", OperationType::Move, ConflictResolution::Skip));

    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.skipped);
    EXPECT_TRUE(fs::exists(test_dir / "a.mkv"));
    EXPECT_EQ(readFile(test_dir / "lib" / "a.mkv"), "old");
}

/**
 * @test ReResolvesTargetThatAppearedAfterPlanning
 * @brief Overwrite without overwriteExisting never clobbers the target
 */
TEST_F(OperationExecutorTest, ReResolvesTargetThatAppearedAfterPlanning) {
    createFile(test_dir / "a.mkv", "new");
    createFile(test_dir / "lib" / "a.mkv", "old");

    OperationExecutor executor(strategy);
    auto result = executor.execute(
        makePlan("a.mkv", "lib/a.mkv", OperationType::Copy, ConflictResolution::Overwrite));

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.targetPath, test_dir / "lib" / "a_1.mkv");
    EXPECT_EQ(readFile(test_dir / "lib" / "a.mkv"), "old");
    EXPECT_EQ(readFile(test_dir / "lib" / "a_1.mkv"), "new");
}

TEST_F(OperationExecutorTest, OverwritesWhenAllowed) {
    createFile(test_dir / "a.mkv", "new");
    createFile(test_dir / "lib" / "a.mkv", "old");

    ExecutorConfig config;
    config.overwriteExisting = true;
    OperationExecutor executor(strategy, config);
    auto result = executor.execute(
        makePlan("a.mkv", "lib/a.mkv", OperationType::Copy, ConflictResolution::Overwrite));

    ASSERT_TRUE(result.success);
    EXPECT_EQ(readFile(test_dir / "lib" / "a.mkv"), "new");
    EXPECT_FALSE(result.backupPath.has_value());
}

/**
 * @test SnapshotsBeforeOverwrite
 * @brief BackupAndOverwrite keeps the old content next to the target
 */
TEST_F(OperationExecutorTest, SnapshotsBeforeOverwrite) {
    createFile(test_dir / "a.mkv", "new");
    createFile(test_dir / "lib" / "a.mkv", "old");

    OperationExecutor executor(strategy);
    auto result = executor.execute(makePlan("a.mkv", "lib/a.mkv", OperationType::Move,
                                            ConflictResolution::BackupAndOverwrite));

    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.backupPath.has_value());
    EXPECT_EQ(readFile(*result.backupPath), "old");
    EXPECT_EQ(readFile(test_dir / "lib" / "a.mkv"), "new");
    EXPECT_EQ(result.backupPath->filename().string().rfind("a.mkv.backup_", 0), 0u);
}

TEST_F(OperationExecutorTest, RejectsOverwritingSourceWithItself) {
    createFile(test_dir / "a.mkv", "x");

    ExecutorConfig config;
    config.overwriteExisting = true;
    OperationExecutor executor(strategy, config);
    auto result = executor.execute(
        makePlan("a.mkv", "a.mkv", OperationType::Copy, ConflictResolution::Overwrite));

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.errorKind == ErrorKind::Conflict);
    EXPECT_EQ(readFile(test_dir / "a.mkv"), "x");
}

/**
 * @test BatchContinuesPastFailures
 * @brief One failing item does not stop the rest; progress fires per item
 */
TEST_F(OperationExecutorTest, BatchContinuesPastFailures) {
    createFile(test_dir / "a.mkv", "aa");
    createFile(test_dir / "c.mkv", "cc");
    createFile(test_dir / "lib" / "d.mkv", "old");
    createFile(test_dir / "d.mkv", "dd");

    std::vector<OperationPlan> plans = {
        makePlan("a.mkv", "lib/a.mkv", OperationType::Copy),
        makePlan("b.mkv", "lib/b.mkv", OperationType::Copy),
        makePlan("c.mkv", "lib/c.mkv", OperationType::Copy),
        makePlan("d.mkv", "lib/d.mkv", OperationType::Copy, ConflictResolution::Skip),
    };

    std::vector<BatchProgress> updates;
    OperationExecutor executor(strategy);
    auto batch = executor.executeBatch(plans, [&](const BatchProgress& p) { updates.push_back(p); });

    EXPECT_FALSE(batch.cancelled);
    EXPECT_EQ(batch.results.size(), 4u);
    EXPECT_EQ(batch.successCount, 2);
    EXPECT_EQ(batch.errorCount, 1);
    EXPECT_EQ(batch.skippedCount, 1);

    ASSERT_EQ(updates.size(), 4u);
    EXPECT_EQ(updates.back().current, 4);
    EXPECT_EQ(updates.back().total, 4);
    EXPECT_DOUBLE_EQ(updates.back().percent, 100.0);
    EXPECT_EQ(updates.back().bytesProcessed, 4u);
    EXPECT_EQ(updates[1].errorCount, 1);
}

TEST_F(OperationExecutorTest, BatchStopsWhenCancelled) {
    createFile(test_dir / "a.mkv", "a");
    createFile(test_dir / "b.mkv", "b");
    createFile(test_dir / "c.mkv", "c");

    std::vector<OperationPlan> plans = {
        makePlan("a.mkv", "lib/a.mkv", OperationType::Move),
        makePlan("b.mkv", "lib/b.mkv", OperationType::Move),
        makePlan("c.mkv", "lib/c.mkv", OperationType::Move),
    };

    CancellationToken token;
    OperationExecutor executor(strategy);
    auto batch = executor.executeBatch(
        plans, [&](const BatchProgress& p) { if (p.current == 1) token.cancel(); }, &token);

    EXPECT_TRUE(batch.cancelled);
    EXPECT_EQ(batch.results.size(), 1u);
    EXPECT_TRUE(fs::exists(test_dir / "lib" / "a.mkv"));
    EXPECT_TRUE(fs::exists(test_dir / "b.mkv"));
    EXPECT_TRUE(fs::exists(test_dir / "c.mkv"));
}

/**
 * @test SimulationDoesNotTouchFilesystem
 * @brief simulate() classifies success, conflict and error only
 */
TEST_F(OperationExecutorTest, SimulationDoesNotTouchFilesystem) {
    createFile(test_dir / "a.mkv", "aaaa");
    createFile(test_dir / "b.mkv", "b");
    createFile(test_dir / "lib" / "b.mkv", "old");

    std::vector<OperationPlan> plans = {
        makePlan("a.mkv", "lib/a.mkv", OperationType::Move),
        makePlan("b.mkv", "lib/b.mkv", OperationType::Move),
        makePlan("missing.mkv", "lib/m.mkv", OperationType::Move),
    };

    OperationExecutor executor(strategy);
    auto report = executor.simulate(plans);

    ASSERT_EQ(report.items.size(), 3u);
    EXPECT_EQ(report.items[0].outcome, SimulatedOutcome::Success);
    EXPECT_EQ(report.items[1].outcome, SimulatedOutcome::Conflict);
    EXPECT_EQ(report.items[2].outcome, SimulatedOutcome::Error);
    EXPECT_EQ(report.successCount, 1);
    EXPECT_EQ(report.conflictCount, 1);
    EXPECT_EQ(report.errorCount, 1);
    EXPECT_EQ(report.totalBytes, 4u);

    EXPECT_TRUE(fs::exists(test_dir / "a.mkv"));
    EXPECT_FALSE(fs::exists(test_dir / "lib" / "a.mkv"));
    EXPECT_EQ(readFile(test_dir / "lib" / "b.mkv"), "old");
}
