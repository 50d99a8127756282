/**
 * @file operationexecutor.hpp
 * @brief Applies OperationPlans to the filesystem
 */

#ifndef OPERATIONEXECUTOR_HPP
#define OPERATIONEXECUTOR_HPP

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "cancellationtoken.hpp"
#include "fileoperation.hpp"
#include "namingstrategy.hpp"

struct ExecutorConfig {
    bool createDirectories = true;
    bool overwriteExisting = false;
    bool backupBeforeOperation = false;
};

/**
 * @brief Outcome of executeBatch()
 */
struct BatchResult {
    std::vector<OperationResult> results;
    bool cancelled = false;
    int successCount = 0;
    int errorCount = 0;
    int skippedCount = 0;
};

enum class SimulatedOutcome {
    Success,
    Conflict,
    Error
};

struct SimulatedItem {
    std::filesystem::path sourcePath;
    std::filesystem::path targetPath;
    SimulatedOutcome outcome = SimulatedOutcome::Success;
    std::string message;
};

struct SimulationReport {
    std::vector<SimulatedItem> items;
    int successCount = 0;
    int conflictCount = 0;
    int errorCount = 0;
    std::uintmax_t totalBytes = 0;
};

/**
 * @class OperationExecutor
 * @brief Executes single plans or whole batches
 *
 * execute() never throws: every failure becomes an OperationResult with
 * success == false, an error message and an ErrorKind. The target is
 * re-checked right before acting, so a file that appeared after planning is
 * never overwritten unless the plan and the configuration both allow it.
 */
class OperationExecutor {
public:
    using ProgressCallback = std::function<void(const BatchProgress&)>;

    OperationExecutor(const NamingStrategy& strategy, ExecutorConfig config = {});

    /**
     * @brief Executes one plan
     *
     * Steps:
     * 1. Source must exist
     * 2. Target directory is created if createDirectories is set
     * 3. Existing target: Skip reports a skipped success; an overwrite that is
     *    not allowed is re-resolved with Rename
     * 4. An overwritten target is snapshotted first when
     *    backupBeforeOperation is set or the plan asks for
     *    BackupAndOverwrite
     * 5. Copy, move or rename
     */
    OperationResult execute(const OperationPlan& plan) const;

    /**
     * @brief Executes @p plans in order without stopping on failures
     *
     * @param onProgress Called after every item, may be empty
     * @param token Checked before every item; once cancelled the remaining
     *        plans are left untouched
     */
    BatchResult executeBatch(const std::vector<OperationPlan>& plans,
                             const ProgressCallback& onProgress = nullptr,
                             const CancellationToken* token = nullptr) const;

    /**
     * @brief Classifies every plan without touching the filesystem
     */
    SimulationReport simulate(const std::vector<OperationPlan>& plans) const;

    const ExecutorConfig& config() const { return m_config; }

private:
    bool overwriteAllowed(const OperationPlan& plan) const;
    std::filesystem::path snapshot(const std::filesystem::path& target) const;
    void apply(OperationType type, const std::filesystem::path& source,
               const std::filesystem::path& target, bool overwrite) const;

    const NamingStrategy& m_strategy;
    ExecutorConfig m_config;
};

/**
 * @brief Moves @p source to @p target, copying across filesystems
 *
 * @throws std::filesystem::filesystem_error
 */
void moveFile(const std::filesystem::path& source, const std::filesystem::path& target);

/**
 * @brief Cross-device half of moveFile()
 *
 * Copies @p source to @p target, then calls @p removeSource on the source.
 * If that throws, the copy is deleted again and the error is rethrown, so
 * only the source is left.
 */
void copyThenRemove(const std::filesystem::path& source, const std::filesystem::path& target,
                    const std::function<void(const std::filesystem::path&)>& removeSource);

#endif // OPERATIONEXECUTOR_HPP
