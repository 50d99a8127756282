/**
 * @file operationexecutor.cpp
 * @brief Applies operation plans to the filesystem
 */

#include "operationexecutor.hpp"

#include <chrono>
#include <system_error>

#include "logging.hpp"
#include "organizererrors.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

void moveFile(const fs::path& source, const fs::path& target) {
    std::error_code ec;
    fs::rename(source, target, ec);
    if (!ec)
        return;

    if (ec != std::errc::cross_device_link)
        throw fs::filesystem_error("move failed", source, target, ec);

    copyThenRemove(source, target, [](const fs::path& path) { fs::remove(path); });
}

void copyThenRemove(const fs::path& source, const fs::path& target,
                    const std::function<void(const fs::path&)>& removeSource) {
    fs::copy_file(source, target, fs::copy_options::overwrite_existing);
    try {
        removeSource(source);
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove(target, ec);
        if (ec)
            MEDIASORT_LOG_ERROR("Could not remove copy {} after a failed move: {}", target.string(),
                                ec.message());
        throw fs::filesystem_error("move failed, source not removed", source, target, e.code());
    }
}

OperationExecutor::OperationExecutor(const NamingStrategy& strategy, ExecutorConfig config)
    : m_strategy(strategy), m_config(config) {}

bool OperationExecutor::overwriteAllowed(const OperationPlan& plan) const {
    switch (plan.conflictResolution) {
        case ConflictResolution::BackupAndOverwrite:
            return true;
        case ConflictResolution::Overwrite:
            return m_config.overwriteExisting;
        default:
            return false;
    }
}

fs::path OperationExecutor::snapshot(const fs::path& target) const {
    fs::path backup = target;
    backup += ".backup_" + timestampString();
    backup = m_strategy.uniquePath(backup);

    std::error_code ec;
    fs::copy_file(target, backup, fs::copy_options::none, ec);
    if (ec)
        throw BackupError("Could not back up " + target.string() + ": " + ec.message());

    MEDIASORT_LOG_INFO("Backed up existing target to {}", backup.string());
    return backup;
}

void OperationExecutor::apply(OperationType type, const fs::path& source,
                              const fs::path& target, bool overwrite) const {
    switch (type) {
        case OperationType::Copy:
            fs::copy_file(source, target,
                          overwrite ? fs::copy_options::overwrite_existing
                                    : fs::copy_options::none);
            break;
        case OperationType::Move:
        case OperationType::Rename:
            moveFile(source, target);
            break;
    }
}

OperationResult OperationExecutor::execute(const OperationPlan& plan) const {
    const auto started = std::chrono::steady_clock::now();

    OperationResult result;
    result.sourcePath = plan.sourcePath;
    result.targetPath = plan.targetPath;

    auto finish = [&started](OperationResult& r) -> OperationResult {
        r.processingTime = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        return r;
    };

    try {
        std::error_code ec;
        if (!fs::is_regular_file(plan.sourcePath, ec))
            throw ValidationError("Source file does not exist: " + plan.sourcePath.string());

        fs::path target = plan.targetPath;
        const fs::path parent = target.parent_path();
        if (!parent.empty() && !fs::exists(parent, ec)) {
            if (!m_config.createDirectories)
                throw ValidationError("Target directory does not exist: " + parent.string());
            fs::create_directories(parent);
        }

        bool overwrite = false;
        if (fs::exists(target, ec)) {
            if (plan.conflictResolution == ConflictResolution::Skip) {
                MEDIASORT_LOG_INFO("Target exists, skipped: {}", target.string());
                result.success = true;
                result.skipped = true;
                return finish(result);
            }

            if (overwriteAllowed(plan)) {
                overwrite = true;
                if (m_config.backupBeforeOperation ||
                    plan.conflictResolution == ConflictResolution::BackupAndOverwrite) {
                    result.backupPath = snapshot(target);
                }
            } else {
                fs::path renamed = m_strategy.uniquePath(target);
                MEDIASORT_LOG_INFO("Target {} appeared after planning, using {}",
                                   target.string(), renamed.string());
                target = renamed;
            }
        }

        if (fs::equivalent(plan.sourcePath, target, ec))
            throw ConflictError("Source and target are the same file: " + target.string());

        apply(plan.operationType, plan.sourcePath, target, overwrite);

        result.targetPath = target;
        result.actualSizeBytes = fs::file_size(target);
        result.success = true;
        MEDIASORT_LOG_DEBUG("{} {} -> {}", toString(plan.operationType),
                            plan.sourcePath.string(), target.string());
    } catch (const OrganizerError& e) {
        result.success = false;
        result.errorMessage = e.what();
        result.errorKind = e.kind();
        MEDIASORT_LOG_ERROR("{} of {} failed: {}", toString(plan.operationType),
                            plan.sourcePath.string(), e.what());
    } catch (const fs::filesystem_error& e) {
        result.success = false;
        result.errorMessage = e.what();
        result.errorKind = ErrorKind::Execution;
        MEDIASORT_LOG_ERROR("{} of {} failed: {}", toString(plan.operationType),
                            plan.sourcePath.string(), e.what());
    }

    return finish(result);
}

BatchResult OperationExecutor::executeBatch(const std::vector<OperationPlan>& plans,
                                            const ProgressCallback& onProgress,
                                            const CancellationToken* token) const {
    BatchResult batch;
    const auto started = std::chrono::steady_clock::now();
    const int total = static_cast<int>(plans.size());

    BatchProgress progress;
    progress.total = total;
    for (const auto& plan : plans)
        progress.totalBytes += plan.estimatedSizeBytes;

    for (int i = 0; i < total; ++i) {
        if (token && token->isCancelled()) {
            batch.cancelled = true;
            MEDIASORT_LOG_WARN("Batch cancelled after {} of {} items", i, total);
            break;
        }

        const OperationPlan& plan = plans[static_cast<std::size_t>(i)];
        OperationResult result = execute(plan);

        if (result.skipped) {
            ++batch.skippedCount;
        } else if (result.success) {
            ++batch.successCount;
            progress.bytesProcessed += result.actualSizeBytes;
        } else {
            ++batch.errorCount;
        }
        batch.results.push_back(result);

        const double elapsed = std::chrono::duration<double>(
                                   std::chrono::steady_clock::now() - started).count();
        progress.current = i + 1;
        progress.percent = static_cast<double>(i + 1) / total * 100.0;
        progress.currentFile = plan.sourcePath;
        progress.successCount = batch.successCount;
        progress.errorCount = batch.errorCount;
        progress.skippedCount = batch.skippedCount;

        const double bytesPerSecond =
            elapsed > 0.0 ? static_cast<double>(progress.bytesProcessed) / elapsed : 0.0;
        progress.megabytesPerSecond = bytesPerSecond / (1024.0 * 1024.0);
        if (bytesPerSecond > 0.0 && progress.totalBytes >= progress.bytesProcessed) {
            progress.etaSeconds =
                static_cast<double>(progress.totalBytes - progress.bytesProcessed) / bytesPerSecond;
        } else {
            progress.etaSeconds.reset();
        }

        if (onProgress)
            onProgress(progress);
    }

    MEDIASORT_LOG_INFO("Batch finished: {} succeeded, {} failed, {} skipped{}",
                       batch.successCount, batch.errorCount, batch.skippedCount,
                       batch.cancelled ? " (cancelled)" : "");
    return batch;
}

SimulationReport OperationExecutor::simulate(const std::vector<OperationPlan>& plans) const {
    SimulationReport report;

    for (const auto& plan : plans) {
        SimulatedItem item;
        item.sourcePath = plan.sourcePath;
        item.targetPath = plan.targetPath;

        std::error_code ec;
        if (!fs::is_regular_file(plan.sourcePath, ec)) {
            item.outcome = SimulatedOutcome::Error;
            item.message = "Source file does not exist";
            ++report.errorCount;
        } else if (fs::exists(plan.targetPath, ec)) {
            item.outcome = SimulatedOutcome::Conflict;
            item.message = "Target exists, resolution: " + toString(plan.conflictResolution);
            ++report.conflictCount;
        } else {
            item.outcome = SimulatedOutcome::Success;
            item.message = toString(plan.operationType) + " " + formatBytes(
                static_cast<long long>(plan.estimatedSizeBytes));
            ++report.successCount;
            report.totalBytes += plan.estimatedSizeBytes;
        }
        report.items.push_back(item);
    }

    return report;
}
