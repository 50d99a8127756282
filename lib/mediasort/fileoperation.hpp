/**
 * @file fileoperation.hpp
 * @brief Plan and result records exchanged by planner, executor and commands
 */

#ifndef FILEOPERATION_HPP
#define FILEOPERATION_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "metadataparser.hpp"
#include "organizererrors.hpp"

enum class OperationType {
    Copy,
    Move,
    Rename
};

enum class ConflictResolution {
    Skip,
    Overwrite,
    Rename,
    BackupAndOverwrite
};

/**
 * @brief One planned file operation
 *
 * Produced by OperationPlanner, consumed unchanged by OperationExecutor.
 */
struct OperationPlan {
    std::filesystem::path sourcePath;
    std::filesystem::path targetPath;
    OperationType operationType = OperationType::Move;
    ConflictResolution conflictResolution = ConflictResolution::Rename;
    std::uintmax_t estimatedSizeBytes = 0;
    MediaMetadata metadata;
};

/**
 * @brief Outcome of executing one OperationPlan
 *
 * targetPath is the path actually written, which differs from the planned
 * target when the executor had to re-resolve a conflict.
 */
struct OperationResult {
    bool success = false;
    bool skipped = false;
    std::filesystem::path sourcePath;
    std::filesystem::path targetPath;
    std::optional<std::filesystem::path> backupPath;
    std::uintmax_t actualSizeBytes = 0;
    std::chrono::milliseconds processingTime{0};
    std::optional<std::string> errorMessage;
    std::optional<ErrorKind> errorKind;
};

/**
 * @brief Progress snapshot emitted after every item of a batch
 */
struct BatchProgress {
    int current = 0;
    int total = 0;
    double percent = 0.0;
    std::filesystem::path currentFile;
    std::uintmax_t bytesProcessed = 0;
    std::uintmax_t totalBytes = 0;
    double megabytesPerSecond = 0.0;
    std::optional<double> etaSeconds;
    int successCount = 0;
    int errorCount = 0;
    int skippedCount = 0;
};

inline std::string toString(OperationType type) {
    switch (type) {
        case OperationType::Copy:   return "copy";
        case OperationType::Move:   return "move";
        case OperationType::Rename: return "rename";
    }
    return "unknown";
}

inline std::string toString(ConflictResolution resolution) {
    switch (resolution) {
        case ConflictResolution::Skip:               return "skip";
        case ConflictResolution::Overwrite:          return "overwrite";
        case ConflictResolution::Rename:             return "rename";
        case ConflictResolution::BackupAndOverwrite: return "backup_and_overwrite";
    }
    return "unknown";
}

#endif // FILEOPERATION_HPP
