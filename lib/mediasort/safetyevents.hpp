/**
 * @file safetyevents.hpp
 * @brief Event payloads published on the EventBus
 */

#ifndef SAFETYEVENTS_HPP
#define SAFETYEVENTS_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "fileoperation.hpp"
#include "safetytypes.hpp"

struct BackupStartedEvent {
    std::string backupId;
    std::vector<std::filesystem::path> sourcePaths;
    BackupStrategy strategy = BackupStrategy::Copy;
};

struct BackupCompletedEvent {
    BackupInfo info;
    std::chrono::milliseconds duration{0};
};

struct BackupFailedEvent {
    std::string backupId;
    std::vector<std::filesystem::path> sourcePaths;
    BackupStrategy strategy = BackupStrategy::Copy;
    std::string errorMessage;
};

struct BackupCleanupEvent {
    std::vector<std::string> removedIds;
    std::uintmax_t freedBytes = 0;
};

struct ConfirmationRequiredEvent {
    ConfirmationRequest request;
};

struct ConfirmationResponseEvent {
    ConfirmationResponse response;
};

struct BatchOperationWarningEvent {
    SafetyOperation operationType = SafetyOperation::Batch;
    int fileCount = 0;
    std::uintmax_t totalSizeBytes = 0;
    RiskLevel riskLevel = RiskLevel::Low;
    std::string message;
    bool canProceed = true;
};

struct OperationInterruptRequestedEvent {
    std::string operationId;
    std::string operationType;
    InterruptionReason reason = InterruptionReason::UserRequest;
};

struct OperationInterruptedEvent {
    InterruptionResult result;
};

struct OperationResumeRequestedEvent {
    std::string originalOperationId;
    std::string newOperationId;
    int resumeFrom = 0;
};

struct SafetyModeChangedEvent {
    SafetyMode oldMode = SafetyMode::Normal;
    SafetyMode newMode = SafetyMode::Normal;
    std::string reason;
};

struct SafetyStatusUpdateEvent {
    SafetyStatus status;
};

struct SafetyAlertEvent {
    std::string alertType;
    std::string message;
    RiskLevel severity = RiskLevel::Medium;
    std::vector<std::string> recommendations;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @brief Preview published instead of executing while in Test or
 *        Simulation mode
 */
struct TestModeOperationEvent {
    SafetyOperation operationType = SafetyOperation::Move;
    std::vector<std::filesystem::path> files;
    SafetyMode mode = SafetyMode::Test;
    RiskLevel riskLevel = RiskLevel::Low;
    std::string simulatedResult;
};

struct FileProcessingProgressEvent {
    std::string operationId;
    BatchProgress progress;
};

#endif // SAFETYEVENTS_HPP
