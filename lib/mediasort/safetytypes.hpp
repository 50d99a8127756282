/**
 * @file safetytypes.hpp
 * @brief Value types shared between the safety components and their events
 */

#ifndef SAFETYTYPES_HPP
#define SAFETYTYPES_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Global operating mode of the SafetyCoordinator
 */
enum class SafetyMode {
    Normal,
    Safe,
    Test,
    Simulation,
    Emergency
};

enum class RiskLevel {
    Low,
    Medium,
    High
};

/**
 * @brief Operation vocabulary used for risk assessment and confirmation
 *
 * Wider than OperationType: Delete and Batch never reach the executor but
 * are assessed and confirmed like any other request.
 */
enum class SafetyOperation {
    Move,
    Copy,
    Delete,
    Rename,
    Batch
};

enum class BackupStrategy {
    Copy,
    Zip,
    Incremental,
    Mirror
};

/**
 * @brief Record of one backup artifact
 */
struct BackupInfo {
    std::string id;
    std::vector<std::filesystem::path> sourcePaths;
    std::filesystem::path location;
    std::chrono::system_clock::time_point createdAt;
    std::uintmax_t sizeBytes = 0;
    BackupStrategy strategy = BackupStrategy::Copy;
    int filesBackedUp = 0;
    std::string checksum;
    std::optional<int> compressionLevel;
    std::optional<std::string> baseBackupId; // incremental only
};

enum class ConfirmationSeverity {
    Info,
    Warning,
    Danger
};

enum class ConfirmationAction {
    Confirm,
    Cancel
};

enum class ConfirmationDecision {
    Confirm,
    Cancel,
    Timeout
};

struct ConfirmationRequest {
    std::string id;
    std::string title;
    std::string message;
    std::string details;
    ConfirmationSeverity severity = ConfirmationSeverity::Warning;
    SafetyOperation operationType = SafetyOperation::Move;
    std::vector<std::filesystem::path> affectedFiles;
    ConfirmationAction defaultAction = ConfirmationAction::Cancel;
    std::optional<std::chrono::milliseconds> timeout;
    bool autoConfirmOnTimeout = false;
    bool requiresConfirmation = true;
    std::chrono::system_clock::time_point createdAt = std::chrono::system_clock::now();
};

struct ConfirmationResponse {
    std::string id;
    ConfirmationDecision decision = ConfirmationDecision::Cancel;
    std::optional<std::string> comment;
    std::chrono::milliseconds responseTime{0};
    bool wasAutoResponse = false;
};

enum class InterruptionReason {
    UserRequest,
    SystemError,
    Timeout
};

/**
 * @brief Outcome of an interruption, published when the worker is done
 */
struct InterruptionResult {
    std::string operationId;
    std::string operationType;
    InterruptionReason reason = InterruptionReason::UserRequest;
    int filesProcessed = 0;
    int filesRemaining = 0;
    bool cleanupSuccessful = false;
    bool wasGraceful = true;
    std::optional<std::string> errorMessage;
    std::chrono::milliseconds cleanupTime{0};
    bool canResume = false;
};

/**
 * @brief Snapshot of the coordinator's state
 */
struct SafetyStatus {
    SafetyMode mode = SafetyMode::Normal;
    RiskLevel riskLevel = RiskLevel::Low;
    double safetyScore = 100.0;
    std::vector<std::string> warnings;
    bool canModifyFiles = true;
    bool confirmationRequired = false;
    bool backupRequired = false;
    bool isTestMode = false;
    bool isSimulationMode = false;
    std::chrono::system_clock::time_point lastUpdated;
};

std::string toString(SafetyMode mode);
std::string toString(RiskLevel level);
std::string toString(SafetyOperation operation);
std::string toString(BackupStrategy strategy);
std::string toString(InterruptionReason reason);

/**
 * @brief Parses a lower-case mode name ("normal", "safe", ...)
 * @return std::nullopt for unknown names
 */
std::optional<SafetyMode> parseSafetyMode(const std::string& name);
std::optional<SafetyOperation> parseSafetyOperation(const std::string& name);
std::optional<BackupStrategy> parseBackupStrategy(const std::string& name);

#endif // SAFETYTYPES_HPP
