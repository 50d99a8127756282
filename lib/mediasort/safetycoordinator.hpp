/**
 * @file safetycoordinator.hpp
 * @brief Mode state machine gating every file operation
 */

#ifndef SAFETYCOORDINATOR_HPP
#define SAFETYCOORDINATOR_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "backupmanager.hpp"
#include "confirmationmanager.hpp"
#include "eventbus.hpp"
#include "interruptionmanager.hpp"
#include "safetyevents.hpp"
#include "safetytypes.hpp"

struct SafetyConfig {
    SafetyMode defaultMode = SafetyMode::Normal;
    bool backupEnabled = true;
    bool backupBeforeOperations = false;
    bool confirmationRequired = false;
    bool autoConfirmLowRisk = true;
    std::chrono::milliseconds confirmationTimeout{30000};

    // File counts; more than highRiskThreshold files raises a safety alert
    int lowRiskThreshold = 10;
    int mediumRiskThreshold = 100;
    int highRiskThreshold = 1000;

    double lowRiskMaxTotalMb = 100.0;
    std::set<std::string> lowRiskExtensions{".txt", ".jpg", ".png", ".mp4", ".mkv"};

    // Records kept for getOperationStatistics(); the oldest are dropped
    std::size_t maxOperationHistory = 1000;
};

/**
 * @brief Fixed restrictions of one SafetyMode
 */
struct ModeRestrictions {
    bool canModifyFiles;
    bool requiresConfirmation;
    bool backupRequired;
};

ModeRestrictions restrictionsFor(SafetyMode mode);

enum class SafeOperationOutcome {
    Executed,
    Simulated,
    BlockedByPolicy,
    BackupFailed,
    ConfirmationDenied,
    CallbackFailed
};

std::string toString(SafeOperationOutcome outcome);

struct SafeOperationResult {
    SafeOperationOutcome outcome = SafeOperationOutcome::BlockedByPolicy;
    RiskLevel riskLevel = RiskLevel::Low;
    std::optional<std::string> backupId;
    std::optional<std::string> errorMessage;

    /// true for Executed (callback returned true) and Simulated
    bool success = false;
};

struct OperationStatistics {
    int totalOperations = 0;
    int successfulOperations = 0;
    int failedOperations = 0;
    double successRate = 0.0;
    int riskIncidents = 0;
    double safetyScore = 100.0;
    SafetyMode mode = SafetyMode::Normal;
};

/**
 * @class SafetyCoordinator
 * @brief Runs operations through risk assessment, backup and confirmation
 *
 * Mode changes are manual only. Every operation request goes through:
 * 1. Test and Simulation mode: publish a TestModeOperationEvent, never call
 *    the callback
 * 2. isOperationSafe()
 * 3. backup when the mode, the backupBeforeOperations flag, High risk or a
 *    Delete ask for it (and backups are enabled)
 * 4. confirmation when the mode or configuration require it; Low risk is
 *    decided by the auto-confirm rules when autoConfirmLowRisk is set
 * 5. the callback
 *
 * The safety score starts at 100 and moves by fixed weights, clamped to
 * [0, 100] after every change. Not thread-safe; use from one thread.
 */
class SafetyCoordinator {
public:
    static constexpr double SCORE_SUCCESS = 1.0;
    static constexpr double SCORE_FAILURE = -2.0;
    static constexpr double SCORE_BACKUP = 0.5;
    static constexpr double SCORE_CONFIRMATION = 0.3;
    static constexpr double SCORE_INCIDENT = -5.0;

    SafetyCoordinator(SafetyConfig config, BackupManager& backups,
                      ConfirmationManager& confirmations, InterruptionManager& interruptions,
                      EventBusPtr bus = nullptr);

    /// Initializes the backup manager and starts the interruption worker
    bool init();

    /// Shuts down the interruption manager
    void shutdown();

    /**
     * @brief Switches to @p mode
     * @return true; changing to the current mode does nothing
     */
    bool changeMode(SafetyMode mode, const std::string& reason = "");
    SafetyMode mode() const { return m_mode; }

    RiskLevel assessRisk(SafetyOperation operation,
                         const std::vector<std::filesystem::path>& files) const;

    /**
     * @brief Checks the mode and, for High risk, that confirmation is active
     */
    bool isOperationSafe(SafetyOperation operation,
                         const std::vector<std::filesystem::path>& files) const;

    /**
     * @brief Runs @p callback if policy allows
     *
     * @return true if the operation was simulated or the callback returned
     *         true. A throwing callback is logged and yields false.
     */
    bool requestSafeOperation(SafetyOperation operation,
                              const std::vector<std::filesystem::path>& files,
                              const std::function<bool()>& callback);

    /**
     * @brief requestSafeOperation() reporting why an operation did not run
     */
    SafeOperationResult requestSafeOperationDetailed(SafetyOperation operation,
                                                     const std::vector<std::filesystem::path>& files,
                                                     const std::function<bool()>& callback);

    /**
     * @brief Recomputes risk level and warnings and publishes the status
     */
    SafetyStatus getSafetyStatus();

    std::vector<std::string> getSafetyRecommendations() const;

    SafetyAlertEvent createSafetyAlert(const std::string& alertType, const std::string& message,
                                       RiskLevel severity,
                                       std::vector<std::string> recommendations = {});

    OperationStatistics getOperationStatistics() const;

    /// Restores the score to 100 and forgets the operation history
    void resetSafetyScore();

    double safetyScore() const { return m_status.safetyScore; }
    const SafetyConfig& config() const { return m_config; }

private:
    struct OperationRecord {
        SafetyOperation operation;
        std::size_t fileCount;
        bool success;
        std::chrono::system_clock::time_point timestamp;
        std::optional<std::string> error;
    };

    bool confirmationActive() const;
    bool shouldCreateBackup(SafetyOperation operation, RiskLevel risk) const;
    bool requestConfirmation(SafetyOperation operation,
                             const std::vector<std::filesystem::path>& files, RiskLevel risk);

    void applyMode(SafetyMode mode);
    void adjustScore(double delta);
    void recordOperation(SafetyOperation operation, std::size_t fileCount, bool success,
                         std::optional<std::string> error);
    void recordIncident();

    template <typename Event>
    void publish(const Event& event) const {
        if (m_bus)
            m_bus->publish(event);
    }

    SafetyConfig m_config;
    BackupManager& m_backups;
    ConfirmationManager& m_confirmations;
    InterruptionManager& m_interruptions;
    EventBusPtr m_bus;

    SafetyMode m_mode;
    SafetyStatus m_status;
    std::vector<OperationRecord> m_history;
    int m_incidents = 0;
};

#endif // SAFETYCOORDINATOR_HPP
