/**
 * @file safetycoordinator.cpp
 */

#include "safetycoordinator.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <system_error>

#include <spdlog/fmt/fmt.h>

#include "filesafety.hpp"
#include "logging.hpp"

namespace fs = std::filesystem;

ModeRestrictions restrictionsFor(SafetyMode mode) {
    switch (mode) {
        case SafetyMode::Normal:     return {true, false, false};
        case SafetyMode::Safe:       return {true, true, true};
        case SafetyMode::Test:       return {false, false, false};
        case SafetyMode::Simulation: return {false, false, false};
        case SafetyMode::Emergency:  return {false, true, true};
    }
    return {false, true, true};
}

std::string toString(SafeOperationOutcome outcome) {
    switch (outcome) {
        case SafeOperationOutcome::Executed:           return "executed";
        case SafeOperationOutcome::Simulated:          return "simulated";
        case SafeOperationOutcome::BlockedByPolicy:    return "blocked_by_policy";
        case SafeOperationOutcome::BackupFailed:       return "backup_failed";
        case SafeOperationOutcome::ConfirmationDenied: return "confirmation_denied";
        case SafeOperationOutcome::CallbackFailed:     return "callback_failed";
    }
    return "unknown";
}

namespace {

double riskMultiplier(SafetyOperation operation) {
    switch (operation) {
        case SafetyOperation::Delete: return 2.0;
        case SafetyOperation::Move:   return 1.0;
        case SafetyOperation::Copy:   return 0.8;
        case SafetyOperation::Rename: return 0.5;
        case SafetyOperation::Batch:  return 1.5;
    }
    return 1.0;
}

std::string lowerExtension(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

SafetyCoordinator::SafetyCoordinator(SafetyConfig config, BackupManager& backups,
                                     ConfirmationManager& confirmations,
                                     InterruptionManager& interruptions, EventBusPtr bus)
    : m_config(std::move(config)),
      m_backups(backups),
      m_confirmations(confirmations),
      m_interruptions(interruptions),
      m_bus(std::move(bus)),
      m_mode(m_config.defaultMode) {
    applyMode(m_mode);
}

bool SafetyCoordinator::init() {
    const bool backupsReady = m_backups.init();
    if (!backupsReady)
        MEDIASORT_LOG_ERROR("Backup manager failed to initialize at {}",
                            m_backups.config().backupRoot.string());
    m_interruptions.start();
    MEDIASORT_LOG_INFO("Safety coordinator ready in {} mode", toString(m_mode));
    return backupsReady;
}

void SafetyCoordinator::shutdown() {
    MEDIASORT_LOG_INFO("Safety coordinator shutting down");
    m_interruptions.shutdown();
}

void SafetyCoordinator::applyMode(SafetyMode mode) {
    const ModeRestrictions restrictions = restrictionsFor(mode);
    m_mode = mode;
    m_status.mode = mode;
    m_status.canModifyFiles = restrictions.canModifyFiles;
    m_status.confirmationRequired = restrictions.requiresConfirmation || m_config.confirmationRequired;
    m_status.backupRequired = restrictions.backupRequired;
    m_status.isTestMode = mode == SafetyMode::Test;
    m_status.isSimulationMode = mode == SafetyMode::Simulation;
    m_status.lastUpdated = std::chrono::system_clock::now();
}

bool SafetyCoordinator::changeMode(SafetyMode mode, const std::string& reason) {
    if (mode == m_mode)
        return true;

    const SafetyMode previous = m_mode;
    applyMode(mode);

    MEDIASORT_LOG_INFO("Safety mode changed: {} -> {}{}", toString(previous), toString(mode),
                       reason.empty() ? "" : " (" + reason + ")");
    publish(SafetyModeChangedEvent{previous, mode, reason});
    return true;
}

bool SafetyCoordinator::confirmationActive() const {
    return m_status.confirmationRequired;
}

/**
 * @brief Classifies an operation as Low, Medium or High risk
 *
 * The file count selects the base bucket. A Low bucket becomes Medium when a
 * file has an extension outside lowRiskExtensions or the total size exceeds
 * lowRiskMaxTotalMb. Any protected path makes the bucket High. The operation
 * multiplier then never lowers the bucket: High stays High, a multiplier of
 * 1.5 or more yields High, Low stays Low only for multipliers up to 1.0.
 */
RiskLevel SafetyCoordinator::assessRisk(SafetyOperation operation,
                                        const std::vector<fs::path>& files) const {
    if (files.empty())
        return RiskLevel::Low;

    const auto count = static_cast<long long>(files.size());
    RiskLevel base = RiskLevel::High;
    if (count <= m_config.lowRiskThreshold)
        base = RiskLevel::Low;
    else if (count <= m_config.mediumRiskThreshold)
        base = RiskLevel::Medium;

    std::uintmax_t totalBytes = 0;
    bool foreignExtension = false;
    bool protectedPath = false;

    for (const auto& file : files) {
        std::error_code ec;
        if (fs::is_regular_file(file, ec)) {
            const auto size = fs::file_size(file, ec);
            if (!ec)
                totalBytes += size;
        }

        const std::string ext = lowerExtension(file);
        if (!ext.empty() && m_config.lowRiskExtensions.count(ext) == 0)
            foreignExtension = true;

        if (FileSafety::isDenylisted(file.string()))
            protectedPath = true;
    }

    const double totalMb = static_cast<double>(totalBytes) / (1024.0 * 1024.0);
    if (base == RiskLevel::Low && (foreignExtension || totalMb > m_config.lowRiskMaxTotalMb))
        base = RiskLevel::Medium;
    if (protectedPath)
        base = RiskLevel::High;

    const double multiplier = riskMultiplier(operation);
    if (base == RiskLevel::High || multiplier >= 1.5)
        return RiskLevel::High;
    if (base == RiskLevel::Low && multiplier <= 1.0)
        return RiskLevel::Low;
    return RiskLevel::Medium;
}

bool SafetyCoordinator::isOperationSafe(SafetyOperation operation,
                                        const std::vector<fs::path>& files) const {
    if (!m_status.canModifyFiles) {
        MEDIASORT_LOG_WARN("{} mode does not allow file modification", toString(m_mode));
        return false;
    }

    if (assessRisk(operation, files) == RiskLevel::High && !confirmationActive()) {
        MEDIASORT_LOG_WARN("High risk {} of {} files needs confirmation, which is disabled",
                           toString(operation), files.size());
        return false;
    }
    return true;
}

bool SafetyCoordinator::shouldCreateBackup(SafetyOperation operation, RiskLevel risk) const {
    if (!m_config.backupEnabled)
        return false;
    return m_status.backupRequired || m_config.backupBeforeOperations || risk == RiskLevel::High ||
           operation == SafetyOperation::Delete;
}

bool SafetyCoordinator::requestConfirmation(SafetyOperation operation,
                                            const std::vector<fs::path>& files, RiskLevel risk) {
    if (risk == RiskLevel::Low && m_config.autoConfirmLowRisk)
        return m_confirmations.autoConfirmOperation(operation, files, risk);

    ConfirmationRequest request;
    request.title = fmt::format("Confirm {} of {} files", toString(operation), files.size());
    request.message = fmt::format("{} risk {} operation in {} mode", toString(risk),
                                  toString(operation), toString(m_mode));
    request.details = files.empty() ? "" : "First file: " + files.front().string();
    request.severity = risk == RiskLevel::High     ? ConfirmationSeverity::Danger
                       : risk == RiskLevel::Medium ? ConfirmationSeverity::Warning
                                                   : ConfirmationSeverity::Info;
    request.operationType = operation;
    request.affectedFiles = files;
    request.defaultAction = ConfirmationAction::Cancel;
    request.timeout = m_config.confirmationTimeout;

    const ConfirmationResponse response = m_confirmations.requestConfirmation(std::move(request), risk);
    return response.decision == ConfirmationDecision::Confirm;
}

bool SafetyCoordinator::requestSafeOperation(SafetyOperation operation,
                                             const std::vector<fs::path>& files,
                                             const std::function<bool()>& callback) {
    return requestSafeOperationDetailed(operation, files, callback).success;
}

SafeOperationResult SafetyCoordinator::requestSafeOperationDetailed(
    SafetyOperation operation, const std::vector<fs::path>& files,
    const std::function<bool()>& callback) {
    SafeOperationResult result;
    result.riskLevel = assessRisk(operation, files);

    if (m_mode == SafetyMode::Test || m_mode == SafetyMode::Simulation) {
        TestModeOperationEvent preview;
        preview.operationType = operation;
        preview.files = files;
        preview.mode = m_mode;
        preview.riskLevel = result.riskLevel;
        preview.simulatedResult = fmt::format("{} of {} files would run at {} risk",
                                              toString(operation), files.size(),
                                              toString(result.riskLevel));
        MEDIASORT_LOG_INFO("{} mode: {}", toString(m_mode), preview.simulatedResult);
        publish(preview);

        result.outcome = SafeOperationOutcome::Simulated;
        result.success = true;
        return result;
    }

    if (!isOperationSafe(operation, files)) {
        result.outcome = SafeOperationOutcome::BlockedByPolicy;
        result.errorMessage = fmt::format("{} blocked in {} mode at {} risk", toString(operation),
                                          toString(m_mode), toString(result.riskLevel));
        return result;
    }

    if (files.size() > static_cast<std::size_t>(m_config.highRiskThreshold)) {
        createSafetyAlert("large_operation",
                          fmt::format("{} touches {} files", toString(operation), files.size()),
                          RiskLevel::High, {"Split the operation into smaller batches"});
    }

    if (shouldCreateBackup(operation, result.riskLevel) && !files.empty()) {
        auto backup = m_backups.createBackup(files);
        if (!backup) {
            MEDIASORT_LOG_ERROR("Backup before {} failed, operation aborted", toString(operation));
            result.outcome = SafeOperationOutcome::BackupFailed;
            result.errorMessage = "Backup creation failed";
            return result;
        }
        result.backupId = backup->id;
        adjustScore(SCORE_BACKUP);
    }

    if (confirmationActive()) {
        if (!requestConfirmation(operation, files, result.riskLevel)) {
            MEDIASORT_LOG_INFO("{} of {} files was not confirmed", toString(operation), files.size());
            result.outcome = SafeOperationOutcome::ConfirmationDenied;
            result.errorMessage = "Operation was not confirmed";
            return result;
        }
        adjustScore(SCORE_CONFIRMATION);
    }

    try {
        const bool ok = callback && callback();
        if (ok) {
            recordOperation(operation, files.size(), true, std::nullopt);
            result.outcome = SafeOperationOutcome::Executed;
            result.success = true;
        } else {
            recordOperation(operation, files.size(), false, std::string("Operation reported failure"));
            result.outcome = SafeOperationOutcome::CallbackFailed;
            result.errorMessage = "Operation reported failure";
        }
    } catch (const std::exception& e) {
        MEDIASORT_LOG_ERROR("{} failed: {}", toString(operation), e.what());
        recordOperation(operation, files.size(), false, std::string(e.what()));
        recordIncident();
        result.outcome = SafeOperationOutcome::CallbackFailed;
        result.errorMessage = e.what();
    }
    return result;
}

void SafetyCoordinator::adjustScore(double delta) {
    m_status.safetyScore = std::clamp(m_status.safetyScore + delta, 0.0, 100.0);
    m_status.lastUpdated = std::chrono::system_clock::now();
}

void SafetyCoordinator::recordOperation(SafetyOperation operation, std::size_t fileCount,
                                        bool success, std::optional<std::string> error) {
    m_history.push_back(
        OperationRecord{operation, fileCount, success, std::chrono::system_clock::now(), std::move(error)});
    const std::size_t limit = std::max<std::size_t>(m_config.maxOperationHistory, 1);
    if (m_history.size() > limit)
        m_history.erase(m_history.begin(), m_history.end() - static_cast<std::ptrdiff_t>(limit));
    adjustScore(success ? SCORE_SUCCESS : SCORE_FAILURE);
}

void SafetyCoordinator::recordIncident() {
    ++m_incidents;
    adjustScore(SCORE_INCIDENT);
}

SafetyStatus SafetyCoordinator::getSafetyStatus() {
    if (m_incidents == 0)
        m_status.riskLevel = RiskLevel::Low;
    else if (m_incidents <= 3)
        m_status.riskLevel = RiskLevel::Medium;
    else
        m_status.riskLevel = RiskLevel::High;

    m_status.warnings.clear();
    if (m_status.safetyScore < 50.0)
        m_status.warnings.emplace_back("Safety score is low, proceed with care");
    if (m_incidents > 5)
        m_status.warnings.emplace_back("Many recent incidents, consider stopping file operations");
    if (m_mode == SafetyMode::Emergency)
        m_status.warnings.emplace_back("Emergency mode, file modification is disabled");

    m_status.lastUpdated = std::chrono::system_clock::now();
    publish(SafetyStatusUpdateEvent{m_status});
    return m_status;
}

std::vector<std::string> SafetyCoordinator::getSafetyRecommendations() const {
    std::vector<std::string> out;

    if (m_status.safetyScore < 30.0)
        out.emplace_back("Safety score is very low. Stop all operations and check the system.");
    else if (m_status.safetyScore < 50.0)
        out.emplace_back("Safety score is low. Avoid risky operations and back up often.");

    if (m_incidents > 10)
        out.emplace_back("Many incidents recorded. Consider switching to safe mode.");

    switch (m_mode) {
        case SafetyMode::Normal:
            out.emplace_back("Normal mode. Create a backup before important operations.");
            break;
        case SafetyMode::Safe:
            out.emplace_back("Safe mode. Every operation needs confirmation.");
            break;
        case SafetyMode::Test:
            out.emplace_back("Test mode. No files are modified.");
            break;
        case SafetyMode::Simulation:
            out.emplace_back("Simulation mode. Operations are only previewed.");
            break;
        case SafetyMode::Emergency:
            out.emplace_back("Emergency mode. Resolve the problem before modifying files.");
            break;
    }
    return out;
}

SafetyAlertEvent SafetyCoordinator::createSafetyAlert(const std::string& alertType,
                                                      const std::string& message,
                                                      RiskLevel severity,
                                                      std::vector<std::string> recommendations) {
    SafetyAlertEvent alert;
    alert.alertType = alertType;
    alert.message = message;
    alert.severity = severity;
    alert.recommendations = std::move(recommendations);
    alert.timestamp = std::chrono::system_clock::now();

    MEDIASORT_LOG_WARN("Safety alert [{}]: {}", alertType, message);
    publish(alert);
    return alert;
}

OperationStatistics SafetyCoordinator::getOperationStatistics() const {
    OperationStatistics stats;
    stats.totalOperations = static_cast<int>(m_history.size());
    stats.successfulOperations = static_cast<int>(std::count_if(
        m_history.begin(), m_history.end(), [](const OperationRecord& r) { return r.success; }));
    stats.failedOperations = stats.totalOperations - stats.successfulOperations;
    if (stats.totalOperations > 0)
        stats.successRate = 100.0 * stats.successfulOperations / stats.totalOperations;
    stats.riskIncidents = m_incidents;
    stats.safetyScore = m_status.safetyScore;
    stats.mode = m_mode;
    return stats;
}

void SafetyCoordinator::resetSafetyScore() {
    m_status.safetyScore = 100.0;
    m_history.clear();
    m_incidents = 0;
    m_status.lastUpdated = std::chrono::system_clock::now();
    MEDIASORT_LOG_INFO("Safety score reset");
}
