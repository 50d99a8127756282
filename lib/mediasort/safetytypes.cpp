#include "safetytypes.hpp"

#include <algorithm>
#include <cctype>

namespace {

std::string lowerCase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::string toString(SafetyMode mode) {
    switch (mode) {
        case SafetyMode::Normal:     return "normal";
        case SafetyMode::Safe:       return "safe";
        case SafetyMode::Test:       return "test";
        case SafetyMode::Simulation: return "simulation";
        case SafetyMode::Emergency:  return "emergency";
    }
    return "unknown";
}

std::string toString(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low:    return "low";
        case RiskLevel::Medium: return "medium";
        case RiskLevel::High:   return "high";
    }
    return "unknown";
}

std::string toString(SafetyOperation operation) {
    switch (operation) {
        case SafetyOperation::Move:   return "move";
        case SafetyOperation::Copy:   return "copy";
        case SafetyOperation::Delete: return "delete";
        case SafetyOperation::Rename: return "rename";
        case SafetyOperation::Batch:  return "batch";
    }
    return "unknown";
}

std::string toString(BackupStrategy strategy) {
    switch (strategy) {
        case BackupStrategy::Copy:        return "copy";
        case BackupStrategy::Zip:         return "zip";
        case BackupStrategy::Incremental: return "incremental";
        case BackupStrategy::Mirror:      return "mirror";
    }
    return "unknown";
}

std::string toString(InterruptionReason reason) {
    switch (reason) {
        case InterruptionReason::UserRequest: return "user_request";
        case InterruptionReason::SystemError: return "system_error";
        case InterruptionReason::Timeout:     return "timeout";
    }
    return "unknown";
}

std::optional<SafetyMode> parseSafetyMode(const std::string& name) {
    const std::string value = lowerCase(name);
    for (auto mode : {SafetyMode::Normal, SafetyMode::Safe, SafetyMode::Test,
                      SafetyMode::Simulation, SafetyMode::Emergency}) {
        if (toString(mode) == value)
            return mode;
    }
    return std::nullopt;
}

std::optional<SafetyOperation> parseSafetyOperation(const std::string& name) {
    const std::string value = lowerCase(name);
    for (auto op : {SafetyOperation::Move, SafetyOperation::Copy, SafetyOperation::Delete,
                    SafetyOperation::Rename, SafetyOperation::Batch}) {
        if (toString(op) == value)
            return op;
    }
    return std::nullopt;
}

std::optional<BackupStrategy> parseBackupStrategy(const std::string& name) {
    const std::string value = lowerCase(name);
    for (auto strategy : {BackupStrategy::Copy, BackupStrategy::Zip,
                          BackupStrategy::Incremental, BackupStrategy::Mirror}) {
        if (toString(strategy) == value)
            return strategy;
    }
    return std::nullopt;
}
