/**
 * @file organizerconfig.cpp
 */

#include "organizerconfig.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "logging.hpp"
#include "organizererrors.hpp"

namespace fs = std::filesystem;

namespace {

template <typename T>
void read(const YAML::Node& section, const char* key, T& target) {
    if (section && section[key])
        target = section[key].as<T>();
}

std::set<std::string> readExtensions(const YAML::Node& node) {
    if (!node.IsSequence())
        throw ValidationError("extension list must be a sequence");

    std::set<std::string> out;
    for (const auto& item : node) {
        std::string ext = item.as<std::string>();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!ext.empty() && ext.front() != '.')
            ext.insert(ext.begin(), '.');
        out.insert(ext);
    }
    return out;
}

void readSafety(const YAML::Node& node, OrganizerConfig& cfg) {
    if (!node)
        return;
    SafetyConfig& safety = cfg.safety;

    if (node["default_mode"]) {
        const std::string name = node["default_mode"].as<std::string>();
        auto mode = parseSafetyMode(name);
        if (!mode)
            throw ValidationError("safety.default_mode: unknown mode " + name);
        safety.defaultMode = *mode;
    }
    read(node, "backup_enabled", safety.backupEnabled);
    read(node, "backup_before_operations", safety.backupBeforeOperations);
    read(node, "confirmation_required", safety.confirmationRequired);
    read(node, "auto_confirm_low_risk", safety.autoConfirmLowRisk);
    if (node["confirmation_timeout_seconds"]) {
        const double seconds = node["confirmation_timeout_seconds"].as<double>();
        if (seconds <= 0)
            throw ValidationError("safety.confirmation_timeout_seconds must be positive");
        safety.confirmationTimeout = std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
        cfg.confirmation.defaultTimeout = safety.confirmationTimeout;
    }
    read(node, "low_risk_threshold", safety.lowRiskThreshold);
    read(node, "medium_risk_threshold", safety.mediumRiskThreshold);
    read(node, "high_risk_threshold", safety.highRiskThreshold);
    read(node, "low_risk_max_total_mb", safety.lowRiskMaxTotalMb);
    if (node["low_risk_extensions"])
        safety.lowRiskExtensions = readExtensions(node["low_risk_extensions"]);
    read(node, "max_operation_history", safety.maxOperationHistory);
    if (safety.maxOperationHistory == 0)
        throw ValidationError("safety.max_operation_history must be positive");

    if (safety.lowRiskThreshold < 0 || safety.lowRiskThreshold > safety.mediumRiskThreshold ||
        safety.mediumRiskThreshold > safety.highRiskThreshold)
        throw ValidationError("safety: risk thresholds must satisfy 0 <= low <= medium <= high");
}

void readBackup(const YAML::Node& node, BackupConfig& backup) {
    if (!node)
        return;

    if (node["directory"])
        backup.backupRoot = node["directory"].as<std::string>();
    if (node["default_strategy"]) {
        const std::string name = node["default_strategy"].as<std::string>();
        auto strategy = parseBackupStrategy(name);
        if (!strategy)
            throw ValidationError("backup.default_strategy: unknown strategy " + name);
        backup.defaultStrategy = *strategy;
    }
    read(node, "compression_level", backup.compressionLevel);
    read(node, "max_backup_age_days", backup.maxBackupAgeDays);
    read(node, "max_backup_count", backup.maxBackupCount);
    read(node, "verify_backups", backup.verifyAfterCreate);

    if (backup.compressionLevel < 0 || backup.compressionLevel > 9)
        throw ValidationError("backup.compression_level must be between 0 and 9");
    if (backup.maxBackupAgeDays < 0)
        throw ValidationError("backup.max_backup_age_days must not be negative");
}

void readInterruption(const YAML::Node& node, InterruptionConfig& interruption) {
    if (!node)
        return;

    if (node["poll_interval_ms"]) {
        const int ms = node["poll_interval_ms"].as<int>();
        if (ms <= 0)
            throw ValidationError("interruption.poll_interval_ms must be positive");
        interruption.pollInterval = std::chrono::milliseconds(ms);
    }
    if (node["graceful_shutdown_timeout_seconds"]) {
        const double seconds = node["graceful_shutdown_timeout_seconds"].as<double>();
        if (seconds < 0)
            throw ValidationError("interruption.graceful_shutdown_timeout_seconds must not be negative");
        interruption.gracefulShutdownTimeout =
            std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
    }
    if (node["max_wait_seconds"]) {
        const double seconds = node["max_wait_seconds"].as<double>();
        if (seconds < 0)
            throw ValidationError("interruption.max_wait_seconds must not be negative");
        interruption.defaultMaxWait = std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
    }
    read(node, "force_interrupt_after_timeout", interruption.forceInterruptAfterTimeout);
}

void readNaming(const YAML::Node& node, OrganizerConfig& cfg) {
    if (!node)
        return;

    read(node, "strategy", cfg.namingStrategy);
    std::transform(cfg.namingStrategy.begin(), cfg.namingStrategy.end(), cfg.namingStrategy.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto names = NamingStrategyFactory::availableStrategies();
    if (std::find(names.begin(), names.end(), cfg.namingStrategy) == names.end())
        throw ValidationError("naming.strategy: unknown strategy " + cfg.namingStrategy);

    read(node, "max_unique_attempts", cfg.naming.maxUniqueAttempts);
    read(node, "enable_timestamp_fallback", cfg.naming.enableTimestampFallback);
    read(node, "max_title_length", cfg.naming.maxTitleLength);
    read(node, "sanitize_special_chars", cfg.naming.sanitizeSpecialChars);

    if (cfg.naming.maxUniqueAttempts < 0)
        throw ValidationError("naming.max_unique_attempts must not be negative");
    if (cfg.naming.maxTitleLength == 0)
        throw ValidationError("naming.max_title_length must be positive");
}

void readOrganizer(const YAML::Node& node, OrganizerConfig& cfg) {
    if (!node)
        return;

    if (node["video_extensions"])
        cfg.planner.videoExtensions = readExtensions(node["video_extensions"]);
    if (node["subtitle_extensions"])
        cfg.planner.subtitleExtensions = readExtensions(node["subtitle_extensions"]);
    read(node, "min_file_size", cfg.planner.minFileSize);
    read(node, "preserve_subtitles", cfg.planner.preserveSubtitles);
    read(node, "max_path_length", cfg.planner.maxPathLength);
    read(node, "create_directories", cfg.executor.createDirectories);
    read(node, "overwrite_existing", cfg.executor.overwriteExisting);
    read(node, "backup_before_operation", cfg.executor.backupBeforeOperation);
    read(node, "max_history_size", cfg.maxHistorySize);

    if (cfg.maxHistorySize == 0)
        throw ValidationError("organizer.max_history_size must be positive");
}

void readLogging(const YAML::Node& node, LoggingConfig& logging) {
    if (!node)
        return;

    read(node, "level", logging.level);
    if (node["file"])
        logging.file = node["file"].as<std::string>();
    read(node, "console", logging.console);
}

YAML::Node extensionList(const std::set<std::string>& extensions) {
    YAML::Node list(YAML::NodeType::Sequence);
    for (const auto& ext : extensions)
        list.push_back(ext);
    return list;
}

} // namespace

OrganizerConfig configFromYaml(const YAML::Node& root) {
    OrganizerConfig cfg;
    if (!root || root.IsNull())
        return cfg;
    if (!root.IsMap())
        throw ValidationError("configuration root must be a map");

    try {
        readSafety(root["safety"], cfg);
        readBackup(root["backup"], cfg.backup);
        readInterruption(root["interruption"], cfg.interruption);
        readNaming(root["naming"], cfg);
        readOrganizer(root["organizer"], cfg);
        readLogging(root["logging"], cfg.logging);
    } catch (const YAML::Exception& e) {
        throw ValidationError(std::string("invalid configuration value: ") + e.what());
    }
    return cfg;
}

OrganizerConfig loadConfig(const fs::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ValidationError("cannot read configuration " + path.string() + ": " + e.what());
    }

    OrganizerConfig cfg = configFromYaml(root);
    MEDIASORT_LOG_INFO("Loaded configuration from {}", path.string());
    return cfg;
}

YAML::Node configToYaml(const OrganizerConfig& config) {
    YAML::Node root;

    YAML::Node safety = root["safety"];
    safety["default_mode"] = toString(config.safety.defaultMode);
    safety["backup_enabled"] = config.safety.backupEnabled;
    safety["backup_before_operations"] = config.safety.backupBeforeOperations;
    safety["confirmation_required"] = config.safety.confirmationRequired;
    safety["auto_confirm_low_risk"] = config.safety.autoConfirmLowRisk;
    safety["confirmation_timeout_seconds"] = config.safety.confirmationTimeout.count() / 1000.0;
    safety["low_risk_threshold"] = config.safety.lowRiskThreshold;
    safety["medium_risk_threshold"] = config.safety.mediumRiskThreshold;
    safety["high_risk_threshold"] = config.safety.highRiskThreshold;
    safety["low_risk_max_total_mb"] = config.safety.lowRiskMaxTotalMb;
    safety["low_risk_extensions"] = extensionList(config.safety.lowRiskExtensions);
    safety["max_operation_history"] = config.safety.maxOperationHistory;

    YAML::Node backup = root["backup"];
    backup["directory"] = config.backup.backupRoot.string();
    backup["default_strategy"] = toString(config.backup.defaultStrategy);
    backup["compression_level"] = config.backup.compressionLevel;
    backup["max_backup_age_days"] = config.backup.maxBackupAgeDays;
    backup["max_backup_count"] = config.backup.maxBackupCount;
    backup["verify_backups"] = config.backup.verifyAfterCreate;

    YAML::Node interruption = root["interruption"];
    interruption["poll_interval_ms"] = static_cast<int>(config.interruption.pollInterval.count());
    interruption["graceful_shutdown_timeout_seconds"] =
        config.interruption.gracefulShutdownTimeout.count() / 1000.0;
    interruption["max_wait_seconds"] = config.interruption.defaultMaxWait.count() / 1000.0;
    interruption["force_interrupt_after_timeout"] = config.interruption.forceInterruptAfterTimeout;

    YAML::Node naming = root["naming"];
    naming["strategy"] = config.namingStrategy;
    naming["max_unique_attempts"] = config.naming.maxUniqueAttempts;
    naming["enable_timestamp_fallback"] = config.naming.enableTimestampFallback;
    naming["max_title_length"] = config.naming.maxTitleLength;
    naming["sanitize_special_chars"] = config.naming.sanitizeSpecialChars;

    YAML::Node organizer = root["organizer"];
    organizer["video_extensions"] = extensionList(config.planner.videoExtensions);
    organizer["subtitle_extensions"] = extensionList(config.planner.subtitleExtensions);
    organizer["min_file_size"] = config.planner.minFileSize;
    organizer["preserve_subtitles"] = config.planner.preserveSubtitles;
    organizer["max_path_length"] = config.planner.maxPathLength;
    organizer["create_directories"] = config.executor.createDirectories;
    organizer["overwrite_existing"] = config.executor.overwriteExisting;
    organizer["backup_before_operation"] = config.executor.backupBeforeOperation;
    organizer["max_history_size"] = config.maxHistorySize;

    YAML::Node logging = root["logging"];
    logging["level"] = config.logging.level;
    logging["file"] = config.logging.file.string();
    logging["console"] = config.logging.console;

    return root;
}

bool saveConfig(const OrganizerConfig& config, const fs::path& path) {
    YAML::Emitter out;
    out << configToYaml(config);

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        MEDIASORT_LOG_ERROR("Cannot write configuration to {}", path.string());
        return false;
    }
    file << out.c_str() << '\n';
    return static_cast<bool>(file);
}
