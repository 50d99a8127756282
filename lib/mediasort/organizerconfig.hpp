/**
 * @file organizerconfig.hpp
 * @brief YAML configuration of the whole engine
 */

#ifndef ORGANIZERCONFIG_HPP
#define ORGANIZERCONFIG_HPP

#include <cstddef>
#include <filesystem>
#include <string>

#include <yaml-cpp/yaml.h>

#include "backupmanager.hpp"
#include "confirmationmanager.hpp"
#include "interruptionmanager.hpp"
#include "namingstrategy.hpp"
#include "operationexecutor.hpp"
#include "operationplanner.hpp"
#include "safetycoordinator.hpp"

struct LoggingConfig {
    std::string level = "info";
    std::filesystem::path file;
    bool console = true;
};

/**
 * @brief Settings of every component, one YAML section each
 *
 * Sections: safety, backup, interruption, naming, organizer, logging.
 * Missing sections and keys keep the defaults below.
 */
struct OrganizerConfig {
    SafetyConfig safety;
    BackupConfig backup;
    InterruptionConfig interruption;
    ConfirmationConfig confirmation;
    std::string namingStrategy = "standard";
    NamingConfig naming;
    PlannerConfig planner;
    ExecutorConfig executor;
    std::size_t maxHistorySize = 100;
    LoggingConfig logging;
};

/**
 * @brief Reads the configuration file at @p path
 * @throws ValidationError if the file cannot be parsed or holds invalid values
 */
OrganizerConfig loadConfig(const std::filesystem::path& path);

/**
 * @brief Builds a configuration from an already parsed document
 * @throws ValidationError for wrong types or invalid values
 */
OrganizerConfig configFromYaml(const YAML::Node& root);

YAML::Node configToYaml(const OrganizerConfig& config);

/**
 * @brief Writes @p config to @p path
 * @return false if the file cannot be written
 */
bool saveConfig(const OrganizerConfig& config, const std::filesystem::path& path);

#endif // ORGANIZERCONFIG_HPP
