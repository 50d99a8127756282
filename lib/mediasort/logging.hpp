/**
 * @file logging.hpp
 * @brief Application logging setup on top of spdlog
 */

#ifndef LOGGING_HPP
#define LOGGING_HPP

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <filesystem>
#include <string>

#include <spdlog/spdlog.h>

/**
 * @brief Installs the default "mediasort" logger
 *
 * Creates a colored stdout sink (when @p consoleOutput is set) and a file sink
 * (when @p logFile is not empty) and registers the combined logger as the
 * spdlog default so the MEDIASORT_LOG_* macros reach it.
 *
 * @param logFile Log file path, or empty for no file output
 * @param consoleOutput Write to stdout as well
 * @param level Minimum level name ("trace", "debug", "info", "warn", "error")
 *
 * @return true if the logger was installed, false if a sink could not be
 *         created (the previous default logger stays active)
 */
bool initLogging(const std::filesystem::path& logFile, bool consoleOutput = true,
                 const std::string& level = "info");

/**
 * @brief Changes the level of the default logger
 */
void setLogLevel(const std::string& level);

/**
 * @brief Flushes and drops all loggers
 */
void shutdownLogging();

#define MEDIASORT_LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define MEDIASORT_LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define MEDIASORT_LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define MEDIASORT_LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define MEDIASORT_LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define MEDIASORT_LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

#endif // LOGGING_HPP
