#include "logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

bool initLogging(const std::filesystem::path& logFile, bool consoleOutput,
                 const std::string& level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (!logFile.empty()) {
            if (logFile.has_parent_path()) {
                std::error_code ec;
                std::filesystem::create_directories(logFile.parent_path(), ec);
            }
            auto file_sink =
                std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile.string(), false);
            file_sink->set_level(spdlog::level::trace);
            sinks.push_back(file_sink);
        }

        if (consoleOutput) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(spdlog::level::trace);
            sinks.push_back(console_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("mediasort", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(level));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");

        spdlog::set_default_logger(logger);
        spdlog::flush_on(spdlog::level::warn);

        return true;
    } catch (const spdlog::spdlog_ex&) {
        return false;
    }
}

void setLogLevel(const std::string& level) {
    spdlog::set_level(spdlog::level::from_str(level));
}

void shutdownLogging() {
    spdlog::shutdown();
}
