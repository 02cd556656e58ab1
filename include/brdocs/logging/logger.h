/**
 * @file logger.h
 * @brief Logging setup for brdocs front-ends
 *
 * Wraps spdlog with a standardized configuration. The library itself only
 * calls spdlog's default logger; applications call Logger::initialize once.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace brdocs {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    /**
     * @brief Map a level name to spdlog's level
     *
     * Accepts trace, debug, info, warn, error, critical and off. Anything
     * else maps to info.
     */
    static spdlog::level::level_enum parseLevel(const std::string& level) {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "info") return spdlog::level::info;
        if (level == "warn") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        if (level == "off") return spdlog::level::off;
        return spdlog::level::info;
    }

    /**
     * @brief Install the default logger
     * @param appName Logger name (e.g., "brdocs-cli")
     * @param logLevel Level name, see parseLevel
     * @param logFile Rotating log file path, empty for console only
     */
    static void initialize(
        const std::string& appName,
        const std::string& logLevel = "info",
        const std::string& logFile = ""
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            // Console goes to stderr so command output on stdout stays clean
            auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            if (!logFile.empty()) {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, 1024 * 1024 * 10, 3  // 10MB, 3 files
                );
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>(appName, sinks.begin(), sinks.end());
            logger->set_level(parseLevel(logLevel));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::debug("Logger initialized: app={}, level={}, file={}",
                          appName, logLevel, logFile.empty() ? "none" : logFile);

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }

    /**
     * @brief Set log level at runtime
     */
    static void setLevel(const std::string& level) {
        spdlog::set_level(parseLevel(level));
        spdlog::debug("Log level changed to: {}", level);
    }

    /**
     * @brief Flush the default logger
     */
    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace brdocs
