/**
 * @file logger.h
 * @brief Structured Logging Wrapper
 *
 * One default logger named after the shell process ("tiptv-shell"). Components
 * tag their own lines with a "[Component]" prefix (e.g. "[CommandRegistry]",
 * "[InvokeHandler]") instead of owning separate spdlog loggers, so a single
 * level setting (LOG_LEVEL) controls the whole process.
 *
 * The rotating file sink is optional (LOG_TO_FILE / LOG_FILE). If it cannot
 * be opened the shell keeps logging to the console.
 *
 * @date 2026-10-17
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstddef>
#include <iostream>
#include <string>
#include <memory>
#include <vector>

namespace common {

/// Rotating file sink limits
constexpr size_t LOG_FILE_MAX_SIZE = 10 * 1024 * 1024;
constexpr size_t LOG_FILE_MAX_FILES = 3;

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    /**
     * @brief Initialize default logger
     * @param serviceName Logger name shown in every line (e.g., "tiptv-shell")
     * @param logLevel Log level (trace, debug, info, warn, error, critical)
     * @param logToFile Enable file logging
     * @param logFile Log file path
     */
    static void initialize(
        const std::string& serviceName,
        const std::string& logLevel = "info",
        bool logToFile = false,
        const std::string& logFile = ""
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            // Console sink (colored)
            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            // File sink (if enabled), console-only when the file cannot be opened
            std::string fileError;
            if (logToFile && !logFile.empty()) {
                try {
                    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                        logFile, LOG_FILE_MAX_SIZE, LOG_FILE_MAX_FILES);
                    fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                    sinks.push_back(fileSink);
                } catch (const spdlog::spdlog_ex& ex) {
                    fileError = ex.what();
                }
            }

            auto logger = std::make_shared<spdlog::logger>(serviceName, sinks.begin(), sinks.end());
            logger->set_level(parseLevel(logLevel));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::info("Logger initialized: service={}, level={}, file={}",
                        serviceName, logLevel, sinks.size() > 1 ? logFile : "none");
            if (!fileError.empty()) {
                spdlog::warn("[Logger] Cannot open log file {}: {}", logFile, fileError);
            }

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }

    /**
     * @brief Map a level name to spdlog level, info when unrecognized
     */
    static spdlog::level::level_enum parseLevel(const std::string& level) {
        if (level == "trace") {
            return spdlog::level::trace;
        } else if (level == "debug") {
            return spdlog::level::debug;
        } else if (level == "warn") {
            return spdlog::level::warn;
        } else if (level == "error") {
            return spdlog::level::err;
        } else if (level == "critical") {
            return spdlog::level::critical;
        }
        return spdlog::level::info;
    }

    /**
     * @brief Flush all loggers
     */
    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace common
