/**
 * @file logger.h
 * @brief spdlog setup for harness processes embedding the emulator
 *
 * The library itself only calls the free spdlog functions; a test runner
 * calls Logger::initialize() once to choose sinks and level.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace dirmock {

class Logger {
public:
    /**
     * @brief Install the default logger
     * @param name Logger name shown in each line
     * @param logLevel trace, debug, info, warn, error or critical (unknown: info)
     * @param logToFile Add a rotating file sink
     * @param logFile File sink path
     */
    static void initialize(
        const std::string& name,
        const std::string& logLevel = "warn",
        bool logToFile = false,
        const std::string& logFile = ""
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            if (logToFile && !logFile.empty()) {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, 1024 * 1024 * 5, 2  // 5MB, 2 files
                );
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
            logger->set_level(levelFromString(logLevel));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::debug("Logger initialized: name={}, level={}, file={}",
                          name, logLevel, logToFile ? logFile : "none");

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }

    /**
     * @brief Change the level of the default logger at runtime
     */
    static void setLevel(const std::string& level) {
        spdlog::set_level(levelFromString(level));
        spdlog::debug("Log level changed to: {}", level);
    }

    static void flush() {
        spdlog::default_logger()->flush();
    }

    static spdlog::level::level_enum levelFromString(const std::string& level) {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "info") return spdlog::level::info;
        if (level == "warn") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        return spdlog::level::info;
    }
};

} // namespace dirmock
