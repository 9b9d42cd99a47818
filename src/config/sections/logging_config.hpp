/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Logging configuration section

**************************************************/

#ifndef AFFINITY_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define AFFINITY_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <optional>
#include <string>

#include "../core/config_section.hpp"

namespace affinity::config {

/**
 * @brief Log level enumeration
 */
enum class LogLevel { Trace, Debug, Info, Warn, Error, Critical, Off };

/**
 * @brief Convert LogLevel to string
 */
[[nodiscard]] inline std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "info";
}

/**
 * @brief Convert string to LogLevel
 * @return Parsed level, or nullopt for an unknown name
 */
[[nodiscard]] inline std::optional<LogLevel> logLevelFromString(
    const std::string& str) {
    if (str == "trace") return LogLevel::Trace;
    if (str == "debug") return LogLevel::Debug;
    if (str == "info") return LogLevel::Info;
    if (str == "warn" || str == "warning") return LogLevel::Warn;
    if (str == "error" || str == "err") return LogLevel::Error;
    if (str == "critical" || str == "fatal") return LogLevel::Critical;
    if (str == "off" || str == "none") return LogLevel::Off;
    return std::nullopt;
}

/**
 * @brief Logging configuration
 *
 * @example
 * ```json
 * "logging": {
 *   "level": "debug",
 *   "enableConsole": true,
 *   "enableFile": true,
 *   "filePath": "logs/affinity.log"
 * }
 * ```
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    /// Configuration path in the config tree
    static constexpr std::string_view PATH = "/affinity/logging";

    LogLevel level{LogLevel::Info};  ///< Minimum level of the default logger
    bool enableConsole{true};        ///< Enable colored console output
    bool enableFile{false};          ///< Enable file output
    std::string filePath{"logs/affinity.log"};  ///< Log file path
    bool truncateFile{false};  ///< Truncate the log file on start

    /// Available placeholders: %Y %m %d %H %M %S %e (milliseconds)
    ///                        %l (level), %n (logger name), %t (thread id)
    ///                        %v (message)
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v"};

    [[nodiscard]] json serialize() const {
        return {{"level", logLevelToString(level)},
                {"enableConsole", enableConsole},
                {"enableFile", enableFile},
                {"filePath", filePath},
                {"truncateFile", truncateFile},
                {"pattern", pattern}};
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;

        auto levelName = j.value("level", logLevelToString(cfg.level));
        auto parsed = logLevelFromString(levelName);
        if (!parsed) {
            throw InvalidConfigException(std::string(PATH) + "/level",
                                         "unknown log level '" + levelName +
                                             "'");
        }
        cfg.level = *parsed;

        cfg.enableConsole = j.value("enableConsole", cfg.enableConsole);
        cfg.enableFile = j.value("enableFile", cfg.enableFile);
        cfg.filePath = j.value("filePath", cfg.filePath);
        cfg.truncateFile = j.value("truncateFile", cfg.truncateFile);
        cfg.pattern = j.value("pattern", cfg.pattern);

        if (cfg.enableFile && cfg.filePath.empty()) {
            throw InvalidConfigException(std::string(PATH) + "/filePath",
                                         "file logging needs a path");
        }
        return cfg;
    }
};

}  // namespace affinity::config

#endif  // AFFINITY_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
