/**
 * @file logging.hpp
 * @brief Default logger setup for Affinity programs.
 *
 * @par Usage Example:
 * @code
 * #include "logging/logging.hpp"
 *
 * affinity::config::LoggingConfig config;
 * config.level = affinity::config::LogLevel::Debug;
 * affinity::logging::initLogging(config);
 *
 * spdlog::info("Hello, logging!");
 * @endcode
 *
 * @date 2024-11-28
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef AFFINITY_LOGGING_LOGGING_HPP
#define AFFINITY_LOGGING_LOGGING_HPP

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "../config/sections/logging_config.hpp"

namespace affinity::logging {

/**
 * @brief Convert a configured level to the spdlog level
 */
[[nodiscard]] auto toSpdlogLevel(config::LogLevel level)
    -> spdlog::level::level_enum;

/**
 * @brief Build the sinks described by a logging configuration
 *
 * Returns an empty list when both console and file output are disabled.
 *
 * @throws spdlog::spdlog_ex if the log file or its directory cannot be
 *         created
 */
[[nodiscard]] auto createSinks(const config::LoggingConfig& config)
    -> std::vector<spdlog::sink_ptr>;

/**
 * @brief Install the default spdlog logger
 *
 * Replaces the current default logger with one named "affinity" writing to
 * the configured sinks, at the configured level and pattern. Warnings and
 * errors are flushed immediately.
 *
 * @return The installed logger
 * @throws spdlog::spdlog_ex if the log file or its directory cannot be
 *         created
 */
auto initLogging(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger>;

}  // namespace affinity::logging

#endif  // AFFINITY_LOGGING_LOGGING_HPP
