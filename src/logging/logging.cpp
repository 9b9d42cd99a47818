/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging.hpp"

#include <filesystem>
#include <system_error>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace affinity::logging {

auto toSpdlogLevel(config::LogLevel level) -> spdlog::level::level_enum {
    switch (level) {
        case config::LogLevel::Trace: return spdlog::level::trace;
        case config::LogLevel::Debug: return spdlog::level::debug;
        case config::LogLevel::Info: return spdlog::level::info;
        case config::LogLevel::Warn: return spdlog::level::warn;
        case config::LogLevel::Error: return spdlog::level::err;
        case config::LogLevel::Critical: return spdlog::level::critical;
        case config::LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

auto createSinks(const config::LoggingConfig& config)
    -> std::vector<spdlog::sink_ptr> {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enableConsole) {
        sinks.push_back(
            std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    if (config.enableFile) {
        std::filesystem::path path(config.filePath);
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                throw spdlog::spdlog_ex("Failed to create log directory " +
                                        path.parent_path().string() + ": " +
                                        ec.message());
            }
        }
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            config.filePath, config.truncateFile));
    }

    return sinks;
}

auto initLogging(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger> {
    auto sinks = createSinks(config);
    auto logger = std::make_shared<spdlog::logger>("affinity", sinks.begin(),
                                                   sinks.end());

    logger->set_level(toSpdlogLevel(config.level));
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    spdlog::debug("Logging initialized with {} sinks at level {}",
                  sinks.size(), config::logLevelToString(config.level));
    return logger;
}

}  // namespace affinity::logging
