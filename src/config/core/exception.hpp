/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Configuration Exception Types

**************************************************/

#ifndef AFFINITY_CONFIG_CORE_EXCEPTION_HPP
#define AFFINITY_CONFIG_CORE_EXCEPTION_HPP

#include <stdexcept>
#include <string>

namespace affinity::config {

/**
 * @brief Base exception for configuration errors
 */
class ConfigException : public std::runtime_error {
public:
    explicit ConfigException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception for invalid configuration values
 */
class InvalidConfigException : public ConfigException {
public:
    InvalidConfigException(const std::string& path, const std::string& message)
        : ConfigException(path + ": " + message), path_(path) {}

    /**
     * @brief Configuration path of the offending value
     */
    [[nodiscard]] auto path() const -> const std::string& { return path_; }

private:
    std::string path_;
};

}  // namespace affinity::config

#endif  // AFFINITY_CONFIG_CORE_EXCEPTION_HPP
