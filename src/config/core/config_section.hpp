/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: ConfigSection CRTP base class for type-safe configuration sections

**************************************************/

#ifndef AFFINITY_CONFIG_CORE_CONFIG_SECTION_HPP
#define AFFINITY_CONFIG_CORE_CONFIG_SECTION_HPP

#include <concepts>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "exception.hpp"

namespace affinity::config {

using json = nlohmann::json;

/**
 * @brief Concept for valid ConfigSection derived types
 */
template <typename T>
concept ConfigSectionDerived = requires(T t, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
};

/**
 * @brief CRTP base class for type-safe configuration sections
 *
 * Derived classes must:
 *
 * 1. Define a static constexpr PATH member for the configuration path
 * 2. Implement serialize() to convert to JSON
 * 3. Implement static deserialize(const json&) to create from JSON, throwing
 *    InvalidConfigException for values out of range
 *
 * Missing keys keep their default values and unknown keys are ignored.
 *
 * @tparam Derived The derived configuration struct type (CRTP)
 *
 * @example
 * ```cpp
 * struct CacheConfig : ConfigSection<CacheConfig> {
 *     static constexpr std::string_view PATH = "/affinity/cache";
 *
 *     bool enabled = true;
 *     std::string directory = "cache";
 *
 *     [[nodiscard]] json serialize() const {
 *         return {{"enabled", enabled}, {"directory", directory}};
 *     }
 *
 *     [[nodiscard]] static CacheConfig deserialize(const json& j) {
 *         CacheConfig config;
 *         config.enabled = j.value("enabled", config.enabled);
 *         config.directory = j.value("directory", config.directory);
 *         return config;
 *     }
 * };
 * ```
 */
template <typename Derived>
class ConfigSection {
public:
    /**
     * @brief Get the configuration path for this section
     * @return Configuration path (e.g., "/affinity/cache")
     */
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    /**
     * @brief Convert this config to JSON
     * @return JSON representation of this configuration
     */
    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    /**
     * @brief Create a configuration from JSON
     * @param j JSON object to deserialize
     * @return Configuration instance
     * @throws InvalidConfigException if j is not an object or holds an
     * invalid value
     */
    [[nodiscard]] static Derived fromJson(const json& j) {
        if (j.is_null()) {
            return Derived{};
        }
        if (!j.is_object()) {
            throw InvalidConfigException(std::string(Derived::PATH),
                                         "expected a JSON object");
        }
        try {
            return Derived::deserialize(j);
        } catch (const json::type_error& e) {
            throw InvalidConfigException(std::string(Derived::PATH), e.what());
        }
    }

    /**
     * @brief Try to create a configuration from JSON with error handling
     * @param j JSON object to deserialize
     * @return Configuration instance or nullopt on error
     */
    [[nodiscard]] static std::optional<Derived> tryFromJson(const json& j) {
        try {
            return fromJson(j);
        } catch (const ConfigException& e) {
            spdlog::warn("Invalid configuration: {}", e.what());
            return std::nullopt;
        }
    }

    /**
     * @brief Get a default-constructed configuration
     * @return Default configuration instance
     */
    [[nodiscard]] static Derived defaults() { return Derived{}; }

    /**
     * @brief Check equality with another configuration
     */
    [[nodiscard]] bool operator==(const ConfigSection& other) const {
        return toJson() == static_cast<const Derived&>(other).toJson();
    }
};

}  // namespace affinity::config

#endif  // AFFINITY_CONFIG_CORE_CONFIG_SECTION_HPP
