/*
 * cache_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-08

Description: Similarity matrix cache configuration

**************************************************/

#ifndef AFFINITY_CONFIG_SECTIONS_CACHE_CONFIG_HPP
#define AFFINITY_CONFIG_SECTIONS_CACHE_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"

namespace affinity::config {

struct CacheConfig : ConfigSection<CacheConfig> {
    static constexpr std::string_view PATH = "/affinity/cache";

    bool enabled{true};            ///< Persist similarity matrices
    std::string directory{"cache"};  ///< One CSV file per metric

    [[nodiscard]] json serialize() const {
        return {{"enabled", enabled}, {"directory", directory}};
    }

    [[nodiscard]] static CacheConfig deserialize(const json& j) {
        CacheConfig cfg;
        cfg.enabled = j.value("enabled", cfg.enabled);
        cfg.directory = j.value("directory", cfg.directory);
        if (cfg.enabled && cfg.directory.empty()) {
            throw InvalidConfigException(std::string(PATH) + "/directory",
                                         "an enabled cache needs a directory");
        }
        return cfg;
    }
};

}  // namespace affinity::config

#endif  // AFFINITY_CONFIG_SECTIONS_CACHE_CONFIG_HPP
