/*
 * recommender_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "recommender_config.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

namespace affinity::config {

static_assert(ConfigSectionDerived<DatasetConfig>);
static_assert(ConfigSectionDerived<RecommendationConfig>);
static_assert(ConfigSectionDerived<CacheConfig>);
static_assert(ConfigSectionDerived<LoggingConfig>);

namespace {

auto sectionOf(const json& j, const char* key) -> json {
    auto it = j.find(key);
    if (it == j.end()) {
        return json();
    }
    return *it;
}

}  // namespace

auto RecommenderConfig::serialize() const -> json {
    return {{"dataset", dataset.toJson()},
            {"recommendation", recommendation.toJson()},
            {"cache", cache.toJson()},
            {"logging", logging.toJson()}};
}

auto RecommenderConfig::deserialize(const json& j) -> RecommenderConfig {
    RecommenderConfig cfg;
    cfg.dataset = DatasetConfig::fromJson(sectionOf(j, "dataset"));
    cfg.recommendation =
        RecommendationConfig::fromJson(sectionOf(j, "recommendation"));
    cfg.cache = CacheConfig::fromJson(sectionOf(j, "cache"));
    cfg.logging = LoggingConfig::fromJson(sectionOf(j, "logging"));
    return cfg;
}

auto loadConfigFile(const std::string& path)
    -> std::expected<RecommenderConfig, std::string> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected("Failed to open config file: " + path);
    }

    auto j = json::parse(file, nullptr, /*allow_exceptions=*/false,
                         /*ignore_comments=*/true);
    if (j.is_discarded()) {
        return std::unexpected("Malformed JSON in config file: " + path);
    }

    try {
        auto config = RecommenderConfig::fromJson(j);
        spdlog::debug("Loaded configuration from {}", path);
        return config;
    } catch (const ConfigException& e) {
        return std::unexpected(std::string("Invalid configuration in ") +
                               path + ": " + e.what());
    }
}

auto saveConfigFile(const std::string& path, const RecommenderConfig& config)
    -> std::expected<void, std::string> {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return std::unexpected("Failed to create config file: " + path);
    }

    file << config.toJson().dump(4) << '\n';
    if (!file.good()) {
        return std::unexpected("Error writing config file: " + path);
    }
    return {};
}

auto toFilterConfig(const RecommendationConfig& config)
    -> recommendation::CollaborativeFilter::Config {
    recommendation::CollaborativeFilter::Config filterConfig;
    filterConfig.metric = config.metric;
    filterConfig.neighborhoodSize = config.neighborhoodSize;
    filterConfig.topN = config.topN;
    filterConfig.degeneratePolicy = config.degeneratePolicy;
    return filterConfig;
}

auto toDatasetSchema(const DatasetConfig& config) -> io::DatasetSchema {
    io::DatasetSchema schema;
    schema.userColumn = config.userColumn;
    schema.itemColumn = config.itemColumn;
    schema.ratingColumn = config.ratingColumn;
    schema.titleColumn = config.titleColumn;
    return schema;
}

}  // namespace affinity::config
