/*
 * recommender_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-08

Description: Top-level configuration of the recommender and its file loader

**************************************************/

#ifndef AFFINITY_CONFIG_RECOMMENDER_CONFIG_HPP
#define AFFINITY_CONFIG_RECOMMENDER_CONFIG_HPP

#include <expected>
#include <string>

#include "../io/observation_source.hpp"
#include "../recommendation/collaborative_filter.hpp"
#include "sections/cache_config.hpp"
#include "sections/dataset_config.hpp"
#include "sections/logging_config.hpp"
#include "sections/recommendation_config.hpp"

namespace affinity::config {

/**
 * @brief Complete recommender configuration
 *
 * @example
 * ```json
 * {
 *   "dataset": { "ratingsPath": "data/ratings.csv",
 *                "itemsPath": "data/movies.csv" },
 *   "recommendation": { "metric": "cosine", "neighborhoodSize": 20 },
 *   "cache": { "enabled": false },
 *   "logging": { "level": "debug" }
 * }
 * ```
 */
struct RecommenderConfig : ConfigSection<RecommenderConfig> {
    static constexpr std::string_view PATH = "/affinity";

    DatasetConfig dataset;
    RecommendationConfig recommendation;
    CacheConfig cache;
    LoggingConfig logging;

    [[nodiscard]] json serialize() const;

    [[nodiscard]] static RecommenderConfig deserialize(const json& j);
};

/**
 * @brief Load a configuration file
 * @param path JSON file path
 * @return Parsed configuration, or error message for unreadable files,
 * malformed JSON and invalid values
 */
[[nodiscard]] auto loadConfigFile(const std::string& path)
    -> std::expected<RecommenderConfig, std::string>;

/**
 * @brief Write a configuration file as indented JSON
 * @return Nothing on success, or error message
 */
[[nodiscard]] auto saveConfigFile(const std::string& path,
                                  const RecommenderConfig& config)
    -> std::expected<void, std::string>;

/**
 * @brief Pipeline parameters for CollaborativeFilter
 */
[[nodiscard]] auto toFilterConfig(const RecommendationConfig& config)
    -> recommendation::CollaborativeFilter::Config;

/**
 * @brief Column names for CsvObservationSource
 */
[[nodiscard]] auto toDatasetSchema(const DatasetConfig& config)
    -> io::DatasetSchema;

}  // namespace affinity::config

#endif  // AFFINITY_CONFIG_RECOMMENDER_CONFIG_HPP
