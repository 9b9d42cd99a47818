/*
 * recommendation_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-08

Description: Collaborative filtering pipeline parameters

**************************************************/

#ifndef AFFINITY_CONFIG_SECTIONS_RECOMMENDATION_CONFIG_HPP
#define AFFINITY_CONFIG_SECTIONS_RECOMMENDATION_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"
#include "../../recommendation/similarity_engine.hpp"

namespace affinity::config {

/**
 * @brief Recommendation pipeline configuration
 *
 * @example
 * ```json
 * "recommendation": {
 *   "metric": "pearson",
 *   "neighborhoodSize": 40,
 *   "topN": 10,
 *   "diagnosticNeighbors": 10,
 *   "degeneratePolicy": "zero"
 * }
 * ```
 */
struct RecommendationConfig : ConfigSection<RecommendationConfig> {
    static constexpr std::string_view PATH = "/affinity/recommendation";

    recommendation::SimilarityMetric metric{
        recommendation::SimilarityMetric::PEARSON};
    int neighborhoodSize{40};     ///< Neighbors used for prediction
    int topN{10};                 ///< Recommended items
    int diagnosticNeighbors{10};  ///< Similar users shown to the user
    recommendation::DegeneratePolicy degeneratePolicy{
        recommendation::DegeneratePolicy::SubstituteZero};

    [[nodiscard]] json serialize() const {
        return {{"metric", recommendation::metricToString(metric)},
                {"neighborhoodSize", neighborhoodSize},
                {"topN", topN},
                {"diagnosticNeighbors", diagnosticNeighbors},
                {"degeneratePolicy",
                 recommendation::degeneratePolicyToString(degeneratePolicy)}};
    }

    [[nodiscard]] static RecommendationConfig deserialize(const json& j) {
        RecommendationConfig cfg;

        auto metricName =
            j.value("metric", recommendation::metricToString(cfg.metric));
        auto metric = recommendation::metricFromString(metricName);
        if (!metric) {
            throw InvalidConfigException(
                std::string(PATH) + "/metric",
                "unknown similarity metric '" + metricName + "'");
        }
        cfg.metric = *metric;

        auto policyName = j.value(
            "degeneratePolicy",
            recommendation::degeneratePolicyToString(cfg.degeneratePolicy));
        auto policy = recommendation::degeneratePolicyFromString(policyName);
        if (!policy) {
            throw InvalidConfigException(
                std::string(PATH) + "/degeneratePolicy",
                "unknown policy '" + policyName + "', expected zero or throw");
        }
        cfg.degeneratePolicy = *policy;

        cfg.neighborhoodSize =
            j.value("neighborhoodSize", cfg.neighborhoodSize);
        cfg.topN = j.value("topN", cfg.topN);
        cfg.diagnosticNeighbors =
            j.value("diagnosticNeighbors", cfg.diagnosticNeighbors);

        if (cfg.neighborhoodSize < 0) {
            throw InvalidConfigException(
                std::string(PATH) + "/neighborhoodSize",
                "must not be negative");
        }
        if (cfg.topN < 0) {
            throw InvalidConfigException(std::string(PATH) + "/topN",
                                         "must not be negative");
        }
        if (cfg.diagnosticNeighbors < 0) {
            throw InvalidConfigException(
                std::string(PATH) + "/diagnosticNeighbors",
                "must not be negative");
        }
        return cfg;
    }
};

}  // namespace affinity::config

#endif  // AFFINITY_CONFIG_SECTIONS_RECOMMENDATION_CONFIG_HPP
