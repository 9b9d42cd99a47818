// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file recommendation.hpp
 * @brief Aggregated header for the collaborative filtering module.
 *
 * This is the primary include file for the recommendation components.
 * Include this file to get access to the rating store, the similarity
 * engine, neighborhood selection, prediction and ranking.
 *
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2024 Max Qian
 */

#pragma once

// ============================================================================
// Recommendation Components
// ============================================================================

#include "collaborative_filter.hpp"
#include "interaction_matrix.hpp"
#include "neighborhood_selector.hpp"
#include "rating_predictor.hpp"
#include "rating_store.hpp"
#include "recommendation_exception.hpp"
#include "recommender.hpp"
#include "similarity_engine.hpp"
#include "similarity_matrix.hpp"

namespace affinity::recommendation {

/**
 * @brief Recommendation module version.
 */
inline constexpr const char* RECOMMENDATION_MODULE_VERSION = "1.0.0";

/**
 * @brief Get recommendation module version string.
 * @return Version string.
 */
[[nodiscard]] inline const char* getRecommendationModuleVersion() noexcept {
    return RECOMMENDATION_MODULE_VERSION;
}

}  // namespace affinity::recommendation
