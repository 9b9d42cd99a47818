// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Affinity - User-based collaborative filtering recommender
 * Copyright (C) 2024 Max Qian
 */

#ifndef AFFINITY_CACHE_SIMILARITY_CACHE_HPP
#define AFFINITY_CACHE_SIMILARITY_CACHE_HPP

#include <expected>
#include <string>

#include "../recommendation/similarity_matrix.hpp"

namespace affinity::cache {

using recommendation::SimilarityMatrix;
using recommendation::SimilarityMetric;

/**
 * @brief Statistics about cache usage
 */
struct CacheStats {
    size_t hitCount = 0;   ///< Successful loads
    size_t missCount = 0;  ///< Loads with nothing stored
    size_t saveCount = 0;  ///< Successful saves

    [[nodiscard]] double getHitRate() const {
        if (hitCount + missCount == 0) return 0.0;
        return static_cast<double>(hitCount) / (hitCount + missCount) * 100.0;
    }
};

/**
 * @brief Abstract store for precomputed similarity matrices
 *
 * Entries are keyed by similarity metric. Implementations must be
 * thread-safe.
 *
 * Error Handling:
 * - Returns std::expected<T, std::string> for fallible operations
 * - A failed load is never fatal: callers recompute the matrix
 */
class ISimilarityCache {
public:
    virtual ~ISimilarityCache() = default;

    ISimilarityCache(const ISimilarityCache&) = delete;
    ISimilarityCache& operator=(const ISimilarityCache&) = delete;

    /**
     * @brief Check whether a matrix is stored for a metric
     */
    [[nodiscard]] virtual auto exists(SimilarityMetric metric) const
        -> bool = 0;

    /**
     * @brief Load the matrix stored for a metric
     * @return Stored matrix, or error message
     */
    [[nodiscard]] virtual auto load(SimilarityMetric metric)
        -> std::expected<SimilarityMatrix, std::string> = 0;

    /**
     * @brief Store a matrix for a metric, replacing any previous one
     * @return Nothing on success, or error message
     */
    [[nodiscard]] virtual auto save(SimilarityMetric metric,
                                    const SimilarityMatrix& matrix)
        -> std::expected<void, std::string> = 0;

    /**
     * @brief Drop the matrix stored for a metric
     * @return true if something was removed
     */
    virtual auto remove(SimilarityMetric metric) -> bool = 0;

    [[nodiscard]] virtual auto getStats() const -> CacheStats = 0;

protected:
    ISimilarityCache() = default;
};

}  // namespace affinity::cache

#endif  // AFFINITY_CACHE_SIMILARITY_CACHE_HPP
