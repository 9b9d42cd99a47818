// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Affinity - User-based collaborative filtering recommender
 * Copyright (C) 2024 Max Qian
 */

#ifndef AFFINITY_CACHE_MEMORY_SIMILARITY_CACHE_HPP
#define AFFINITY_CACHE_MEMORY_SIMILARITY_CACHE_HPP

#include <atomic>
#include <map>
#include <shared_mutex>

#include "similarity_cache.hpp"

namespace affinity::cache {

/**
 * @brief In-process similarity cache
 *
 * Keeps one matrix per metric for the lifetime of the process.
 */
class MemorySimilarityCache : public ISimilarityCache {
public:
    MemorySimilarityCache() = default;
    ~MemorySimilarityCache() override = default;

    [[nodiscard]] auto exists(SimilarityMetric metric) const -> bool override;

    [[nodiscard]] auto load(SimilarityMetric metric)
        -> std::expected<SimilarityMatrix, std::string> override;

    [[nodiscard]] auto save(SimilarityMetric metric,
                            const SimilarityMatrix& matrix)
        -> std::expected<void, std::string> override;

    auto remove(SimilarityMetric metric) -> bool override;

    [[nodiscard]] auto getStats() const -> CacheStats override;

private:
    mutable std::shared_mutex mutex_;
    std::map<SimilarityMetric, SimilarityMatrix> entries_;

    std::atomic<size_t> hitCount_{0};
    std::atomic<size_t> missCount_{0};
    std::atomic<size_t> saveCount_{0};
};

}  // namespace affinity::cache

#endif  // AFFINITY_CACHE_MEMORY_SIMILARITY_CACHE_HPP
