// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Affinity - User-based collaborative filtering recommender
 * Copyright (C) 2024 Max Qian
 */

#include "memory_similarity_cache.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

namespace affinity::cache {

auto MemorySimilarityCache::exists(SimilarityMetric metric) const -> bool {
    std::shared_lock lock(mutex_);
    return entries_.contains(metric);
}

auto MemorySimilarityCache::load(SimilarityMetric metric)
    -> std::expected<SimilarityMatrix, std::string> {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(metric);
    if (it == entries_.end()) {
        ++missCount_;
        return std::unexpected("No " + recommendation::metricToString(metric) +
                               " similarity matrix in memory cache");
    }
    ++hitCount_;
    return it->second;
}

auto MemorySimilarityCache::save(SimilarityMetric metric,
                                 const SimilarityMatrix& matrix)
    -> std::expected<void, std::string> {
    std::unique_lock lock(mutex_);
    entries_.insert_or_assign(metric, matrix);
    ++saveCount_;
    SPDLOG_DEBUG("Cached {} similarity matrix for {} users in memory",
                 recommendation::metricToString(metric), matrix.size());
    return {};
}

auto MemorySimilarityCache::remove(SimilarityMetric metric) -> bool {
    std::unique_lock lock(mutex_);
    return entries_.erase(metric) > 0;
}

auto MemorySimilarityCache::getStats() const -> CacheStats {
    CacheStats stats;
    stats.hitCount = hitCount_.load();
    stats.missCount = missCount_.load();
    stats.saveCount = saveCount_.load();
    return stats;
}

}  // namespace affinity::cache
