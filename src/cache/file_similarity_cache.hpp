// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Affinity - User-based collaborative filtering recommender
 * Copyright (C) 2024 Max Qian
 */

#ifndef AFFINITY_CACHE_FILE_SIMILARITY_CACHE_HPP
#define AFFINITY_CACHE_FILE_SIMILARITY_CACHE_HPP

#include <atomic>
#include <filesystem>
#include <mutex>

#include "similarity_cache.hpp"

namespace affinity::cache {

/**
 * @brief Similarity cache storing one CSV file per metric
 *
 * Files are named "<metric>_similarity.csv" inside the cache directory. The
 * first column holds the row user id, followed by one column per user id:
 *
 * @code
 * userId,1,2,3
 * 1,0,0.42,-0.1
 * 2,0.42,0,0.9
 * 3,-0.1,0.9,0
 * @endcode
 *
 * Values are written with the shortest representation that reads back to
 * the same double, so a reloaded matrix is bit-identical to the saved one.
 */
class FileSimilarityCache : public ISimilarityCache {
public:
    /**
     * @param directory Directory holding the cache files; created on save
     * @throws std::invalid_argument if directory is empty
     */
    explicit FileSimilarityCache(std::filesystem::path directory);

    ~FileSimilarityCache() override = default;

    [[nodiscard]] auto exists(SimilarityMetric metric) const -> bool override;

    /**
     * @brief Load and validate the cached matrix
     *
     * Fails if the file is unreadable, a cell is not a number, the header
     * does not match the row ids, or the matrix is not symmetric with a zero
     * diagonal.
     */
    [[nodiscard]] auto load(SimilarityMetric metric)
        -> std::expected<SimilarityMatrix, std::string> override;

    [[nodiscard]] auto save(SimilarityMetric metric,
                            const SimilarityMatrix& matrix)
        -> std::expected<void, std::string> override;

    auto remove(SimilarityMetric metric) -> bool override;

    [[nodiscard]] auto getStats() const -> CacheStats override;

    /**
     * @brief File used for a metric
     */
    [[nodiscard]] auto pathFor(SimilarityMetric metric) const
        -> std::filesystem::path;

    [[nodiscard]] auto directory() const -> const std::filesystem::path& {
        return directory_;
    }

private:
    std::filesystem::path directory_;
    mutable std::mutex mutex_;

    std::atomic<size_t> hitCount_{0};
    std::atomic<size_t> missCount_{0};
    std::atomic<size_t> saveCount_{0};
};

}  // namespace affinity::cache

#endif  // AFFINITY_CACHE_FILE_SIMILARITY_CACHE_HPP
