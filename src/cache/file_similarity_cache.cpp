// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Affinity - User-based collaborative filtering recommender
 * Copyright (C) 2024 Max Qian
 */

#include "file_similarity_cache.hpp"

#include <cmath>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "../io/csv_handler.hpp"

namespace affinity::cache {

namespace {

constexpr const char* USER_COLUMN = "userId";

}  // namespace

FileSimilarityCache::FileSimilarityCache(std::filesystem::path directory)
    : directory_(std::move(directory)) {
    if (directory_.empty()) {
        throw std::invalid_argument("Cache directory cannot be empty");
    }
    SPDLOG_INFO("FileSimilarityCache using directory: {}", directory_.string());
}

auto FileSimilarityCache::pathFor(SimilarityMetric metric) const
    -> std::filesystem::path {
    return directory_ /
           (recommendation::metricToString(metric) + "_similarity.csv");
}

auto FileSimilarityCache::exists(SimilarityMetric metric) const -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(pathFor(metric), ec);
}

auto FileSimilarityCache::load(SimilarityMetric metric)
    -> std::expected<SimilarityMatrix, std::string> {
    std::lock_guard lock(mutex_);
    const auto path = pathFor(metric);

    if (std::error_code ec; !std::filesystem::is_regular_file(path, ec)) {
        ++missCount_;
        return std::unexpected("No cached matrix at " + path.string());
    }

    io::CsvHandler handler;
    io::CsvDialect dialect;
    dialect.strict = true;

    auto records = handler.read(path.string(), dialect);
    if (!records) {
        return std::unexpected(records.error());
    }
    if (records->empty()) {
        return std::unexpected("Cached matrix is empty: " + path.string());
    }

    const size_t n = records->size();
    std::vector<recommendation::UserId> userIds;
    userIds.reserve(n);
    for (auto& record : *records) {
        if (record.size() != n + 1) {
            return std::unexpected("Header of " + path.string() +
                                   " does not match its " + std::to_string(n) +
                                   " rows");
        }
        auto id = io::CsvHandler::parseInt64(record[USER_COLUMN]);
        if (!id) {
            return std::unexpected("Malformed user id in " + path.string());
        }
        if (!userIds.empty() && *id <= userIds.back()) {
            return std::unexpected("User ids in " + path.string() +
                                   " are not strictly increasing");
        }
        userIds.push_back(*id);
    }

    const auto size = static_cast<Eigen::Index>(n);
    Eigen::MatrixXd values(size, size);
    for (size_t i = 0; i < n; ++i) {
        auto& record = (*records)[i];
        for (size_t j = 0; j < n; ++j) {
            auto cell = record.find(std::to_string(userIds[j]));
            if (cell == record.end()) {
                return std::unexpected("Missing column for user " +
                                       std::to_string(userIds[j]) + " in " +
                                       path.string());
            }
            auto value = io::CsvHandler::parseDouble(cell->second);
            if (!value) {
                return std::unexpected("Malformed similarity '" +
                                       cell->second + "' in " + path.string());
            }
            if (!std::isfinite(*value) || *value < -1.0 || *value > 1.0) {
                return std::unexpected("Similarity '" + cell->second +
                                       "' outside [-1, 1] in " +
                                       path.string());
            }
            values(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
                *value;
        }
    }

    SimilarityMatrix matrix(std::move(userIds), std::move(values));
    if (!matrix.isSymmetric() || !matrix.hasZeroDiagonal()) {
        return std::unexpected("Cached matrix in " + path.string() +
                               " is not symmetric with a zero diagonal");
    }

    ++hitCount_;
    spdlog::info("Loaded {} similarity matrix for {} users from {}",
                 recommendation::metricToString(metric), matrix.size(),
                 path.string());
    return matrix;
}

auto FileSimilarityCache::save(SimilarityMetric metric,
                               const SimilarityMatrix& matrix)
    -> std::expected<void, std::string> {
    std::lock_guard lock(mutex_);

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return std::unexpected("Failed to create cache directory " +
                               directory_.string() + ": " + ec.message());
    }

    const auto& userIds = matrix.userIds();
    const auto& values = matrix.values();

    std::vector<std::string> fields;
    fields.reserve(userIds.size() + 1);
    fields.emplace_back(USER_COLUMN);
    for (auto id : userIds) {
        fields.push_back(std::to_string(id));
    }

    std::vector<io::CsvRecord> rows;
    rows.reserve(userIds.size());
    for (size_t i = 0; i < userIds.size(); ++i) {
        io::CsvRecord row;
        row[USER_COLUMN] = fields[i + 1];
        for (size_t j = 0; j < userIds.size(); ++j) {
            row[fields[j + 1]] = io::CsvHandler::formatDouble(
                values(static_cast<Eigen::Index>(i),
                       static_cast<Eigen::Index>(j)));
        }
        rows.push_back(std::move(row));
    }

    // Write next to the target and rename so readers never see a partial file
    const auto path = pathFor(metric);
    auto tmpPath = path;
    tmpPath += ".tmp";

    io::CsvHandler handler;
    auto written = handler.write(tmpPath.string(), rows, fields);
    if (!written) {
        std::filesystem::remove(tmpPath, ec);
        return std::unexpected(written.error());
    }

    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::filesystem::remove(tmpPath, ec);
        return std::unexpected("Failed to move cache file into place at " +
                               path.string());
    }

    ++saveCount_;
    spdlog::info("Saved {} similarity matrix for {} users to {}",
                 recommendation::metricToString(metric), matrix.size(),
                 path.string());
    return {};
}

auto FileSimilarityCache::remove(SimilarityMetric metric) -> bool {
    std::lock_guard lock(mutex_);
    std::error_code ec;
    bool removed = std::filesystem::remove(pathFor(metric), ec);
    if (ec) {
        SPDLOG_WARN("Failed to remove cache file {}: {}",
                    pathFor(metric).string(), ec.message());
        return false;
    }
    return removed;
}

auto FileSimilarityCache::getStats() const -> CacheStats {
    CacheStats stats;
    stats.hitCount = hitCount_.load();
    stats.missCount = missCount_.load();
    stats.saveCount = saveCount_.load();
    return stats;
}

}  // namespace affinity::cache
