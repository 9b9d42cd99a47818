// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Affinity - User-based collaborative filtering recommender
 * Copyright (C) 2024 Max Qian
 */

#include "observation_source.hpp"

#include <cmath>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

namespace affinity::io {

namespace {

constexpr size_t MAX_REPORTED_ERRORS = 100;

auto requireColumns(const std::vector<CsvRecord>& records,
                    const std::vector<std::string>& columns,
                    const std::string& path)
    -> std::expected<void, std::string> {
    if (records.empty()) {
        return {};
    }
    for (const auto& column : columns) {
        if (!records.front().contains(column)) {
            return std::unexpected("Missing column '" + column + "' in " +
                                   path);
        }
    }
    return {};
}

void recordError(ImportResult& result, std::string message) {
    ++result.errorCount;
    if (result.errors.size() < MAX_REPORTED_ERRORS) {
        result.errors.push_back(std::move(message));
    }
}

}  // namespace

CsvObservationSource::CsvObservationSource(std::string ratingsPath,
                                           std::string itemsPath,
                                           DatasetSchema schema,
                                           CsvDialect dialect)
    : ratingsPath_(std::move(ratingsPath)),
      itemsPath_(std::move(itemsPath)),
      schema_(std::move(schema)),
      dialect_(std::move(dialect)) {}

auto CsvObservationSource::loadObservations()
    -> std::expected<std::vector<data::Observation>, std::string> {
    CsvHandler handler;
    lastResult_ = ImportResult{};

    // Items table: item id -> title
    auto items = handler.read(itemsPath_, dialect_);
    if (!items) {
        return std::unexpected("Failed to read items: " + items.error());
    }
    if (auto check = requireColumns(
            *items, {schema_.itemColumn, schema_.titleColumn}, itemsPath_);
        !check) {
        return std::unexpected(check.error());
    }

    std::unordered_map<data::ItemId, std::string> titles;
    titles.reserve(items->size());
    size_t skippedItems = 0;
    for (auto& row : *items) {
        auto itemId = CsvHandler::parseInt64(row[schema_.itemColumn]);
        if (!itemId) {
            ++skippedItems;
            continue;
        }
        if (!titles.try_emplace(*itemId, std::move(row[schema_.titleColumn]))
                 .second) {
            SPDLOG_DEBUG("Duplicate item {} in {}, keeping first title",
                         *itemId, itemsPath_);
        }
    }
    if (skippedItems > 0) {
        spdlog::warn("Skipped {} item rows with a malformed {} in {}",
                     skippedItems, schema_.itemColumn, itemsPath_);
    }

    // Ratings table joined with titles
    auto ratings = handler.read(ratingsPath_, dialect_);
    if (!ratings) {
        return std::unexpected("Failed to read ratings: " + ratings.error());
    }
    if (auto check = requireColumns(
            *ratings,
            {schema_.userColumn, schema_.itemColumn, schema_.ratingColumn},
            ratingsPath_);
        !check) {
        return std::unexpected(check.error());
    }

    std::vector<data::Observation> observations;
    observations.reserve(ratings->size());
    lastResult_.totalRecords = static_cast<int>(ratings->size());

    for (size_t i = 0; i < ratings->size(); ++i) {
        auto& row = (*ratings)[i];
        // Data records are numbered from 1, blank lines and the header
        // excluded
        const auto recordNum = std::to_string(i + 1);

        auto userId = CsvHandler::parseInt64(row[schema_.userColumn]);
        auto itemId = CsvHandler::parseInt64(row[schema_.itemColumn]);
        auto rating = CsvHandler::parseDouble(row[schema_.ratingColumn]);

        if (!userId || !itemId) {
            recordError(lastResult_,
                        "Record " + recordNum + ": malformed user or item id");
            continue;
        }
        if (!rating || !std::isfinite(*rating)) {
            recordError(lastResult_, "Record " + recordNum +
                                         ": malformed rating '" +
                                         row[schema_.ratingColumn] + "'");
            continue;
        }

        auto title = titles.find(*itemId);
        if (title == titles.end()) {
            ++lastResult_.unmatchedCount;
            continue;
        }

        observations.emplace_back(*userId, *itemId, *rating, title->second);
        ++lastResult_.successCount;
    }

    spdlog::info(
        "Loaded {} observations from {} ({} malformed, {} without item)",
        observations.size(), ratingsPath_, lastResult_.errorCount,
        lastResult_.unmatchedCount);

    if (observations.empty()) {
        return std::unexpected("No observations loaded from " + ratingsPath_);
    }
    return observations;
}

}  // namespace affinity::io
