// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Affinity - User-based collaborative filtering recommender
 * Copyright (C) 2024 Max Qian
 */

#ifndef AFFINITY_IO_OBSERVATION_SOURCE_HPP
#define AFFINITY_IO_OBSERVATION_SOURCE_HPP

#include <expected>
#include <string>
#include <vector>

#include "../data/observation.hpp"
#include "csv_handler.hpp"

namespace affinity::io {

/**
 * @brief Column names of the ratings and items tables
 */
struct DatasetSchema {
    std::string userColumn = "userId";    ///< Ratings: user identifier
    std::string itemColumn = "movieId";   ///< Both tables: item identifier
    std::string ratingColumn = "rating";  ///< Ratings: rating value
    std::string titleColumn = "title";    ///< Items: item title
};

/**
 * @brief Provider of joined (user, item, rating, title) observations
 */
class IObservationSource {
public:
    virtual ~IObservationSource() = default;

    /**
     * @brief Load every observation
     * @return Observations, or error message
     */
    [[nodiscard]] virtual auto loadObservations()
        -> std::expected<std::vector<data::Observation>, std::string> = 0;
};

/**
 * @brief Observation source backed by a ratings CSV and an items CSV
 *
 * The two files are inner-joined on the item column: a rating whose item has
 * no row in the items file is dropped. Rows with a non-numeric identifier or
 * a non-finite rating are skipped and reported in the import result.
 */
class CsvObservationSource : public IObservationSource {
public:
    CsvObservationSource(std::string ratingsPath, std::string itemsPath,
                         DatasetSchema schema = {}, CsvDialect dialect = {});

    ~CsvObservationSource() override = default;

    [[nodiscard]] auto loadObservations()
        -> std::expected<std::vector<data::Observation>, std::string> override;

    /**
     * @brief Statistics of the most recent ratings import
     */
    [[nodiscard]] auto lastImportResult() const -> const ImportResult& {
        return lastResult_;
    }

private:
    std::string ratingsPath_;
    std::string itemsPath_;
    DatasetSchema schema_;
    CsvDialect dialect_;
    ImportResult lastResult_;
};

}  // namespace affinity::io

#endif  // AFFINITY_IO_OBSERVATION_SOURCE_HPP
