// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Affinity - User-based collaborative filtering recommender
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 */

#ifndef AFFINITY_IO_CSV_HANDLER_HPP
#define AFFINITY_IO_CSV_HANDLER_HPP

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace affinity::io {

/**
 * @brief CSV dialect configuration for handling different CSV formats
 */
struct CsvDialect {
    char delimiter = ',';               ///< Field separator character
    char quotechar = '"';               ///< Quote character
    char escapechar = '\\';             ///< Escape character
    bool doublequote = true;            ///< Whether to double quote characters
    bool skipinitialspace = false;      ///< Skip spaces after delimiter
    std::string lineterminator = "\n";  ///< Line ending string
    bool strict = false;                ///< Strict mode validation
};

/// One CSV row keyed by column name
using CsvRecord = std::unordered_map<std::string, std::string>;

/**
 * @brief Result statistics for import operations
 */
struct ImportResult {
    int totalRecords = 0;             ///< Total records encountered
    int successCount = 0;             ///< Successfully imported
    int errorCount = 0;               ///< Records with errors
    int duplicateCount = 0;           ///< Duplicate records skipped
    int unmatchedCount = 0;           ///< Records dropped by a join
    std::vector<std::string> errors;  ///< Detailed error messages
};

/**
 * @brief CSV handler for reading and writing delimited text files
 *
 * Reads a header line followed by data rows into records keyed by column
 * name, and writes records back with quoting as required by the dialect.
 */
class CsvHandler {
public:
    CsvHandler();
    ~CsvHandler();

    /**
     * @brief Read CSV file and return raw data as records
     *
     * @param filename Path to the CSV file
     * @param dialect CSV dialect configuration
     * @return Expected vector of field dictionaries, or error string
     */
    [[nodiscard]] auto read(const std::string& filename,
                            const CsvDialect& dialect = {})
        -> std::expected<std::vector<CsvRecord>, std::string>;

    /**
     * @brief Write raw data to CSV file
     *
     * @param filename Output file path
     * @param data Vector of field dictionaries
     * @param fields Column names, in output order
     * @param dialect CSV dialect configuration
     * @return Expected count of written rows, or error string
     */
    [[nodiscard]] auto write(const std::string& filename,
                             const std::vector<CsvRecord>& data,
                             const std::vector<std::string>& fields,
                             const CsvDialect& dialect = {})
        -> std::expected<int, std::string>;

    /**
     * @brief Parse a whole field as a signed 64-bit integer
     * @return Parsed value, or nullopt if the field is not an integer
     */
    [[nodiscard]] static auto parseInt64(const std::string& field)
        -> std::optional<std::int64_t>;

    /**
     * @brief Parse a whole field as a double
     * @return Parsed value, or nullopt if the field is not a number
     */
    [[nodiscard]] static auto parseDouble(const std::string& field)
        -> std::optional<double>;

    /**
     * @brief Format a double so that parseDouble restores it exactly
     */
    [[nodiscard]] static auto formatDouble(double value) -> std::string;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace affinity::io

#endif  // AFFINITY_IO_CSV_HANDLER_HPP
