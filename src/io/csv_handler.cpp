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

#include "csv_handler.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <fstream>
#include <system_error>
#include <utility>

namespace affinity::io {

/**
 * @brief Internal implementation of CSV handler
 */
class CsvHandler::Impl {
public:
    /**
     * @brief Parse CSV line according to dialect
     *
     * @param line Input line to parse
     * @param dialect CSV dialect configuration
     * @return Vector of field values
     */
    static auto parseLine(const std::string& line, const CsvDialect& dialect)
        -> std::vector<std::string> {
        std::vector<std::string> fields;
        std::string field;
        bool inQuotes = false;
        bool escapeNext = false;

        auto pushField = [&]() {
            if (dialect.skipinitialspace && !field.empty() &&
                std::isspace(static_cast<unsigned char>(field.front()))) {
                field.erase(0, 1);
            }
            fields.push_back(field);
            field.clear();
        };

        for (size_t i = 0; i < line.length(); ++i) {
            char c = line[i];

            if (escapeNext) {
                field += c;
                escapeNext = false;
                continue;
            }

            if (c == dialect.escapechar) {
                escapeNext = true;
                continue;
            }

            if (c == dialect.quotechar) {
                if (inQuotes && i + 1 < line.length() &&
                    line[i + 1] == dialect.quotechar && dialect.doublequote) {
                    field += dialect.quotechar;
                    ++i;  // Skip next quote
                } else {
                    inQuotes = !inQuotes;
                }
                continue;
            }

            if (c == dialect.delimiter && !inQuotes) {
                pushField();
                continue;
            }

            field += c;
        }

        // Add last field
        if (!field.empty() || !inQuotes) {
            pushField();
        }

        return fields;
    }

    /**
     * @brief Escape a field for CSV output
     *
     * @param field Field value to escape
     * @param dialect CSV dialect configuration
     * @return Escaped field value
     */
    static auto escapeField(const std::string& field, const CsvDialect& dialect)
        -> std::string {
        bool needsQuotes =
            field.find(dialect.delimiter) != std::string::npos ||
            field.find(dialect.quotechar) != std::string::npos ||
            field.find(dialect.escapechar) != std::string::npos ||
            field.find('\n') != std::string::npos ||
            field.find('\r') != std::string::npos;

        if (!needsQuotes) {
            return field;
        }

        std::string result;
        result += dialect.quotechar;

        for (char c : field) {
            if (c == dialect.quotechar) {
                if (dialect.doublequote) {
                    result += dialect.quotechar;
                    result += dialect.quotechar;
                } else {
                    result += dialect.escapechar;
                    result += dialect.quotechar;
                }
            } else if (c == dialect.escapechar) {
                result += dialect.escapechar;
                result += c;
            } else {
                result += c;
            }
        }

        result += dialect.quotechar;
        return result;
    }

    /**
     * @brief Strip surrounding whitespace
     */
    static auto trim(const std::string& str) -> std::string {
        size_t first = 0;
        size_t last = str.size();
        while (first < last &&
               std::isspace(static_cast<unsigned char>(str[first]))) {
            ++first;
        }
        while (last > first &&
               std::isspace(static_cast<unsigned char>(str[last - 1]))) {
            --last;
        }
        return str.substr(first, last - first);
    }
};

// ============================================================================
// CsvHandler Implementation
// ============================================================================

CsvHandler::CsvHandler() : impl_(std::make_unique<Impl>()) {}

CsvHandler::~CsvHandler() = default;

auto CsvHandler::read(const std::string& filename, const CsvDialect& dialect)
    -> std::expected<std::vector<CsvRecord>, std::string> {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(std::string("Failed to open file: ") + filename);
    }

    std::vector<CsvRecord> records;
    std::string line;
    size_t lineNum = 0;

    auto nextLine = [&file, &line, &lineNum]() -> bool {
        if (!std::getline(file, line)) {
            return false;
        }
        ++lineNum;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return true;
    };

    // Read header line
    if (!nextLine()) {
        return std::unexpected("Empty CSV file: " + filename);
    }

    auto fieldnames = Impl::parseLine(line, dialect);
    if (fieldnames.empty() ||
        (fieldnames.size() == 1 && fieldnames[0].empty())) {
        return std::unexpected("No field names in CSV header: " + filename);
    }

    // Read data lines
    while (nextLine()) {
        if (line.empty()) {
            continue;
        }

        auto fields = Impl::parseLine(line, dialect);

        if (fields.size() != fieldnames.size()) {
            if (dialect.strict) {
                return std::unexpected(
                    std::string("Field count mismatch at line ") +
                    std::to_string(lineNum) + ": expected " +
                    std::to_string(fieldnames.size()) + ", got " +
                    std::to_string(fields.size()));
            }
            // Pad with empty strings or truncate
            fields.resize(fieldnames.size());
        }

        CsvRecord record;
        for (size_t i = 0; i < fieldnames.size(); ++i) {
            record[fieldnames[i]] = std::move(fields[i]);
        }
        records.push_back(std::move(record));
    }

    return records;
}

auto CsvHandler::write(const std::string& filename,
                       const std::vector<CsvRecord>& data,
                       const std::vector<std::string>& fields,
                       const CsvDialect& dialect)
    -> std::expected<int, std::string> {
    if (fields.empty()) {
        return std::unexpected("No columns to write");
    }

    std::ofstream file(filename, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return std::unexpected(std::string("Failed to create file: ") +
                               filename);
    }

    // Write header
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            file << dialect.delimiter;
        }
        file << Impl::escapeField(fields[i], dialect);
    }
    file << dialect.lineterminator;

    // Write data rows
    int rowCount = 0;
    for (const auto& record : data) {
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) {
                file << dialect.delimiter;
            }

            auto it = record.find(fields[i]);
            if (it != record.end()) {
                file << Impl::escapeField(it->second, dialect);
            }
        }
        file << dialect.lineterminator;
        ++rowCount;
    }

    file.flush();
    if (!file.good()) {
        return std::unexpected("Error writing to CSV file: " + filename);
    }

    return rowCount;
}

auto CsvHandler::parseInt64(const std::string& field)
    -> std::optional<std::int64_t> {
    auto text = Impl::trim(field);
    if (text.empty()) {
        return std::nullopt;
    }

    std::int64_t value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto CsvHandler::parseDouble(const std::string& field)
    -> std::optional<double> {
    auto text = Impl::trim(field);
    if (text.empty()) {
        return std::nullopt;
    }

    double value = 0.0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto CsvHandler::formatDouble(double value) -> std::string {
    std::array<char, 32> buffer{};
    auto [ptr, ec] =
        std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc()) {
        return std::to_string(value);
    }
    return std::string(buffer.data(), ptr);
}

}  // namespace affinity::io
