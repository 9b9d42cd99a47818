/*
 * movie_recommendation_example.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-08

Description: Movie recommendation example

Loads a MovieLens style ratings/movies pair, prints the users most similar
to a target user and the movies recommended to them.

Usage: movie_recommendation_example <userId> [config.json]

*************************************************/

#include <charconv>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

#include <spdlog/spdlog.h>

#include "cache/file_similarity_cache.hpp"
#include "config/recommender_config.hpp"
#include "io/observation_source.hpp"
#include "logging/logging.hpp"
#include "recommendation/recommendation.hpp"

using namespace affinity;

namespace {

auto parseUserId(const std::string& text) -> std::optional<data::UserId> {
    data::UserId value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Print the most similar users of the target
 */
void printSimilarUsers(const recommendation::Neighborhood& neighbors,
                       data::UserId target) {
    std::cout << "\nTop " << neighbors.size()
              << " most similar users for target user with ID " << target
              << "\n";
    for (const auto& neighbor : neighbors) {
        std::cout << "user " << neighbor.userId << " : " << std::fixed
                  << std::setprecision(2) << neighbor.score << "\n";
    }
}

/**
 * @brief Print the ranked recommendation
 */
void printRecommendation(const recommendation::Recommendation& items) {
    std::cout << "\nTop " << items.size() << " recommended movies\n";
    int rank = 1;
    for (const auto& item : items) {
        std::cout << std::setw(3) << rank++ << ". " << item.itemTitle << " ("
                  << std::fixed << std::setprecision(2)
                  << item.predictedRating << ")\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <userId> [config.json]\n";
        return 1;
    }

    auto target = parseUserId(argv[1]);
    if (!target) {
        std::cerr << "Invalid user id: " << argv[1] << "\n";
        return 1;
    }

    auto config = config::RecommenderConfig::defaults();
    if (argc > 2) {
        auto loaded = config::loadConfigFile(argv[2]);
        if (!loaded) {
            std::cerr << loaded.error() << "\n";
            return 1;
        }
        config = *loaded;
    }

    try {
        logging::initLogging(config.logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << "\n";
        return 1;
    }

    spdlog::info("Affinity recommendation module {}",
                 recommendation::getRecommendationModuleVersion());

    io::CsvObservationSource source(config.dataset.ratingsPath,
                                    config.dataset.itemsPath,
                                    config::toDatasetSchema(config.dataset));
    auto observations = source.loadObservations();
    if (!observations) {
        spdlog::error("Failed to load dataset: {}", observations.error());
        return 1;
    }
    for (const auto& error : source.lastImportResult().errors) {
        spdlog::debug("Skipped rating: {}", error);
    }

    std::shared_ptr<cache::ISimilarityCache> similarityCache;
    if (config.cache.enabled) {
        similarityCache = std::make_shared<cache::FileSimilarityCache>(
            config.cache.directory);
    }

    try {
        auto ratings =
            std::make_shared<const recommendation::RatingStore>(*observations);
        recommendation::CollaborativeFilter filter(
            ratings, config::toFilterConfig(config.recommendation),
            similarityCache);

        auto similar = filter.similarUsers(
            *target, config.recommendation.diagnosticNeighbors);
        printSimilarUsers(similar, *target);

        auto result = filter.recommend(*target);
        printRecommendation(result.recommendation);

        spdlog::debug("{}", filter.getStats());
    } catch (const recommendation::RecommendationException& e) {
        spdlog::error("Recommendation failed: {}", e.what());
        return 1;
    }

    return 0;
}
