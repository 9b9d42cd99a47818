#ifndef AFFINITY_RECOMMENDATION_COLLABORATIVE_FILTER_HPP
#define AFFINITY_RECOMMENDATION_COLLABORATIVE_FILTER_HPP

#include <memory>
#include <shared_mutex>
#include <string>

#include "../cache/similarity_cache.hpp"
#include "neighborhood_selector.hpp"
#include "rating_predictor.hpp"
#include "rating_store.hpp"
#include "recommender.hpp"
#include "similarity_engine.hpp"

namespace affinity::recommendation {

/**
 * @brief Everything produced for one recommendation request
 */
struct RecommendationResult {
    UserId targetUser = 0;
    Neighborhood neighborhood;      ///< Neighbors used for prediction
    PredictionSet predictions;      ///< Ratings for every candidate item
    Recommendation recommendation;  ///< Best predictions, ranked
};

/**
 * @brief User-based collaborative filtering pipeline
 *
 * Wires RatingStore -> InteractionMatrixBuilder -> SimilarityEngine ->
 * NeighborhoodSelector -> RatingPredictor -> Recommender for a fixed rating
 * set.
 *
 * The similarity matrix is the expensive part (users^2 x items). It is
 * computed on first use, or loaded from the optional cache, and then shared
 * as an immutable object between requests. Concurrent readers never see a
 * partially built matrix; invalidate() drops it as a whole.
 */
class CollaborativeFilter {
public:
    /**
     * @brief Configuration for collaborative filtering
     */
    struct Config {
        SimilarityMetric metric = SimilarityMetric::PEARSON;
        int neighborhoodSize = 40;  ///< Neighbors used for prediction
        int topN = 10;              ///< Recommended items
        DegeneratePolicy degeneratePolicy = DegeneratePolicy::SubstituteZero;
    };

    /**
     * @brief Construct the pipeline
     * @param ratings Rating history shared with the caller
     * @param config Pipeline parameters
     * @param cache Optional similarity cache, may be null
     * @throws std::invalid_argument if ratings is null
     */
    CollaborativeFilter(
        std::shared_ptr<const RatingStore> ratings, const Config& config,
        std::shared_ptr<cache::ISimilarityCache> cache = nullptr);

    /**
     * @brief Similarity matrix for the configured metric
     *
     * Loaded from the cache when it holds a matrix over the same users,
     * computed (and saved to the cache) otherwise.
     *
     * @throws InvalidInputError if the rating store is empty
     * @throws DegenerateInputError under DegeneratePolicy::Throw
     */
    [[nodiscard]] auto similarity() -> std::shared_ptr<const SimilarityMatrix>;

    /**
     * @brief The k users most similar to a target user
     * @throws UnknownUserError if the user has no ratings
     */
    [[nodiscard]] auto similarUsers(UserId user, int k) -> Neighborhood;

    /**
     * @brief Predicted ratings for every item the user has not rated
     * @throws UnknownUserError if the user has no ratings
     */
    [[nodiscard]] auto predict(UserId user) -> PredictionSet;

    /**
     * @brief Full recommendation for a user with the configured top N
     * @throws UnknownUserError if the user has no ratings
     */
    [[nodiscard]] auto recommend(UserId user) -> RecommendationResult;

    /**
     * @brief Full recommendation for a user with an explicit top N
     */
    [[nodiscard]] auto recommend(UserId user, int topN) -> RecommendationResult;

    /**
     * @brief Drop the shared similarity matrix and its cache entry
     *
     * Call when the underlying ratings changed.
     */
    void invalidate();

    [[nodiscard]] auto getStats() const -> std::string;

    [[nodiscard]] auto config() const -> const Config& { return config_; }

    [[nodiscard]] auto ratings() const -> const RatingStore& {
        return *ratings_;
    }

private:
    std::shared_ptr<const RatingStore> ratings_;
    Config config_;
    std::shared_ptr<cache::ISimilarityCache> cache_;
    SimilarityEngine engine_;

    std::shared_ptr<const SimilarityMatrix> similarity_;
    mutable std::shared_mutex mtx_;

    /**
     * @brief Cached matrix matching the rating store, if any
     */
    [[nodiscard]] auto loadFromCache() const
        -> std::shared_ptr<const SimilarityMatrix>;

    void saveToCache(const SimilarityMatrix& matrix) const;
};

}  // namespace affinity::recommendation

#endif  // AFFINITY_RECOMMENDATION_COLLABORATIVE_FILTER_HPP
