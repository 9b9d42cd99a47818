#ifndef AFFINITY_RECOMMENDATION_RECOMMENDER_HPP
#define AFFINITY_RECOMMENDATION_RECOMMENDER_HPP

#include <string>
#include <vector>

#include "rating_predictor.hpp"

namespace affinity::recommendation {

/**
 * @brief One recommended item
 */
struct RecommendedItem {
    ItemId itemId = 0;
    std::string itemTitle;
    double predictedRating = 0.0;

    bool operator==(const RecommendedItem&) const = default;
};

/// Items ordered by descending predicted rating
using Recommendation = std::vector<RecommendedItem>;

/**
 * @brief Ranks predictions and keeps the best N
 */
class Recommender {
public:
    /**
     * @brief Top n predictions by descending predicted rating
     *
     * Ties are broken by ascending itemTitle, then ascending itemId.
     *
     * @param predictions Predicted ratings
     * @param n Maximum number of items; n <= 0 yields an empty list
     * @return At most n items, all of them if fewer are available
     */
    [[nodiscard]] static auto topN(const PredictionSet& predictions, int n)
        -> Recommendation;
};

}  // namespace affinity::recommendation

#endif  // AFFINITY_RECOMMENDATION_RECOMMENDER_HPP
