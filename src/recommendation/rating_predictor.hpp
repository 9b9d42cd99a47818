#ifndef AFFINITY_RECOMMENDATION_RATING_PREDICTOR_HPP
#define AFFINITY_RECOMMENDATION_RATING_PREDICTOR_HPP

#include <optional>
#include <string>
#include <vector>

#include "neighborhood_selector.hpp"
#include "rating_store.hpp"

namespace affinity::recommendation {

/**
 * @brief Predicted rating of one item for the target user
 */
struct Prediction {
    ItemId itemId = 0;
    std::string itemTitle;
    double predictedRating = 0.0;

    bool operator==(const Prediction&) const = default;
};

/**
 * @brief Predicted ratings, one per item, ordered by ascending itemId
 */
class PredictionSet {
public:
    using const_iterator = std::vector<Prediction>::const_iterator;

    PredictionSet() = default;

    /**
     * @brief Add a prediction
     * @throws InvalidInputError if the item already has a prediction
     */
    void add(Prediction prediction);

    [[nodiscard]] auto contains(ItemId item) const -> bool;

    /**
     * @brief Prediction for an item, or nullopt if absent
     */
    [[nodiscard]] auto find(ItemId item) const -> std::optional<Prediction>;

    /**
     * @brief Predicted rating for the first item carrying this title
     */
    [[nodiscard]] auto findByTitle(const std::string& title) const
        -> std::optional<double>;

    [[nodiscard]] auto entries() const -> const std::vector<Prediction>& {
        return entries_;
    }
    [[nodiscard]] auto size() const -> size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const -> bool { return entries_.empty(); }
    [[nodiscard]] auto begin() const -> const_iterator {
        return entries_.begin();
    }
    [[nodiscard]] auto end() const -> const_iterator { return entries_.end(); }

    bool operator==(const PredictionSet&) const = default;

private:
    std::vector<Prediction> entries_;
};

/**
 * @brief Predicts unseen item ratings from a neighborhood
 *
 * For every item rated by at least one neighbor and not by the target user:
 *
 *   prediction = mean(target) + sum(sim(u) * (r(u, i) - mean(u))) / sum(sim(u))
 *
 * where both sums run over the neighbors u that rated the item. Items whose
 * similarity sum is exactly 0 carry no signal and are left out.
 */
class RatingPredictor {
public:
    /**
     * @brief Predict ratings for the target user
     * @param ratings Rating history of every user
     * @param neighborhood Neighbors of the target user
     * @param targetUser Target user
     * @return Predictions for candidate items; empty for an empty
     * neighborhood
     * @throws InsufficientDataError if the target user has no ratings
     */
    [[nodiscard]] static auto predict(const RatingStore& ratings,
                                      const Neighborhood& neighborhood,
                                      UserId targetUser) -> PredictionSet;
};

}  // namespace affinity::recommendation

#endif  // AFFINITY_RECOMMENDATION_RATING_PREDICTOR_HPP
