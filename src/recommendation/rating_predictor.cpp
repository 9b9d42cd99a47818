#include "rating_predictor.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

#include <spdlog/spdlog.h>

#include "recommendation_exception.hpp"

namespace affinity::recommendation {

// ============================================================================
// PredictionSet
// ============================================================================

void PredictionSet::add(Prediction prediction) {
    auto it = std::lower_bound(
        entries_.begin(), entries_.end(), prediction.itemId,
        [](const Prediction& entry, ItemId item) {
            return entry.itemId < item;
        });
    if (it != entries_.end() && it->itemId == prediction.itemId) {
        throw InvalidInputError("Item " + std::to_string(prediction.itemId) +
                                " already has a prediction");
    }
    entries_.insert(it, std::move(prediction));
}

auto PredictionSet::contains(ItemId item) const -> bool {
    return find(item).has_value();
}

auto PredictionSet::find(ItemId item) const -> std::optional<Prediction> {
    auto it = std::lower_bound(
        entries_.begin(), entries_.end(), item,
        [](const Prediction& entry, ItemId id) { return entry.itemId < id; });
    if (it == entries_.end() || it->itemId != item) {
        return std::nullopt;
    }
    return *it;
}

auto PredictionSet::findByTitle(const std::string& title) const
    -> std::optional<double> {
    auto it = std::find_if(
        entries_.begin(), entries_.end(),
        [&title](const Prediction& entry) { return entry.itemTitle == title; });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->predictedRating;
}

// ============================================================================
// RatingPredictor
// ============================================================================

namespace {

struct NeighborProfile {
    double similarity;
    double meanRating;
    const std::map<ItemId, double>* ratings;
};

}  // namespace

auto RatingPredictor::predict(const RatingStore& ratings,
                              const Neighborhood& neighborhood,
                              UserId targetUser) -> PredictionSet {
    auto targetMean = ratings.meanRating(targetUser);
    if (!targetMean) {
        throw InsufficientDataError("User " + std::to_string(targetUser) +
                                    " has no ratings to predict from");
    }

    PredictionSet predictions;
    if (neighborhood.empty()) {
        return predictions;
    }

    const auto& targetRatings = ratings.ratingsFor(targetUser);

    std::vector<NeighborProfile> profiles;
    profiles.reserve(neighborhood.size());
    std::set<ItemId> candidates;

    for (const auto& neighbor : neighborhood) {
        if (neighbor.userId == targetUser) {
            continue;
        }
        auto mean = ratings.meanRating(neighbor.userId);
        if (!mean) {
            spdlog::debug("Neighbor {} has no ratings, skipping",
                          neighbor.userId);
            continue;
        }

        const auto& history = ratings.ratingsFor(neighbor.userId);
        profiles.push_back({neighbor.score, *mean, &history});
        for (const auto& [item, _] : history) {
            if (!targetRatings.contains(item)) {
                candidates.insert(item);
            }
        }
    }

    size_t omitted = 0;
    for (ItemId item : candidates) {
        double weightedSum = 0.0;
        double similaritySum = 0.0;

        for (const auto& profile : profiles) {
            auto it = profile.ratings->find(item);
            if (it == profile.ratings->end()) {
                continue;
            }
            weightedSum +=
                profile.similarity * (it->second - profile.meanRating);
            similaritySum += profile.similarity;
        }

        if (similaritySum == 0.0) {
            ++omitted;
            continue;
        }

        predictions.add({item, ratings.titleOf(item).value_or(""),
                         *targetMean + weightedSum / similaritySum});
    }

    spdlog::debug(
        "Predicted {} of {} candidate items for user {} ({} without signal)",
        predictions.size(), candidates.size(), targetUser, omitted);
    return predictions;
}

}  // namespace affinity::recommendation
