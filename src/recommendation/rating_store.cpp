#include "rating_store.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

#include <spdlog/spdlog.h>

#include "recommendation_exception.hpp"

namespace affinity::recommendation {

namespace {

struct RatingAccumulator {
    double sum = 0.0;
    int count = 0;
};

const std::map<ItemId, double> EMPTY_RATINGS;

}  // namespace

RatingStore::RatingStore(const std::vector<Observation>& observations) {
    std::map<std::pair<UserId, ItemId>, RatingAccumulator> merged;

    for (const auto& obs : observations) {
        if (!std::isfinite(obs.rating)) {
            throw InvalidInputError("Rating for user " +
                                    std::to_string(obs.userId) + " on item " +
                                    std::to_string(obs.itemId) +
                                    " is not a finite number");
        }

        auto& acc = merged[{obs.userId, obs.itemId}];
        if (acc.count > 0) {
            ++duplicateCount_;
        }
        acc.sum += obs.rating;
        ++acc.count;

        titles_.try_emplace(obs.itemId, obs.itemTitle);
    }

    observations_.reserve(merged.size());
    for (const auto& [key, acc] : merged) {
        const auto& [user, item] = key;
        double rating = acc.sum / acc.count;

        observations_.emplace_back(user, item, rating, titles_.at(item));
        userRatings_[user].emplace(item, rating);

        if (userIds_.empty() || userIds_.back() != user) {
            userIds_.push_back(user);
        }
    }

    itemIds_.reserve(titles_.size());
    for (const auto& [item, _] : titles_) {
        itemIds_.push_back(item);
    }
    std::sort(itemIds_.begin(), itemIds_.end());

    if (duplicateCount_ > 0) {
        spdlog::warn("RatingStore merged {} duplicate observations by mean",
                     duplicateCount_);
    }
    spdlog::debug("RatingStore holds {} ratings from {} users on {} items",
                  observations_.size(), userIds_.size(), itemIds_.size());
}

auto RatingStore::contains(UserId user) const -> bool {
    return userRatings_.contains(user);
}

auto RatingStore::ratingsFor(UserId user) const
    -> const std::map<ItemId, double>& {
    auto it = userRatings_.find(user);
    if (it == userRatings_.end()) {
        return EMPTY_RATINGS;
    }
    return it->second;
}

auto RatingStore::meanRating(UserId user) const -> std::optional<double> {
    const auto& ratings = ratingsFor(user);
    if (ratings.empty()) {
        return std::nullopt;
    }

    double sum = std::accumulate(
        ratings.begin(), ratings.end(), 0.0,
        [](double total, const auto& entry) { return total + entry.second; });
    return sum / static_cast<double>(ratings.size());
}

auto RatingStore::titleOf(ItemId item) const -> std::optional<std::string> {
    auto it = titles_.find(item);
    if (it == titles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace affinity::recommendation
