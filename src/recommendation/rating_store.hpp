#ifndef AFFINITY_RECOMMENDATION_RATING_STORE_HPP
#define AFFINITY_RECOMMENDATION_RATING_STORE_HPP

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../data/observation.hpp"

namespace affinity::recommendation {

using data::ItemId;
using data::Observation;
using data::UserId;

/**
 * @brief Read-only store of (user, item, rating, title) observations
 *
 * Built once from the joined observations and never mutated afterwards.
 * Duplicate (user, item) observations are collapsed into one rating equal to
 * their mean. The first title seen for an item is kept.
 */
class RatingStore {
public:
    /**
     * @brief Build the store from raw observations
     * @param observations Joined observations, possibly empty
     * @throws InvalidInputError if a rating is not a finite number
     */
    explicit RatingStore(const std::vector<Observation>& observations);

    /**
     * @brief Deduplicated observations ordered by userId then itemId
     */
    [[nodiscard]] auto observations() const -> const std::vector<Observation>& {
        return observations_;
    }

    /**
     * @brief Sorted distinct user ids
     */
    [[nodiscard]] auto userIds() const -> const std::vector<UserId>& {
        return userIds_;
    }

    /**
     * @brief Sorted distinct item ids
     */
    [[nodiscard]] auto itemIds() const -> const std::vector<ItemId>& {
        return itemIds_;
    }

    [[nodiscard]] auto contains(UserId user) const -> bool;

    /**
     * @brief Ratings given by a user, keyed by item
     * @param user User identifier
     * @return Item to rating map; empty for unknown users
     */
    [[nodiscard]] auto ratingsFor(UserId user) const
        -> const std::map<ItemId, double>&;

    /**
     * @brief Mean of all ratings given by a user
     * @return Mean rating, or nullopt if the user rated nothing
     */
    [[nodiscard]] auto meanRating(UserId user) const -> std::optional<double>;

    /**
     * @brief Title of an item
     * @return Title, or nullopt if the item is unknown
     */
    [[nodiscard]] auto titleOf(ItemId item) const
        -> std::optional<std::string>;

    [[nodiscard]] auto empty() const -> bool { return observations_.empty(); }
    [[nodiscard]] auto size() const -> size_t { return observations_.size(); }
    [[nodiscard]] auto userCount() const -> size_t { return userIds_.size(); }
    [[nodiscard]] auto itemCount() const -> size_t { return itemIds_.size(); }

    /**
     * @brief Number of input observations merged into an earlier one
     */
    [[nodiscard]] auto duplicateCount() const -> size_t {
        return duplicateCount_;
    }

private:
    std::vector<Observation> observations_;
    std::vector<UserId> userIds_;
    std::vector<ItemId> itemIds_;
    std::unordered_map<UserId, std::map<ItemId, double>> userRatings_;
    std::unordered_map<ItemId, std::string> titles_;
    size_t duplicateCount_ = 0;
};

}  // namespace affinity::recommendation

#endif  // AFFINITY_RECOMMENDATION_RATING_STORE_HPP
