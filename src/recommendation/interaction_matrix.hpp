#ifndef AFFINITY_RECOMMENDATION_INTERACTION_MATRIX_HPP
#define AFFINITY_RECOMMENDATION_INTERACTION_MATRIX_HPP

#include <optional>
#include <vector>

#include <eigen3/Eigen/Dense>

#include "rating_store.hpp"

namespace affinity::recommendation {

/**
 * @brief Dense user by item rating matrix
 *
 * Rows follow the sorted distinct user ids, columns the sorted distinct item
 * ids. A cell without an observation holds 0, which stands for "no
 * interaction" rather than a low rating. Similarity metrics computed over
 * this matrix therefore treat unrated items as zeros.
 */
class InteractionMatrix {
public:
    InteractionMatrix(std::vector<UserId> userIds, std::vector<ItemId> itemIds,
                      Eigen::MatrixXd values);

    [[nodiscard]] auto userIds() const -> const std::vector<UserId>& {
        return userIds_;
    }
    [[nodiscard]] auto itemIds() const -> const std::vector<ItemId>& {
        return itemIds_;
    }
    [[nodiscard]] auto values() const -> const Eigen::MatrixXd& {
        return values_;
    }

    [[nodiscard]] auto rows() const -> Eigen::Index { return values_.rows(); }
    [[nodiscard]] auto cols() const -> Eigen::Index { return values_.cols(); }

    /**
     * @brief Row index of a user, or nullopt if absent
     */
    [[nodiscard]] auto userRow(UserId user) const
        -> std::optional<Eigen::Index>;

    /**
     * @brief Column index of an item, or nullopt if absent
     */
    [[nodiscard]] auto itemColumn(ItemId item) const
        -> std::optional<Eigen::Index>;

    /**
     * @brief Rating cell for a (user, item) pair
     * @return Stored rating, 0 when the pair was never observed
     * @throws UnknownUserError if the user is not a row of the matrix
     * @throws InvalidInputError if the item is not a column of the matrix
     */
    [[nodiscard]] auto at(UserId user, ItemId item) const -> double;

private:
    std::vector<UserId> userIds_;
    std::vector<ItemId> itemIds_;
    Eigen::MatrixXd values_;
};

/**
 * @brief Pivots observations into a zero-filled InteractionMatrix
 */
class InteractionMatrixBuilder {
public:
    /**
     * @brief Build the matrix from raw observations
     *
     * Duplicate (user, item) observations are averaged.
     *
     * @param observations Joined observations
     * @return Dense interaction matrix
     * @throws InvalidInputError if observations is empty or a rating is not
     * finite
     */
    [[nodiscard]] static auto build(
        const std::vector<Observation>& observations) -> InteractionMatrix;

    /**
     * @brief Build the matrix from an already deduplicated store
     * @throws InvalidInputError if the store is empty
     */
    [[nodiscard]] static auto build(const RatingStore& store)
        -> InteractionMatrix;
};

}  // namespace affinity::recommendation

#endif  // AFFINITY_RECOMMENDATION_INTERACTION_MATRIX_HPP
