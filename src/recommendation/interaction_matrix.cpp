#include "interaction_matrix.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "recommendation_exception.hpp"

namespace affinity::recommendation {

namespace {

template <typename Id>
auto indexOf(const std::vector<Id>& ids, Id id) -> std::optional<Eigen::Index> {
    auto it = std::lower_bound(ids.begin(), ids.end(), id);
    if (it == ids.end() || *it != id) {
        return std::nullopt;
    }
    return static_cast<Eigen::Index>(std::distance(ids.begin(), it));
}

}  // namespace

InteractionMatrix::InteractionMatrix(std::vector<UserId> userIds,
                                     std::vector<ItemId> itemIds,
                                     Eigen::MatrixXd values)
    : userIds_(std::move(userIds)),
      itemIds_(std::move(itemIds)),
      values_(std::move(values)) {
    if (values_.rows() != static_cast<Eigen::Index>(userIds_.size()) ||
        values_.cols() != static_cast<Eigen::Index>(itemIds_.size())) {
        throw InvalidInputError("Interaction matrix shape does not match its "
                                "user and item indices");
    }
    if (!std::is_sorted(userIds_.begin(), userIds_.end()) ||
        !std::is_sorted(itemIds_.begin(), itemIds_.end())) {
        throw InvalidInputError("Interaction matrix indices must be sorted");
    }
}

auto InteractionMatrix::userRow(UserId user) const
    -> std::optional<Eigen::Index> {
    return indexOf(userIds_, user);
}

auto InteractionMatrix::itemColumn(ItemId item) const
    -> std::optional<Eigen::Index> {
    return indexOf(itemIds_, item);
}

auto InteractionMatrix::at(UserId user, ItemId item) const -> double {
    auto row = userRow(user);
    if (!row) {
        throw UnknownUserError("User " + std::to_string(user) +
                               " is not part of the interaction matrix");
    }
    auto col = itemColumn(item);
    if (!col) {
        throw InvalidInputError("Item " + std::to_string(item) +
                                " is not part of the interaction matrix");
    }
    return values_(*row, *col);
}

auto InteractionMatrixBuilder::build(
    const std::vector<Observation>& observations) -> InteractionMatrix {
    if (observations.empty()) {
        throw InvalidInputError(
            "Cannot build an interaction matrix from no observations");
    }
    return build(RatingStore(observations));
}

auto InteractionMatrixBuilder::build(const RatingStore& store)
    -> InteractionMatrix {
    if (store.empty()) {
        throw InvalidInputError(
            "Cannot build an interaction matrix from no observations");
    }

    const auto& users = store.userIds();
    const auto& items = store.itemIds();
    Eigen::MatrixXd values = Eigen::MatrixXd::Zero(
        static_cast<Eigen::Index>(users.size()),
        static_cast<Eigen::Index>(items.size()));

    for (const auto& obs : store.observations()) {
        auto row = indexOf(users, obs.userId);
        auto col = indexOf(items, obs.itemId);
        values(*row, *col) = obs.rating;
    }

    spdlog::info("Built {}x{} interaction matrix from {} ratings",
                 values.rows(), values.cols(), store.size());
    return InteractionMatrix(users, items, std::move(values));
}

}  // namespace affinity::recommendation
