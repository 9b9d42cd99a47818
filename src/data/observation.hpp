// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Affinity - User-based collaborative filtering recommender
 * Copyright (C) 2024 Max Qian
 */

#ifndef AFFINITY_DATA_OBSERVATION_HPP
#define AFFINITY_DATA_OBSERVATION_HPP

#include <cstdint>
#include <string>
#include <utility>

namespace affinity::data {

using UserId = std::int64_t;
using ItemId = std::int64_t;

/**
 * @brief A single rating given by a user to an item
 *
 * This is the flattened form produced by joining the ratings table with the
 * item table on the item identifier.
 */
struct Observation {
    UserId userId = 0;      ///< Rating user
    ItemId itemId = 0;      ///< Rated item
    double rating = 0.0;    ///< Rating value
    std::string itemTitle;  ///< Human readable item title

    Observation() = default;

    Observation(UserId user, ItemId item, double value, std::string title)
        : userId(user),
          itemId(item),
          rating(value),
          itemTitle(std::move(title)) {}
};

}  // namespace affinity::data

#endif  // AFFINITY_DATA_OBSERVATION_HPP
