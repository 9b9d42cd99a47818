// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for RatingStore
 */

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "recommendation/rating_store.hpp"
#include "recommendation/recommendation_exception.hpp"

using namespace affinity::recommendation;

class RatingStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        observations_ = {
            {2, 20, 3.0, "Heat (1995)"},
            {1, 10, 4.0, "Toy Story (1995)"},
            {1, 20, 2.0, "Heat (1995)"},
            {3, 30, 5.0, "Casino (1995)"},
        };
    }

    std::vector<Observation> observations_;
};

TEST_F(RatingStoreTest, SortsObservationsByUserThenItem) {
    RatingStore store(observations_);
    const auto& obs = store.observations();
    ASSERT_EQ(obs.size(), 4);
    EXPECT_EQ(obs[0].userId, 1);
    EXPECT_EQ(obs[0].itemId, 10);
    EXPECT_EQ(obs[1].userId, 1);
    EXPECT_EQ(obs[1].itemId, 20);
    EXPECT_EQ(obs[2].userId, 2);
    EXPECT_EQ(obs[3].userId, 3);
}

TEST_F(RatingStoreTest, DistinctSortedIds) {
    RatingStore store(observations_);
    EXPECT_EQ(store.userIds(), (std::vector<UserId>{1, 2, 3}));
    EXPECT_EQ(store.itemIds(), (std::vector<ItemId>{10, 20, 30}));
    EXPECT_EQ(store.userCount(), 3);
    EXPECT_EQ(store.itemCount(), 3);
    EXPECT_EQ(store.size(), 4);
    EXPECT_FALSE(store.empty());
}

TEST_F(RatingStoreTest, RatingsForUser) {
    RatingStore store(observations_);
    const auto& ratings = store.ratingsFor(1);
    ASSERT_EQ(ratings.size(), 2);
    EXPECT_DOUBLE_EQ(ratings.at(10), 4.0);
    EXPECT_DOUBLE_EQ(ratings.at(20), 2.0);

    EXPECT_TRUE(store.ratingsFor(42).empty());
    EXPECT_TRUE(store.contains(3));
    EXPECT_FALSE(store.contains(42));
}

TEST_F(RatingStoreTest, MeanRating) {
    RatingStore store(observations_);
    ASSERT_TRUE(store.meanRating(1).has_value());
    EXPECT_DOUBLE_EQ(*store.meanRating(1), 3.0);
    EXPECT_FALSE(store.meanRating(42).has_value());
}

TEST_F(RatingStoreTest, TitleLookup) {
    RatingStore store(observations_);
    EXPECT_EQ(store.titleOf(30), "Casino (1995)");
    EXPECT_FALSE(store.titleOf(99).has_value());
}

TEST_F(RatingStoreTest, DuplicatesAreAveraged) {
    observations_.push_back({1, 10, 5.0, "Toy Story (1995)"});
    observations_.push_back({1, 10, 3.0, "Toy Story (1995)"});

    RatingStore store(observations_);
    EXPECT_EQ(store.duplicateCount(), 2);
    EXPECT_EQ(store.size(), 4);
    EXPECT_DOUBLE_EQ(store.ratingsFor(1).at(10), 4.0);
}

TEST_F(RatingStoreTest, RejectsNonFiniteRating) {
    observations_.push_back(
        {4, 10, std::numeric_limits<double>::quiet_NaN(), "Toy Story (1995)"});
    EXPECT_THROW(RatingStore store(observations_), InvalidInputError);
}

TEST_F(RatingStoreTest, EmptyInput) {
    RatingStore store(std::vector<Observation>{});
    EXPECT_TRUE(store.empty());
    EXPECT_TRUE(store.userIds().empty());
}
