// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for RatingPredictor and PredictionSet
 */

#include <gtest/gtest.h>

#include "recommendation/rating_predictor.hpp"
#include "recommendation/recommendation_exception.hpp"

using namespace affinity::recommendation;

class RatingPredictorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<RatingStore>(std::vector<Observation>{
            {1, 1, 5.0, "Item 1"},
            {1, 2, 3.0, "Item 2"},
            {2, 1, 4.0, "Item 1"},
            {2, 3, 5.0, "Item 3"},
            {3, 3, 2.0, "Item 3"},
            {3, 4, 4.0, "Item 4"},
        });
    }

    std::unique_ptr<RatingStore> store_;
};

TEST_F(RatingPredictorTest, SingleNeighborPrediction) {
    // Target mean 4.0, neighbor mean 4.5: 4.0 + 0.8 * (5 - 4.5) / 0.8
    auto predictions = RatingPredictor::predict(*store_, {{2, 0.8}}, 1);
    ASSERT_EQ(predictions.size(), 1);
    ASSERT_TRUE(predictions.findByTitle("Item 3").has_value());
    EXPECT_NEAR(*predictions.findByTitle("Item 3"), 4.5, 1e-12);
}

TEST_F(RatingPredictorTest, WeightedOverSeveralNeighbors) {
    auto predictions =
        RatingPredictor::predict(*store_, {{2, 0.8}, {3, 0.2}}, 1);

    // Item 3: 4.0 + (0.8 * 0.5 + 0.2 * (2 - 3)) / 1.0
    auto item3 = predictions.find(3);
    ASSERT_TRUE(item3.has_value());
    EXPECT_NEAR(item3->predictedRating, 4.2, 1e-12);
    EXPECT_EQ(item3->itemTitle, "Item 3");

    // Item 4: 4.0 + 0.2 * (4 - 3) / 0.2
    auto item4 = predictions.find(4);
    ASSERT_TRUE(item4.has_value());
    EXPECT_NEAR(item4->predictedRating, 5.0, 1e-12);
}

TEST_F(RatingPredictorTest, ExcludesItemsTheTargetRated) {
    auto predictions =
        RatingPredictor::predict(*store_, {{2, 0.8}, {3, 0.2}}, 1);
    EXPECT_FALSE(predictions.contains(1));
    EXPECT_FALSE(predictions.contains(2));
    for (const auto& prediction : predictions) {
        EXPECT_FALSE(store_->ratingsFor(1).contains(prediction.itemId));
    }
}

TEST_F(RatingPredictorTest, EmptyNeighborhood) {
    auto predictions = RatingPredictor::predict(*store_, {}, 1);
    EXPECT_TRUE(predictions.empty());
}

TEST_F(RatingPredictorTest, TargetWithoutRatingsThrows) {
    EXPECT_THROW((void)RatingPredictor::predict(*store_, {{2, 0.8}}, 42),
                 InsufficientDataError);
}

TEST_F(RatingPredictorTest, ZeroSimilaritySumIsOmitted) {
    auto predictions =
        RatingPredictor::predict(*store_, {{2, 0.5}, {3, -0.5}}, 1);
    EXPECT_FALSE(predictions.contains(3));
    ASSERT_TRUE(predictions.contains(4));
    // Only user 3 rated item 4: 4.0 + -0.5 * (4 - 3) / -0.5
    EXPECT_NEAR(predictions.find(4)->predictedRating, 5.0, 1e-12);
}

TEST_F(RatingPredictorTest, NegativeSimilarityPullsBelowMean) {
    RatingStore store(std::vector<Observation>{
        {1, 1, 5.0, "Item 1"},
        {1, 2, 3.0, "Item 2"},
        {2, 1, 4.0, "Item 1"},
        {2, 3, 5.0, "Item 3"},
        {3, 3, 5.0, "Item 3"},
        {3, 4, 1.0, "Item 4"},
    });

    auto predictions =
        RatingPredictor::predict(store, {{2, 0.8}, {3, -0.6}}, 1);
    ASSERT_EQ(predictions.size(), 2);

    // 4.0 + (0.8 * (5 - 4.5) + -0.6 * (5 - 3)) / (0.8 - 0.6)
    EXPECT_NEAR(predictions.find(3)->predictedRating, 0.0, 1e-9);
    EXPECT_LT(predictions.find(3)->predictedRating, 4.0);
    // 4.0 + -0.6 * (1 - 3) / -0.6
    EXPECT_NEAR(predictions.find(4)->predictedRating, 2.0, 1e-9);
}

TEST_F(RatingPredictorTest, SkipsUnknownNeighborsAndTheTarget) {
    auto predictions =
        RatingPredictor::predict(*store_, {{1, 0.9}, {99, 0.7}, {2, 0.8}}, 1);
    ASSERT_EQ(predictions.size(), 1);
    EXPECT_NEAR(predictions.find(3)->predictedRating, 4.5, 1e-12);
}

TEST_F(RatingPredictorTest, NeighborsWithNothingNew) {
    RatingStore store(std::vector<Observation>{
        {1, 1, 5.0, "Item 1"},
        {2, 1, 3.0, "Item 1"},
    });
    EXPECT_TRUE(RatingPredictor::predict(store, {{2, 1.0}}, 1).empty());
}

TEST_F(RatingPredictorTest, PredictionSetRejectsDuplicates) {
    PredictionSet set;
    set.add({5, "Five", 3.0});
    set.add({2, "Two", 4.0});
    EXPECT_THROW(set.add({5, "Again", 1.0}), InvalidInputError);

    ASSERT_EQ(set.size(), 2);
    EXPECT_EQ(set.entries().front().itemId, 2);
    EXPECT_FALSE(set.find(9).has_value());
    EXPECT_FALSE(set.findByTitle("Nine").has_value());
}
