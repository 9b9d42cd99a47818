// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for MemorySimilarityCache
 */

#include <gtest/gtest.h>

#include "cache/memory_similarity_cache.hpp"

using namespace affinity::cache;

class MemorySimilarityCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        Eigen::MatrixXd values(2, 2);
        values << 0.0, 0.25, 0.25, 0.0;
        matrix_ = std::make_unique<SimilarityMatrix>(
            std::vector<affinity::data::UserId>{1, 2}, values);
    }

    MemorySimilarityCache cache_;
    std::unique_ptr<SimilarityMatrix> matrix_;
};

TEST_F(MemorySimilarityCacheTest, MissOnEmptyCache) {
    EXPECT_FALSE(cache_.exists(SimilarityMetric::PEARSON));
    EXPECT_FALSE(cache_.load(SimilarityMetric::PEARSON));
    EXPECT_EQ(cache_.getStats().missCount, 1);
    EXPECT_DOUBLE_EQ(cache_.getStats().getHitRate(), 0.0);
}

TEST_F(MemorySimilarityCacheTest, SaveAndLoad) {
    ASSERT_TRUE(cache_.save(SimilarityMetric::PEARSON, *matrix_));
    EXPECT_TRUE(cache_.exists(SimilarityMetric::PEARSON));
    EXPECT_FALSE(cache_.exists(SimilarityMetric::COSINE));

    auto loaded = cache_.load(SimilarityMetric::PEARSON);
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded->userIds(), matrix_->userIds());
    EXPECT_EQ(loaded->values(), matrix_->values());

    auto stats = cache_.getStats();
    EXPECT_EQ(stats.hitCount, 1);
    EXPECT_EQ(stats.saveCount, 1);
    EXPECT_DOUBLE_EQ(stats.getHitRate(), 100.0);
}

TEST_F(MemorySimilarityCacheTest, SaveReplacesEntry) {
    ASSERT_TRUE(cache_.save(SimilarityMetric::COSINE, *matrix_));
    SimilarityMatrix other({5}, Eigen::MatrixXd::Zero(1, 1));
    ASSERT_TRUE(cache_.save(SimilarityMetric::COSINE, other));

    auto loaded = cache_.load(SimilarityMetric::COSINE);
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded->size(), 1);
}

TEST_F(MemorySimilarityCacheTest, Remove) {
    ASSERT_TRUE(cache_.save(SimilarityMetric::PEARSON, *matrix_));
    EXPECT_TRUE(cache_.remove(SimilarityMetric::PEARSON));
    EXPECT_FALSE(cache_.remove(SimilarityMetric::PEARSON));
    EXPECT_FALSE(cache_.exists(SimilarityMetric::PEARSON));
}
