// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for FileSimilarityCache
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "cache/file_similarity_cache.hpp"

namespace fs = std::filesystem;
using namespace affinity::cache;

class FileSimilarityCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() / "affinity_cache_test" /
                   ::testing::UnitTest::GetInstance()
                       ->current_test_info()
                       ->name();
        fs::remove_all(test_dir);

        Eigen::MatrixXd values(3, 3);
        values << 0.0, 0.1, -0.7071067811865476,  //
            0.1, 0.0, 1.0 / 3.0,                  //
            -0.7071067811865476, 1.0 / 3.0, 0.0;
        matrix_ = std::make_unique<SimilarityMatrix>(
            std::vector<affinity::data::UserId>{3, 17, 250}, values);
    }

    void TearDown() override { fs::remove_all(test_dir); }

    void writeCacheFile(const std::string& content) {
        fs::create_directories(test_dir);
        std::ofstream out(test_dir / "pearson_similarity.csv");
        out << content;
    }

    fs::path test_dir;
    std::unique_ptr<SimilarityMatrix> matrix_;
};

TEST_F(FileSimilarityCacheTest, EmptyDirectoryIsRejected) {
    EXPECT_THROW(FileSimilarityCache(""), std::invalid_argument);
}

TEST_F(FileSimilarityCacheTest, FileNamedAfterMetric) {
    FileSimilarityCache cache(test_dir);
    EXPECT_EQ(cache.pathFor(SimilarityMetric::PEARSON),
              test_dir / "pearson_similarity.csv");
    EXPECT_EQ(cache.pathFor(SimilarityMetric::COSINE),
              test_dir / "cosine_similarity.csv");
    EXPECT_EQ(cache.directory(), test_dir);
}

TEST_F(FileSimilarityCacheTest, SaveCreatesDirectoryAndFile) {
    FileSimilarityCache cache(test_dir);
    EXPECT_FALSE(cache.exists(SimilarityMetric::PEARSON));

    ASSERT_TRUE(cache.save(SimilarityMetric::PEARSON, *matrix_));
    EXPECT_TRUE(cache.exists(SimilarityMetric::PEARSON));
    EXPECT_FALSE(cache.exists(SimilarityMetric::COSINE));
    EXPECT_FALSE(fs::exists(test_dir / "pearson_similarity.csv.tmp"));
    EXPECT_EQ(cache.getStats().saveCount, 1);
}

TEST_F(FileSimilarityCacheTest, LoadRestoresExactValues) {
    FileSimilarityCache cache(test_dir);
    ASSERT_TRUE(cache.save(SimilarityMetric::PEARSON, *matrix_));

    auto loaded = cache.load(SimilarityMetric::PEARSON);
    ASSERT_TRUE(loaded) << loaded.error();
    EXPECT_EQ(loaded->userIds(), matrix_->userIds());
    EXPECT_EQ(loaded->values(), matrix_->values());
    EXPECT_EQ(cache.getStats().hitCount, 1);
}

TEST_F(FileSimilarityCacheTest, LoadMissingFile) {
    FileSimilarityCache cache(test_dir);
    auto loaded = cache.load(SimilarityMetric::COSINE);
    EXPECT_FALSE(loaded);
    EXPECT_EQ(cache.getStats().missCount, 1);
}

TEST_F(FileSimilarityCacheTest, HandWrittenFile) {
    writeCacheFile(
        "userId,1,2\n"
        "1,0,0.5\n"
        "2,0.5,0\n");

    FileSimilarityCache cache(test_dir);
    auto loaded = cache.load(SimilarityMetric::PEARSON);
    ASSERT_TRUE(loaded) << loaded.error();
    EXPECT_DOUBLE_EQ(loaded->at(1, 2), 0.5);
}

TEST_F(FileSimilarityCacheTest, RejectsAsymmetricMatrix) {
    writeCacheFile(
        "userId,1,2\n"
        "1,0,0.5\n"
        "2,0.4,0\n");

    FileSimilarityCache cache(test_dir);
    EXPECT_FALSE(cache.load(SimilarityMetric::PEARSON));
}

TEST_F(FileSimilarityCacheTest, RejectsValuesOutsideUnitRange) {
    FileSimilarityCache cache(test_dir);

    writeCacheFile("userId,1,2\n1,0,inf\n2,inf,0\n");
    EXPECT_FALSE(cache.load(SimilarityMetric::PEARSON));

    writeCacheFile("userId,1,2\n1,0,-inf\n2,-inf,0\n");
    EXPECT_FALSE(cache.load(SimilarityMetric::PEARSON));

    writeCacheFile("userId,1,2\n1,0,1.5\n2,1.5,0\n");
    auto loaded = cache.load(SimilarityMetric::PEARSON);
    ASSERT_FALSE(loaded);
    EXPECT_NE(loaded.error().find("outside [-1, 1]"), std::string::npos);

    writeCacheFile("userId,1,2\n1,0,-1\n2,-1,0\n");
    EXPECT_TRUE(cache.load(SimilarityMetric::PEARSON));
}

TEST_F(FileSimilarityCacheTest, RejectsMalformedFiles) {
    FileSimilarityCache cache(test_dir);

    writeCacheFile("userId,1,2\n1,0,0.5\n");
    EXPECT_FALSE(cache.load(SimilarityMetric::PEARSON));

    writeCacheFile("userId,1,2\n1,0,abc\n2,abc,0\n");
    EXPECT_FALSE(cache.load(SimilarityMetric::PEARSON));

    writeCacheFile("userId,1,2\nx,0,0.5\n2,0.5,0\n");
    EXPECT_FALSE(cache.load(SimilarityMetric::PEARSON));

    writeCacheFile("userId,1,2\n1,0,0.5\n2,0.5\n");
    EXPECT_FALSE(cache.load(SimilarityMetric::PEARSON));

    writeCacheFile("userId\n");
    EXPECT_FALSE(cache.load(SimilarityMetric::PEARSON));
}

TEST_F(FileSimilarityCacheTest, Remove) {
    FileSimilarityCache cache(test_dir);
    ASSERT_TRUE(cache.save(SimilarityMetric::COSINE, *matrix_));
    EXPECT_TRUE(cache.remove(SimilarityMetric::COSINE));
    EXPECT_FALSE(cache.exists(SimilarityMetric::COSINE));
    EXPECT_FALSE(cache.remove(SimilarityMetric::COSINE));
}
