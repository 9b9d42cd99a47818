// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for CsvObservationSource
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "io/observation_source.hpp"

namespace fs = std::filesystem;
using namespace affinity::io;

class ObservationSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() / "affinity_source_test" /
                   ::testing::UnitTest::GetInstance()
                       ->current_test_info()
                       ->name();
        fs::create_directories(test_dir);

        items_ = writeFile("movies.csv",
                           "movieId,title,genres\n"
                           "1,Toy Story (1995),Animation\n"
                           "2,\"City of Lost Children, The (1995)\",Drama\n"
                           "3,Heat (1995),Action\n");
    }

    void TearDown() override { fs::remove_all(test_dir); }

    auto writeFile(const std::string& name, const std::string& content)
        -> std::string {
        auto path = test_dir / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    fs::path test_dir;
    std::string items_;
};

TEST_F(ObservationSourceTest, JoinsRatingsWithTitles) {
    auto ratings = writeFile("ratings.csv",
                             "userId,movieId,rating,timestamp\n"
                             "1,1,4.0,964982703\n"
                             "1,2,3.5,964981247\n"
                             "2,3,5.0,964982224\n");

    CsvObservationSource source(ratings, items_);
    auto observations = source.loadObservations();
    ASSERT_TRUE(observations) << observations.error();
    ASSERT_EQ(observations->size(), 3);

    const auto& second = (*observations)[1];
    EXPECT_EQ(second.userId, 1);
    EXPECT_EQ(second.itemId, 2);
    EXPECT_DOUBLE_EQ(second.rating, 3.5);
    EXPECT_EQ(second.itemTitle, "City of Lost Children, The (1995)");

    EXPECT_EQ(source.lastImportResult().totalRecords, 3);
    EXPECT_EQ(source.lastImportResult().successCount, 3);
}

TEST_F(ObservationSourceTest, DropsRatingsWithoutItem) {
    auto ratings = writeFile("ratings.csv",
                             "userId,movieId,rating\n"
                             "1,1,4.0\n"
                             "1,99,2.0\n");

    CsvObservationSource source(ratings, items_);
    auto observations = source.loadObservations();
    ASSERT_TRUE(observations);
    EXPECT_EQ(observations->size(), 1);
    EXPECT_EQ(source.lastImportResult().unmatchedCount, 1);
}

TEST_F(ObservationSourceTest, ReportsMalformedRows) {
    auto ratings = writeFile("ratings.csv",
                             "userId,movieId,rating\n"
                             "1,1,4.0\n"
                             "x,2,3.0\n"
                             "2,3,nan\n"
                             "2,3,high\n");

    CsvObservationSource source(ratings, items_);
    auto observations = source.loadObservations();
    ASSERT_TRUE(observations);
    EXPECT_EQ(observations->size(), 1);

    const auto& result = source.lastImportResult();
    EXPECT_EQ(result.errorCount, 3);
    ASSERT_EQ(result.errors.size(), 3);
    EXPECT_NE(result.errors[0].find("Record 2:"), std::string::npos);
    EXPECT_NE(result.errors[1].find("Record 3:"), std::string::npos);
    EXPECT_NE(result.errors[2].find("Record 4:"), std::string::npos);
}

TEST_F(ObservationSourceTest, ErrorsNumberRecordsAcrossBlankLines) {
    auto ratings = writeFile("ratings.csv",
                             "userId,movieId,rating\n"
                             "1,1,4.0\n"
                             "\n"
                             "\n"
                             "1,2,oops\n");

    CsvObservationSource source(ratings, items_);
    ASSERT_TRUE(source.loadObservations());

    const auto& result = source.lastImportResult();
    EXPECT_EQ(result.totalRecords, 2);
    ASSERT_EQ(result.errors.size(), 1);
    EXPECT_EQ(result.errors[0], "Record 2: malformed rating 'oops'");
}

TEST_F(ObservationSourceTest, CustomSchema) {
    auto items = writeFile("books.csv",
                           "isbn,name\n"
                           "100,Dune\n");
    auto ratings = writeFile("book_ratings.csv",
                             "reader,isbn,stars\n"
                             "7,100,5\n");

    DatasetSchema schema;
    schema.userColumn = "reader";
    schema.itemColumn = "isbn";
    schema.ratingColumn = "stars";
    schema.titleColumn = "name";

    CsvObservationSource source(ratings, items, schema);
    auto observations = source.loadObservations();
    ASSERT_TRUE(observations);
    ASSERT_EQ(observations->size(), 1);
    EXPECT_EQ(observations->front().userId, 7);
    EXPECT_EQ(observations->front().itemTitle, "Dune");
}

TEST_F(ObservationSourceTest, MissingColumnFails) {
    auto ratings = writeFile("ratings.csv",
                             "userId,movieId\n"
                             "1,1\n");

    CsvObservationSource source(ratings, items_);
    auto observations = source.loadObservations();
    ASSERT_FALSE(observations);
    EXPECT_NE(observations.error().find("rating"), std::string::npos);
}

TEST_F(ObservationSourceTest, MissingFileFails) {
    CsvObservationSource source((test_dir / "missing.csv").string(), items_);
    EXPECT_FALSE(source.loadObservations());
}

TEST_F(ObservationSourceTest, NothingJoinedFails) {
    auto ratings = writeFile("ratings.csv",
                             "userId,movieId,rating\n"
                             "1,42,4.0\n");

    CsvObservationSource source(ratings, items_);
    EXPECT_FALSE(source.loadObservations());
}
