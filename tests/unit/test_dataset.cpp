/**
 * @file test_dataset.cpp
 * @brief Unit tests for Dataset and the CSV dataset service.
 */

#include "dataset/csv_dataset_service.hpp"
#include "dataset/dataset.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace automl_bench;

// ─── Dataset ─────────────────────────────────

TEST(DatasetTest, ReleaseIsIdempotent) {
    auto ds = test_support::make_classification_dataset();
    EXPECT_FALSE(ds->is_released());
    EXPECT_EQ(ds->train().rows(), 3u);

    ds->release();
    EXPECT_TRUE(ds->is_released());
    ds->release();
    EXPECT_TRUE(ds->is_released());
}

TEST(DatasetTest, AccessAfterReleaseThrows) {
    auto ds = test_support::make_classification_dataset();
    ds->release();
    EXPECT_THROW((void)ds->train(), std::logic_error);
    EXPECT_THROW((void)ds->test(), std::logic_error);
    // Metadata survives release.
    EXPECT_TRUE(ds->target().is_categorical());
}

// ─── CsvDatasetService ───────────────────────

class CsvDatasetServiceTest : public ::testing::Test {
protected:
    test_support::TempDir dir_;
};

TEST_F(CsvDatasetServiceTest, LoadsCategoricalTarget) {
    dir_.write("task_59/fold_0/train.csv",
               "sepal,color,class\n"
               "5.1,red,setosa\n"
               "6.2,blue,versicolor\n"
               "?,red,setosa\n");
    dir_.write("task_59/fold_0/test.csv",
               "sepal,color,class\n"
               "5.0,green,virginica\n");

    CsvDatasetService service(dir_.path());
    auto loaded = service.load(59, 0);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    const auto& ds = **loaded;

    ASSERT_EQ(ds.features().size(), 2u);
    EXPECT_FALSE(ds.features()[0].is_categorical());
    EXPECT_TRUE(ds.features()[1].is_categorical());
    EXPECT_EQ(ds.features()[1].categories, (std::vector<std::string>{"blue", "green", "red"}));

    EXPECT_TRUE(ds.target().is_categorical());
    EXPECT_EQ(ds.target().categories,
              (std::vector<std::string>{"setosa", "versicolor", "virginica"}));
    EXPECT_EQ(ds.train().y, (std::vector<double>{0, 1, 0}));
    EXPECT_EQ(ds.test().y, (std::vector<double>{2}));
    EXPECT_TRUE(std::isnan(ds.train().X[2][0]));
    EXPECT_DOUBLE_EQ(ds.test().X[0][1], 1.0);
}

TEST_F(CsvDatasetServiceTest, NumericTargetIsRegression) {
    dir_.write("task_7/fold_1/train.csv", "x,y\n1,1.5\n2,2.5\n");
    dir_.write("task_7/fold_1/test.csv", "x,y\n3,3.5\n");

    CsvDatasetService service(dir_.path());
    auto loaded = service.load(7, 1);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_FALSE((*loaded)->target().is_categorical());
    EXPECT_EQ((*loaded)->train().y, (std::vector<double>{1.5, 2.5}));
}

TEST_F(CsvDatasetServiceTest, MissingFoldIsDatasetLoadError) {
    CsvDatasetService service(dir_.path());
    auto loaded = service.load(59, 3);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::DatasetLoad);
}

TEST_F(CsvDatasetServiceTest, RaggedRowIsDatasetLoadError) {
    dir_.write("task_1/fold_0/train.csv", "x,y\n1,2,3\n");
    dir_.write("task_1/fold_0/test.csv", "x,y\n1,2\n");
    CsvDatasetService service(dir_.path());
    auto loaded = service.load(1, 0);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::DatasetLoad);
}

TEST_F(CsvDatasetServiceTest, HeaderMismatchIsDatasetLoadError) {
    dir_.write("task_1/fold_0/train.csv", "x,y\n1,2\n");
    dir_.write("task_1/fold_0/test.csv", "a,y\n1,2\n");
    CsvDatasetService service(dir_.path());
    EXPECT_FALSE(service.load(1, 0).has_value());
}
