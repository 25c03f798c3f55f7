/**
 * @file test_task_catalog.cpp
 * @brief Unit tests for the task catalog and benchmark definition loading.
 */

#include "benchmark/task_catalog.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace automl_bench;

namespace {

TaskDefinition task(std::string name, std::optional<bool> enabled = std::nullopt) {
    TaskDefinition def;
    def.name = std::move(name);
    def.folds = 2;
    def.enabled = enabled;
    def.dataset = OpenmlTaskRef{1};
    return def;
}

}  // namespace

// ─── TaskCatalog ─────────────────────────────

TEST(TaskCatalogTest, ListEnabledKeepsSourceOrder) {
    TaskCatalog catalog({task("b"), task("a", false), task("c", true)});
    auto enabled = catalog.list_enabled();
    ASSERT_EQ(enabled.size(), 2u);
    EXPECT_EQ(enabled[0].name, "b");
    EXPECT_EQ(enabled[1].name, "c");
}

TEST(TaskCatalogTest, GetByName) {
    TaskCatalog catalog({task("iris"), task("kc2")});
    auto def = catalog.get("kc2");
    ASSERT_TRUE(def.has_value());
    EXPECT_EQ(def->name, "kc2");
}

TEST(TaskCatalogTest, UnknownTask) {
    TaskCatalog catalog({task("iris")});
    auto def = catalog.get("does-not-exist");
    ASSERT_FALSE(def.has_value());
    EXPECT_EQ(def.error().code, ErrorCode::UnknownTask);
    EXPECT_EQ(def.error().message, "Incorrect task name: does-not-exist.");
}

TEST(TaskCatalogTest, DisabledTask) {
    TaskCatalog catalog({task("iris", false)});
    auto def = catalog.get("iris");
    ASSERT_FALSE(def.has_value());
    EXPECT_EQ(def.error().code, ErrorCode::TaskDisabled);
}

// ─── load_benchmark_definition ───────────────

class BenchmarkDefinitionTest : public ::testing::Test {
protected:
    test_support::TempDir dir_;
    TaskDefaults defaults_;

    void SetUp() override {
        defaults_.folds = 10;
        defaults_.metrics = {"acc"};
        defaults_.seed = 42;
        defaults_.max_runtime_seconds = 3600;
    }
};

TEST_F(BenchmarkDefinitionTest, AppliesDefaults) {
    auto path = dir_.write("test.toml", R"(
        [[tasks]]
        name = "iris"
        openml_task_id = 59
        folds = 2
        metric = ["balacc", "acc"]

        [[tasks]]
        name = "kc2"
        openml_task_id = 3913
        enabled = "no"
        max_runtime_seconds = 60
    )");

    auto defs = load_benchmark_definition(path, defaults_);
    ASSERT_TRUE(defs.has_value()) << defs.error().message;
    ASSERT_EQ(defs->size(), 2u);

    const auto& iris = (*defs)[0];
    EXPECT_EQ(iris.name, "iris");
    EXPECT_EQ(iris.folds, 2);
    EXPECT_EQ(iris.metrics, (std::vector<std::string>{"balacc", "acc"}));
    EXPECT_EQ(iris.seed, 42u);
    EXPECT_EQ(std::get<OpenmlTaskRef>(iris.dataset).id, 59);
    EXPECT_TRUE(iris.is_enabled());

    const auto& kc2 = (*defs)[1];
    EXPECT_EQ(kc2.folds, 10);
    EXPECT_EQ(kc2.metrics, std::vector<std::string>{"acc"});
    EXPECT_EQ(kc2.max_runtime_seconds, 60);
    EXPECT_FALSE(kc2.is_enabled());
}

TEST_F(BenchmarkDefinitionTest, DatasetReferenceKinds) {
    auto path = dir_.write("refs.toml", R"(
        [[tasks]]
        name = "by_dataset"
        openml_dataset_id = 61

        [[tasks]]
        name = "raw"
        dataset = "/data/raw.csv"
    )");
    auto defs = load_benchmark_definition(path, defaults_);
    ASSERT_TRUE(defs.has_value()) << defs.error().message;
    EXPECT_TRUE(std::holds_alternative<OpenmlDatasetRef>((*defs)[0].dataset));
    EXPECT_EQ(std::get<RawDatasetRef>((*defs)[1].dataset).path, "/data/raw.csv");
}

TEST_F(BenchmarkDefinitionTest, TaskWithoutDatasetIsRejected) {
    auto path = dir_.write("bad.toml", R"(
        [[tasks]]
        name = "orphan"
    )");
    auto defs = load_benchmark_definition(path, defaults_);
    ASSERT_FALSE(defs.has_value());
    EXPECT_EQ(defs.error().code, ErrorCode::ConfigParse);
}

TEST_F(BenchmarkDefinitionTest, DuplicateNameIsRejected) {
    auto path = dir_.write("dup.toml", R"(
        [[tasks]]
        name = "iris"
        openml_task_id = 59

        [[tasks]]
        name = "iris"
        openml_task_id = 60
    )");
    EXPECT_FALSE(load_benchmark_definition(path, defaults_).has_value());
}

TEST_F(BenchmarkDefinitionTest, NonPositiveFoldsIsRejected) {
    auto path = dir_.write("folds.toml", R"(
        [[tasks]]
        name = "iris"
        openml_task_id = 59
        folds = 0
    )");
    EXPECT_FALSE(load_benchmark_definition(path, defaults_).has_value());
}

TEST_F(BenchmarkDefinitionTest, InvalidEnabledValueIsRejected) {
    auto path = dir_.write("enabled.toml", R"(
        [[tasks]]
        name = "iris"
        openml_task_id = 59
        enabled = "sometimes"
    )");
    EXPECT_FALSE(load_benchmark_definition(path, defaults_).has_value());
}

TEST_F(BenchmarkDefinitionTest, DefinitionPathResolution) {
    EXPECT_EQ(benchmark_definition_path("/bench", "test").string(), "/bench/test.toml");
    auto file = dir_.write("custom.toml", "");
    EXPECT_EQ(benchmark_definition_path("/bench", file.string()), file);
}
