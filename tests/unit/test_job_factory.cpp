/**
 * @file test_job_factory.cpp
 * @brief Unit tests for fold selection, job expansion and the job lifecycle.
 */

#include "benchmark/job.hpp"
#include "resource_monitor/monitor.hpp"
#include "telemetry/json_sink.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace automl_bench;

// ─── parse_fold_selector ─────────────────────

TEST(FoldSelectorTest, EmptyMeansAllFolds) {
    auto sel = parse_fold_selector("");
    ASSERT_TRUE(sel.has_value());
    EXPECT_TRUE(std::holds_alternative<std::monostate>(*sel));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(*parse_fold_selector("all")));
}

TEST(FoldSelectorTest, SingleFold) {
    auto sel = parse_fold_selector(" 3 ");
    ASSERT_TRUE(sel.has_value());
    EXPECT_EQ(std::get<int>(*sel), 3);
}

TEST(FoldSelectorTest, FoldList) {
    auto sel = parse_fold_selector("0, 2,1");
    ASSERT_TRUE(sel.has_value());
    EXPECT_EQ(std::get<std::vector<int>>(*sel), (std::vector<int>{0, 2, 1}));

    auto bracketed = parse_fold_selector("[4,5]");
    ASSERT_TRUE(bracketed.has_value());
    EXPECT_EQ(std::get<std::vector<int>>(*bracketed), (std::vector<int>{4, 5}));
}

TEST(FoldSelectorTest, EmptyBracketsSelectNothing) {
    auto sel = parse_fold_selector("[]");
    ASSERT_TRUE(sel.has_value());
    EXPECT_TRUE(std::get<std::vector<int>>(*sel).empty());
}

TEST(FoldSelectorTest, InvalidText) {
    for (auto text : {"x", "1,,2", "1.5", "[a]"}) {
        auto sel = parse_fold_selector(text);
        ASSERT_FALSE(sel.has_value()) << text;
        EXPECT_EQ(sel.error().code, ErrorCode::InvalidFoldSpec);
    }
}

// ─── resolve_folds ───────────────────────────

namespace {

TaskDefinition iris(int folds = 3) {
    TaskDefinition def;
    def.name = "iris";
    def.folds = folds;
    def.metrics = {"acc"};
    def.dataset = OpenmlTaskRef{59};
    return def;
}

}  // namespace

TEST(ResolveFoldsTest, AllFolds) {
    auto folds = JobFactory::resolve_folds(iris(3), FoldSelector{});
    ASSERT_TRUE(folds.has_value());
    EXPECT_EQ(*folds, (std::vector<int>{0, 1, 2}));
}

TEST(ResolveFoldsTest, OutOfRange) {
    for (FoldSelector sel : {FoldSelector{3}, FoldSelector{-1}, FoldSelector{std::vector<int>{0, 7}}}) {
        auto folds = JobFactory::resolve_folds(iris(3), sel);
        ASSERT_FALSE(folds.has_value());
        EXPECT_EQ(folds.error().code, ErrorCode::FoldOutOfRange);
    }
    EXPECT_EQ(JobFactory::resolve_folds(iris(3), FoldSelector{5}).error().message,
              "Fold value 5 is out of range for task iris.");
}

// ─── JobFactory::expand ──────────────────────

class JobFactoryTest : public ::testing::Test {
protected:
    Config config_ = default_config();
    Logger logger_{std::make_unique<NullSink>()};
    test_support::FakeDatasetService datasets_;
    MockMonitor monitor_;
    std::shared_ptr<test_support::ScriptedAdapter> adapter_ = test_support::make_perfect_adapter();

    void SetUp() override {
        config_.results.save = false;
        datasets_.add(59, [] { return test_support::make_classification_dataset("iris"); });
    }

    JobFactory factory() {
        return JobFactory(BenchmarkContext{config_, logger_, datasets_, monitor_},
                          FrameworkDefinition{.name = "constantpredictor", .module = "constantpredictor"},
                          adapter_);
    }
};

TEST_F(JobFactoryTest, OneJobPerFoldInOrder) {
    auto jobs = factory().expand(iris(3), FoldSelector{std::vector<int>{2, 0}});
    ASSERT_TRUE(jobs.has_value());
    ASSERT_EQ(jobs->size(), 2u);
    EXPECT_EQ((*jobs)[0]->name(), "local_iris_2_constantpredictor");
    EXPECT_EQ((*jobs)[1]->key().fold, 0);
    EXPECT_EQ((*jobs)[0]->state(), JobState::Created);
}

TEST_F(JobFactoryTest, OutOfRangeCreatesNoJob) {
    auto jobs = factory().expand(iris(2), FoldSelector{std::vector<int>{0, 2}});
    ASSERT_FALSE(jobs.has_value());
    EXPECT_EQ(jobs.error().code, ErrorCode::FoldOutOfRange);
    EXPECT_TRUE(datasets_.loads().empty());
}

TEST_F(JobFactoryTest, ExpansionIsLazy) {
    auto jobs = factory().expand(iris(2), FoldSelector{});
    ASSERT_TRUE(jobs.has_value());
    EXPECT_TRUE(datasets_.loads().empty());
    EXPECT_TRUE(adapter_->configs().empty());
}

TEST_F(JobFactoryTest, StartRunsTheJobOnce) {
    auto jobs = factory().expand(iris(2), FoldSelector{1});
    ASSERT_TRUE(jobs.has_value());
    auto& job = *(*jobs)[0];

    auto completion = job.start();
    EXPECT_EQ(completion.state, JobState::Completed);
    EXPECT_EQ(job.state(), JobState::Completed);
    ASSERT_TRUE(completion.result.has_value());
    EXPECT_TRUE(completion.result->is_scored());
    EXPECT_EQ(completion.result->identity.fold, 1);
    EXPECT_EQ(completion.key.name(), "local_iris_1_constantpredictor");
    EXPECT_GE(completion.duration, 0.0);

    auto again = job.start();
    EXPECT_EQ(again.state, JobState::Failed);
    EXPECT_FALSE(again.result.has_value());
    ASSERT_TRUE(again.error.has_value());
    EXPECT_EQ(adapter_->configs().size(), 1u);
    EXPECT_EQ(datasets_.loads().size(), 1u);
}

TEST_F(JobFactoryTest, DatasetLoadFailureFailsTheJob) {
    TaskDefinition def = iris(1);
    def.dataset = OpenmlTaskRef{404};
    auto jobs = factory().expand(def, FoldSelector{});
    ASSERT_TRUE(jobs.has_value());

    auto completion = (*jobs)[0]->start();
    EXPECT_EQ(completion.state, JobState::Failed);
    EXPECT_FALSE(completion.result.has_value());
    ASSERT_TRUE(completion.error.has_value());
    EXPECT_TRUE(adapter_->configs().empty());
}

TEST_F(JobFactoryTest, UnsupportedDatasetShapeFailsTheJob) {
    TaskDefinition def = iris(1);
    def.dataset = RawDatasetRef{"/data/iris.csv"};
    auto jobs = factory().expand(def, FoldSelector{});
    ASSERT_TRUE(jobs.has_value());

    auto completion = (*jobs)[0]->start();
    EXPECT_EQ(completion.state, JobState::Failed);
    EXPECT_TRUE(datasets_.loads().empty());
}

TEST(JobTest, ExceptionInRunnableIsReported) {
    Logger logger{std::make_unique<NullSink>()};
    Job job(JobKey{.task = "t", .fold = 0, .framework = "fw"},
            []() -> Result<TaskResult> { throw std::runtime_error("lost"); }, logger);
    auto completion = job.start();
    EXPECT_EQ(completion.state, JobState::Failed);
    EXPECT_EQ(completion.error, "lost");
    EXPECT_EQ(job.state(), JobState::Failed);
}

TEST(JobTest, ClaimOnlyOnce) {
    Logger logger{std::make_unique<NullSink>()};
    Job job(JobKey{.task = "t", .framework = "fw"}, [] { return Result<TaskResult>(TaskResult{}); }, logger);
    EXPECT_TRUE(job.claim());
    EXPECT_FALSE(job.claim());
    EXPECT_EQ(job.state(), JobState::Running);
    job.settle(JobState::Completed);
    EXPECT_EQ(job.state(), JobState::Completed);
}
