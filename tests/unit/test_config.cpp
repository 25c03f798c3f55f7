/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading and command-line overrides.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace automl_bench;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "automl_bench_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.project.output_dir.string(), "./results");
    EXPECT_TRUE(config.results.save);
    EXPECT_EQ(config.results.error_max_length, 200u);
    EXPECT_EQ(config.benchmarks.os_mem_size_mb, 2048);
    EXPECT_EQ(config.benchmarks.defaults.folds, 10);
    EXPECT_EQ(config.benchmarks.defaults.metrics, std::vector<std::string>{"acc"});
    EXPECT_EQ(config.runner.strategy, "threads");
    EXPECT_EQ(config.runner.parallel_jobs, 1u);
    EXPECT_TRUE(config.overrides.framework.empty());
    EXPECT_TRUE(config.overrides.task.empty());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [project]
        input_dir = "/data/in"
        output_dir = "/data/out"
        frameworks_file = "/etc/frameworks.toml"

        [results]
        save = false
        error_max_length = 80

        [benchmarks]
        os_mem_size_mb = 1024

        [benchmarks.defaults]
        folds = 3
        max_runtime_seconds = 600
        cores = 2
        metrics = ["balacc", "acc"]
        seed = 7

        [runner]
        strategy = "processes"
        parallel_jobs = 4
        delay_secs = 0
        done_async = false
        poll_interval_ms = 20

        [telemetry]
        log_dir = "/tmp/automl_logs"
        log_level = "debug"

        [overrides.f]
        max_evals = 10
        verbose = true

        [overrides.t]
        seed = 99
        metrics = ["rmse", "r2"]
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.project.input_dir.string(), "/data/in");
    EXPECT_EQ(config.project.output_dir.string(), "/data/out");
    EXPECT_EQ(config.project.frameworks_file.string(), "/etc/frameworks.toml");
    EXPECT_FALSE(config.results.save);
    EXPECT_EQ(config.results.error_max_length, 80u);
    EXPECT_EQ(config.benchmarks.os_mem_size_mb, 1024);
    EXPECT_EQ(config.benchmarks.defaults.folds, 3);
    EXPECT_EQ(config.benchmarks.defaults.max_runtime_seconds, 600);
    EXPECT_EQ(config.benchmarks.defaults.cores, 2);
    EXPECT_EQ(config.benchmarks.defaults.metrics, (std::vector<std::string>{"balacc", "acc"}));
    EXPECT_EQ(config.benchmarks.defaults.seed, 7u);
    EXPECT_EQ(config.runner.strategy, "processes");
    EXPECT_EQ(config.runner.parallel_jobs, 4u);
    EXPECT_EQ(config.runner.delay_secs, 0u);
    EXPECT_FALSE(config.runner.done_async);
    EXPECT_EQ(config.runner.poll_interval_ms, 20u);
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_EQ(config.overrides.framework.at("max_evals"), "10");
    EXPECT_EQ(config.overrides.framework.at("verbose"), "true");
    ASSERT_TRUE(config.overrides.task.seed.has_value());
    EXPECT_EQ(*config.overrides.task.seed, 99u);
    ASSERT_TRUE(config.overrides.task.metrics.has_value());
    EXPECT_EQ(*config.overrides.task.metrics, (std::vector<std::string>{"rmse", "r2"}));
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [runner]
        parallel_jobs = 3
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->runner.parallel_jobs, 3u);
    // Defaults for everything else
    EXPECT_EQ(result->runner.strategy, "threads");
    EXPECT_EQ(result->benchmarks.os_mem_size_mb, 2048);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigParse);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigParse);
}

TEST_F(ConfigTest, UnsupportedTaskOverrideInFile) {
    auto path = write_toml(R"(
        [overrides.t]
        folds = 3
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigParse);
}

// ─── Command-line overrides ──────────────────

TEST(OverrideTest, FrameworkParam) {
    auto config = default_config();
    ASSERT_TRUE(apply_override(config, "f.max_evals=10"));
    EXPECT_EQ(config.overrides.framework.at("max_evals"), "10");
}

TEST(OverrideTest, TaskOverrides) {
    auto config = default_config();
    ASSERT_TRUE(apply_override(config, "t.max_runtime_seconds=60"));
    ASSERT_TRUE(apply_override(config, "t.metric=balacc"));
    ASSERT_TRUE(apply_override(config, "t.metrics=acc, rmse"));
    ASSERT_TRUE(apply_override(config, "t.seed=3"));

    const auto& task = config.overrides.task;
    EXPECT_EQ(task.max_runtime_seconds, 60);
    EXPECT_EQ(task.metric, "balacc");
    EXPECT_EQ(task.metrics, (std::vector<std::string>{"acc", "rmse"}));
    EXPECT_EQ(task.seed, 3u);
}

TEST(OverrideTest, RejectsMalformedInput) {
    auto config = default_config();
    EXPECT_FALSE(apply_override(config, "no_section=1"));
    EXPECT_FALSE(apply_override(config, "t.seed"));
    EXPECT_FALSE(apply_override(config, "t.seed=abc"));
    EXPECT_FALSE(apply_override(config, "t.unknown=1"));
    EXPECT_FALSE(apply_override(config, "x.key=1"));
    EXPECT_FALSE(config.overrides.task.seed.has_value());
}

TEST(ParseBoolTest, AcceptsCommonSpellings) {
    EXPECT_EQ(parse_bool("true"), true);
    EXPECT_EQ(parse_bool(" Yes "), true);
    EXPECT_EQ(parse_bool("on"), true);
    EXPECT_EQ(parse_bool("1"), true);
    EXPECT_EQ(parse_bool("false"), false);
    EXPECT_EQ(parse_bool("NO"), false);
    EXPECT_EQ(parse_bool("off"), false);
    EXPECT_EQ(parse_bool("0"), false);
    EXPECT_FALSE(parse_bool("maybe").has_value());
}
