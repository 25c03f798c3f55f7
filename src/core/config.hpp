/**
 * @file config.hpp
 * @brief Runner configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace automl_bench {

struct ProjectConfig {
    std::filesystem::path input_dir = "./data";
    std::filesystem::path output_dir = "./results";
    std::filesystem::path frameworks_dir = "./frameworks";
    std::filesystem::path frameworks_file = "./resources/frameworks.toml";
    std::filesystem::path benchmarks_dir = "./resources/benchmarks";
};

struct ResultsConfig {
    bool save = true;
    uint32_t error_max_length = 200;
};

/// Values applied to every task definition that does not set them itself.
struct TaskDefaults {
    int folds = 10;
    int64_t max_runtime_seconds = 3600;
    int cores = -1;
    int64_t max_mem_size_mb = -1;
    std::vector<std::string> metrics{"acc"};
    uint64_t seed = 42;
};

struct BenchmarksConfig {
    int64_t os_mem_size_mb = 2048;
    TaskDefaults defaults;
};

struct RunnerConfig {
    std::string strategy = "threads";   ///< "sequential", "threads", "processes"
    uint32_t parallel_jobs = 1;
    uint32_t delay_secs = 5;            ///< Stagger between submissions
    bool done_async = true;             ///< Poll for completions instead of joining
    uint32_t poll_interval_ms = 100;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    std::string log_level = "info";
};

/**
 * @brief Task parameters overridable from the command line (`-Xt.*`).
 *
 * Applied in declaration order by TaskConfig::apply_overrides.
 */
struct TaskOverrides {
    std::optional<int64_t> max_runtime_seconds;
    std::optional<std::string> metric;
    std::optional<std::vector<std::string>> metrics;
    std::optional<uint64_t> seed;

    [[nodiscard]] bool empty() const noexcept {
        return !max_runtime_seconds && !metric && !metrics && !seed;
    }
};

struct OverridesConfig {
    Params framework;                   ///< `-Xf.*`
    TaskOverrides task;                 ///< `-Xt.*`
};

/**
 * @brief Top-level runner configuration.
 */
struct Config {
    ProjectConfig project;
    ResultsConfig results;
    BenchmarksConfig benchmarks;
    RunnerConfig runner;
    TelemetryConfig telemetry;
    OverridesConfig overrides;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Apply one `section.key=value` command-line override.
 *
 * Supports `f.<param>` (framework params) and `t.max_runtime_seconds`,
 * `t.metric`, `t.metrics` (comma separated), `t.seed`.
 */
Result<void> apply_override(Config& config, std::string_view assignment);

/**
 * @brief Parse a boolean-like string (true/false, yes/no, on/off, 1/0).
 */
std::optional<bool> parse_bool(std::string_view text);

}  // namespace automl_bench
