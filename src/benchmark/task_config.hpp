/**
 * @file task_config.hpp
 * @brief Job-specific configuration handed to a framework adapter.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "resource_monitor/monitor.hpp"
#include "resource_monitor/resource_estimator.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace automl_bench {

/**
 * @brief Resolved configuration for one (task, fold, framework) run.
 *
 * Built once per task fold by from_def(); the executor copies that template
 * and specializes the copy for each framework run, so the template itself
 * is never modified by a job.
 */
struct TaskConfig {
    TaskName name;
    int fold{0};
    TaskType type{TaskType::Unknown};

    FrameworkName framework;
    Params framework_params;

    std::vector<std::string> metrics;  ///< First entry is the primary metric
    uint64_t seed{0};
    int64_t max_runtime_seconds{0};
    int cores{-1};
    int64_t max_mem_size_mb{-1};

    std::filesystem::path input_dir;
    std::filesystem::path output_dir;
    std::filesystem::path output_predictions_file;

    [[nodiscard]] std::string metric() const {
        return metrics.empty() ? std::string{} : metrics.front();
    }

    static TaskConfig from_def(const TaskDefinition& def, int fold, const Config& config);

    /**
     * @brief Apply command-line task overrides in a fixed order:
     *        max_runtime_seconds, metric, metrics, seed.
     *
     * `metric` replaces the metric list with that single metric; a later
     * `metrics` replaces the whole list.
     */
    void apply_overrides(const TaskOverrides& overrides);

    /**
     * @brief Resolve cores and memory from a fresh probe reading.
     *
     * Advisories are logged as warnings and returned in the estimate; the
     * resolved values are applied regardless.
     */
    Result<ResourceEstimate> estimate_system_params(ISystemProbe& probe,
                                                    int64_t os_mem_size_mb,
                                                    Logger& logger);

    /// Multi-line "key: value" rendering for logs.
    [[nodiscard]] std::string describe() const;
};

/// `<output_dir>/predictions/<framework lower-cased>_<task>_<fold>.csv`
std::filesystem::path predictions_file(const std::filesystem::path& output_dir,
                                       std::string_view framework,
                                       std::string_view task,
                                       int fold);

}  // namespace automl_bench
