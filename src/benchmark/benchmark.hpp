/**
 * @file benchmark.hpp
 * @brief Top-level orchestrator: tasks → jobs → runner → scoreboards.
 */

#pragma once

#include "benchmark/context.hpp"
#include "benchmark/framework.hpp"
#include "benchmark/job.hpp"
#include "benchmark/task_catalog.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/job_runner.hpp"
#include "results/scoreboard.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace automl_bench {

/**
 * @brief Runs one framework against a benchmark's task catalog.
 *
 * Configuration errors (unknown or disabled task, bad fold, empty task set)
 * are returned before any job runs. Once jobs run, individual failures end
 * up as NoResult rows or are logged; they never fail the whole run.
 */
class Benchmark {
public:
    Benchmark(BenchmarkContext context,
              FrameworkDefinition framework,
              std::shared_ptr<IFrameworkAdapter> adapter,
              std::string benchmark_name,
              TaskCatalog catalog,
              std::unique_ptr<IJobRunner> runner);

    Benchmark(const Benchmark&) = delete;
    Benchmark& operator=(const Benchmark&) = delete;

    /// Framework setup through the marker-file guard; see SetupMode.
    Result<void> setup(SetupMode mode);

    /**
     * @brief Run the selected tasks and folds.
     *
     * All enabled tasks produce one benchmark-bound board. A single task
     * name produces that task's board. Several names produce one persisted
     * board per task and return their rows combined under the benchmark
     * name. nullopt when no job produced a result.
     */
    Result<std::optional<Scoreboard>> run(const TaskSelector& tasks, const FoldSelector& folds);

    [[nodiscard]] const std::string& uid() const noexcept { return uid_; }
    [[nodiscard]] const std::string& name() const noexcept { return benchmark_name_; }
    [[nodiscard]] const FrameworkDefinition& framework() const noexcept { return framework_; }
    [[nodiscard]] const TaskCatalog& catalog() const noexcept { return catalog_; }
    [[nodiscard]] const IJobRunner& runner() const noexcept { return *runner_; }

private:
    Result<std::vector<TaskDefinition>> resolve_tasks(const TaskSelector& tasks) const;
    std::optional<Scoreboard> process_results(const std::vector<JobCompletion>& completions,
                                              const std::optional<TaskName>& task);
    void record_telemetry(const std::vector<JobCompletion>& completions, double duration);

    BenchmarkContext context_;
    FrameworkDefinition framework_;
    std::shared_ptr<IFrameworkAdapter> adapter_;
    std::string benchmark_name_;
    TaskCatalog catalog_;
    std::unique_ptr<IJobRunner> runner_;
    std::string uid_;
};

/// `<framework>-<benchmark>-<YYYYMMDDTHHMMSS>`, lower-cased.
std::string make_run_uid(std::string_view framework, std::string_view benchmark);

}  // namespace automl_bench
