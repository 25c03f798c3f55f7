/**
 * @file job.hpp
 * @brief Job, job completion and the factory expanding tasks into jobs.
 */

#pragma once

#include "benchmark/context.hpp"
#include "benchmark/framework.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "results/task_result.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace automl_bench {

// ─────────────────────────────────────────────
// Job identity and completion
// ─────────────────────────────────────────────

struct JobKey {
    std::string scope = "local";
    TaskName task;
    int fold{0};
    FrameworkName framework;

    /// "<scope>_<task>_<fold>_<framework>"
    [[nodiscard]] std::string name() const;

    bool operator==(const JobKey&) const = default;
};

/**
 * @brief What a runner reports for one submitted job.
 *
 * `result` is set whenever the job reached the executor (scored or
 * NoResult); `error` is set when the job failed before that point, e.g. on
 * a dataset load failure or a crashed worker process.
 */
struct JobCompletion {
    JobKey key;
    JobState state{JobState::Created};
    double duration{0.0};              ///< Runner-measured wall clock, seconds
    std::optional<TaskResult> result;
    std::optional<std::string> error;
};

// ─────────────────────────────────────────────
// Job
// ─────────────────────────────────────────────

/**
 * @brief One deferred (task, fold, framework) run.
 *
 * start() runs the deferred callable at most once; a second call reports an
 * error completion without running anything.
 */
class Job {
public:
    using Runnable = std::function<Result<TaskResult>()>;

    Job(JobKey key, Runnable runnable, Logger& logger);

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    JobCompletion start();

    /// Claim the job for a runner that executes it elsewhere (e.g. a child process).
    [[nodiscard]] bool claim() noexcept;
    /// Run a job already claimed; the worker side of claim().
    JobCompletion run_claimed();
    /// Record the final state of a job run elsewhere.
    void settle(JobState state) noexcept;

    [[nodiscard]] const JobKey& key() const noexcept { return key_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] JobState state() const noexcept { return state_.load(); }

private:
    JobKey key_;
    std::string name_;
    Runnable runnable_;
    Logger& logger_;
    std::atomic<JobState> state_{JobState::Created};
};

using JobList = std::vector<std::shared_ptr<Job>>;

// ─────────────────────────────────────────────
// Job Factory
// ─────────────────────────────────────────────

/**
 * @brief Parse a fold selector: "" (all folds), "3", or "0,1,2".
 */
Result<FoldSelector> parse_fold_selector(std::string_view text);

/**
 * @brief Expands task definitions into one job per fold for one framework.
 */
class JobFactory {
public:
    JobFactory(BenchmarkContext context,
               FrameworkDefinition framework,
               std::shared_ptr<IFrameworkAdapter> adapter);

    /**
     * @brief One job per selected fold, in selection order.
     *
     * Fails with FoldOutOfRange, without producing any job, if a selected
     * fold is outside [0, def.folds).
     */
    [[nodiscard]] Result<JobList> expand(const TaskDefinition& def, const FoldSelector& folds) const;

    static Result<std::vector<int>> resolve_folds(const TaskDefinition& def,
                                                  const FoldSelector& folds);

private:
    std::shared_ptr<Job> make_job(const TaskDefinition& def, int fold) const;

    BenchmarkContext context_;
    FrameworkDefinition framework_;
    std::shared_ptr<IFrameworkAdapter> adapter_;
};

}  // namespace automl_bench
