/**
 * @file job_runner.hpp
 * @brief Strategies that drive a list of jobs to completion.
 *
 * Every strategy returns exactly one JobCompletion per submitted job, and a
 * failing job never prevents the others from running. Only the sequential
 * strategy guarantees that completions come back in submission order.
 */

#pragma once

#include "benchmark/job.hpp"
#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"

#include <chrono>
#include <memory>
#include <string_view>
#include <vector>

struct pollfd;

namespace automl_bench {

struct ParallelOptions {
    size_t max_workers{1};
    std::chrono::milliseconds delay{0};           ///< Stagger between submissions
    bool done_async{true};                        ///< Poll completions instead of joining in order
    std::chrono::milliseconds poll_interval{100};
};

// ─────────────────────────────────────────────
// IJobRunner (Virtual — selected by configuration)
// ─────────────────────────────────────────────

class IJobRunner {
public:
    virtual ~IJobRunner() = default;

    /**
     * @brief Run every job and reconcile durations.
     *
     * A result that did not measure its own duration takes the wall clock
     * measured around its job.
     */
    std::vector<JobCompletion> run(const JobList& jobs);

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

protected:
    explicit IJobRunner(Logger& logger) : logger_(logger) {}

    virtual std::vector<JobCompletion> run_jobs(const JobList& jobs) = 0;

    Logger& logger_;
};

/// Give NaN result durations the runner-measured job duration.
void reconcile_durations(std::vector<JobCompletion>& completions);

// ─────────────────────────────────────────────
// Strategies
// ─────────────────────────────────────────────

class SequentialJobRunner final : public IJobRunner {
public:
    explicit SequentialJobRunner(Logger& logger) : IJobRunner(logger) {}

    [[nodiscard]] std::string_view name() const noexcept override { return "sequential"; }

protected:
    std::vector<JobCompletion> run_jobs(const JobList& jobs) override;
};

/**
 * @brief Runs jobs on a ThreadPool of `max_workers` threads.
 */
class ThreadedJobRunner final : public IJobRunner {
public:
    ThreadedJobRunner(ParallelOptions options, Logger& logger);

    [[nodiscard]] std::string_view name() const noexcept override { return "threads"; }
    [[nodiscard]] const ParallelOptions& options() const noexcept { return options_; }

protected:
    std::vector<JobCompletion> run_jobs(const JobList& jobs) override;

private:
    ParallelOptions options_;
};

/**
 * @brief Runs each job in a forked child process, at most `max_workers` alive.
 *
 * The stagger `delay` applies between forks only.
 *
 * The child sends its completion back through a pipe. A child that dies
 * before reporting (crash, signal, abort) yields an error completion, so a
 * crashing adapter cannot take the run down with it.
 */
class ProcessJobRunner : public IJobRunner {
public:
    ProcessJobRunner(ParallelOptions options, Logger& logger);

    [[nodiscard]] std::string_view name() const noexcept override { return "processes"; }
    [[nodiscard]] const ParallelOptions& options() const noexcept { return options_; }

protected:
    std::vector<JobCompletion> run_jobs(const JobList& jobs) override;

    /// Wait on the worker pipes; ::poll semantics. If it fails, the live
    /// workers are killed and every remaining job is reported as failed.
    virtual int poll_workers(pollfd* fds, size_t count, int timeout_ms);

private:
    ParallelOptions options_;
};

static_assert(JobRunnerLike<SequentialJobRunner, JobList>);
static_assert(JobRunnerLike<ThreadedJobRunner, JobList>);
static_assert(JobRunnerLike<ProcessJobRunner, JobList>);

/**
 * @brief Pick a strategy from `[runner]`: "sequential", "threads" or
 *        "processes". `parallel_jobs <= 1` always runs sequentially.
 */
Result<std::unique_ptr<IJobRunner>> make_job_runner(const RunnerConfig& config, Logger& logger);

}  // namespace automl_bench
