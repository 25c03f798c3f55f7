/**
 * @file scoreboard.hpp
 * @brief Aggregated job results and their CSV persistence.
 */

#pragma once

#include "benchmark/job.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "results/task_result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace automl_bench {

/**
 * @brief Ordered rows of one framework, bound to a task or to a benchmark.
 */
class Scoreboard {
public:
    static Scoreboard for_task(FrameworkName framework, TaskName task,
                               std::vector<TaskResult> rows = {});
    static Scoreboard for_benchmark(FrameworkName framework, std::string benchmark,
                                    std::vector<TaskResult> rows = {});

    [[nodiscard]] const FrameworkName& framework() const noexcept { return framework_; }
    [[nodiscard]] const std::optional<TaskName>& task() const noexcept { return task_; }
    [[nodiscard]] const std::optional<std::string>& benchmark() const noexcept { return benchmark_; }
    [[nodiscard]] const std::vector<TaskResult>& rows() const noexcept { return rows_; }
    [[nodiscard]] size_t size() const noexcept { return rows_.size(); }
    [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

    void append(TaskResult row);
    void append(const Scoreboard& other);

    /// `<framework>_task_<task>.csv` or `<framework>_benchmark_<benchmark>.csv`
    [[nodiscard]] std::string file_name() const;

    /// Fixed-width rendering for logs and the console.
    [[nodiscard]] std::string to_table() const;

private:
    Scoreboard(FrameworkName framework, std::optional<TaskName> task,
               std::optional<std::string> benchmark, std::vector<TaskResult> rows);

    FrameworkName framework_;
    std::optional<TaskName> task_;
    std::optional<std::string> benchmark_;
    std::vector<TaskResult> rows_;
};

/**
 * @brief Build a board from the results carried by job completions.
 *
 * Bound to `task` when given (keeping only that task's rows), otherwise to
 * `benchmark`. Completions without a result are skipped; returns nullopt
 * when no row remains.
 */
std::optional<Scoreboard> collect(const std::vector<JobCompletion>& completions,
                                  const FrameworkName& framework,
                                  const std::string& benchmark,
                                  const std::optional<TaskName>& task = std::nullopt);

/**
 * @brief CSV files under `<output_dir>/scores`.
 */
class ScoreStore {
public:
    explicit ScoreStore(std::filesystem::path output_dir);

    /**
     * @brief Append a board to its own file and to the all-time `results.csv`.
     *
     * Both writes are attempted even when the first fails; the error lists
     * every failure.
     */
    Result<void> persist(const Scoreboard& board) const;

    [[nodiscard]] std::filesystem::path scores_dir() const;
    [[nodiscard]] std::filesystem::path board_file(const Scoreboard& board) const;
    [[nodiscard]] std::filesystem::path results_file() const;

    /// Column names shared by every score file.
    static const std::vector<std::string>& columns();

    /// One CSV line (no trailing newline) for a result row.
    static std::string to_csv_row(const TaskResult& row);

private:
    static Result<void> append_rows(const std::filesystem::path& path,
                                    const std::vector<TaskResult>& rows);

    std::filesystem::path output_dir_;
};

}  // namespace automl_bench
