/**
 * @file task_result.hpp
 * @brief Per-job outcome: a scored record or a NoResult diagnostic.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace automl_bench {

// ─────────────────────────────────────────────
// Adapter output
// ─────────────────────────────────────────────

/**
 * @brief What a framework adapter hands back after a successful run.
 *
 * Predictions and truth use the dataset's target encoding. `duration` is
 * the adapter's own training time in seconds, NaN when not measured.
 */
struct MetaResult {
    std::vector<double> predictions;
    std::vector<double> truth;
    double duration = std::numeric_limits<double>::quiet_NaN();
    uint32_t models_count = 0;
};

// ─────────────────────────────────────────────
// Outcome
// ─────────────────────────────────────────────

struct MetricScore {
    std::string metric;
    double value;
};

struct Scored {
    std::vector<MetricScore> scores;   ///< In TaskConfig metrics order
};

struct NoResult {
    std::string info;
};

using Outcome = std::variant<Scored, NoResult>;

/**
 * @brief Identity shared by every result of one job.
 */
struct ResultIdentity {
    std::string id;                    ///< e.g. "openml.org/t/59"
    TaskName task;
    FrameworkName framework;
    int fold{0};
    uint64_t seed{0};
};

struct TaskResult {
    ResultIdentity identity;
    double duration = std::numeric_limits<double>::quiet_NaN();
    std::string utc;
    uint32_t models_count = 0;
    Outcome outcome;

    [[nodiscard]] bool is_scored() const noexcept {
        return std::holds_alternative<Scored>(outcome);
    }

    /// Value of the first metric, absent for NoResult.
    [[nodiscard]] std::optional<double> primary_score() const;
    [[nodiscard]] std::string primary_metric() const;

    /// NoResult diagnostic, empty for scored results.
    [[nodiscard]] std::string info() const;
};

// ─────────────────────────────────────────────
// Construction helpers
// ─────────────────────────────────────────────

/**
 * @brief Cap a message at `max_length` characters.
 *
 * Longer messages keep their first `max_length - 3` characters followed by
 * "...", so the stored text is exactly `max_length` long.
 */
[[nodiscard]] std::string truncate_message(std::string_view message, size_t max_length);

/// Current UTC time as "YYYY-MM-DDTHH:MM:SS".
[[nodiscard]] std::string utc_now();

/**
 * @brief Score a meta-result against the requested metrics.
 *
 * Unknown metrics score NaN. Fails when the prediction count does not match
 * the truth count.
 */
Result<TaskResult> compute_scores(const ResultIdentity& identity,
                                  const std::vector<std::string>& metrics,
                                  const MetaResult& meta);

[[nodiscard]] TaskResult make_no_result(const ResultIdentity& identity, std::string info);

}  // namespace automl_bench
