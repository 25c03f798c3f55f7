/**
 * @file task_result.cpp
 * @brief TaskResult helpers and scoring.
 */

#include "results/task_result.hpp"
#include "results/metrics.hpp"

#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace automl_bench {

std::optional<double> TaskResult::primary_score() const {
    if (const auto* scored = std::get_if<Scored>(&outcome); scored && !scored->scores.empty()) {
        return scored->scores.front().value;
    }
    return std::nullopt;
}

std::string TaskResult::primary_metric() const {
    if (const auto* scored = std::get_if<Scored>(&outcome); scored && !scored->scores.empty()) {
        return scored->scores.front().metric;
    }
    return {};
}

std::string TaskResult::info() const {
    if (const auto* none = std::get_if<NoResult>(&outcome)) return none->info;
    return {};
}

std::string truncate_message(std::string_view message, size_t max_length) {
    if (message.size() <= max_length) return std::string(message);
    constexpr std::string_view marker = "...";
    if (max_length <= marker.size()) return std::string(marker.substr(0, max_length));
    return std::string(message.substr(0, max_length - marker.size())) + std::string(marker);
}

std::string utc_now() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%T");
    return oss.str();
}

Result<TaskResult> compute_scores(const ResultIdentity& identity,
                                  const std::vector<std::string>& metrics,
                                  const MetaResult& meta) {
    if (meta.predictions.size() != meta.truth.size()) {
        return Error{"Got " + std::to_string(meta.predictions.size()) + " predictions for "
                     + std::to_string(meta.truth.size()) + " test rows"};
    }

    Scored scored;
    for (const auto& metric : metrics) {
        auto value = compute_metric(metric, meta.truth, meta.predictions);
        scored.scores.push_back({metric, value.value_or(std::nan(""))});
    }

    TaskResult result;
    result.identity = identity;
    result.duration = meta.duration;
    result.utc = utc_now();
    result.models_count = meta.models_count;
    result.outcome = std::move(scored);
    return result;
}

TaskResult make_no_result(const ResultIdentity& identity, std::string info) {
    TaskResult result;
    result.identity = identity;
    result.utc = utc_now();
    result.outcome = NoResult{std::move(info)};
    return result;
}

}  // namespace automl_bench
