/**
 * @file metrics.hpp
 * @brief Scoring metrics computed from predictions and ground truth.
 */

#pragma once

#include "core/result.hpp"

#include <string_view>
#include <vector>

namespace automl_bench {

/**
 * @brief Compute one metric over encoded targets.
 *
 * Supported: "acc", "balacc" (classification, values are class indices),
 * "rmse", "mae", "r2" (regression). Rows whose truth or prediction is NaN
 * are skipped.
 */
Result<double> compute_metric(std::string_view metric,
                              const std::vector<double>& truth,
                              const std::vector<double>& predictions);

[[nodiscard]] bool is_known_metric(std::string_view metric) noexcept;

}  // namespace automl_bench
