/**
 * @file constant_predictor.hpp
 * @brief Baseline adapter predicting a constant learned from the train split.
 */

#pragma once

#include "benchmark/framework.hpp"

namespace automl_bench {

/**
 * @brief Predicts the majority class (classification) or the mean target
 *        (regression) for every test row.
 *
 * Stateless, so one instance can serve concurrent jobs.
 */
class ConstantPredictor final : public IFrameworkAdapter {
public:
    Result<MetaResult> run(const Dataset& dataset, const TaskConfig& config) override;
};

/// Register every adapter shipped with the runner under its module name.
void register_builtin_adapters(AdapterRegistry& registry);

}  // namespace automl_bench
