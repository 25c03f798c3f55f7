/**
 * @file constant_predictor.cpp
 * @brief ConstantPredictor implementation.
 */

#include "frameworks/constant_predictor.hpp"

#include <cmath>
#include <map>

namespace automl_bench {

namespace {

double majority_class(const std::vector<double>& labels) {
    std::map<double, size_t> counts;
    for (double label : labels) {
        if (!std::isnan(label)) ++counts[label];
    }
    double best = std::nan("");
    size_t best_count = 0;
    for (const auto& [label, count] : counts) {
        // Ties go to the smallest encoded label.
        if (count > best_count) {
            best = label;
            best_count = count;
        }
    }
    return best;
}

double mean(const std::vector<double>& values) {
    double sum = 0.0;
    size_t n = 0;
    for (double v : values) {
        if (std::isnan(v)) continue;
        sum += v;
        ++n;
    }
    return n == 0 ? std::nan("") : sum / static_cast<double>(n);
}

}  // anonymous namespace

Result<MetaResult> ConstantPredictor::run(const Dataset& dataset, const TaskConfig& config) {
    const auto& train = dataset.train();
    const auto& test = dataset.test();
    if (train.rows() == 0) {
        return Error{ErrorCode::AdapterFailure, "Empty training set for task " + config.name};
    }

    double constant = config.type == TaskType::Classification ? majority_class(train.y)
                                                              : mean(train.y);
    if (std::isnan(constant)) {
        return Error{ErrorCode::AdapterFailure, "No usable target value in task " + config.name};
    }

    MetaResult meta;
    meta.predictions.assign(test.rows(), constant);
    meta.truth = test.y;
    meta.models_count = 1;
    return meta;
}

void register_builtin_adapters(AdapterRegistry& registry) {
    registry.add("constantpredictor", std::make_shared<ConstantPredictor>());
}

}  // namespace automl_bench
