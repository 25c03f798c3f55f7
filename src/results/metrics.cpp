/**
 * @file metrics.cpp
 * @brief Metric implementations.
 */

#include "results/metrics.hpp"

#include <cmath>
#include <map>
#include <string>

namespace automl_bench {

namespace {

struct Pair {
    double truth;
    double prediction;
};

std::vector<Pair> valid_pairs(const std::vector<double>& truth,
                              const std::vector<double>& predictions) {
    std::vector<Pair> pairs;
    pairs.reserve(truth.size());
    for (size_t i = 0; i < truth.size(); ++i) {
        if (std::isnan(truth[i]) || std::isnan(predictions[i])) continue;
        pairs.push_back({truth[i], predictions[i]});
    }
    return pairs;
}

double accuracy(const std::vector<Pair>& pairs) {
    size_t hits = 0;
    for (const auto& p : pairs) {
        if (std::lround(p.truth) == std::lround(p.prediction)) ++hits;
    }
    return static_cast<double>(hits) / static_cast<double>(pairs.size());
}

double balanced_accuracy(const std::vector<Pair>& pairs) {
    std::map<long, std::pair<size_t, size_t>> per_class;  // class -> (hits, total)
    for (const auto& p : pairs) {
        auto& [hits, total] = per_class[std::lround(p.truth)];
        ++total;
        if (std::lround(p.truth) == std::lround(p.prediction)) ++hits;
    }
    double recall_sum = 0.0;
    for (const auto& [cls, counts] : per_class) {
        recall_sum += static_cast<double>(counts.first) / static_cast<double>(counts.second);
    }
    return recall_sum / static_cast<double>(per_class.size());
}

double rmse(const std::vector<Pair>& pairs) {
    double sum = 0.0;
    for (const auto& p : pairs) sum += (p.truth - p.prediction) * (p.truth - p.prediction);
    return std::sqrt(sum / static_cast<double>(pairs.size()));
}

double mae(const std::vector<Pair>& pairs) {
    double sum = 0.0;
    for (const auto& p : pairs) sum += std::fabs(p.truth - p.prediction);
    return sum / static_cast<double>(pairs.size());
}

double r2(const std::vector<Pair>& pairs) {
    double mean = 0.0;
    for (const auto& p : pairs) mean += p.truth;
    mean /= static_cast<double>(pairs.size());

    double ss_res = 0.0;
    double ss_tot = 0.0;
    for (const auto& p : pairs) {
        ss_res += (p.truth - p.prediction) * (p.truth - p.prediction);
        ss_tot += (p.truth - mean) * (p.truth - mean);
    }
    if (ss_tot == 0.0) return ss_res == 0.0 ? 1.0 : 0.0;
    return 1.0 - ss_res / ss_tot;
}

}  // anonymous namespace

bool is_known_metric(std::string_view metric) noexcept {
    return metric == "acc" || metric == "balacc" || metric == "rmse"
        || metric == "mae" || metric == "r2";
}

Result<double> compute_metric(std::string_view metric,
                              const std::vector<double>& truth,
                              const std::vector<double>& predictions) {
    if (!is_known_metric(metric)) {
        return Error{"Unsupported metric: " + std::string(metric)};
    }
    if (truth.size() != predictions.size()) {
        return Error{"Got " + std::to_string(predictions.size()) + " predictions for "
                     + std::to_string(truth.size()) + " rows"};
    }

    auto pairs = valid_pairs(truth, predictions);
    if (pairs.empty()) {
        return Error{"No valid prediction to score"};
    }

    if (metric == "acc") return accuracy(pairs);
    if (metric == "balacc") return balanced_accuracy(pairs);
    if (metric == "rmse") return rmse(pairs);
    if (metric == "mae") return mae(pairs);
    return r2(pairs);
}

}  // namespace automl_bench
