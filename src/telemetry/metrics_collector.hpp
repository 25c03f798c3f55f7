/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "resource_monitor/resource_estimator.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace automl_bench {

struct JobKey;

/// Counts reported at the end of a benchmark run.
struct RunSummary {
    std::string uid;
    FrameworkName framework;
    size_t jobs{0};
    size_t scored{0};
    size_t no_result{0};
    size_t failed{0};
    double duration{0.0};
};

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_resource_estimate(std::string_view task, int fold, const ResourceEstimate& estimate);
    void record_job_event(const JobKey& key, JobState state, double duration_secs);
    void record_run_summary(const RunSummary& summary);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace automl_bench
