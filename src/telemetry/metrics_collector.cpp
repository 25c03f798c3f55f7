/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"
#include "benchmark/job.hpp"

#include <sstream>

namespace automl_bench {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_resource_estimate(std::string_view task, int fold,
                                                const ResourceEstimate& estimate) {
    std::ostringstream oss;
    oss << R"({"event":"resource_estimate")"
        << R"(,"task":")" << json_escape(task) << "\""
        << R"(,"fold":)" << fold
        << R"(,"cores":)" << estimate.cores
        << R"(,"mem_mb":)" << estimate.memory_mb
        << R"(,"advisories":)" << estimate.advisories.size()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_job_event(const JobKey& key, JobState state, double duration_secs) {
    std::ostringstream oss;
    oss << R"({"event":"job_state_change")"
        << R"(,"job":")" << json_escape(key.name()) << "\""
        << R"(,"state":")" << to_string(state) << "\""
        << R"(,"duration_s":)" << duration_secs
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_run_summary(const RunSummary& summary) {
    std::ostringstream oss;
    oss << R"({"event":"run_summary")"
        << R"(,"uid":")" << json_escape(summary.uid) << "\""
        << R"(,"framework":")" << json_escape(summary.framework) << "\""
        << R"(,"jobs":)" << summary.jobs
        << R"(,"scored":)" << summary.scored
        << R"(,"no_result":)" << summary.no_result
        << R"(,"failed":)" << summary.failed
        << R"(,"duration_s":)" << summary.duration
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace automl_bench
