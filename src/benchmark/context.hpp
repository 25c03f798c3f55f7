/**
 * @file context.hpp
 * @brief Services shared by the job factory, executors and orchestrator.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "dataset/dataset.hpp"
#include "resource_monitor/monitor.hpp"

namespace automl_bench {

class MetricsCollector;

/**
 * @brief Non-owning bundle of the collaborators a benchmark run needs.
 *
 * Built once by the caller and passed by value; every referenced object
 * must outlive the jobs created from it.
 */
struct BenchmarkContext {
    const Config& config;
    Logger& logger;
    IDatasetService& datasets;
    ISystemProbe& probe;
    MetricsCollector* metrics = nullptr;
};

}  // namespace automl_bench
