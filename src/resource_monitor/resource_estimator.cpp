/**
 * @file resource_estimator.cpp
 * @brief Resource budget arithmetic.
 */

#include "resource_monitor/resource_estimator.hpp"

#include <algorithm>

namespace automl_bench {

ResourceEstimate estimate_resources(const ResourceRequest& request,
                                    const SystemResources& system,
                                    int64_t os_mem_size_mb) noexcept {
    ResourceEstimate estimate;
    estimate.cores = request.cores > 0 ? std::min(request.cores, system.cores)
                                       : system.cores;

    // The OS already uses part of its recommended memory: keep only half of it.
    int64_t left_for_app = system.memory_available_mb - os_mem_size_mb / 2;
    estimate.memory_mb = request.memory_mb > 0 ? request.memory_mb
                       : left_for_app > 0      ? left_for_app
                                               : system.memory_available_mb;

    if (estimate.memory_mb > system.memory_available_mb) {
        estimate.advisories.push_back(ResourceAdvisory::ExceedsAvailable);
    } else if (estimate.memory_mb > system.memory_total_mb - os_mem_size_mb) {
        estimate.advisories.push_back(ResourceAdvisory::WithinOsBuffer);
    }
    return estimate;
}

std::string describe_advisory(ResourceAdvisory advisory,
                              const ResourceEstimate& estimate,
                              const SystemResources& system,
                              int64_t os_mem_size_mb) {
    auto assigned = std::to_string(estimate.memory_mb);
    auto available = std::to_string(system.memory_available_mb);
    auto total = std::to_string(system.memory_total_mb);
    auto buffer = std::to_string(os_mem_size_mb);

    switch (advisory) {
        case ResourceAdvisory::ExceedsAvailable:
            return "Assigned memory (" + assigned + "MB) exceeds system available memory ("
                 + available + "MB / total=" + total + "MB)!";
        case ResourceAdvisory::WithinOsBuffer:
            return "Assigned memory (" + assigned + "MB) is within " + buffer
                 + "MB of system total memory (" + total + "MB): we recommend a "
                 + buffer + "MB buffer, otherwise OS memory usage might interfere "
                 + "with the benchmark task.";
    }
    return {};
}

}  // namespace automl_bench
