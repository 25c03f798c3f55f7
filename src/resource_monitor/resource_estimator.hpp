/**
 * @file resource_estimator.hpp
 * @brief Per-job core/memory budget from requested values and live capacity.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace automl_bench {

/// Requested budget; values <= 0 mean "unspecified".
struct ResourceRequest {
    int cores{-1};
    int64_t memory_mb{-1};
};

enum class ResourceAdvisory : uint8_t {
    ExceedsAvailable,   ///< Assigned memory is above what is currently available
    WithinOsBuffer      ///< Assigned memory leaves less than the OS headroom
};

[[nodiscard]] constexpr std::string_view to_string(ResourceAdvisory advisory) noexcept {
    switch (advisory) {
        case ResourceAdvisory::ExceedsAvailable: return "exceeds_available";
        case ResourceAdvisory::WithinOsBuffer:   return "within_os_buffer";
    }
    return "unknown";
}

struct ResourceEstimate {
    int cores{0};
    int64_t memory_mb{0};
    std::vector<ResourceAdvisory> advisories;
};

/**
 * @brief Resolve the budget for one job.
 *
 *   cores  = min(requested, system) if requested > 0, else system
 *   memory = requested if > 0, else (available - headroom/2) if > 0,
 *            else available
 *
 * Advisories are returned, never enforced: ExceedsAvailable when memory
 * is above the available figure, otherwise WithinOsBuffer when memory is
 * above total minus the headroom.
 */
[[nodiscard]] ResourceEstimate estimate_resources(const ResourceRequest& request,
                                                  const SystemResources& system,
                                                  int64_t os_mem_size_mb) noexcept;

/// Human-readable warning for an advisory, as logged by the executor.
[[nodiscard]] std::string describe_advisory(ResourceAdvisory advisory,
                                            const ResourceEstimate& estimate,
                                            const SystemResources& system,
                                            int64_t os_mem_size_mb);

}  // namespace automl_bench
