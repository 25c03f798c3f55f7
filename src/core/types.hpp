/**
 * @file types.hpp
 * @brief Fundamental types used throughout the benchmark runner.
 *
 * Defines task definitions, dataset references, fold selectors, system
 * resource figures and other shared vocabulary types. All types are plain
 * values; a loaded TaskDefinition is never mutated afterwards.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace automl_bench {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskName = std::string;
using FrameworkName = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Seconds = std::chrono::duration<double>;

/// Framework parameters, stored as their textual TOML/command-line form.
using Params = std::map<std::string, std::string>;

// ─────────────────────────────────────────────
// Dataset References
// ─────────────────────────────────────────────

struct OpenmlTaskRef {
    int64_t id{0};
};

struct OpenmlDatasetRef {
    int64_t id{0};
};

struct RawDatasetRef {
    std::string path;
};

using DatasetRef = std::variant<OpenmlTaskRef, OpenmlDatasetRef, RawDatasetRef>;

// ─────────────────────────────────────────────
// Task Definition
// ─────────────────────────────────────────────

/**
 * @brief One entry of a benchmark definition.
 *
 * `metrics` is ordered; the first entry is the primary metric reported in
 * the scoreboard `result` column. `cores` and `max_mem_size_mb` use values
 * <= 0 for "unspecified".
 */
struct TaskDefinition {
    TaskName name;
    int folds{10};
    std::vector<std::string> metrics;
    uint64_t seed{0};
    int64_t max_runtime_seconds{3600};
    int cores{-1};
    int64_t max_mem_size_mb{-1};
    std::optional<bool> enabled;
    DatasetRef dataset;

    [[nodiscard]] bool is_enabled() const noexcept {
        return !enabled.has_value() || *enabled;
    }
};

// ─────────────────────────────────────────────
// Selectors
// ─────────────────────────────────────────────

/// All folds (monostate), a single fold, or an explicit list of folds.
using FoldSelector = std::variant<std::monostate, int, std::vector<int>>;

/// The whole enabled catalog (monostate), one task, or a list of tasks.
using TaskSelector = std::variant<std::monostate, std::string, std::vector<std::string>>;

// ─────────────────────────────────────────────
// Task Type
// ─────────────────────────────────────────────

enum class TaskType : uint8_t {
    Unknown,
    Classification,
    Regression
};

[[nodiscard]] constexpr std::string_view to_string(TaskType type) noexcept {
    switch (type) {
        case TaskType::Unknown:        return "unknown";
        case TaskType::Classification: return "classification";
        case TaskType::Regression:     return "regression";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// System Resources
// ─────────────────────────────────────────────

/**
 * @brief A point-in-time reading of the machine capacity, in cores and MB.
 */
struct SystemResources {
    int cores{0};
    int64_t memory_total_mb{0};
    int64_t memory_available_mb{0};
};

// ─────────────────────────────────────────────
// Job State
// ─────────────────────────────────────────────

enum class JobState : uint8_t {
    Created,
    Running,
    Completed,     ///< Produced a TaskResult (scored or NoResult)
    Failed         ///< Failed before fault isolation applied
};

[[nodiscard]] constexpr std::string_view to_string(JobState state) noexcept {
    switch (state) {
        case JobState::Created:   return "created";
        case JobState::Running:   return "running";
        case JobState::Completed: return "completed";
        case JobState::Failed:    return "failed";
    }
    return "unknown";
}

}  // namespace automl_bench
