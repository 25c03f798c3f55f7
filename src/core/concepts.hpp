/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for benchmark runner interfaces.
 *
 * Defines compile-time interface constraints that complement the virtual
 * interfaces used where a component is chosen at runtime.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <concepts>
#include <string_view>
#include <vector>

namespace automl_bench {

// Forward declarations
class Job;
struct JobCompletion;

// ─────────────────────────────────────────────
// SystemProbeLike
// ─────────────────────────────────────────────

/**
 * @concept SystemProbeLike
 * @brief Constrains types that can report the machine's cores and memory.
 *
 * A probe is read once per job dispatch; it must not cache readings.
 */
template <typename T>
concept SystemProbeLike = requires(T probe) {
    { probe.read() } -> std::same_as<Result<SystemResources>>;
    { probe.cores() } -> std::convertible_to<int>;
    { probe.memory_available_mb() } -> std::convertible_to<int64_t>;
};

// ─────────────────────────────────────────────
// JobRunnerLike
// ─────────────────────────────────────────────

/**
 * @concept JobRunnerLike
 * @brief Constrains types that drive a batch of jobs to completion.
 */
template <typename T, typename JobListT>
concept JobRunnerLike = requires(T runner, const JobListT& jobs) {
    { runner.run(jobs) } -> std::same_as<std::vector<JobCompletion>>;
    { runner.name() } -> std::convertible_to<std::string_view>;
};

}  // namespace automl_bench
