/**
 * @file task_catalog.hpp
 * @brief Ordered catalog of task definitions for one benchmark.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace automl_bench {

class TaskCatalog {
public:
    TaskCatalog() = default;
    explicit TaskCatalog(std::vector<TaskDefinition> definitions);

    /// Enabled definitions, in definition order.
    [[nodiscard]] std::vector<TaskDefinition> list_enabled() const;

    /// Fails with UnknownTask or TaskDisabled.
    [[nodiscard]] Result<TaskDefinition> get(std::string_view name) const;

    [[nodiscard]] const std::vector<TaskDefinition>& definitions() const noexcept {
        return definitions_;
    }
    [[nodiscard]] size_t size() const noexcept { return definitions_.size(); }

private:
    std::vector<TaskDefinition> definitions_;
};

/**
 * @brief Parse a TOML benchmark definition (`[[tasks]]` entries).
 *
 * Fields missing from an entry take their value from `defaults`. Each entry
 * needs exactly one of `openml_task_id`, `openml_dataset_id` or `dataset`.
 */
Result<std::vector<TaskDefinition>> load_benchmark_definition(const std::filesystem::path& path,
                                                              const TaskDefaults& defaults);

/// `<benchmarks_dir>/<name>.toml`, or `name` itself when it is a path to a file.
std::filesystem::path benchmark_definition_path(const std::filesystem::path& benchmarks_dir,
                                                std::string_view name);

}  // namespace automl_bench
