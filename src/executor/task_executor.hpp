/**
 * @file task_executor.hpp
 * @brief Runs one framework adapter on one task fold with fault isolation.
 */

#pragma once

#include "benchmark/context.hpp"
#include "benchmark/framework.hpp"
#include "benchmark/task_config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "dataset/dataset.hpp"
#include "results/task_result.hpp"

#include <memory>
#include <string>

namespace automl_bench {

/**
 * @brief Owns the dataset and the config template of one (task, fold).
 *
 * load_data() must succeed before execute(). execute() never throws: any
 * adapter failure, whether returned or thrown, becomes a NoResult row.
 * Dataset load failures are not handled here; they are fatal for the job.
 */
class TaskExecutor {
public:
    TaskExecutor(BenchmarkContext context, TaskDefinition definition, int fold);

    Result<void> load_data();

    TaskResult execute(IFrameworkAdapter& adapter, const FrameworkDefinition& framework) noexcept;

    /// Copy of the template specialized for one framework run.
    [[nodiscard]] TaskConfig specialize(const FrameworkDefinition& framework, TaskType type) const;

    [[nodiscard]] const TaskConfig& task_config() const noexcept { return template_; }
    [[nodiscard]] const std::string& task_id() const noexcept { return task_id_; }
    [[nodiscard]] const Dataset* dataset() const noexcept { return dataset_.get(); }

private:
    TaskResult run_adapter(IFrameworkAdapter& adapter, TaskConfig& config);
    [[nodiscard]] ResultIdentity identity(const TaskConfig& config) const;
    void release_dataset() noexcept;

    BenchmarkContext context_;
    TaskDefinition definition_;
    TaskConfig template_;
    std::string task_id_;
    std::unique_ptr<Dataset> dataset_;
};

}  // namespace automl_bench
