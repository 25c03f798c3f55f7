/**
 * @file task_executor.cpp
 * @brief TaskExecutor implementation.
 */

#include "executor/task_executor.hpp"
#include "results/metrics.hpp"
#include "telemetry/metrics_collector.hpp"

namespace automl_bench {

namespace {

std::string make_task_id(const DatasetRef& ref) {
    if (const auto* task = std::get_if<OpenmlTaskRef>(&ref)) {
        return "openml.org/t/" + std::to_string(task->id);
    }
    if (const auto* dataset = std::get_if<OpenmlDatasetRef>(&ref)) {
        return "openml.org/d/" + std::to_string(dataset->id);
    }
    return std::get<RawDatasetRef>(ref).path;
}

/// Releases the dataset on every exit path of execute().
struct ReleaseGuard {
    std::unique_ptr<Dataset>& dataset;
    ~ReleaseGuard() {
        if (dataset) dataset->release();
    }
};

}  // anonymous namespace

TaskExecutor::TaskExecutor(BenchmarkContext context, TaskDefinition definition, int fold)
    : context_(context)
    , definition_(std::move(definition))
    , template_(TaskConfig::from_def(definition_, fold, context.config))
    , task_id_(make_task_id(definition_.dataset)) {}

Result<void> TaskExecutor::load_data() {
    const auto* task = std::get_if<OpenmlTaskRef>(&definition_.dataset);
    if (!task) {
        return Error{ErrorCode::UnsupportedDatasetShape,
                     "Task " + definition_.name
                     + " should reference an openml task; dataset ids and raw files are not supported."};
    }

    auto loaded = context_.datasets.load(task->id, template_.fold);
    if (!loaded) return loaded.error();
    dataset_ = std::move(*loaded);
    return {};
}

TaskConfig TaskExecutor::specialize(const FrameworkDefinition& framework, TaskType type) const {
    TaskConfig config = template_;
    config.type = type;
    config.framework = framework.name;

    config.framework_params = framework.params;
    for (const auto& [key, value] : context_.config.overrides.framework) {
        config.framework_params[key] = value;
    }
    config.apply_overrides(context_.config.overrides.task);
    config.output_predictions_file =
        predictions_file(config.output_dir, framework.name, config.name, config.fold);
    return config;
}

TaskResult TaskExecutor::execute(IFrameworkAdapter& adapter,
                                 const FrameworkDefinition& framework) noexcept {
    ReleaseGuard guard{dataset_};
    TaskConfig config = template_;
    config.framework = framework.name;

    try {
        if (!dataset_) {
            throw std::logic_error("No dataset loaded for task " + template_.name);
        }
        auto type = dataset_->target().is_categorical() ? TaskType::Classification
                                                        : TaskType::Regression;
        config = specialize(framework, type);
        return run_adapter(adapter, config);
    } catch (const std::exception& e) {
        auto info = truncate_message(std::string("Error: ") + e.what(),
                                     context_.config.results.error_max_length);
        context_.logger.error("Job " + template_.name + " fold " + std::to_string(template_.fold)
                              + " could not run " + framework.name + ": " + e.what());
        return make_no_result(identity(config), std::move(info));
    } catch (...) {
        context_.logger.error("Job " + template_.name + " fold " + std::to_string(template_.fold)
                              + " could not run " + framework.name + ": unknown exception");
        return make_no_result(identity(config),
                              truncate_message("Error: unknown exception",
                                               context_.config.results.error_max_length));
    }
}

TaskResult TaskExecutor::run_adapter(IFrameworkAdapter& adapter, TaskConfig& config) {
    auto estimate = config.estimate_system_params(context_.probe,
                                                  context_.config.benchmarks.os_mem_size_mb,
                                                  context_.logger);
    if (!estimate) {
        context_.logger.warn("Could not read system resources: " + estimate.error().message);
    } else if (context_.metrics) {
        context_.metrics->record_resource_estimate(config.name, config.fold, *estimate);
    }
    context_.logger.info("Running task " + config.name + " on framework " + config.framework
                         + " with config:\n" + config.describe());

    std::optional<std::string> failure;
    Result<MetaResult> meta = Error{ErrorCode::AdapterFailure, "adapter did not run"};
    try {
        meta = adapter.run(*dataset_, config);
        if (!meta) failure = meta.error().message;
    } catch (const std::exception& e) {
        failure = e.what();
    } catch (...) {
        failure = "unknown exception";
    }

    if (failure) {
        context_.logger.error("Framework " + config.framework + " failed on task " + config.name
                              + " fold " + std::to_string(config.fold) + ": " + *failure);
        return make_no_result(identity(config),
                              truncate_message("Error: " + *failure,
                                               context_.config.results.error_max_length));
    }

    release_dataset();
    for (const auto& metric : config.metrics) {
        if (!is_known_metric(metric)) {
            context_.logger.warn("Performance metric " + metric + " not supported.");
        }
    }
    auto scored = compute_scores(identity(config), config.metrics, *meta);
    if (!scored) {
        context_.logger.error("Could not score task " + config.name + " fold "
                              + std::to_string(config.fold) + ": " + scored.error().message);
        return make_no_result(identity(config),
                              truncate_message("Error: " + scored.error().message,
                                               context_.config.results.error_max_length));
    }
    return std::move(*scored);
}

ResultIdentity TaskExecutor::identity(const TaskConfig& config) const {
    return ResultIdentity{
        .id = task_id_,
        .task = config.name,
        .framework = config.framework,
        .fold = config.fold,
        .seed = config.seed
    };
}

void TaskExecutor::release_dataset() noexcept {
    if (dataset_) dataset_->release();
}

}  // namespace automl_bench
