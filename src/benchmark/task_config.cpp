/**
 * @file task_config.cpp
 * @brief TaskConfig construction, overrides and resource estimation.
 */

#include "benchmark/task_config.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace automl_bench {

TaskConfig TaskConfig::from_def(const TaskDefinition& def, int fold, const Config& config) {
    TaskConfig tc;
    tc.name = def.name;
    tc.fold = fold;
    tc.metrics = def.metrics;
    tc.seed = def.seed;
    tc.max_runtime_seconds = def.max_runtime_seconds;
    tc.cores = def.cores;
    tc.max_mem_size_mb = def.max_mem_size_mb;
    tc.input_dir = config.project.input_dir;
    tc.output_dir = config.project.output_dir;
    tc.output_predictions_file = config.project.output_dir / "predictions.csv";
    return tc;
}

void TaskConfig::apply_overrides(const TaskOverrides& overrides) {
    if (overrides.max_runtime_seconds) {
        max_runtime_seconds = *overrides.max_runtime_seconds;
    }
    if (overrides.metric) {
        metrics = {*overrides.metric};
    }
    if (overrides.metrics) {
        metrics = *overrides.metrics;
    }
    if (overrides.seed) {
        seed = *overrides.seed;
    }
}

Result<ResourceEstimate> TaskConfig::estimate_system_params(ISystemProbe& probe,
                                                            int64_t os_mem_size_mb,
                                                            Logger& logger) {
    auto system = probe.read();
    if (!system) return system.error();

    auto estimate = estimate_resources({.cores = cores, .memory_mb = max_mem_size_mb},
                                       *system, os_mem_size_mb);

    cores = estimate.cores;
    logger.info("Assigning " + std::to_string(cores) + " cores (total="
                + std::to_string(system->cores) + ") for new task " + name + ".");

    max_mem_size_mb = estimate.memory_mb;
    logger.info("Assigning " + std::to_string(max_mem_size_mb) + "MB (total="
                + std::to_string(system->memory_total_mb) + "MB) for new " + name + " task.");

    for (auto advisory : estimate.advisories) {
        logger.warn("WARNING: " + describe_advisory(advisory, estimate, *system, os_mem_size_mb));
    }
    return estimate;
}

std::string TaskConfig::describe() const {
    std::ostringstream oss;
    oss << "name: " << name << '\n'
        << "fold: " << fold << '\n'
        << "type: " << to_string(type) << '\n'
        << "framework: " << framework << '\n'
        << "framework_params: {";
    bool first = true;
    for (const auto& [key, value] : framework_params) {
        oss << (first ? "" : ", ") << key << ": " << value;
        first = false;
    }
    oss << "}\n"
        << "metrics: [";
    for (size_t i = 0; i < metrics.size(); ++i) {
        oss << (i ? ", " : "") << metrics[i];
    }
    oss << "]\n"
        << "seed: " << seed << '\n'
        << "max_runtime_seconds: " << max_runtime_seconds << '\n'
        << "cores: " << cores << '\n'
        << "max_mem_size_mb: " << max_mem_size_mb << '\n'
        << "input_dir: " << input_dir.string() << '\n'
        << "output_dir: " << output_dir.string() << '\n'
        << "output_predictions_file: " << output_predictions_file.string();
    return oss.str();
}

std::filesystem::path predictions_file(const std::filesystem::path& output_dir,
                                       std::string_view framework,
                                       std::string_view task,
                                       int fold) {
    std::string fw(framework);
    std::transform(fw.begin(), fw.end(), fw.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return output_dir / "predictions"
         / (fw + "_" + std::string(task) + "_" + std::to_string(fold) + ".csv");
}

}  // namespace automl_bench
