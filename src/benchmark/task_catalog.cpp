/**
 * @file task_catalog.cpp
 * @brief TaskCatalog lookups and benchmark definition loading using toml++.
 */

#include "benchmark/task_catalog.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <iterator>
#include <set>

namespace automl_bench {

TaskCatalog::TaskCatalog(std::vector<TaskDefinition> definitions)
    : definitions_(std::move(definitions)) {}

std::vector<TaskDefinition> TaskCatalog::list_enabled() const {
    std::vector<TaskDefinition> enabled;
    std::copy_if(definitions_.begin(), definitions_.end(), std::back_inserter(enabled),
                 [](const TaskDefinition& def) { return def.is_enabled(); });
    return enabled;
}

Result<TaskDefinition> TaskCatalog::get(std::string_view name) const {
    auto it = std::find_if(definitions_.begin(), definitions_.end(),
                           [&](const TaskDefinition& def) { return def.name == name; });
    if (it == definitions_.end()) {
        return Error{ErrorCode::UnknownTask, "Incorrect task name: " + std::string(name) + "."};
    }
    if (!it->is_enabled()) {
        return Error{ErrorCode::TaskDisabled,
                     "Task " + std::string(name) + " is disabled, please enable it first."};
    }
    return *it;
}

namespace {

std::vector<std::string> read_metrics(const toml::table& entry, const TaskDefaults& defaults) {
    std::vector<std::string> metrics;
    for (auto key : {"metrics", "metric"}) {
        auto node = entry[key];
        if (auto arr = node.as_array()) {
            for (const auto& elem : *arr) {
                if (auto str = elem.value<std::string>()) metrics.push_back(*str);
            }
        } else if (auto str = node.value<std::string>()) {
            metrics.push_back(*str);
        }
        if (!metrics.empty()) return metrics;
    }
    return defaults.metrics;
}

Result<std::optional<bool>> read_enabled(const toml::table& entry, const std::string& name) {
    auto node = entry["enabled"];
    if (!node) return std::optional<bool>{};
    if (auto b = node.value_exact<bool>()) return std::optional<bool>{*b};
    if (auto str = node.value<std::string>()) {
        if (auto parsed = parse_bool(*str)) return std::optional<bool>{*parsed};
    }
    return Error{ErrorCode::ConfigParse, "Task " + name + " has an invalid `enabled` value"};
}

Result<DatasetRef> read_dataset(const toml::table& entry, const std::string& name) {
    std::vector<DatasetRef> refs;
    if (auto id = entry["openml_task_id"].value<int64_t>()) refs.push_back(OpenmlTaskRef{*id});
    if (auto id = entry["openml_dataset_id"].value<int64_t>()) refs.push_back(OpenmlDatasetRef{*id});
    if (auto path = entry["dataset"].value<std::string>()) refs.push_back(RawDatasetRef{*path});

    if (refs.size() != 1) {
        return Error{ErrorCode::ConfigParse,
                     "Task " + name + " should have exactly one property among "
                     "[openml_task_id, openml_dataset_id, dataset]."};
    }
    return refs.front();
}

Result<TaskDefinition> parse_task(const toml::table& entry, const TaskDefaults& defaults) {
    auto name = entry["name"].value<std::string>();
    if (!name || name->empty()) {
        return Error{ErrorCode::ConfigParse, "Every task needs a `name`"};
    }

    TaskDefinition def;
    def.name = *name;
    def.folds = static_cast<int>(entry["folds"].value_or(int64_t{defaults.folds}));
    def.metrics = read_metrics(entry, defaults);
    def.seed = static_cast<uint64_t>(entry["seed"].value_or(static_cast<int64_t>(defaults.seed)));
    def.max_runtime_seconds = entry["max_runtime_seconds"].value_or(defaults.max_runtime_seconds);
    def.cores = static_cast<int>(entry["cores"].value_or(int64_t{defaults.cores}));
    def.max_mem_size_mb = entry["max_mem_size_mb"].value_or(defaults.max_mem_size_mb);

    if (def.folds <= 0) {
        return Error{ErrorCode::ConfigParse, "Task " + def.name + " needs at least one fold"};
    }

    auto enabled = read_enabled(entry, def.name);
    if (!enabled) return enabled.error();
    def.enabled = *enabled;

    auto dataset = read_dataset(entry, def.name);
    if (!dataset) return dataset.error();
    def.dataset = *dataset;

    return def;
}

}  // anonymous namespace

Result<std::vector<TaskDefinition>> load_benchmark_definition(const std::filesystem::path& path,
                                                              const TaskDefaults& defaults) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigParse, "Benchmark definition not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        auto tasks = tbl["tasks"].as_array();
        if (!tasks) {
            return Error{ErrorCode::ConfigParse, "Benchmark " + path.string() + " has no [[tasks]]"};
        }

        std::vector<TaskDefinition> definitions;
        std::set<std::string> names;
        for (const auto& node : *tasks) {
            auto entry = node.as_table();
            if (!entry) {
                return Error{ErrorCode::ConfigParse, "Every [[tasks]] entry should be a table"};
            }
            auto def = parse_task(*entry, defaults);
            if (!def) return def.error();
            if (!names.insert(def->name).second) {
                return Error{ErrorCode::ConfigParse, "Duplicate task name: " + def->name};
            }
            definitions.push_back(std::move(*def));
        }
        return definitions;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigParse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

std::filesystem::path benchmark_definition_path(const std::filesystem::path& benchmarks_dir,
                                                std::string_view name) {
    std::filesystem::path candidate{std::string(name)};
    std::error_code ec;
    if (candidate.has_extension() && std::filesystem::is_regular_file(candidate, ec)) {
        return candidate;
    }
    return benchmarks_dir / (std::string(name) + ".toml");
}

}  // namespace automl_bench
