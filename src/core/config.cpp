/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace automl_bench {

namespace {

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(std::string_view text) {
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string_view::npos) return {};
    auto end = text.find_last_not_of(" \t");
    return std::string(text.substr(begin, end - begin + 1));
}

template <typename Int>
std::optional<Int> parse_int(std::string_view text) {
    Int value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

std::vector<std::string> split_list(std::string_view text) {
    std::vector<std::string> items;
    std::string item;
    std::istringstream iss{std::string(text)};
    while (std::getline(iss, item, ',')) {
        auto trimmed = trim(item);
        if (!trimmed.empty()) items.push_back(std::move(trimmed));
    }
    return items;
}

/// Render a TOML scalar the way it is stored in Params.
std::string node_to_string(const toml::node& node) {
    if (auto str = node.value<std::string>()) return *str;
    if (auto b = node.value_exact<bool>()) return *b ? "true" : "false";
    std::ostringstream oss;
    if (auto arr = node.as_array()) {
        oss << *arr;
    } else if (auto tbl = node.as_table()) {
        oss << *tbl;
    } else if (auto i = node.value_exact<int64_t>()) {
        oss << *i;
    } else if (auto d = node.value_exact<double>()) {
        oss << *d;
    }
    return oss.str();
}

/// Arrays become comma separated lists, matching the `-Xt.metrics=` syntax.
std::string override_value(const toml::node& node) {
    auto arr = node.as_array();
    if (!arr) return node_to_string(node);
    std::string joined;
    for (const auto& elem : *arr) {
        if (!joined.empty()) joined += ',';
        joined += node_to_string(elem);
    }
    return joined;
}

std::vector<std::string> read_metrics(const toml::node_view<toml::node>& node) {
    std::vector<std::string> metrics;
    if (auto arr = node.as_array()) {
        for (const auto& elem : *arr) {
            if (auto str = elem.value<std::string>()) metrics.push_back(*str);
        }
    } else if (auto str = node.value<std::string>()) {
        metrics.push_back(*str);
    }
    return metrics;
}

}  // anonymous namespace

std::optional<bool> parse_bool(std::string_view text) {
    auto value = lower(trim(text));
    if (value == "true" || value == "yes" || value == "on" || value == "1" || value == "t" || value == "y") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0" || value == "f" || value == "n") {
        return false;
    }
    return std::nullopt;
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigParse, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [project]
        if (auto project = tbl["project"]; project.is_table()) {
            config.project.input_dir = project["input_dir"].value_or(std::string{"./data"});
            config.project.output_dir = project["output_dir"].value_or(std::string{"./results"});
            config.project.frameworks_dir =
                project["frameworks_dir"].value_or(std::string{"./frameworks"});
            config.project.frameworks_file =
                project["frameworks_file"].value_or(std::string{"./resources/frameworks.toml"});
            config.project.benchmarks_dir =
                project["benchmarks_dir"].value_or(std::string{"./resources/benchmarks"});
        }

        // [results]
        if (auto results = tbl["results"]; results.is_table()) {
            config.results.save = results["save"].value_or(true);
            config.results.error_max_length = static_cast<uint32_t>(
                results["error_max_length"].value_or(int64_t{200}));
        }

        // [benchmarks]
        if (auto benchmarks = tbl["benchmarks"]; benchmarks.is_table()) {
            config.benchmarks.os_mem_size_mb =
                benchmarks["os_mem_size_mb"].value_or(int64_t{2048});

            // [benchmarks.defaults]
            if (auto defaults = benchmarks["defaults"]; defaults.is_table()) {
                auto& d = config.benchmarks.defaults;
                d.folds = static_cast<int>(defaults["folds"].value_or(int64_t{10}));
                d.max_runtime_seconds = defaults["max_runtime_seconds"].value_or(int64_t{3600});
                d.cores = static_cast<int>(defaults["cores"].value_or(int64_t{-1}));
                d.max_mem_size_mb = defaults["max_mem_size_mb"].value_or(int64_t{-1});
                d.seed = static_cast<uint64_t>(defaults["seed"].value_or(int64_t{42}));
                if (auto metrics = read_metrics(defaults["metrics"]); !metrics.empty()) {
                    d.metrics = std::move(metrics);
                } else if (auto metric = read_metrics(defaults["metric"]); !metric.empty()) {
                    d.metrics = std::move(metric);
                }
            }
        }

        // [runner]
        if (auto runner = tbl["runner"]; runner.is_table()) {
            config.runner.strategy = runner["strategy"].value_or(std::string{"threads"});
            config.runner.parallel_jobs = static_cast<uint32_t>(
                runner["parallel_jobs"].value_or(int64_t{1}));
            config.runner.delay_secs = static_cast<uint32_t>(
                runner["delay_secs"].value_or(int64_t{5}));
            config.runner.done_async = runner["done_async"].value_or(true);
            config.runner.poll_interval_ms = static_cast<uint32_t>(
                runner["poll_interval_ms"].value_or(int64_t{100}));
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        // [overrides.f] / [overrides.t]
        if (auto overrides = tbl["overrides"]; overrides.is_table()) {
            if (auto f = overrides["f"].as_table()) {
                for (const auto& [key, node] : *f) {
                    config.overrides.framework[std::string(key.str())] = node_to_string(node);
                }
            }
            if (auto t = overrides["t"].as_table()) {
                for (const auto& [key, node] : *t) {
                    auto assignment = "t." + std::string(key.str()) + "=" + override_value(node);
                    if (auto applied = apply_override(config, assignment); !applied) {
                        return applied.error();
                    }
                }
            }
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigParse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<void> apply_override(Config& config, std::string_view assignment) {
    auto eq = assignment.find('=');
    auto dot = assignment.find('.');
    if (eq == std::string_view::npos || dot == std::string_view::npos || dot > eq) {
        return Error{ErrorCode::ConfigParse,
                     "Override should look like section.key=value: " + std::string(assignment)};
    }

    auto section = trim(assignment.substr(0, dot));
    auto key = trim(assignment.substr(dot + 1, eq - dot - 1));
    auto value = trim(assignment.substr(eq + 1));
    if (key.empty()) {
        return Error{ErrorCode::ConfigParse, "Empty override key: " + std::string(assignment)};
    }

    if (section == "f") {
        config.overrides.framework[key] = value;
        return {};
    }

    if (section == "t") {
        auto& task = config.overrides.task;
        if (key == "max_runtime_seconds") {
            auto parsed = parse_int<int64_t>(value);
            if (!parsed) {
                return Error{ErrorCode::ConfigParse, "Invalid max_runtime_seconds: " + value};
            }
            task.max_runtime_seconds = *parsed;
        } else if (key == "metric") {
            task.metric = value;
        } else if (key == "metrics") {
            auto metrics = split_list(value);
            if (metrics.empty()) {
                return Error{ErrorCode::ConfigParse, "Empty metrics override"};
            }
            task.metrics = std::move(metrics);
        } else if (key == "seed") {
            auto parsed = parse_int<uint64_t>(value);
            if (!parsed) {
                return Error{ErrorCode::ConfigParse, "Invalid seed: " + value};
            }
            task.seed = *parsed;
        } else {
            return Error{ErrorCode::ConfigParse, "Unsupported task override: t." + key};
        }
        return {};
    }

    return Error{ErrorCode::ConfigParse, "Unknown override section: " + section};
}

}  // namespace automl_bench
