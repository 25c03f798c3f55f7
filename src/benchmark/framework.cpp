/**
 * @file framework.cpp
 * @brief Framework catalog loading, adapter registry and framework setup.
 */

#include "benchmark/framework.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <set>
#include <sstream>
#include <sys/wait.h>

namespace automl_bench {

namespace {

constexpr const char* kSetupMarker = ".marker_setup_safe_to_delete";

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string scalar_to_string(const toml::node& node) {
    if (auto str = node.value<std::string>()) return *str;
    if (auto b = node.value_exact<bool>()) return *b ? "true" : "false";
    if (auto i = node.value_exact<int64_t>()) return std::to_string(*i);
    std::ostringstream oss;
    if (auto d = node.value_exact<double>()) {
        oss << *d;
    } else if (auto arr = node.as_array()) {
        oss << *arr;
    }
    return oss.str();
}

/// One raw entry of the frameworks file before `extends` is resolved.
struct RawDefinition {
    FrameworkDefinition definition;
    std::optional<std::string> extends;
    std::set<std::string> explicit_fields;
};

RawDefinition parse_entry(const std::string& name, const toml::table& entry) {
    RawDefinition raw;
    auto& def = raw.definition;
    def.name = name;

    auto read_string = [&](std::string_view key, std::string& target) {
        if (auto value = entry[key].value<std::string>()) {
            target = *value;
            raw.explicit_fields.insert(std::string(key));
        }
    };
    read_string("module", def.module);
    read_string("version", def.version);
    read_string("project", def.project);
    read_string("setup_args", def.setup_args);

    if (auto cmd = entry["setup_cmd"].value<std::string>()) {
        def.setup_cmd = *cmd;
        raw.explicit_fields.insert("setup_cmd");
    }
    if (auto params = entry["params"].as_table()) {
        for (const auto& [key, node] : *params) {
            def.params[std::string(key.str())] = scalar_to_string(node);
        }
    }
    if (auto parent = entry["extends"].value<std::string>()) {
        raw.extends = *parent;
    }
    return raw;
}

Result<FrameworkDefinition> resolve(const std::string& name,
                                    const std::map<std::string, RawDefinition>& raws,
                                    std::set<std::string>& visiting) {
    auto it = raws.find(lower(name));
    if (it == raws.end()) {
        return Error{ErrorCode::UnknownFramework, "Incorrect framework: " + name + "."};
    }
    const auto& raw = it->second;
    if (!raw.extends) {
        auto def = raw.definition;
        if (def.module.empty()) def.module = def.name;
        return def;
    }
    if (!visiting.insert(lower(name)).second) {
        return Error{ErrorCode::ConfigParse, "Cyclic `extends` chain at framework " + name};
    }

    auto parent = resolve(*raw.extends, raws, visiting);
    if (!parent) return parent.error();

    FrameworkDefinition def = *parent;
    def.name = raw.definition.name;
    const auto& child = raw.definition;
    const auto& fields = raw.explicit_fields;
    if (fields.contains("module")) def.module = child.module;
    if (fields.contains("version")) def.version = child.version;
    if (fields.contains("project")) def.project = child.project;
    if (fields.contains("setup_args")) def.setup_args = child.setup_args;
    if (fields.contains("setup_cmd")) def.setup_cmd = child.setup_cmd;
    for (const auto& [key, value] : child.params) {
        def.params[key] = value;
    }
    return def;
}

}  // anonymous namespace

// ── FrameworkCatalog ─────────────────────────

Result<FrameworkCatalog> FrameworkCatalog::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigParse, "Frameworks file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());

        std::vector<std::string> order;
        std::map<std::string, RawDefinition> raws;
        for (const auto& [key, node] : tbl) {
            std::string name(key.str());
            // Entries starting with "__" only document the format.
            if (name.starts_with("__")) continue;
            auto entry = node.as_table();
            if (!entry) {
                return Error{ErrorCode::ConfigParse, "Framework " + name + " should be a table"};
            }
            order.push_back(name);
            raws.emplace(lower(name), parse_entry(name, *entry));
        }

        FrameworkCatalog catalog;
        for (const auto& name : order) {
            std::set<std::string> visiting;
            auto def = resolve(name, raws, visiting);
            if (!def) {
                if (def.error().code == ErrorCode::UnknownFramework) {
                    return Error{ErrorCode::ConfigParse,
                                 "Framework " + name + " extends an unknown framework: "
                                 + def.error().message};
                }
                return def.error();
            }
            catalog.add(std::move(*def));
        }
        return catalog;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigParse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

void FrameworkCatalog::add(FrameworkDefinition definition) {
    if (definition.module.empty()) definition.module = definition.name;
    auto key = lower(definition.name);
    auto it = std::find_if(definitions_.begin(), definitions_.end(),
                           [&](const FrameworkDefinition& d) { return lower(d.name) == key; });
    if (it != definitions_.end()) {
        *it = std::move(definition);
    } else {
        definitions_.push_back(std::move(definition));
    }
}

Result<FrameworkDefinition> FrameworkCatalog::get(std::string_view name) const {
    auto key = lower(name);
    for (const auto& def : definitions_) {
        if (lower(def.name) == key) return def;
    }
    return Error{ErrorCode::UnknownFramework, "Incorrect framework: " + std::string(name) + "."};
}

std::vector<FrameworkName> FrameworkCatalog::names() const {
    std::vector<FrameworkName> out;
    out.reserve(definitions_.size());
    for (const auto& def : definitions_) out.push_back(def.name);
    return out;
}

// ── AdapterRegistry ──────────────────────────

void AdapterRegistry::add(std::string module, std::shared_ptr<IFrameworkAdapter> adapter) {
    adapters_[lower(module)] = std::move(adapter);
}

Result<std::shared_ptr<IFrameworkAdapter>> AdapterRegistry::get(std::string_view module) const {
    auto it = adapters_.find(lower(module));
    if (it == adapters_.end()) {
        return Error{ErrorCode::UnknownFramework,
                     "No adapter registered for framework module " + std::string(module)};
    }
    return it->second;
}

bool AdapterRegistry::contains(std::string_view module) const {
    return adapters_.find(lower(module)) != adapters_.end();
}

// ── Framework Setup ──────────────────────────

std::optional<SetupMode> parse_setup_mode(std::string_view text) noexcept {
    if (text == "auto") return SetupMode::Auto;
    if (text == "skip") return SetupMode::Skip;
    if (text == "force") return SetupMode::Force;
    if (text == "only") return SetupMode::Only;
    return std::nullopt;
}

FrameworkSetup::FrameworkSetup(std::filesystem::path frameworks_dir, Logger& logger)
    : frameworks_dir_(std::move(frameworks_dir)), logger_(logger) {}

std::filesystem::path FrameworkSetup::marker_file(const FrameworkDefinition& definition) const {
    return frameworks_dir_ / definition.module / kSetupMarker;
}

bool FrameworkSetup::is_setup_done(const FrameworkDefinition& definition) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(marker_file(definition), ec);
}

Result<void> FrameworkSetup::run(const FrameworkDefinition& definition,
                                 IFrameworkAdapter& adapter,
                                 SetupMode mode) {
    if (mode == SetupMode::Skip) return {};
    if (!adapter.has_setup() && !definition.setup_cmd) return {};
    if (mode == SetupMode::Auto && is_setup_done(definition)) {
        logger_.debug("Framework " + definition.name + " already set up.");
        return {};
    }

    logger_.info("Setting up framework " + definition.name + ".");
    if (adapter.has_setup()) {
        auto done = adapter.setup(definition.setup_args);
        if (!done) {
            return Error{ErrorCode::SetupFailure,
                         "Setup of framework " + definition.name + " failed: " + done.error().message};
        }
    }
    if (definition.setup_cmd) {
        auto output = run_command(*definition.setup_cmd);
        if (!output) return output.error();
        logger_.debug(*output);
    }

    auto marker = marker_file(definition);
    std::error_code ec;
    std::filesystem::create_directories(marker.parent_path(), ec);
    std::ofstream touch(marker, std::ios::app);
    if (!touch.is_open()) {
        logger_.warn("Could not write setup marker " + marker.string());
    }

    logger_.info("Setup of framework " + definition.name + " completed successfully.");
    return {};
}

Result<std::string> run_command(const std::string& command) {
    auto full = command + " 2>&1";
    FILE* pipe = ::popen(full.c_str(), "r");
    if (!pipe) {
        return Error{ErrorCode::SetupFailure, "Could not start command: " + command};
    }

    std::string output;
    std::array<char, 4096> buffer{};
    size_t n;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        output.append(buffer.data(), n);
    }

    int status = ::pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return Error{ErrorCode::SetupFailure,
                     "Command `" + command + "` failed: " + output};
    }
    return output;
}

}  // namespace automl_bench
