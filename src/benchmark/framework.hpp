/**
 * @file framework.hpp
 * @brief Framework definitions, the adapter interface and adapter registry.
 *
 * Framework definitions come from a TOML file; the adapters that actually
 * run them are C++ objects registered once at startup under their module
 * name. A definition's `module` selects its adapter.
 */

#pragma once

#include "benchmark/task_config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "dataset/dataset.hpp"
#include "results/task_result.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace automl_bench {

// ─────────────────────────────────────────────
// Framework Definition
// ─────────────────────────────────────────────

struct FrameworkDefinition {
    FrameworkName name;
    std::string module;                ///< Adapter key; defaults to the name
    std::string version;
    std::string project;
    std::string setup_args;
    std::optional<std::string> setup_cmd;
    Params params;
};

/**
 * @brief Named framework definitions, looked up case-insensitively.
 *
 * `extends = "<other>"` inherits every field from another entry; the
 * child's own fields win and params are merged key by key.
 */
class FrameworkCatalog {
public:
    static Result<FrameworkCatalog> load(const std::filesystem::path& path);

    void add(FrameworkDefinition definition);
    [[nodiscard]] Result<FrameworkDefinition> get(std::string_view name) const;
    [[nodiscard]] std::vector<FrameworkName> names() const;
    [[nodiscard]] size_t size() const noexcept { return definitions_.size(); }

private:
    std::vector<FrameworkDefinition> definitions_;
};

// ─────────────────────────────────────────────
// IFrameworkAdapter
// ─────────────────────────────────────────────

/**
 * @brief Trains and evaluates one framework on one task fold.
 *
 * A single adapter instance serves every job of a run and may be called
 * from several workers at once. run() reports failure either through the
 * returned Result or by throwing; the executor treats both the same way.
 */
class IFrameworkAdapter {
public:
    virtual ~IFrameworkAdapter() = default;

    virtual Result<MetaResult> run(const Dataset& dataset, const TaskConfig& config) = 0;

    /// One-time installation step; most adapters have nothing to do.
    virtual Result<void> setup(const std::string& /*setup_args*/) { return {}; }
    [[nodiscard]] virtual bool has_setup() const noexcept { return false; }
};

// ─────────────────────────────────────────────
// AdapterRegistry
// ─────────────────────────────────────────────

class AdapterRegistry {
public:
    void add(std::string module, std::shared_ptr<IFrameworkAdapter> adapter);
    [[nodiscard]] Result<std::shared_ptr<IFrameworkAdapter>> get(std::string_view module) const;
    [[nodiscard]] bool contains(std::string_view module) const;

private:
    std::map<std::string, std::shared_ptr<IFrameworkAdapter>, std::less<>> adapters_;
};

// ─────────────────────────────────────────────
// Framework Setup
// ─────────────────────────────────────────────

enum class SetupMode : uint8_t {
    Auto,    ///< Set up unless the marker file says it was done
    Skip,    ///< Never set up
    Force,   ///< Always set up
    Only     ///< Set up, then stop (the caller runs nothing)
};

[[nodiscard]] std::optional<SetupMode> parse_setup_mode(std::string_view text) noexcept;

/**
 * @brief Runs adapter setup and the definition's setup command, guarded by
 *        a per-framework marker file.
 */
class FrameworkSetup {
public:
    FrameworkSetup(std::filesystem::path frameworks_dir, Logger& logger);

    Result<void> run(const FrameworkDefinition& definition,
                     IFrameworkAdapter& adapter,
                     SetupMode mode);

    [[nodiscard]] std::filesystem::path marker_file(const FrameworkDefinition& definition) const;
    [[nodiscard]] bool is_setup_done(const FrameworkDefinition& definition) const;

private:
    std::filesystem::path frameworks_dir_;
    Logger& logger_;
};

/// Run a shell command, returning its combined output or a SetupFailure.
Result<std::string> run_command(const std::string& command);

}  // namespace automl_bench
