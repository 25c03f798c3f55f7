/**
 * @file main.cpp
 * @brief automl_bench command-line entry point.
 *
 * Wires the modules into one benchmark run:
 *   Config → Logger → Frameworks → Task catalog → Job runner → Benchmark → Scores
 */

#include "benchmark/benchmark.hpp"
#include "benchmark/framework.hpp"
#include "benchmark/task_catalog.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "dataset/csv_dataset_service.hpp"
#include "executor/job_runner.hpp"
#include "frameworks/constant_predictor.hpp"
#include "resource_monitor/monitor.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace automl_bench;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;  ///< Bad arguments or an invalid configuration

int exit_code_for(const Error& error) {
    return is_configuration_error(error.code) ? kExitUsage : kExitFailure;
}

void print_usage() {
    std::cout << "Usage: automl_bench <framework> [benchmark] [OPTIONS]\n"
              << "  <framework>          Framework name from the frameworks file\n"
              << "  [benchmark]          Benchmark definition name or file (default: test)\n"
              << "  --task <name>        Run only this task; repeat for several tasks\n"
              << "  --fold <spec>        Fold(s) to run: 3 or 0,1,2 (default: all)\n"
              << "  --mode <mode>        Framework setup: auto, skip, force, only (default: auto)\n"
              << "  --parallel <n>       Maximum number of jobs running at once\n"
              << "  --strategy <name>    Job runner: sequential, threads, processes\n"
              << "  --config <path>      Configuration file (default: config/default.toml)\n"
              << "  --log-dir <path>     Log output directory\n"
              << "  -X<section.key=v>    Override, e.g. -Xt.seed=3 or -Xf.max_evals=10\n"
              << "  --help, -h           Show this help message\n";
}

struct CLIArgs {
    std::string framework;
    std::string benchmark = "test";
    std::vector<std::string> tasks;
    std::string fold;
    SetupMode mode = SetupMode::Auto;
    std::optional<uint32_t> parallel;
    std::string strategy;
    std::filesystem::path config_path = "config/default.toml";
    std::string log_dir;
    std::vector<std::string> overrides;
};

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(kExitOk);
        } else if (arg.starts_with("-X")) {
            args.overrides.push_back(arg.substr(2));
        } else if (arg == "--task" || arg == "--fold" || arg == "--mode" || arg == "--parallel"
                   || arg == "--strategy" || arg == "--config" || arg == "--log-dir") {
            auto value = next();
            if (!value) return Error{"Missing value for " + arg};
            if (arg == "--task") {
                args.tasks.push_back(*value);
            } else if (arg == "--fold") {
                args.fold = *value;
            } else if (arg == "--mode") {
                auto mode = parse_setup_mode(*value);
                if (!mode) return Error{"Invalid setup mode: " + *value};
                args.mode = *mode;
            } else if (arg == "--parallel") {
                uint32_t n = 0;
                auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), n);
                if (ec != std::errc{} || ptr != value->data() + value->size()) {
                    return Error{"Invalid --parallel value: " + *value};
                }
                args.parallel = n;
            } else if (arg == "--strategy") {
                args.strategy = *value;
            } else if (arg == "--config") {
                args.config_path = *value;
            } else {
                args.log_dir = *value;
            }
        } else if (arg.starts_with("-")) {
            return Error{"Unknown option: " + arg};
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty() || positional.size() > 2) {
        return Error{"Expected <framework> [benchmark]"};
    }
    args.framework = positional[0];
    if (positional.size() == 2) args.benchmark = positional[1];
    return args;
}

Result<Config> build_config(const CLIArgs& args) {
    Config config;
    if (std::filesystem::exists(args.config_path)) {
        auto loaded = load_config(args.config_path);
        if (!loaded) return loaded.error();
        config = std::move(*loaded);
    } else {
        std::cerr << "Config file " << args.config_path << " not found, using defaults." << std::endl;
        config = default_config();
    }

    for (const auto& assignment : args.overrides) {
        if (auto applied = apply_override(config, assignment); !applied) return applied.error();
    }
    if (args.parallel) config.runner.parallel_jobs = *args.parallel;
    if (!args.strategy.empty()) config.runner.strategy = args.strategy;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    return config;
}

TaskSelector task_selector(const std::vector<std::string>& tasks) {
    if (tasks.empty()) return std::monostate{};
    if (tasks.size() == 1) return tasks.front();
    return tasks;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        std::cerr << parsed.error().message << "\n\n";
        print_usage();
        return kExitUsage;
    }
    const auto& args = *parsed;

    auto config_result = build_config(args);
    if (!config_result) {
        std::cerr << "Invalid configuration: " << config_result.error().message << std::endl;
        return exit_code_for(config_result.error());
    }
    const Config config = std::move(*config_result);

    // ── Initialize Logger ────────────────────
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "automl_bench", true);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), level);
    logger.info("Running " + args.framework + " on benchmark " + args.benchmark + ".");

    // ── Initialize Telemetry ─────────────────
    std::unique_ptr<ILogSink> telemetry_sink;
    if (!config.telemetry.log_dir.empty()) {
        telemetry_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "automl_bench_metrics");
    } else {
        telemetry_sink = std::make_unique<NullSink>();
    }
    MetricsCollector metrics(std::move(telemetry_sink));

    // ── Resolve framework and adapter ────────
    auto frameworks = FrameworkCatalog::load(config.project.frameworks_file);
    if (!frameworks) {
        logger.error(frameworks.error().message);
        return exit_code_for(frameworks.error());
    }
    auto framework = frameworks->get(args.framework);
    if (!framework) {
        logger.error(framework.error().message);
        return exit_code_for(framework.error());
    }

    AdapterRegistry adapters;
    register_builtin_adapters(adapters);
    auto adapter = adapters.get(framework->module);
    if (!adapter) {
        logger.error(adapter.error().message);
        return exit_code_for(adapter.error());
    }

    // ── Load benchmark definition ────────────
    auto definition_path = benchmark_definition_path(config.project.benchmarks_dir, args.benchmark);
    auto definitions = load_benchmark_definition(definition_path, config.benchmarks.defaults);
    if (!definitions) {
        logger.error(definitions.error().message);
        return exit_code_for(definitions.error());
    }
    logger.info("Loaded " + std::to_string(definitions->size()) + " tasks from "
                + definition_path.string() + ".");

    auto folds = parse_fold_selector(args.fold);
    if (!folds) {
        logger.error(folds.error().message);
        return exit_code_for(folds.error());
    }

    auto runner = make_job_runner(config.runner, logger);
    if (!runner) {
        logger.error(runner.error().message);
        return exit_code_for(runner.error());
    }

    // ── Run ──────────────────────────────────
    CsvDatasetService datasets(config.project.input_dir);
    LinuxMonitor probe;
    BenchmarkContext context{
        .config = config,
        .logger = logger,
        .datasets = datasets,
        .probe = probe,
        .metrics = &metrics
    };

    Benchmark bench(context, *framework, *adapter, args.benchmark,
                    TaskCatalog(std::move(*definitions)), std::move(*runner));

    if (auto setup = bench.setup(args.mode); !setup) {
        logger.error(setup.error().message);
        return exit_code_for(setup.error());
    }
    if (args.mode == SetupMode::Only) {
        logger.info("Setup of " + framework->name + " done, exiting as requested.");
        return kExitOk;
    }

    auto board = bench.run(task_selector(args.tasks), *folds);
    if (!board) {
        logger.error(board.error().message);
        return exit_code_for(board.error());
    }

    if (*board) {
        std::cout << (*board)->to_table();
    } else {
        std::cout << "No results." << std::endl;
    }

    metrics.flush();
    logger.flush();
    return kExitOk;
}
