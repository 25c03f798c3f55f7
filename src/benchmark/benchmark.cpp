/**
 * @file benchmark.cpp
 * @brief Benchmark orchestrator implementation.
 */

#include "benchmark/benchmark.hpp"
#include "telemetry/metrics_collector.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace automl_bench {

std::string make_run_uid(std::string_view framework, std::string_view benchmark) {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);

    std::ostringstream oss;
    oss << framework << '-' << benchmark << '-' << std::put_time(&utc, "%Y%m%dT%H%M%S");
    auto uid = oss.str();
    std::transform(uid.begin(), uid.end(), uid.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return uid;
}

Benchmark::Benchmark(BenchmarkContext context,
                     FrameworkDefinition framework,
                     std::shared_ptr<IFrameworkAdapter> adapter,
                     std::string benchmark_name,
                     TaskCatalog catalog,
                     std::unique_ptr<IJobRunner> runner)
    : context_(context)
    , framework_(std::move(framework))
    , adapter_(std::move(adapter))
    , benchmark_name_(std::move(benchmark_name))
    , catalog_(std::move(catalog))
    , runner_(std::move(runner))
    , uid_(make_run_uid(framework_.name, benchmark_name_)) {}

Result<void> Benchmark::setup(SetupMode mode) {
    FrameworkSetup setup(context_.config.project.frameworks_dir, context_.logger);
    return setup.run(framework_, *adapter_, mode);
}

Result<std::vector<TaskDefinition>> Benchmark::resolve_tasks(const TaskSelector& tasks) const {
    std::vector<TaskDefinition> selected;
    if (std::holds_alternative<std::monostate>(tasks)) {
        selected = catalog_.list_enabled();
    } else if (const auto* single = std::get_if<std::string>(&tasks)) {
        auto def = catalog_.get(*single);
        if (!def) return def.error();
        selected.push_back(std::move(*def));
    } else {
        for (const auto& name : std::get<std::vector<std::string>>(tasks)) {
            auto def = catalog_.get(name);
            if (!def) return def.error();
            selected.push_back(std::move(*def));
        }
    }

    if (selected.empty()) {
        return Error{ErrorCode::NoTaskAvailable, "No task available."};
    }
    return selected;
}

Result<std::optional<Scoreboard>> Benchmark::run(const TaskSelector& tasks, const FoldSelector& folds) {
    auto selected = resolve_tasks(tasks);
    if (!selected) return selected.error();

    // Every fold is validated before the first job starts.
    JobFactory factory(context_, framework_, adapter_);
    JobList jobs;
    for (const auto& def : *selected) {
        auto expanded = factory.expand(def, folds);
        if (!expanded) return expanded.error();
        jobs.insert(jobs.end(), expanded->begin(), expanded->end());
    }

    context_.logger.info("Running benchmark " + uid_ + ": " + std::to_string(selected->size())
                         + " tasks, " + std::to_string(jobs.size()) + " jobs.");
    auto start = std::chrono::steady_clock::now();
    auto completions = runner_->run(jobs);
    record_telemetry(completions,
                     std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count());

    if (const auto* single = std::get_if<std::string>(&tasks)) {
        return process_results(completions, *single);
    }
    if (const auto* names = std::get_if<std::vector<std::string>>(&tasks)) {
        auto combined = Scoreboard::for_benchmark(framework_.name, benchmark_name_);
        for (const auto& name : *names) {
            if (auto board = process_results(completions, name)) combined.append(*board);
        }
        if (combined.empty()) return std::optional<Scoreboard>{};
        return std::optional<Scoreboard>{std::move(combined)};
    }
    return process_results(completions, std::nullopt);
}

std::optional<Scoreboard> Benchmark::process_results(const std::vector<JobCompletion>& completions,
                                                     const std::optional<TaskName>& task) {
    auto board = collect(completions, framework_.name, benchmark_name_, task);
    if (!board) {
        context_.logger.warn("No results to report" + (task ? " for task " + *task : std::string{}) + ".");
        return std::nullopt;
    }

    context_.logger.info("Processing results for " + board->file_name() + ":\n" + board->to_table());
    if (context_.config.results.save) {
        ScoreStore store(context_.config.project.output_dir);
        if (auto saved = store.persist(*board); !saved) {
            context_.logger.error("Could not save scores: " + saved.error().message);
        } else {
            context_.logger.info("Scores saved to " + store.board_file(*board).string() + ".");
        }
    }
    return board;
}

void Benchmark::record_telemetry(const std::vector<JobCompletion>& completions, double duration) {
    RunSummary summary{.uid = uid_, .framework = framework_.name, .jobs = completions.size()};
    summary.duration = duration;
    for (const auto& completion : completions) {
        if (!completion.result) {
            ++summary.failed;
        } else if (completion.result->is_scored()) {
            ++summary.scored;
        } else {
            ++summary.no_result;
        }
        if (context_.metrics) {
            context_.metrics->record_job_event(completion.key, completion.state, completion.duration);
        }
    }

    context_.logger.info("Benchmark " + uid_ + " done: " + std::to_string(summary.scored) + " scored, "
                         + std::to_string(summary.no_result) + " without result, "
                         + std::to_string(summary.failed) + " failed.");
    if (context_.metrics) context_.metrics->record_run_summary(summary);
}

}  // namespace automl_bench
