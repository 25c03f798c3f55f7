/**
 * @file job.cpp
 * @brief Job lifecycle and JobFactory expansion.
 */

#include "benchmark/job.hpp"
#include "executor/task_executor.hpp"

#include <charconv>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace automl_bench {

namespace {

std::string format_seconds(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << seconds;
    return oss.str();
}

std::string_view trim(std::string_view text) {
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string_view::npos) return {};
    auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

std::optional<int> parse_fold(std::string_view text) {
    text = trim(text);
    int value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

}  // anonymous namespace

// ── JobKey ───────────────────────────────────

std::string JobKey::name() const {
    return scope + "_" + task + "_" + std::to_string(fold) + "_" + framework;
}

// ── Job ──────────────────────────────────────

Job::Job(JobKey key, Runnable runnable, Logger& logger)
    : key_(std::move(key))
    , name_(key_.name())
    , runnable_(std::move(runnable))
    , logger_(logger) {}

bool Job::claim() noexcept {
    auto expected = JobState::Created;
    return state_.compare_exchange_strong(expected, JobState::Running);
}

void Job::settle(JobState state) noexcept {
    state_.store(state);
}

JobCompletion Job::start() {
    JobCompletion completion;
    completion.key = key_;

    if (!claim()) {
        completion.state = JobState::Failed;
        completion.error = "Job " + name_ + " was already started";
        logger_.warn(*completion.error);
        return completion;
    }
    return run_claimed();
}

JobCompletion Job::run_claimed() {
    JobCompletion completion;
    completion.key = key_;

    logger_.info("Starting job " + name_ + ".");
    auto start = std::chrono::steady_clock::now();
    try {
        auto outcome = runnable_();
        if (outcome) {
            completion.result = std::move(*outcome);
            completion.state = JobState::Completed;
        } else {
            completion.error = outcome.error().message;
            completion.state = JobState::Failed;
            logger_.error("Job " + name_ + " failed: " + outcome.error().message);
        }
    } catch (const std::exception& e) {
        completion.error = e.what();
        completion.state = JobState::Failed;
        logger_.error("Job " + name_ + " aborted: " + e.what());
    } catch (...) {
        completion.error = "unknown exception";
        completion.state = JobState::Failed;
        logger_.error("Job " + name_ + " aborted: unknown exception");
    }
    completion.duration = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    settle(completion.state);
    logger_.info("Job " + name_ + " executed in " + format_seconds(completion.duration) + " seconds.");
    return completion;
}

// ── Fold selection ───────────────────────────

Result<FoldSelector> parse_fold_selector(std::string_view text) {
    text = trim(text);
    if (text.starts_with('[') && text.ends_with(']')) {
        text = trim(text.substr(1, text.size() - 2));
        if (text.empty()) return FoldSelector{std::vector<int>{}};
    } else if (text.empty() || text == "all") {
        return FoldSelector{};
    }

    if (text.find(',') == std::string_view::npos) {
        auto fold = parse_fold(text);
        if (!fold) {
            return Error{ErrorCode::InvalidFoldSpec,
                         "Fold value should be empty, an int, or a list of ints: " + std::string(text)};
        }
        return FoldSelector{*fold};
    }

    std::vector<int> folds;
    size_t pos = 0;
    while (pos <= text.size()) {
        auto next = text.find(',', pos);
        auto item = text.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos);
        auto fold = parse_fold(item);
        if (!fold) {
            return Error{ErrorCode::InvalidFoldSpec,
                         "Fold value should be empty, an int, or a list of ints: " + std::string(text)};
        }
        folds.push_back(*fold);
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return FoldSelector{std::move(folds)};
}

// ── JobFactory ───────────────────────────────

JobFactory::JobFactory(BenchmarkContext context,
                       FrameworkDefinition framework,
                       std::shared_ptr<IFrameworkAdapter> adapter)
    : context_(context)
    , framework_(std::move(framework))
    , adapter_(std::move(adapter)) {}

Result<std::vector<int>> JobFactory::resolve_folds(const TaskDefinition& def,
                                                   const FoldSelector& folds) {
    std::vector<int> resolved;
    if (std::holds_alternative<std::monostate>(folds)) {
        for (int f = 0; f < def.folds; ++f) resolved.push_back(f);
        return resolved;
    }
    if (const auto* single = std::get_if<int>(&folds)) {
        resolved.push_back(*single);
    } else {
        resolved = std::get<std::vector<int>>(folds);
    }

    for (int fold : resolved) {
        if (fold < 0 || fold >= def.folds) {
            return Error{ErrorCode::FoldOutOfRange,
                         "Fold value " + std::to_string(fold) + " is out of range for task "
                         + def.name + "."};
        }
    }
    return resolved;
}

Result<JobList> JobFactory::expand(const TaskDefinition& def, const FoldSelector& folds) const {
    auto resolved = resolve_folds(def, folds);
    if (!resolved) return resolved.error();

    JobList jobs;
    jobs.reserve(resolved->size());
    for (int fold : *resolved) {
        jobs.push_back(make_job(def, fold));
    }
    return jobs;
}

std::shared_ptr<Job> JobFactory::make_job(const TaskDefinition& def, int fold) const {
    auto executor = std::make_shared<TaskExecutor>(context_, def, fold);
    JobKey key{.scope = "local", .task = def.name, .fold = fold, .framework = framework_.name};

    auto runnable = [executor, adapter = adapter_, framework = framework_]() -> Result<TaskResult> {
        if (auto loaded = executor->load_data(); !loaded) {
            return loaded.error();
        }
        return executor->execute(*adapter, framework);
    };
    return std::make_shared<Job>(std::move(key), std::move(runnable), context_.logger);
}

}  // namespace automl_bench
