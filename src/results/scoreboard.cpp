/**
 * @file scoreboard.cpp
 * @brief Scoreboard, result collection and CSV score files.
 */

#include "results/scoreboard.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace automl_bench {

namespace {

std::string format_number(double value) {
    if (std::isnan(value)) return "nan";
    std::ostringstream oss;
    oss << std::setprecision(6) << value;
    return oss.str();
}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\n\r") == std::string::npos) return field;
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

/// "acc=0.9;balacc=0.85"
std::string format_scores(const TaskResult& row) {
    const auto* scored = std::get_if<Scored>(&row.outcome);
    if (!scored) return {};
    std::string out;
    for (const auto& score : scored->scores) {
        if (!out.empty()) out += ';';
        out += score.metric + "=" + format_number(score.value);
    }
    return out;
}

std::vector<std::string> row_fields(const TaskResult& row) {
    auto score = row.primary_score();
    return {
        row.identity.id,
        row.identity.task,
        row.identity.framework,
        std::to_string(row.identity.fold),
        score ? format_number(*score) : std::string{},
        row.primary_metric(),
        format_scores(row),
        format_number(row.duration),
        std::to_string(row.models_count),
        std::to_string(row.identity.seed),
        row.utc,
        row.info()
    };
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Scoreboard
// ─────────────────────────────────────────────

Scoreboard::Scoreboard(FrameworkName framework, std::optional<TaskName> task,
                       std::optional<std::string> benchmark, std::vector<TaskResult> rows)
    : framework_(std::move(framework))
    , task_(std::move(task))
    , benchmark_(std::move(benchmark))
    , rows_(std::move(rows)) {}

Scoreboard Scoreboard::for_task(FrameworkName framework, TaskName task,
                                std::vector<TaskResult> rows) {
    return Scoreboard(std::move(framework), std::move(task), std::nullopt, std::move(rows));
}

Scoreboard Scoreboard::for_benchmark(FrameworkName framework, std::string benchmark,
                                     std::vector<TaskResult> rows) {
    return Scoreboard(std::move(framework), std::nullopt, std::move(benchmark), std::move(rows));
}

void Scoreboard::append(TaskResult row) {
    rows_.push_back(std::move(row));
}

void Scoreboard::append(const Scoreboard& other) {
    rows_.insert(rows_.end(), other.rows_.begin(), other.rows_.end());
}

std::string Scoreboard::file_name() const {
    if (task_) return framework_ + "_task_" + *task_ + ".csv";
    return framework_ + "_benchmark_" + benchmark_.value_or("unknown") + ".csv";
}

std::string Scoreboard::to_table() const {
    static const std::vector<std::string> headers{
        "id", "task", "framework", "fold", "result", "metric", "duration", "info"};

    std::vector<std::vector<std::string>> cells;
    cells.reserve(rows_.size());
    for (const auto& row : rows_) {
        auto score = row.primary_score();
        cells.push_back({
            row.identity.id,
            row.identity.task,
            row.identity.framework,
            std::to_string(row.identity.fold),
            score ? format_number(*score) : std::string{},
            row.primary_metric(),
            format_number(row.duration),
            row.info()
        });
    }

    std::vector<size_t> widths;
    for (const auto& h : headers) widths.push_back(h.size());
    for (const auto& line : cells) {
        for (size_t i = 0; i < line.size(); ++i) widths[i] = std::max(widths[i], line[i].size());
    }

    std::ostringstream oss;
    auto render = [&](const std::vector<std::string>& line) {
        for (size_t i = 0; i < line.size(); ++i) {
            oss << std::left << std::setw(static_cast<int>(widths[i])) << line[i];
            oss << (i + 1 < line.size() ? "  " : "\n");
        }
    };
    render(headers);
    for (const auto& line : cells) render(line);
    return oss.str();
}

std::optional<Scoreboard> collect(const std::vector<JobCompletion>& completions,
                                  const FrameworkName& framework,
                                  const std::string& benchmark,
                                  const std::optional<TaskName>& task) {
    auto board = task ? Scoreboard::for_task(framework, *task)
                      : Scoreboard::for_benchmark(framework, benchmark);
    for (const auto& completion : completions) {
        if (!completion.result) continue;
        if (task && completion.result->identity.task != *task) continue;
        board.append(*completion.result);
    }
    if (board.empty()) return std::nullopt;
    return board;
}

// ─────────────────────────────────────────────
// ScoreStore
// ─────────────────────────────────────────────

ScoreStore::ScoreStore(std::filesystem::path output_dir)
    : output_dir_(std::move(output_dir)) {}

std::filesystem::path ScoreStore::scores_dir() const {
    return output_dir_ / "scores";
}

std::filesystem::path ScoreStore::board_file(const Scoreboard& board) const {
    return scores_dir() / board.file_name();
}

std::filesystem::path ScoreStore::results_file() const {
    return scores_dir() / "results.csv";
}

const std::vector<std::string>& ScoreStore::columns() {
    static const std::vector<std::string> names{
        "id", "task", "framework", "fold", "result", "metric", "scores",
        "duration", "models_count", "seed", "utc", "info"};
    return names;
}

std::string ScoreStore::to_csv_row(const TaskResult& row) {
    auto fields = row_fields(row);
    std::string line;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) line += ',';
        line += csv_escape(fields[i]);
    }
    return line;
}

Result<void> ScoreStore::append_rows(const std::filesystem::path& path,
                                     const std::vector<TaskResult>& rows) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::Io, "Cannot create " + path.parent_path().string() + ": " + ec.message()};
    }

    bool write_header = !std::filesystem::exists(path) || std::filesystem::file_size(path, ec) == 0;
    std::ofstream out(path, std::ios::app);
    if (!out) {
        return Error{ErrorCode::Io, "Cannot open " + path.string() + " for writing"};
    }

    if (write_header) {
        std::string header;
        for (const auto& column : columns()) {
            if (!header.empty()) header += ',';
            header += column;
        }
        out << header << '\n';
    }
    for (const auto& row : rows) {
        out << to_csv_row(row) << '\n';
    }
    out.flush();
    if (!out) {
        return Error{ErrorCode::Io, "Failed writing scores to " + path.string()};
    }
    return {};
}

Result<void> ScoreStore::persist(const Scoreboard& board) const {
    std::vector<std::string> failures;
    if (auto written = append_rows(board_file(board), board.rows()); !written) {
        failures.push_back(written.error().message);
    }
    if (auto written = append_rows(results_file(), board.rows()); !written) {
        failures.push_back(written.error().message);
    }
    if (failures.empty()) return {};

    std::string message = failures.front();
    for (size_t i = 1; i < failures.size(); ++i) message += "; " + failures[i];
    return Error{ErrorCode::Io, std::move(message)};
}

}  // namespace automl_bench
