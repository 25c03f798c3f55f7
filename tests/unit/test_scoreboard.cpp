/**
 * @file test_scoreboard.cpp
 * @brief Unit tests for scoreboards and the CSV score store.
 */

#include "results/scoreboard.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

using namespace automl_bench;

namespace {

TaskResult row(const std::string& task, int fold, double acc) {
    TaskResult result;
    result.identity = {.id = "openml.org/t/59", .task = task, .framework = "constantpredictor",
                       .fold = fold, .seed = 42};
    result.duration = 1.5;
    result.utc = "2024-05-01T10:00:00";
    result.models_count = 1;
    result.outcome = Scored{{{"acc", acc}, {"balacc", 0.5}}};
    return result;
}

TaskResult failed_row(const std::string& task, int fold, std::string info) {
    auto result = row(task, fold, 0.0);
    result.outcome = NoResult{std::move(info)};
    return result;
}

JobCompletion completed(TaskResult result) {
    JobCompletion c;
    c.key = JobKey{.task = result.identity.task, .fold = result.identity.fold,
                   .framework = result.identity.framework};
    c.state = JobState::Completed;
    c.result = std::move(result);
    return c;
}

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) lines.push_back(line);
    return lines;
}

}  // namespace

// ─── Scoreboard ──────────────────────────────

TEST(ScoreboardTest, FileNames) {
    EXPECT_EQ(Scoreboard::for_task("constantpredictor", "iris").file_name(),
              "constantpredictor_task_iris.csv");
    EXPECT_EQ(Scoreboard::for_benchmark("constantpredictor", "test").file_name(),
              "constantpredictor_benchmark_test.csv");
}

TEST(ScoreboardTest, AppendBoards) {
    auto total = Scoreboard::for_benchmark("fw", "test");
    auto iris = Scoreboard::for_task("fw", "iris", {row("iris", 0, 1.0)});
    auto kc2 = Scoreboard::for_task("fw", "kc2", {row("kc2", 0, 0.5), row("kc2", 1, 0.7)});
    total.append(iris);
    total.append(kc2);
    EXPECT_EQ(total.size(), 3u);
    EXPECT_FALSE(total.task().has_value());
    EXPECT_EQ(total.benchmark(), "test");
}

TEST(ScoreboardTest, TableHasHeaderAndRows) {
    auto board = Scoreboard::for_task("constantpredictor", "iris",
                                      {row("iris", 0, 0.75), failed_row("iris", 1, "Error: boom")});
    auto table = board.to_table();

    std::istringstream in(table);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) lines.push_back(line);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].rfind("id", 0), 0u);
    EXPECT_NE(lines[0].find("result"), std::string::npos);
    EXPECT_NE(lines[1].find("0.75"), std::string::npos);
    EXPECT_NE(lines[2].find("Error: boom"), std::string::npos);
}

// ─── collect ─────────────────────────────────

TEST(CollectTest, SkipsCompletionsWithoutResult) {
    JobCompletion failed;
    failed.state = JobState::Failed;
    failed.error = "no dataset";
    std::vector<JobCompletion> completions{completed(row("iris", 0, 1.0)), failed,
                                           completed(failed_row("iris", 1, "Error: x"))};

    auto board = collect(completions, "constantpredictor", "test", std::string("iris"));
    ASSERT_TRUE(board.has_value());
    EXPECT_EQ(board->size(), 2u);
    EXPECT_EQ(board->task(), "iris");
    EXPECT_EQ(board->file_name(), "constantpredictor_task_iris.csv");
}

TEST(CollectTest, FiltersByTask) {
    std::vector<JobCompletion> completions{completed(row("iris", 0, 1.0)),
                                           completed(row("kc2", 0, 1.0))};
    auto board = collect(completions, "fw", "test", std::string("kc2"));
    ASSERT_TRUE(board.has_value());
    ASSERT_EQ(board->size(), 1u);
    EXPECT_EQ(board->rows()[0].identity.task, "kc2");

    auto all = collect(completions, "fw", "test");
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all->size(), 2u);
    EXPECT_EQ(all->file_name(), "fw_benchmark_test.csv");
}

TEST(CollectTest, NothingToCollect) {
    JobCompletion failed;
    failed.error = "boom";
    EXPECT_FALSE(collect({failed}, "fw", "test").has_value());
    EXPECT_FALSE(collect({}, "fw", "test", std::string("iris")).has_value());
}

// ─── ScoreStore ──────────────────────────────

TEST(ScoreStoreTest, CsvRow) {
    EXPECT_EQ(ScoreStore::to_csv_row(row("iris", 0, 0.5)),
              "openml.org/t/59,iris,constantpredictor,0,0.5,acc,acc=0.5;balacc=0.5,"
              "1.5,1,42,2024-05-01T10:00:00,");
}

TEST(ScoreStoreTest, CsvRowQuotesInfo) {
    auto line = ScoreStore::to_csv_row(failed_row("iris", 1, "Error: bad \"value\", retry"));
    EXPECT_NE(line.find("\"Error: bad \"\"value\"\", retry\""), std::string::npos);
    // No score, metric or scores for a NoResult row.
    EXPECT_NE(line.find("iris,constantpredictor,1,,,,1.5,"), std::string::npos) << line;
}

TEST(ScoreStoreTest, PersistWritesBoardAndResults) {
    test_support::TempDir dir;
    ScoreStore store(dir.path());
    auto board = Scoreboard::for_task("constantpredictor", "iris", {row("iris", 0, 1.0)});

    ASSERT_TRUE(store.persist(board).has_value());
    ASSERT_TRUE(store.persist(board).has_value());

    auto board_lines = read_lines(dir.path() / "scores" / "constantpredictor_task_iris.csv");
    ASSERT_EQ(board_lines.size(), 3u);
    EXPECT_EQ(board_lines[0], "id,task,framework,fold,result,metric,scores,duration,"
                              "models_count,seed,utc,info");

    auto results_lines = read_lines(store.results_file());
    EXPECT_EQ(results_lines.size(), 3u);
    EXPECT_EQ(store.results_file(), dir.path() / "scores" / "results.csv");
}

TEST(ScoreStoreTest, PersistReportsUnwritableDirectory) {
    test_support::TempDir dir;
    // A regular file where the scores directory should be.
    dir.write("scores", "not a directory");
    ScoreStore store(dir.path());
    auto written = store.persist(Scoreboard::for_task("fw", "iris", {row("iris", 0, 1.0)}));
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code, ErrorCode::Io);
    EXPECT_NE(written.error().message.find("; "), std::string::npos);
}
