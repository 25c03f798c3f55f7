/**
 * @file csv_dataset_service.cpp
 * @brief CsvDatasetService implementation.
 */

#include "dataset/csv_dataset_service.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace automl_bench {

namespace {

struct RawTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
};

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;
    for (char c : line) {
        if (c == '"') {
            quoted = !quoted;
        } else if (c == ',' && !quoted) {
            cells.push_back(std::move(cell));
            cell.clear();
        } else if (c != '\r') {
            cell += c;
        }
    }
    cells.push_back(std::move(cell));
    return cells;
}

Result<RawTable> read_csv(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return Error{ErrorCode::DatasetLoad, "Could not open " + path.string()};
    }

    RawTable table;
    std::string line;
    if (!std::getline(ifs, line)) {
        return Error{ErrorCode::DatasetLoad, "Empty file " + path.string()};
    }
    table.header = split_csv_line(line);

    size_t line_no = 1;
    while (std::getline(ifs, line)) {
        ++line_no;
        if (line.empty() || line == "\r") continue;
        auto cells = split_csv_line(line);
        if (cells.size() != table.header.size()) {
            return Error{ErrorCode::DatasetLoad,
                         path.string() + ":" + std::to_string(line_no) + ": expected "
                         + std::to_string(table.header.size()) + " columns, got "
                         + std::to_string(cells.size())};
        }
        table.rows.push_back(std::move(cells));
    }
    return table;
}

bool is_missing(const std::string& cell) {
    return cell.empty() || cell == "?";
}

std::optional<double> parse_number(const std::string& cell) {
    double value{};
    auto [ptr, ec] = std::from_chars(cell.data(), cell.data() + cell.size(), value);
    if (ec != std::errc{} || ptr != cell.data() + cell.size()) return std::nullopt;
    return value;
}

/// Decide the kind of every column from the cells of both splits.
std::vector<Feature> infer_columns(const RawTable& train, const RawTable& test) {
    std::vector<Feature> columns(train.header.size());
    for (size_t col = 0; col < columns.size(); ++col) {
        columns[col].name = train.header[col];
        std::set<std::string> labels;
        bool numeric = true;
        for (const auto* table : {&train, &test}) {
            for (const auto& row : table->rows) {
                const auto& cell = row[col];
                if (is_missing(cell)) continue;
                labels.insert(cell);
                if (numeric && !parse_number(cell)) numeric = false;
            }
        }
        if (!numeric) {
            columns[col].kind = FeatureKind::Categorical;
            columns[col].categories.assign(labels.begin(), labels.end());
        }
    }
    return columns;
}

double encode(const Feature& column, const std::string& cell) {
    if (is_missing(cell)) return std::numeric_limits<double>::quiet_NaN();
    if (!column.is_categorical()) return *parse_number(cell);
    auto it = std::lower_bound(column.categories.begin(), column.categories.end(), cell);
    return static_cast<double>(std::distance(column.categories.begin(), it));
}

DataSplit encode_split(const RawTable& table, const std::vector<Feature>& columns) {
    DataSplit split;
    size_t target_col = columns.size() - 1;
    split.X.reserve(table.rows.size());
    split.y.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        std::vector<double> features;
        features.reserve(target_col);
        for (size_t col = 0; col < target_col; ++col) {
            features.push_back(encode(columns[col], row[col]));
        }
        split.X.push_back(std::move(features));
        split.y.push_back(encode(columns[target_col], row[target_col]));
    }
    return split;
}

}  // anonymous namespace

CsvDatasetService::CsvDatasetService(std::filesystem::path input_dir)
    : input_dir_(std::move(input_dir)) {}

std::filesystem::path CsvDatasetService::fold_dir(int64_t task_id, int fold) const {
    return input_dir_ / ("task_" + std::to_string(task_id)) / ("fold_" + std::to_string(fold));
}

Result<std::unique_ptr<Dataset>> CsvDatasetService::load(int64_t task_id, int fold) {
    auto dir = fold_dir(task_id, fold);

    auto train = read_csv(dir / "train.csv");
    if (!train) return train.error();
    auto test = read_csv(dir / "test.csv");
    if (!test) return test.error();

    if (train->header.empty() || train->header.size() < 2) {
        return Error{ErrorCode::DatasetLoad,
                     "Dataset for task " + std::to_string(task_id) + " needs at least one feature and a target"};
    }
    if (train->header != test->header) {
        return Error{ErrorCode::DatasetLoad,
                     "Train and test headers differ for task " + std::to_string(task_id)};
    }

    auto columns = infer_columns(*train, *test);
    auto train_split = encode_split(*train, columns);
    auto test_split = encode_split(*test, columns);
    Feature target = columns.back();
    columns.pop_back();

    return std::make_unique<Dataset>("task_" + std::to_string(task_id) + "_fold_" + std::to_string(fold),
                                     std::move(columns),
                                     std::move(target),
                                     std::move(train_split),
                                     std::move(test_split));
}

}  // namespace automl_bench
