/**
 * @file csv_dataset_service.hpp
 * @brief Dataset service reading pre-split CSV folds from the input directory.
 */

#pragma once

#include "dataset/dataset.hpp"

#include <filesystem>

namespace automl_bench {

/**
 * @brief Loads `<input_dir>/task_<id>/fold_<k>/{train,test}.csv`.
 *
 * Both files carry a header row and the same columns; the last column is
 * the target. A column holding any non-numeric value is categorical and
 * encoded by the index of its label in the sorted label set of both splits.
 * Empty cells and "?" are missing values (NaN) in numerical columns.
 */
class CsvDatasetService : public IDatasetService {
public:
    explicit CsvDatasetService(std::filesystem::path input_dir);

    Result<std::unique_ptr<Dataset>> load(int64_t task_id, int fold) override;

    [[nodiscard]] std::filesystem::path fold_dir(int64_t task_id, int fold) const;

private:
    std::filesystem::path input_dir_;
};

}  // namespace automl_bench
