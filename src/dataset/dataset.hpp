/**
 * @file dataset.hpp
 * @brief Dataset handle and the dataset service interface.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace automl_bench {

enum class FeatureKind : uint8_t {
    Numerical,
    Categorical
};

struct Feature {
    std::string name;
    FeatureKind kind{FeatureKind::Numerical};
    std::vector<std::string> categories;   ///< Label of each encoded value

    [[nodiscard]] bool is_categorical() const noexcept {
        return kind == FeatureKind::Categorical;
    }
};

/// Rows of encoded feature values and the encoded target.
struct DataSplit {
    std::vector<std::vector<double>> X;
    std::vector<double> y;

    [[nodiscard]] size_t rows() const noexcept { return y.size(); }
};

/**
 * @brief Train/test data for one task fold.
 *
 * Move-only and exclusively owned by the job that loaded it. release()
 * drops the data and may be called any number of times; accessing the
 * splits afterwards throws std::logic_error.
 */
class Dataset {
public:
    Dataset(std::string name,
            std::vector<Feature> features,
            Feature target,
            DataSplit train,
            DataSplit test);
    ~Dataset();

    Dataset(const Dataset&) = delete;
    Dataset& operator=(const Dataset&) = delete;
    Dataset(Dataset&&) noexcept = default;
    Dataset& operator=(Dataset&&) noexcept = default;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::vector<Feature>& features() const noexcept { return features_; }
    [[nodiscard]] const Feature& target() const noexcept { return target_; }

    [[nodiscard]] const DataSplit& train() const;
    [[nodiscard]] const DataSplit& test() const;

    void release() noexcept;
    [[nodiscard]] bool is_released() const noexcept { return data_ == nullptr; }

private:
    struct Splits {
        DataSplit train;
        DataSplit test;
    };

    std::string name_;
    std::vector<Feature> features_;
    Feature target_;
    std::unique_ptr<Splits> data_;
};

/**
 * @brief Source of datasets, keyed by task id and fold.
 */
class IDatasetService {
public:
    virtual ~IDatasetService() = default;

    virtual Result<std::unique_ptr<Dataset>> load(int64_t task_id, int fold) = 0;
};

}  // namespace automl_bench
