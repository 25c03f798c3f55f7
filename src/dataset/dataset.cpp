/**
 * @file dataset.cpp
 * @brief Dataset implementation.
 */

#include "dataset/dataset.hpp"

#include <stdexcept>

namespace automl_bench {

Dataset::Dataset(std::string name,
                 std::vector<Feature> features,
                 Feature target,
                 DataSplit train,
                 DataSplit test)
    : name_(std::move(name))
    , features_(std::move(features))
    , target_(std::move(target))
    , data_(std::make_unique<Splits>(Splits{std::move(train), std::move(test)})) {}

Dataset::~Dataset() = default;

const DataSplit& Dataset::train() const {
    if (!data_) throw std::logic_error("Dataset " + name_ + " has been released");
    return data_->train;
}

const DataSplit& Dataset::test() const {
    if (!data_) throw std::logic_error("Dataset " + name_ + " has been released");
    return data_->test;
}

void Dataset::release() noexcept {
    data_.reset();
}

}  // namespace automl_bench
