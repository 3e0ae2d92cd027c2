#include "dataset.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace frnn {

Dataset::Dataset(std::vector<double> features, size_t dim)
    : features_(std::move(features)), dim_(dim) {}

Dataset::Dataset(std::vector<double> features, size_t dim, std::vector<int> labels)
    : features_(std::move(features)), dim_(dim), labels_(std::move(labels)) {}

Dataset::Dataset(const std::vector<std::vector<double>>& rows, std::vector<int> labels)
    : labels_(std::move(labels)) {
    if (rows.empty()) return;
    dim_ = rows.front().size();
    features_.reserve(rows.size() * dim_);
    for (const auto& r : rows) {
        if (r.size() != dim_)
            throw InvalidInput("Dataset: rows have different dimensionality ("
                               + std::to_string(r.size()) + " vs "
                               + std::to_string(dim_) + ")");
        features_.insert(features_.end(), r.begin(), r.end());
    }
}

std::vector<int> Dataset::classes() const {
    std::vector<int> c(labels_);
    std::sort(c.begin(), c.end());
    c.erase(std::unique(c.begin(), c.end()), c.end());
    return c;
}

void Dataset::validate_unlabeled() const {
    if (features_.empty())
        throw InvalidInput("Dataset: empty dataset");
    if (dim_ == 0)
        throw InvalidInput("Dataset: dimensionality must be > 0");
    if (features_.size() % dim_ != 0)
        throw InvalidInput("Dataset: feature count is not a multiple of dim");
    for (double v : features_)
        if (!std::isfinite(v))
            throw InvalidInput("Dataset: non-finite feature value");
}

void Dataset::validate_labeled() const {
    validate_unlabeled();
    if (labels_.size() != size())
        throw InvalidInput("Dataset: " + std::to_string(size()) + " rows but "
                           + std::to_string(labels_.size()) + " labels");
}

}  // namespace frnn
