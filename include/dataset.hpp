#ifndef FRNN_DATASET_HPP
#define FRNN_DATASET_HPP

#include <cstddef>
#include <vector>

namespace frnn {

/**
 * Row-major feature matrix plus, for training data, one label per row:
 * features[i * dim + j] = i-th instance, j-th feature.
 * Owns its storage; models copy what they keep.
 */
class Dataset {
public:
    Dataset() = default;
    Dataset(std::vector<double> features, size_t dim);
    Dataset(std::vector<double> features, size_t dim, std::vector<int> labels);
    Dataset(const std::vector<std::vector<double>>& rows, std::vector<int> labels);

    size_t size() const { return dim_ == 0 ? 0 : features_.size() / dim_; }
    size_t dim() const { return dim_; }
    bool empty() const { return features_.empty(); }
    bool labeled() const { return !labels_.empty(); }

    const double* data() const { return features_.data(); }
    const double* row(size_t i) const { return features_.data() + i * dim_; }
    const std::vector<double>& features() const { return features_; }
    const std::vector<int>& labels() const { return labels_; }

    // Sorted distinct labels.
    std::vector<int> classes() const;

    // Throws InvalidInput on empty data, ragged features, non-finite values,
    // or (labeled) a label count different from the row count.
    void validate_unlabeled() const;
    void validate_labeled() const;

private:
    std::vector<double> features_;
    size_t dim_ = 0;
    std::vector<int> labels_;
};

}  // namespace frnn

#endif  // FRNN_DATASET_HPP
