#ifndef FRNN_CLASSIFIER_HPP
#define FRNN_CLASSIFIER_HPP

#include "dataset.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace frnn {

/**
 * Per-class confidence scores for n query rows, row-major n x classes.size().
 * Scores are non-negative soft evidence; they need not sum to 1.
 */
struct Confidences {
    std::vector<int> classes;
    size_t n = 0;
    std::vector<double> scores;

    size_t num_classes() const { return classes.size(); }
    const double* row(size_t i) const { return scores.data() + i * classes.size(); }

    // Throws std::out_of_range for a row past n or a label not in classes.
    double score(size_t i, int label) const;
};

/**
 * Constructed classifier. Immutable: query() never changes the model and may
 * be called concurrently and repeatedly with identical results.
 */
class ClassifierModel {
public:
    // Row-major n x dim queries. Throws DimensionMismatch when dim differs
    // from the training data; the whole batch fails and the model is untouched.
    virtual Confidences query(const double* data, size_t n, size_t dim) const = 0;

    Confidences query(const Dataset& data) const {
        return query(data.data(), data.size(), data.dim());
    }

    // One instance; the returned Confidences has n == 1.
    Confidences query_one(const std::vector<double>& x) const {
        return query(x.data(), 1, x.size());
    }

    virtual const std::vector<int>& classes() const = 0;
    virtual size_t dim() const = 0;

    virtual ~ClassifierModel() = default;
};

/**
 * Unconstructed classifier: configuration only. construct() is the single
 * transition to a ClassifierModel; it copies what it needs from the dataset.
 */
class Classifier {
public:
    // Throws InvalidInput for empty or inconsistent data, or fewer than two
    // distinct labels.
    virtual std::unique_ptr<const ClassifierModel> construct(const Dataset& train) const = 0;

    virtual std::string name() const = 0;

    virtual ~Classifier() = default;
};

// Shared construct-time checks for labeled classifiers.
void validate_training_data(const Dataset& train, const char* who);

}  // namespace frnn

#endif  // FRNN_CLASSIFIER_HPP
