#ifndef FRNN_OWA_NN_HPP
#define FRNN_OWA_NN_HPP

#include "classifier.hpp"
#include "distance.hpp"
#include "kspec.hpp"
#include "neighbour_index.hpp"
#include "owa.hpp"
#include <memory>
#include <string>
#include <vector>

namespace frnn {

struct OWANNConfig {
    KSpec k = KSpec::fixed(5);
    OWAFamily family = OWAFamily::Uniform;
    double decay = 0.5;
    Metric metric = Metric::Euclidean;
    SearchBackend backend = SearchBackend::BruteForce;
    bool verbose = false;
};

/**
 * Nearest-neighbour classifier with OWA-weighted votes. For each query the
 * k nearest training rows (k resolved against the training size) are ranked
 * by distance, then training order, and class c scores
 *     sum_r w_r * [label_r == c]
 * with w the operator's weights for the resolved k.
 */
class OWANNClassifier : public Classifier {
public:
    explicit OWANNClassifier(const OWANNConfig& cfg = {});

    std::unique_ptr<const ClassifierModel> construct(const Dataset& train) const override;
    std::string name() const override;

    const OWANNConfig& config() const { return cfg_; }

private:
    OWANNConfig cfg_;
    OWAOperator owa_;
};

class OWANNModel : public ClassifierModel {
public:
    using ClassifierModel::query;

    Confidences query(const double* data, size_t n, size_t dim) const override;

    const std::vector<int>& classes() const override { return classes_; }
    size_t dim() const override { return index_->dim(); }

    size_t resolved_k() const { return k_; }
    const std::vector<double>& weights() const { return weights_; }

private:
    friend class OWANNClassifier;

    OWANNModel(std::unique_ptr<NeighbourIndex> index,
               std::vector<size_t> class_of_row,
               std::vector<int> classes,
               const OWAOperator& owa, const KSpec& k);

    std::unique_ptr<NeighbourIndex> index_;
    std::vector<size_t> class_of_row_;   // training row -> position in classes_
    std::vector<int> classes_;
    size_t k_;
    std::vector<double> weights_;
};

}  // namespace frnn

#endif  // FRNN_OWA_NN_HPP
