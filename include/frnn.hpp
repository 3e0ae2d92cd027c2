#ifndef FRNN_FRNN_HPP
#define FRNN_FRNN_HPP

#include "classifier.hpp"
#include "distance.hpp"
#include "kspec.hpp"
#include "neighbour_index.hpp"
#include "owa.hpp"
#include <memory>
#include <string>
#include <vector>

namespace frnn {

struct FRNNConfig {
    KSpec upper_k = KSpec::fixed(20);
    OWAFamily upper_family = OWAFamily::Linear;
    KSpec lower_k = KSpec::fixed(20);
    OWAFamily lower_family = OWAFamily::Linear;
    double decay = 0.5;   // exponential families only, in (0, 1]
    Metric metric = Metric::Euclidean;
    SearchBackend backend = SearchBackend::BruteForce;
    bool verbose = false;
};

/**
 * Fuzzy-rough nearest neighbour classifier with OWA-based approximations
 * (Jensen & Cornelis 2011; Cornelis, Verbiest & Jensen 2010).
 *
 * For class c and query y, with proximity p(d) = 1 / (1 + d):
 *   upper(c) = soft_max over the upper_k nearest members of c of p(d)
 *   lower(c) = soft_min over the lower_k nearest non-members of 1 - p(d)
 *   score(c) = (upper(c) + lower(c)) / 2
 * Each k is resolved against the size of the set it is drawn from.
 */
class FRNNClassifier : public Classifier {
public:
    explicit FRNNClassifier(const FRNNConfig& cfg = {});

    std::unique_ptr<const ClassifierModel> construct(const Dataset& train) const override;
    std::string name() const override;

    const FRNNConfig& config() const { return cfg_; }

private:
    FRNNConfig cfg_;
    OWAOperator upper_;
    OWAOperator lower_;
};

class FRNNModel : public ClassifierModel {
public:
    using ClassifierModel::query;

    Confidences query(const double* data, size_t n, size_t dim) const override;

    const std::vector<int>& classes() const override { return classes_; }
    size_t dim() const override { return dim_; }

private:
    friend class FRNNClassifier;

    struct ClassIndex {
        std::unique_ptr<NeighbourIndex> members;
        std::unique_ptr<NeighbourIndex> others;
        size_t upper_k;
        size_t lower_k;
    };

    FRNNModel(std::vector<int> classes, size_t dim,
              std::vector<ClassIndex> per_class,
              const OWAOperator& upper, const OWAOperator& lower);

    std::vector<int> classes_;
    size_t dim_;
    std::vector<ClassIndex> per_class_;
    OWAOperator upper_;
    OWAOperator lower_;
};

}  // namespace frnn

#endif  // FRNN_FRNN_HPP
