#include "owa_nn.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "timer.hpp"
#include <algorithm>
#include <omp.h>
#include <string>
#include <utility>

namespace frnn {

OWANNClassifier::OWANNClassifier(const OWANNConfig& cfg)
    : cfg_(cfg), owa_(cfg.family, cfg.decay) {
    if (!backend_available(cfg_.backend))
        throw InvalidConfiguration(std::string("OWANNClassifier: backend ")
                                   + backend_name(cfg_.backend) + " is not available");
    if (cfg_.backend == SearchBackend::Faiss && cfg_.metric != Metric::Euclidean)
        throw InvalidConfiguration("OWANNClassifier: faiss backend supports euclidean only");
}

std::string OWANNClassifier::name() const {
    return std::string("OWANN(k=") + cfg_.k.to_string() + ", "
           + owa_family_name(cfg_.family) + ", " + metric_name(cfg_.metric) + ")";
}

std::unique_ptr<const ClassifierModel> OWANNClassifier::construct(const Dataset& train) const {
    validate_training_data(train, "OWANNClassifier::construct");

    Stopwatch t;
    std::vector<int> classes = train.classes();
    std::vector<size_t> class_of_row(train.size());
    for (size_t i = 0; i < train.size(); ++i) {
        auto it = std::lower_bound(classes.begin(), classes.end(), train.labels()[i]);
        class_of_row[i] = static_cast<size_t>(it - classes.begin());
    }

    auto index = make_index(cfg_.backend, train.data(), train.size(), train.dim(),
                            cfg_.metric);

    std::unique_ptr<const ClassifierModel> model(
        new OWANNModel(std::move(index), std::move(class_of_row), std::move(classes),
                       owa_, cfg_.k));

    FRNN_VLOG(cfg_.verbose, "%s constructed: n=%zu dim=%zu classes=%zu in %.1fms",
              name().c_str(), train.size(), train.dim(), model->classes().size(),
              t.elapsed_ms());
    return model;
}

OWANNModel::OWANNModel(std::unique_ptr<NeighbourIndex> index,
                       std::vector<size_t> class_of_row,
                       std::vector<int> classes,
                       const OWAOperator& owa, const KSpec& k)
    : index_(std::move(index)),
      class_of_row_(std::move(class_of_row)),
      classes_(std::move(classes)),
      k_(k.resolve(index_->size())),
      weights_(owa.weights(k_)) {}

Confidences OWANNModel::query(const double* data, size_t n, size_t dim) const {
    if (dim != index_->dim())
        throw DimensionMismatch("OWANNModel::query: expected dim "
                                + std::to_string(index_->dim()) + ", got "
                                + std::to_string(dim));

    Neighbours nb = index_->query(data, n, dim, k_);

    Confidences out;
    out.classes = classes_;
    out.n = n;
    out.scores.assign(n * classes_.size(), 0.0);

    const size_t c = classes_.size();
    #pragma omp parallel for schedule(static)
    for (size_t i = 0; i < n; ++i) {
        const size_t* idx = nb.index_row(i);
        double* row = out.scores.data() + i * c;
        for (size_t r = 0; r < nb.k; ++r)
            row[class_of_row_[idx[r]]] += weights_[r];
    }
    return out;
}

}  // namespace frnn
