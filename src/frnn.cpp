#include "frnn.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "timer.hpp"
#include <algorithm>
#include <omp.h>
#include <string>
#include <utility>

namespace frnn {

namespace {

// Rows of train whose label is (or, with invert, is not) the given label.
std::vector<double> select_rows(const Dataset& train, int label, bool invert) {
    std::vector<double> out;
    for (size_t i = 0; i < train.size(); ++i) {
        if ((train.labels()[i] == label) != invert) {
            const double* r = train.row(i);
            out.insert(out.end(), r, r + train.dim());
        }
    }
    return out;
}

}  // namespace

FRNNClassifier::FRNNClassifier(const FRNNConfig& cfg)
    : cfg_(cfg),
      upper_(cfg.upper_family, cfg.decay),
      lower_(cfg.lower_family, cfg.decay) {
    if (!backend_available(cfg_.backend))
        throw InvalidConfiguration(std::string("FRNNClassifier: backend ")
                                   + backend_name(cfg_.backend) + " is not available");
    if (cfg_.backend == SearchBackend::Faiss && cfg_.metric != Metric::Euclidean)
        throw InvalidConfiguration("FRNNClassifier: faiss backend supports euclidean only");
}

std::string FRNNClassifier::name() const {
    return std::string("FRNN(upper=") + owa_family_name(cfg_.upper_family) + "/"
           + cfg_.upper_k.to_string() + ", lower=" + owa_family_name(cfg_.lower_family)
           + "/" + cfg_.lower_k.to_string() + ")";
}

std::unique_ptr<const ClassifierModel> FRNNClassifier::construct(const Dataset& train) const {
    validate_training_data(train, "FRNNClassifier::construct");

    Stopwatch t;
    const size_t dim = train.dim();
    std::vector<int> classes = train.classes();
    std::vector<FRNNModel::ClassIndex> per_class;
    per_class.reserve(classes.size());

    for (int c : classes) {
        std::vector<double> members = select_rows(train, c, false);
        std::vector<double> others = select_rows(train, c, true);
        size_t n_members = members.size() / dim;
        size_t n_others = others.size() / dim;

        FRNNModel::ClassIndex ci;
        ci.members = make_index(cfg_.backend, members.data(), n_members, dim, cfg_.metric);
        ci.others = make_index(cfg_.backend, others.data(), n_others, dim, cfg_.metric);
        ci.upper_k = cfg_.upper_k.resolve(n_members);
        ci.lower_k = cfg_.lower_k.resolve(n_others);
        FRNN_VLOG(cfg_.verbose, "FRNN class %d: members=%zu upper_k=%zu others=%zu lower_k=%zu",
                  c, n_members, ci.upper_k, n_others, ci.lower_k);
        per_class.push_back(std::move(ci));
    }

    std::unique_ptr<const ClassifierModel> model(
        new FRNNModel(std::move(classes), dim, std::move(per_class),
                      upper_, lower_));

    FRNN_VLOG(cfg_.verbose, "%s constructed: n=%zu dim=%zu in %.1fms",
              name().c_str(), train.size(), dim, t.elapsed_ms());
    return model;
}

FRNNModel::FRNNModel(std::vector<int> classes, size_t dim,
                     std::vector<ClassIndex> per_class,
                     const OWAOperator& upper, const OWAOperator& lower)
    : classes_(std::move(classes)),
      dim_(dim),
      per_class_(std::move(per_class)),
      upper_(upper),
      lower_(lower) {}

Confidences FRNNModel::query(const double* data, size_t n, size_t dim) const {
    if (dim != dim_)
        throw DimensionMismatch("FRNNModel::query: expected dim "
                                + std::to_string(dim_) + ", got "
                                + std::to_string(dim));

    const size_t nc = classes_.size();
    Confidences out;
    out.classes = classes_;
    out.n = n;
    out.scores.assign(n * nc, 0.0);

    for (size_t c = 0; c < nc; ++c) {
        const ClassIndex& ci = per_class_[c];
        Neighbours up = ci.members->query(data, n, dim, ci.upper_k);
        Neighbours lo = ci.others->query(data, n, dim, ci.lower_k);

        #pragma omp parallel
        {
            std::vector<double> buf(std::max(up.k, lo.k));
            #pragma omp for schedule(static)
            for (size_t i = 0; i < n; ++i) {
                const double* du = up.distance_row(i);
                for (size_t j = 0; j < up.k; ++j) buf[j] = shifted_reciprocal(du[j]);
                double upper = upper_.soft_max(buf.data(), up.k, up.k);

                const double* dl = lo.distance_row(i);
                for (size_t j = 0; j < lo.k; ++j) buf[j] = 1.0 - shifted_reciprocal(dl[j]);
                double lower = lower_.soft_min(buf.data(), lo.k, lo.k);

                out.scores[i * nc + c] = 0.5 * (upper + lower);
            }
        }
    }
    return out;
}

}  // namespace frnn
