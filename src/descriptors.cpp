#include "descriptors.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <omp.h>
#include <string>
#include <utility>

namespace frnn {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

void check_backend(SearchBackend backend, Metric metric, const char* who) {
    if (!backend_available(backend))
        throw InvalidConfiguration(std::string(who) + ": backend "
                                   + backend_name(backend) + " is not available");
    if (backend == SearchBackend::Faiss && metric != Metric::Euclidean)
        throw InvalidConfiguration(std::string(who) + ": faiss backend supports euclidean only");
}

void check_query_dim(size_t expected, size_t dim, const char* who) {
    if (dim != expected)
        throw DimensionMismatch(std::string(who) + ": expected dim "
                                + std::to_string(expected) + ", got "
                                + std::to_string(dim));
}

// a / b, with 0 / 0 -> fallback and x / 0 -> +inf.
inline double div_or(double a, double b, double fallback) {
    if (b == 0.0) return a == 0.0 ? fallback : kInf;
    return a / b;
}

class NNDModel : public DescriptorModel {
public:
    using DescriptorModel::query;

    NNDModel(std::unique_ptr<NeighbourIndex> index, size_t k, bool trimmed,
             const OWAOperator& owa)
        : index_(std::move(index)), k_(k), trimmed_(trimmed), owa_(owa) {}

    std::vector<double> query(const double* data, size_t n, size_t dim) const override {
        check_query_dim(index_->dim(), dim, "NND::query");
        Neighbours nb = index_->query(data, n, dim, k_);
        std::vector<double> out(n);

        #pragma omp parallel
        {
            std::vector<double> prox(nb.k);
            #pragma omp for schedule(static)
            for (size_t i = 0; i < n; ++i) {
                const double* d = nb.distance_row(i);
                if (trimmed_) {
                    out[i] = shifted_reciprocal(d[nb.k - 1]);
                    continue;
                }
                for (size_t j = 0; j < nb.k; ++j) prox[j] = shifted_reciprocal(d[j]);
                out[i] = owa_.soft_max(prox.data(), nb.k, nb.k);
            }
        }
        return out;
    }

    size_t dim() const override { return index_->dim(); }
    size_t resolved_k() const override { return k_; }

private:
    std::unique_ptr<NeighbourIndex> index_;
    size_t k_;
    bool trimmed_;
    OWAOperator owa_;
};

class LNNDModel : public DescriptorModel {
public:
    using DescriptorModel::query;

    LNNDModel(std::unique_ptr<NeighbourIndex> index, size_t k)
        : index_(std::move(index)), k_(k) {
        Neighbours self = index_->query_self(k_);
        kdist_.resize(index_->size());
        for (size_t i = 0; i < self.n; ++i)
            kdist_[i] = self.distance_row(i)[k_ - 1];
    }

    std::vector<double> query(const double* data, size_t n, size_t dim) const override {
        check_query_dim(index_->dim(), dim, "LNND::query");
        Neighbours nb = index_->query(data, n, dim, k_);
        std::vector<double> out(n);

        #pragma omp parallel for schedule(static)
        for (size_t i = 0; i < n; ++i) {
            double qd = nb.distance_row(i)[k_ - 1];
            double ref = kdist_[nb.index_row(i)[k_ - 1]];
            out[i] = shifted_reciprocal(div_or(qd, ref, 1.0));
        }
        return out;
    }

    size_t dim() const override { return index_->dim(); }
    size_t resolved_k() const override { return k_; }

private:
    std::unique_ptr<NeighbourIndex> index_;
    size_t k_;
    std::vector<double> kdist_;   // k-th neighbour distance of each training row
};

class LOFModel : public DescriptorModel {
public:
    using DescriptorModel::query;

    LOFModel(std::unique_ptr<NeighbourIndex> index, size_t k)
        : index_(std::move(index)), k_(k) {
        Neighbours self = index_->query_self(k_);
        const size_t n = index_->size();
        kdist_.resize(n);
        for (size_t i = 0; i < n; ++i)
            kdist_[i] = self.distance_row(i)[k_ - 1];

        lrd_.resize(n);
        for (size_t i = 0; i < n; ++i)
            lrd_[i] = 1.0 / mean_reach(self.index_row(i), self.distance_row(i));
    }

    std::vector<double> query(const double* data, size_t n, size_t dim) const override {
        check_query_dim(index_->dim(), dim, "LOF::query");
        Neighbours nb = index_->query(data, n, dim, k_);
        std::vector<double> out(n);

        #pragma omp parallel for schedule(static)
        for (size_t i = 0; i < n; ++i) {
            const size_t* idx = nb.index_row(i);
            double mean_lrd = 0.0;
            for (size_t j = 0; j < k_; ++j) mean_lrd += lrd_[idx[j]];
            mean_lrd /= static_cast<double>(k_);

            // lof = mean_lrd / q_lrd with q_lrd = 1 / reach
            double lof = mean_lrd * mean_reach(idx, nb.distance_row(i));
            if (std::isnan(lof)) lof = 1.0;
            out[i] = shifted_reciprocal(lof);
        }
        return out;
    }

    size_t dim() const override { return index_->dim(); }
    size_t resolved_k() const override { return k_; }

private:
    std::unique_ptr<NeighbourIndex> index_;
    size_t k_;
    std::vector<double> kdist_;
    std::vector<double> lrd_;     // local reachability density per training row

    double mean_reach(const size_t* idx, const double* d) const {
        double s = 0.0;
        for (size_t j = 0; j < k_; ++j) s += std::max(d[j], kdist_[idx[j]]);
        return s / static_cast<double>(k_);
    }
};

}  // namespace

NND::NND(const NNDConfig& cfg) : cfg_(cfg), owa_(cfg.family, cfg.decay) {
    check_backend(cfg_.backend, cfg_.metric, "NND");
}

std::string NND::name() const {
    std::string agg = cfg_.trimmed ? "trimmed" : owa_family_name(cfg_.family);
    return "NND(k=" + cfg_.k.to_string() + ", " + agg + ")";
}

std::unique_ptr<const DescriptorModel> NND::construct(const Dataset& train) const {
    train.validate_unlabeled();
    size_t k = cfg_.k.resolve(train.size());
    auto index = make_index(cfg_.backend, train.data(), train.size(), train.dim(), cfg_.metric);
    FRNN_LOG("%s constructed: n=%zu k=%zu", name().c_str(), train.size(), k);
    return std::unique_ptr<const DescriptorModel>(
        new NNDModel(std::move(index), k, cfg_.trimmed, owa_));
}

LNND::LNND(const LocalConfig& cfg) : cfg_(cfg) {
    check_backend(cfg_.backend, cfg_.metric, "LNND");
}

std::string LNND::name() const {
    return "LNND(k=" + cfg_.k.to_string() + ")";
}

std::unique_ptr<const DescriptorModel> LNND::construct(const Dataset& train) const {
    train.validate_unlabeled();
    if (train.size() < 2)
        throw InvalidInput("LNND::construct: needs at least 2 training rows");
    size_t k = cfg_.k.resolve(train.size() - 1);
    auto index = make_index(cfg_.backend, train.data(), train.size(), train.dim(), cfg_.metric);
    FRNN_LOG("%s constructed: n=%zu k=%zu", name().c_str(), train.size(), k);
    return std::unique_ptr<const DescriptorModel>(new LNNDModel(std::move(index), k));
}

LOF::LOF(const LocalConfig& cfg) : cfg_(cfg) {
    check_backend(cfg_.backend, cfg_.metric, "LOF");
}

std::string LOF::name() const {
    return "LOF(k=" + cfg_.k.to_string() + ")";
}

std::unique_ptr<const DescriptorModel> LOF::construct(const Dataset& train) const {
    train.validate_unlabeled();
    if (train.size() < 2)
        throw InvalidInput("LOF::construct: needs at least 2 training rows");
    size_t k = cfg_.k.resolve(train.size() - 1);
    auto index = make_index(cfg_.backend, train.data(), train.size(), train.dim(), cfg_.metric);
    FRNN_LOG("%s constructed: n=%zu k=%zu", name().c_str(), train.size(), k);
    return std::unique_ptr<const DescriptorModel>(new LOFModel(std::move(index), k));
}

}  // namespace frnn
