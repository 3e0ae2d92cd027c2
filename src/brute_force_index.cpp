#include "brute_force_index.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cblas.h>
#include <omp.h>
#include <string>
#include <utility>

namespace frnn {

namespace {

inline double sqnorm(const double* x, size_t dim) {
    double s = 0.0;
    for (size_t j = 0; j < dim; ++j) s += x[j] * x[j];
    return s;
}

}  // namespace

BruteForceIndex::BruteForceIndex(const double* data, size_t n, size_t dim,
                                 Metric metric)
    : n_(n), dim_(dim), metric_(metric) {
    if (data == nullptr || n == 0 || dim == 0)
        throw InvalidInput("BruteForceIndex: invalid data or dimensions");
    check_finite_rows(data, n, dim, "BruteForceIndex");

    data_.assign(data, data + n * dim);
    if (metric_ != Metric::Euclidean) return;

    // Centring keeps the norms small relative to the distances, so large
    // coordinate offsets do not cancel out in the dgemm expansion.
    mean_.assign(dim_, 0.0);
    for (size_t i = 0; i < n_; ++i)
        for (size_t j = 0; j < dim_; ++j) mean_[j] += data_[i * dim_ + j];
    for (double& m : mean_) m /= static_cast<double>(n_);

    centred_.resize(n_ * dim_);
    norms_.resize(n_);
    #pragma omp parallel for schedule(static)
    for (size_t i = 0; i < n_; ++i) {
        for (size_t j = 0; j < dim_; ++j)
            centred_[i * dim_ + j] = data_[i * dim_ + j] - mean_[j];
        norms_[i] = sqnorm(centred_.data() + i * dim_, dim_);
    }
    max_norm_ = *std::max_element(norms_.begin(), norms_.end());
}

std::string BruteForceIndex::name() const {
    return std::string("brute_force/") + metric_name(metric_);
}

void BruteForceIndex::distance_block(const double* queries, size_t rows,
                                     double* out, double* qnorms) const {
    if (metric_ == Metric::Euclidean) {
        std::vector<double> q(rows * dim_);
        for (size_t i = 0; i < rows; ++i)
            for (size_t j = 0; j < dim_; ++j)
                q[i * dim_ + j] = queries[i * dim_ + j] - mean_[j];

        // out[i,t] = -2 * q_i . t_t
        cblas_dgemm(CblasRowMajor, CblasNoTrans, CblasTrans,
                    static_cast<int>(rows),
                    static_cast<int>(n_),
                    static_cast<int>(dim_),
                    -2.0,
                    q.data(), static_cast<int>(dim_),
                    centred_.data(), static_cast<int>(dim_),
                    0.0,
                    out, static_cast<int>(n_));

        #pragma omp parallel for schedule(static)
        for (size_t i = 0; i < rows; ++i) {
            double qn = sqnorm(q.data() + i * dim_, dim_);
            qnorms[i] = qn;
            double* row = out + i * n_;
            for (size_t t = 0; t < n_; ++t) row[t] += qn + norms_[t];
        }
        return;
    }

    #pragma omp parallel for schedule(static)
    for (size_t i = 0; i < rows; ++i) {
        const double* q = queries + i * dim_;
        double* row = out + i * n_;
        for (size_t t = 0; t < n_; ++t)
            row[t] = distance(metric_, q, data_.data() + t * dim_, dim_);
    }
}

Neighbours BruteForceIndex::search(const double* queries, size_t nq, size_t k,
                                   bool exclude_self) const {
    Neighbours out;
    out.n = nq;
    out.k = k;
    out.indices.resize(nq * k);
    out.distances.resize(nq * k);
    if (nq == 0 || k == 0) return out;

    const bool prefilter = metric_ == Metric::Euclidean;
    size_t block = std::max<size_t>(1, kMaxScratch / n_);
    std::vector<double> scratch(std::min(block, nq) * n_);
    std::vector<double> qnorms(std::min(block, nq));

    for (size_t start = 0; start < nq; start += block) {
        size_t rows = std::min(block, nq - start);
        distance_block(queries + start * dim_, rows, scratch.data(), qnorms.data());

        #pragma omp parallel
        {
            std::vector<size_t> order(n_);
            std::vector<std::pair<double, size_t>> cand;
            #pragma omp for schedule(static)
            for (size_t r = 0; r < rows; ++r) {
                const double* d = scratch.data() + r * n_;
                const double* q = queries + (start + r) * dim_;
                size_t self = start + r;
                auto by_distance = [d](size_t a, size_t b) {
                    return d[a] < d[b] || (d[a] == d[b] && a < b);
                };

                size_t m = 0;
                for (size_t t = 0; t < n_; ++t)
                    if (!exclude_self || t != self) order[m++] = t;

                size_t* oi = out.indices.data() + (start + r) * k;
                double* od = out.distances.data() + (start + r) * k;

                if (!prefilter) {
                    std::partial_sort(order.begin(), order.begin() + k,
                                      order.begin() + m, by_distance);
                    for (size_t j = 0; j < k; ++j) {
                        oi[j] = order[j];
                        od[j] = d[order[j]];
                    }
                    continue;
                }

                std::nth_element(order.begin(), order.begin() + (k - 1),
                                 order.begin() + m, by_distance);
                double cutoff = d[order[k - 1]]
                    + kPrefilterSlack * static_cast<double>(dim_ + 4)
                      * (qnorms[r] + max_norm_);

                cand.clear();
                for (size_t j = 0; j < m; ++j) {
                    size_t t = order[j];
                    if (d[t] <= cutoff)
                        cand.emplace_back(distance(metric_, q, data_.data() + t * dim_, dim_), t);
                }
                std::partial_sort(cand.begin(), cand.begin() + k, cand.end());
                for (size_t j = 0; j < k; ++j) {
                    oi[j] = cand[j].second;
                    od[j] = cand[j].first;
                }
            }
        }
    }
    return out;
}

Neighbours BruteForceIndex::query(const double* data, size_t n, size_t dim,
                                  size_t k) const {
    if (dim != dim_)
        throw DimensionMismatch("BruteForceIndex::query: expected dim "
                                + std::to_string(dim_) + ", got "
                                + std::to_string(dim));
    if (n > 0 && data == nullptr)
        throw InvalidInput("BruteForceIndex::query: null data");
    check_finite_rows(data, n, dim, "BruteForceIndex::query");
    return search(data, n, std::min(k, n_), false);
}

Neighbours BruteForceIndex::query_self(size_t k) const {
    if (n_ < 2)
        throw InvalidInput("BruteForceIndex::query_self: needs at least 2 rows");
    return search(data_.data(), n_, std::min(k, n_ - 1), true);
}

}  // namespace frnn
