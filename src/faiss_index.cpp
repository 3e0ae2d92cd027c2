#include "faiss_index.hpp"
#include "errors.hpp"
#include <faiss/IndexFlat.h>
#include <algorithm>
#include <cfloat>
#include <numeric>
#include <omp.h>
#include <string>
#include <utility>
#include <vector>

namespace frnn {

FaissIndex::FaissIndex(const double* data, size_t n, size_t dim, Metric metric)
    : n_(n), dim_(dim) {
    if (metric != Metric::Euclidean)
        throw InvalidConfiguration(std::string("FaissIndex: only euclidean is supported, got ")
                                   + metric_name(metric));
    if (data == nullptr || n == 0 || dim == 0)
        throw InvalidInput("FaissIndex: invalid data or dimensions");
    check_finite_rows(data, n, dim, "FaissIndex");

    data_.assign(data, data + n * dim);
    mean_.assign(dim_, 0.0);
    for (size_t i = 0; i < n_; ++i)
        for (size_t j = 0; j < dim_; ++j) mean_[j] += data_[i * dim_ + j];
    for (double& m : mean_) m /= static_cast<double>(n_);

    std::vector<float> centred(n_ * dim_);
    for (size_t i = 0; i < n_; ++i) {
        double norm = 0.0;
        for (size_t j = 0; j < dim_; ++j) {
            float c = static_cast<float>(data_[i * dim_ + j] - mean_[j]);
            centred[i * dim_ + j] = c;
            norm += static_cast<double>(c) * c;
        }
        max_norm_ = std::max(max_norm_, norm);
    }

    index_ = std::make_unique<faiss::IndexFlatL2>(static_cast<faiss::idx_t>(dim_));
    index_->add(static_cast<faiss::idx_t>(n_), centred.data());
}

FaissIndex::~FaissIndex() = default;

Neighbours FaissIndex::search(const double* queries, size_t nq, size_t k,
                              bool exclude_self) const {
    Neighbours out;
    out.n = nq;
    out.k = k;
    out.indices.resize(nq * k);
    out.distances.resize(nq * k);
    if (nq == 0 || k == 0) return out;

    std::vector<float> centred(nq * dim_);
    std::vector<double> qnorms(nq, 0.0);
    for (size_t i = 0; i < nq; ++i) {
        for (size_t j = 0; j < dim_; ++j) {
            float c = static_cast<float>(queries[i * dim_ + j] - mean_[j]);
            centred[i * dim_ + j] = c;
            qnorms[i] += static_cast<double>(c) * c;
        }
    }

    std::vector<size_t> pending(nq);
    std::iota(pending.begin(), pending.end(), size_t(0));
    // One spare candidate when the row itself has to be dropped.
    size_t kk = std::min(n_, exclude_self ? k + 1 : k);

    while (!pending.empty()) {
        const size_t np = pending.size();
        std::vector<float> batch(np * dim_);
        for (size_t p = 0; p < np; ++p)
            std::copy_n(centred.data() + pending[p] * dim_, dim_, batch.data() + p * dim_);

        std::vector<float> d2(np * kk);
        std::vector<faiss::idx_t> labels(np * kk);
        index_->search(static_cast<faiss::idx_t>(np), batch.data(),
                       static_cast<faiss::idx_t>(kk), d2.data(), labels.data());

        std::vector<char> done(np, 0);
        #pragma omp parallel
        {
            std::vector<std::pair<double, size_t>> cand;
            #pragma omp for schedule(static)
            for (size_t p = 0; p < np; ++p) {
                const size_t i = pending[p];
                const float* rd = d2.data() + p * kk;
                const faiss::idx_t* rl = labels.data() + p * kk;

                size_t seen = 0;
                double kth = 0.0;
                for (size_t j = 0; j < kk && seen < k; ++j) {
                    if (rl[j] < 0 || (exclude_self && static_cast<size_t>(rl[j]) == i))
                        continue;
                    if (++seen == k) kth = rd[j];
                }

                // Rows FAISS left out are at least rd[kk - 1] away in float;
                // they can still reach the k-th place unless that clears the
                // float error bound.
                if (kk < n_) {
                    double slack = 4.0 * static_cast<double>(dim_ + 4) * FLT_EPSILON
                                   * (kth + qnorms[i] + max_norm_);
                    if (seen < k || !(rd[kk - 1] > kth + slack)) continue;
                }

                const double* q = queries + i * dim_;
                cand.clear();
                for (size_t j = 0; j < kk; ++j) {
                    if (rl[j] < 0) continue;
                    size_t idx = static_cast<size_t>(rl[j]);
                    if (exclude_self && idx == i) continue;
                    cand.emplace_back(distance(Metric::Euclidean, q,
                                               data_.data() + idx * dim_, dim_), idx);
                }
                std::partial_sort(cand.begin(), cand.begin() + k, cand.end());

                size_t* oi = out.indices.data() + i * k;
                double* od = out.distances.data() + i * k;
                for (size_t j = 0; j < k; ++j) {
                    oi[j] = cand[j].second;
                    od[j] = cand[j].first;
                }
                done[p] = 1;
            }
        }

        std::vector<size_t> next;
        for (size_t p = 0; p < np; ++p)
            if (!done[p]) next.push_back(pending[p]);
        pending.swap(next);
        kk = std::min(n_, kk * 2);
    }
    return out;
}

Neighbours FaissIndex::query(const double* data, size_t n, size_t dim,
                             size_t k) const {
    if (dim != dim_)
        throw DimensionMismatch("FaissIndex::query: expected dim "
                                + std::to_string(dim_) + ", got "
                                + std::to_string(dim));
    if (n > 0 && data == nullptr)
        throw InvalidInput("FaissIndex::query: null data");
    check_finite_rows(data, n, dim, "FaissIndex::query");
    return search(data, n, std::min(k, n_), false);
}

Neighbours FaissIndex::query_self(size_t k) const {
    if (n_ < 2)
        throw InvalidInput("FaissIndex::query_self: needs at least 2 rows");
    return search(data_.data(), n_, std::min(k, n_ - 1), true);
}

}  // namespace frnn
