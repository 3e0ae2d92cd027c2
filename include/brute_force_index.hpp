#ifndef FRNN_BRUTE_FORCE_INDEX_HPP
#define FRNN_BRUTE_FORCE_INDEX_HPP

#include "neighbour_index.hpp"
#include <cstddef>
#include <vector>

namespace frnn {

/**
 * Exact neighbour search. For Euclidean, one cblas_dgemm per query block gives
 * ||q||^2 - 2 q.t + ||t||^2 on mean-centred copies; that value only selects
 * candidates. Every row within kPrefilterSlack of the k-th candidate is
 * re-ranked with the scalar distance() on the original coordinates. Other
 * metrics are scalar loops throughout. OpenMP parallel over query rows,
 * partial_sort on (distance, index). Query blocks bound the scratch matrix to
 * kMaxScratch doubles.
 */
class BruteForceIndex : public NeighbourIndex {
public:
    BruteForceIndex(const double* data, size_t n, size_t dim,
                    Metric metric = Metric::Euclidean);

    Neighbours query(const double* data, size_t n, size_t dim,
                     size_t k) const override;
    Neighbours query_self(size_t k) const override;

    size_t size() const override { return n_; }
    size_t dim() const override { return dim_; }
    Metric metric() const override { return metric_; }
    std::string name() const override;

    static constexpr size_t kMaxScratch = size_t(1) << 22;
    // Relative bound (per dimension) on the dgemm squared-distance error.
    static constexpr double kPrefilterSlack = 1e-12;

private:
    size_t n_;
    size_t dim_;
    Metric metric_;

    std::vector<double> data_;
    // Euclidean only: rows minus their column mean, squared norms of those.
    std::vector<double> mean_;
    std::vector<double> centred_;
    std::vector<double> norms_;
    double max_norm_ = 0.0;

    // out[i * n_ + t] = distance from query row i to indexed row t. For
    // Euclidean it is an approximate squared distance and qnorms[i] receives
    // the centred squared norm of query row i.
    void distance_block(const double* queries, size_t rows,
                        double* out, double* qnorms) const;

    Neighbours search(const double* queries, size_t nq, size_t k,
                      bool exclude_self) const;
};

}  // namespace frnn

#endif  // FRNN_BRUTE_FORCE_INDEX_HPP
