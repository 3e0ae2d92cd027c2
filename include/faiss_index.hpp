#ifndef FRNN_FAISS_INDEX_HPP
#define FRNN_FAISS_INDEX_HPP

#include "neighbour_index.hpp"
#include <cstddef>
#include <memory>
#include <vector>

namespace faiss {
struct IndexFlatL2;
}

namespace frnn {

/**
 * FAISS-backed exact search: faiss::IndexFlatL2 over mean-centred float32
 * copies of the data. Euclidean only. FAISS only proposes candidates: a
 * query's candidate list is widened until its last float distance clears the
 * k-th by the float error bound, then every candidate is re-ranked on the
 * double distance() and (distance, index), matching BruteForceIndex.
 */
class FaissIndex : public NeighbourIndex {
public:
    FaissIndex(const double* data, size_t n, size_t dim,
               Metric metric = Metric::Euclidean);
    ~FaissIndex() override;

    Neighbours query(const double* data, size_t n, size_t dim,
                     size_t k) const override;
    Neighbours query_self(size_t k) const override;

    size_t size() const override { return n_; }
    size_t dim() const override { return dim_; }
    Metric metric() const override { return Metric::Euclidean; }
    std::string name() const override { return "faiss/euclidean"; }

private:
    size_t n_;
    size_t dim_;
    std::unique_ptr<faiss::IndexFlatL2> index_;
    std::vector<double> data_;      // original rows, for exact re-ranking
    std::vector<double> mean_;
    double max_norm_ = 0.0;         // largest centred squared norm

    Neighbours search(const double* queries, size_t nq, size_t k,
                      bool exclude_self) const;
};

}  // namespace frnn

#endif  // FRNN_FAISS_INDEX_HPP
