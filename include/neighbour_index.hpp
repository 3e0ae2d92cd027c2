#ifndef FRNN_NEIGHBOUR_INDEX_HPP
#define FRNN_NEIGHBOUR_INDEX_HPP

#include "distance.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace frnn {

/**
 * k nearest neighbours for a batch of n queries, row-major n x k.
 * Each row is ordered by ascending distance; equal distances are ordered by
 * ascending position in the indexed data.
 */
struct Neighbours {
    size_t n = 0;
    size_t k = 0;
    std::vector<size_t> indices;
    std::vector<double> distances;

    const size_t* index_row(size_t i) const { return indices.data() + i * k; }
    const double* distance_row(size_t i) const { return distances.data() + i * k; }
};

enum class SearchBackend { BruteForce, Faiss };

SearchBackend parse_backend(const std::string& text);
const char* backend_name(SearchBackend backend);

// False for backends whose library was not found at configure time.
bool backend_available(SearchBackend backend);

// Throws InvalidInput naming the first row holding a NaN or infinity.
void check_finite_rows(const double* data, size_t n, size_t dim, const char* who);

/**
 * Abstract nearest-neighbour index over a private copy of a row-major
 * double matrix. Immutable once built; query() is safe to call concurrently.
 */
class NeighbourIndex {
public:
    // k is clamped to size(). Throws DimensionMismatch if dim != this->dim()
    // and InvalidInput for non-finite values; nothing is returned for the
    // batch in either case.
    virtual Neighbours query(const double* data, size_t n, size_t dim,
                             size_t k) const = 0;

    // Neighbours of every indexed row, excluding the row itself. k is clamped
    // to size() - 1; requires size() >= 2.
    virtual Neighbours query_self(size_t k) const = 0;

    virtual size_t size() const = 0;
    virtual size_t dim() const = 0;
    virtual Metric metric() const = 0;
    virtual std::string name() const = 0;

    virtual ~NeighbourIndex() = default;
};

std::unique_ptr<NeighbourIndex> make_index(SearchBackend backend,
                                           const double* data, size_t n,
                                           size_t dim, Metric metric);

}  // namespace frnn

#endif  // FRNN_NEIGHBOUR_INDEX_HPP
