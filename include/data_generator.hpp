#ifndef FRNN_DATA_GENERATOR_HPP
#define FRNN_DATA_GENERATOR_HPP

#include "dataset.hpp"
#include <cstddef>

namespace frnn {

// Labeled Gaussian blobs for tests and benchmarks.
// Class centres are uniform in [-10, 10]^dim; each class gets its own noise
// scale in [0.5, 2]. Labels 0..num_classes-1 are assigned round-robin, so
// the result is deterministic for a seed.
Dataset generate_labeled_gaussians(size_t n, size_t dim, int num_classes,
                                   unsigned seed);

}  // namespace frnn

#endif  // FRNN_DATA_GENERATOR_HPP
