#ifndef FRNN_DISTANCE_HPP
#define FRNN_DISTANCE_HPP

#include <cstddef>
#include <string>

namespace frnn {

enum class Metric { Euclidean, Manhattan, Chebyshev };

Metric parse_metric(const std::string& text);
const char* metric_name(Metric metric);

double distance(Metric metric, const double* a, const double* b, size_t dim);

// Order-reversing map [0, inf) -> (0, 1]: 1 / (1 + d). inf -> 0.
inline double shifted_reciprocal(double d) {
    return 1.0 / (1.0 + d);
}

}  // namespace frnn

#endif  // FRNN_DISTANCE_HPP
