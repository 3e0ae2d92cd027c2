#include "distance.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace frnn {

Metric parse_metric(const std::string& text) {
    std::string t(text);
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (t == "euclidean" || t == "l2") return Metric::Euclidean;
    if (t == "manhattan" || t == "l1" || t == "cityblock") return Metric::Manhattan;
    if (t == "chebyshev" || t == "linf") return Metric::Chebyshev;
    throw InvalidConfiguration("parse_metric: unknown distance metric '" + text + "'");
}

const char* metric_name(Metric metric) {
    switch (metric) {
    case Metric::Euclidean: return "euclidean";
    case Metric::Manhattan: return "manhattan";
    case Metric::Chebyshev: return "chebyshev";
    }
    return "unknown";
}

double distance(Metric metric, const double* a, const double* b, size_t dim) {
    double s = 0.0;
    switch (metric) {
    case Metric::Euclidean:
        for (size_t j = 0; j < dim; ++j) {
            double d = a[j] - b[j];
            s += d * d;
        }
        return std::sqrt(s);
    case Metric::Manhattan:
        for (size_t j = 0; j < dim; ++j) s += std::fabs(a[j] - b[j]);
        return s;
    case Metric::Chebyshev:
        for (size_t j = 0; j < dim; ++j) s = std::max(s, std::fabs(a[j] - b[j]));
        return s;
    }
    return s;
}

}  // namespace frnn
