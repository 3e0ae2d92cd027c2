#include "data_generator.hpp"
#include "errors.hpp"
#include <random>
#include <utility>
#include <vector>

namespace frnn {

Dataset generate_labeled_gaussians(size_t n, size_t dim, int num_classes,
                                   unsigned seed) {
    if (n == 0 || dim == 0 || num_classes <= 0)
        throw InvalidInput("generate_labeled_gaussians: invalid parameters");

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> mean_dist(-10.0, 10.0);
    std::uniform_real_distribution<double> scale_dist(0.5, 2.0);

    const size_t nc = static_cast<size_t>(num_classes);
    std::vector<double> centres(nc * dim);
    std::vector<double> scales(nc);
    for (size_t g = 0; g < nc; ++g) {
        scales[g] = scale_dist(rng);
        for (size_t d = 0; d < dim; ++d)
            centres[g * dim + d] = mean_dist(rng);
    }

    std::vector<double> features(n * dim);
    std::vector<int> labels(n);
    std::normal_distribution<double> noise(0.0, 1.0);

    for (size_t i = 0; i < n; ++i) {
        size_t g = i % nc;
        const double* c = centres.data() + g * dim;
        double* row = features.data() + i * dim;
        for (size_t d = 0; d < dim; ++d)
            row[d] = c[d] + scales[g] * noise(rng);
        labels[i] = static_cast<int>(g);
    }

    return Dataset(std::move(features), dim, std::move(labels));
}

}  // namespace frnn
