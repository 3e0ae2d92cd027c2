#include "predict.hpp"
#include "errors.hpp"

namespace frnn {

std::vector<int> select_class(const Confidences& conf) {
    if (conf.classes.empty() && conf.n > 0)
        throw InvalidInput("select_class: confidences without classes");

    std::vector<int> labels(conf.n);
    const size_t c = conf.num_classes();
    for (size_t i = 0; i < conf.n; ++i) {
        const double* row = conf.row(i);
        size_t best = 0;
        for (size_t j = 1; j < c; ++j)
            if (row[j] > row[best]) best = j;
        labels[i] = conf.classes[best];
    }
    return labels;
}

std::vector<std::vector<int>> threshold(const Confidences& conf, double t) {
    std::vector<std::vector<int>> out(conf.n);
    const size_t c = conf.num_classes();
    for (size_t i = 0; i < conf.n; ++i) {
        const double* row = conf.row(i);
        for (size_t j = 0; j < c; ++j)
            if (row[j] >= t) out[i].push_back(conf.classes[j]);
    }
    return out;
}

}  // namespace frnn
