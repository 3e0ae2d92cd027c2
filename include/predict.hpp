#ifndef FRNN_PREDICT_HPP
#define FRNN_PREDICT_HPP

#include "classifier.hpp"
#include <vector>

namespace frnn {

// Highest-scoring class per row; ties go to the smallest label.
std::vector<int> select_class(const Confidences& conf);

// Per row, every label scoring >= threshold, in ascending label order.
std::vector<std::vector<int>> threshold(const Confidences& conf, double t);

}  // namespace frnn

#endif  // FRNN_PREDICT_HPP
