#ifndef FRNN_METRICS_HPP
#define FRNN_METRICS_HPP

#include <cstddef>
#include <vector>

namespace frnn {

// Fraction of positions where pred == truth.
double accuracy(const std::vector<int>& pred, const std::vector<int>& truth);

// Mean recall over the classes present in truth.
double balanced_accuracy(const std::vector<int>& pred, const std::vector<int>& truth);

// Area under the ROC curve for scores against binary targets (true = positive),
// via the Mann-Whitney statistic with mid-ranks for tied scores. Requires at
// least one positive and one negative.
double auroc(const std::vector<double>& scores, const std::vector<bool>& positive);

}  // namespace frnn

#endif  // FRNN_METRICS_HPP
