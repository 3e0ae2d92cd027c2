#include "metrics.hpp"
#include "errors.hpp"
#include <algorithm>
#include <map>
#include <numeric>
#include <string>

namespace frnn {

namespace {

void check_sizes(size_t a, size_t b, const char* who) {
    if (a != b)
        throw InvalidInput(std::string(who) + ": size mismatch ("
                           + std::to_string(a) + " vs " + std::to_string(b) + ")");
    if (a == 0)
        throw InvalidInput(std::string(who) + ": empty input");
}

}  // namespace

double accuracy(const std::vector<int>& pred, const std::vector<int>& truth) {
    check_sizes(pred.size(), truth.size(), "accuracy");
    size_t correct = 0;
    for (size_t i = 0; i < pred.size(); ++i)
        if (pred[i] == truth[i]) ++correct;
    return static_cast<double>(correct) / static_cast<double>(pred.size());
}

double balanced_accuracy(const std::vector<int>& pred, const std::vector<int>& truth) {
    check_sizes(pred.size(), truth.size(), "balanced_accuracy");
    // label -> (hits, total)
    std::map<int, std::pair<size_t, size_t>> per_class;
    for (size_t i = 0; i < truth.size(); ++i) {
        auto& c = per_class[truth[i]];
        c.second++;
        if (pred[i] == truth[i]) c.first++;
    }
    double sum = 0.0;
    for (const auto& kv : per_class)
        sum += static_cast<double>(kv.second.first) / static_cast<double>(kv.second.second);
    return sum / static_cast<double>(per_class.size());
}

double auroc(const std::vector<double>& scores, const std::vector<bool>& positive) {
    check_sizes(scores.size(), positive.size(), "auroc");
    const size_t n = scores.size();

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t(0));
    std::sort(order.begin(), order.end(),
              [&scores](size_t a, size_t b) { return scores[a] < scores[b]; });

    // Mid-ranks (1-based) over tied groups.
    std::vector<double> rank(n);
    for (size_t i = 0; i < n;) {
        size_t j = i;
        while (j + 1 < n && scores[order[j + 1]] == scores[order[i]]) ++j;
        double mid = 0.5 * static_cast<double>(i + j) + 1.0;
        for (size_t t = i; t <= j; ++t) rank[order[t]] = mid;
        i = j + 1;
    }

    double pos = 0.0, rank_sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        if (positive[i]) {
            pos += 1.0;
            rank_sum += rank[i];
        }
    }
    double neg = static_cast<double>(n) - pos;
    if (pos == 0.0 || neg == 0.0)
        throw InvalidInput("auroc: need both positive and negative targets");
    return (rank_sum - pos * (pos + 1.0) / 2.0) / (pos * neg);
}

}  // namespace frnn
