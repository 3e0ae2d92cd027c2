#ifndef FRNN_OWA_HPP
#define FRNN_OWA_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace frnn {

/**
 * Weight families for ordered weighted averaging. Weights are always given in
 * rank order: rank 1 is the most relevant value (the largest one for a soft
 * maximum, the nearest neighbour for neighbour aggregation). Every family is
 * non-negative, sums to 1 and is non-increasing by rank.
 *
 *   strict       [1, 0, ..., 0]
 *   linear       w_i = 2 (k + 1 - i) / (k (k + 1))      (a.k.a. additive)
 *   exponential  w_i ~ decay^(i - 1), normalised
 *   invadd       w_i = (1 / i) / H_k
 *   uniform      w_i = 1 / k                            (a.k.a. mean)
 */
enum class OWAFamily { Strict, Linear, Exponential, InvAdd, Uniform };

OWAFamily parse_owa_family(const std::string& text);
const char* owa_family_name(OWAFamily family);

class OWAOperator {
public:
    explicit OWAOperator(OWAFamily family, double decay = 0.5);

    /** k weights in rank order. Pure; recomputed on every call. */
    std::vector<double> weights(size_t k) const;

    // Weighted average of the k largest values, largest first.
    double soft_max(const double* values, size_t n, size_t k) const;
    double soft_max(const std::vector<double>& values, size_t k) const;

    // Weighted average of the k smallest values; the smallest one receives
    // the rank-1 weight.
    double soft_min(const double* values, size_t n, size_t k) const;
    double soft_min(const std::vector<double>& values, size_t k) const;

    OWAFamily family() const { return family_; }
    double decay() const { return decay_; }

    // e.g. "linear(5)".
    std::string name(size_t k) const;

    bool operator==(const OWAOperator& o) const {
        return family_ == o.family_ && decay_ == o.decay_;
    }

private:
    OWAFamily family_;
    double decay_;
};

}  // namespace frnn

#endif  // FRNN_OWA_HPP
