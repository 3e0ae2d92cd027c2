#include "owa.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>
#include <numeric>

namespace frnn {

OWAFamily parse_owa_family(const std::string& text) {
    std::string t(text);
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (t == "strict") return OWAFamily::Strict;
    if (t == "linear" || t == "additive") return OWAFamily::Linear;
    if (t == "exponential") return OWAFamily::Exponential;
    if (t == "invadd") return OWAFamily::InvAdd;
    if (t == "uniform" || t == "mean") return OWAFamily::Uniform;
    throw InvalidConfiguration("parse_owa_family: unknown weighting family '" + text + "'");
}

const char* owa_family_name(OWAFamily family) {
    switch (family) {
    case OWAFamily::Strict: return "strict";
    case OWAFamily::Linear: return "linear";
    case OWAFamily::Exponential: return "exponential";
    case OWAFamily::InvAdd: return "invadd";
    case OWAFamily::Uniform: return "uniform";
    }
    return "unknown";
}

OWAOperator::OWAOperator(OWAFamily family, double decay)
    : family_(family), decay_(decay) {
    if (family_ == OWAFamily::Exponential && !(decay_ > 0.0 && decay_ <= 1.0))
        throw InvalidConfiguration("OWAOperator: exponential decay must be in (0, 1]");
}

std::vector<double> OWAOperator::weights(size_t k) const {
    if (k == 0)
        throw InvalidConfiguration("OWAOperator::weights: k must be >= 1");

    std::vector<double> w(k, 0.0);
    const double kd = static_cast<double>(k);

    switch (family_) {
    case OWAFamily::Strict:
        w[0] = 1.0;
        return w;
    case OWAFamily::Linear:
        for (size_t i = 0; i < k; ++i)
            w[i] = 2.0 * (kd - static_cast<double>(i)) / (kd * (kd + 1.0));
        break;
    case OWAFamily::Exponential: {
        double p = 1.0;
        for (size_t i = 0; i < k; ++i) {
            w[i] = p;
            p *= decay_;
        }
        break;
    }
    case OWAFamily::InvAdd:
        for (size_t i = 0; i < k; ++i)
            w[i] = 1.0 / static_cast<double>(i + 1);
        break;
    case OWAFamily::Uniform:
        std::fill(w.begin(), w.end(), 1.0 / kd);
        return w;
    }

    double total = std::accumulate(w.begin(), w.end(), 0.0);
    for (double& x : w) x /= total;
    return w;
}

double OWAOperator::soft_max(const double* values, size_t n, size_t k) const {
    if (values == nullptr || n == 0)
        throw InvalidInput("OWAOperator::soft_max: empty input");
    size_t m = std::min(k, n);
    std::vector<double> v(values, values + n);
    std::partial_sort(v.begin(), v.begin() + m, v.end(), std::greater<double>());
    std::vector<double> w = weights(m);
    double s = 0.0;
    for (size_t i = 0; i < m; ++i) s += w[i] * v[i];
    return s;
}

double OWAOperator::soft_max(const std::vector<double>& values, size_t k) const {
    return soft_max(values.data(), values.size(), k);
}

double OWAOperator::soft_min(const double* values, size_t n, size_t k) const {
    if (values == nullptr || n == 0)
        throw InvalidInput("OWAOperator::soft_min: empty input");
    size_t m = std::min(k, n);
    std::vector<double> v(values, values + n);
    std::partial_sort(v.begin(), v.begin() + m, v.end());
    std::vector<double> w = weights(m);
    double s = 0.0;
    for (size_t i = 0; i < m; ++i) s += w[i] * v[i];
    return s;
}

double OWAOperator::soft_min(const std::vector<double>& values, size_t k) const {
    return soft_min(values.data(), values.size(), k);
}

std::string OWAOperator::name(size_t k) const {
    return std::string(owa_family_name(family_)) + "(" + std::to_string(k) + ")";
}

}  // namespace frnn
