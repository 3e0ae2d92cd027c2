#include "kspec.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace frnn {

namespace {

// Keeps products like 0.3 * 10 from rounding up to 4.
constexpr double kCeilSlack = 1e-9;

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

}  // namespace

KSpec KSpec::fixed(long long n) {
    if (n <= 0)
        throw InvalidConfiguration("KSpec::fixed: k must be a positive integer, got "
                                   + std::to_string(n));
    return KSpec(Kind::Fixed, n, 0.0);
}

KSpec KSpec::fraction(double f) {
    if (!(f > 0.0 && f <= 1.0))
        throw InvalidConfiguration("KSpec::fraction: fraction must be in (0, 1], got "
                                   + std::to_string(f));
    return KSpec(Kind::Fraction, 0, f);
}

KSpec KSpec::all() {
    return KSpec(Kind::All, 0, 0.0);
}

KSpec KSpec::parse(const std::string& text) {
    std::string t = trim(text);
    if (t.empty())
        throw InvalidConfiguration("KSpec::parse: empty k specification");

    std::string lower(t);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "all")
        return all();

    const char* begin = t.c_str();
    char* end = nullptr;
    if (t.find_first_of(".eE") == std::string::npos) {
        long long n = std::strtoll(begin, &end, 10);
        if (end == begin || *end != '\0')
            throw InvalidConfiguration("KSpec::parse: unrecognised k '" + text + "'");
        return fixed(n);
    }

    double f = std::strtod(begin, &end);
    if (end == begin || *end != '\0')
        throw InvalidConfiguration("KSpec::parse: unrecognised k '" + text + "'");
    return fraction(f);
}

size_t KSpec::resolve(size_t available) const {
    if (available == 0)
        throw InvalidConfiguration("KSpec::resolve: no neighbours available");

    switch (kind_) {
    case Kind::Fixed:
        return std::min(static_cast<size_t>(count_), available);
    case Kind::Fraction: {
        double want = fraction_ * static_cast<double>(available);
        double k = std::ceil(want - kCeilSlack * want);
        if (k < 1.0) return 1;
        if (k > static_cast<double>(available)) return available;
        return static_cast<size_t>(k);
    }
    case Kind::All:
        return available;
    }
    throw InvalidConfiguration("KSpec::resolve: unknown k kind");
}

std::string KSpec::to_string() const {
    switch (kind_) {
    case Kind::Fixed:
        return std::to_string(count_);
    case Kind::Fraction: {
        std::ostringstream os;
        os << fraction_;
        return os.str();
    }
    case Kind::All:
        return "all";
    }
    return "?";
}

size_t resolve(const KSpec& k, size_t available) {
    return k.resolve(available);
}

}  // namespace frnn
