#ifndef FRNN_KSPEC_HPP
#define FRNN_KSPEC_HPP

#include <cstddef>
#include <string>

namespace frnn {

/**
 * Requested neighbourhood size. Resolved against the number of neighbours
 * actually available to a query:
 *   Fixed(n)     -> min(n, N)
 *   Fraction(f)  -> ceil(f * N), clamped to [1, N]
 *   All          -> N
 */
class KSpec {
public:
    enum class Kind { Fixed, Fraction, All };

    static KSpec fixed(long long n);
    static KSpec fraction(double f);
    static KSpec all();

    // "all", an integer ("5") or a decimal fraction ("0.25").
    static KSpec parse(const std::string& text);

    Kind kind() const { return kind_; }

    size_t resolve(size_t available) const;

    std::string to_string() const;

    bool operator==(const KSpec& o) const {
        return kind_ == o.kind_ && count_ == o.count_ && fraction_ == o.fraction_;
    }
    bool operator!=(const KSpec& o) const { return !(*this == o); }

private:
    KSpec(Kind kind, long long count, double fraction)
        : kind_(kind), count_(count), fraction_(fraction) {}

    Kind kind_;
    long long count_;
    double fraction_;
};

// Free-function form; throws InvalidConfiguration when available == 0.
size_t resolve(const KSpec& k, size_t available);

}  // namespace frnn

#endif  // FRNN_KSPEC_HPP
