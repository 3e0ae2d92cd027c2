#include <gtest/gtest.h>
#include "errors.hpp"
#include "kspec.hpp"

#include <cmath>
#include <limits>

using namespace frnn;

// 1. Every valid spec resolves into [1, N].
TEST(KSpec, ResolvedKWithinBounds) {
    const KSpec specs[] = {
        KSpec::fixed(1), KSpec::fixed(3), KSpec::fixed(1000),
        KSpec::fraction(0.01), KSpec::fraction(0.5), KSpec::fraction(1.0),
        KSpec::all(),
    };
    for (const KSpec& k : specs) {
        for (size_t n = 1; n <= 64; ++n) {
            size_t r = k.resolve(n);
            EXPECT_GE(r, 1u) << "k=" << k.to_string() << " N=" << n;
            EXPECT_LE(r, n) << "k=" << k.to_string() << " N=" << n;
        }
    }
}

TEST(KSpec, AllResolvesToN) {
    for (size_t n = 1; n <= 100; ++n)
        EXPECT_EQ(resolve(KSpec::all(), n), n);
}

// Integer k larger than the neighbourhood degrades to N rather than failing.
TEST(KSpec, FixedClampsToAvailable) {
    EXPECT_EQ(KSpec::fixed(5).resolve(3), 3u);
    EXPECT_EQ(KSpec::fixed(5).resolve(5), 5u);
    EXPECT_EQ(KSpec::fixed(5).resolve(50), 5u);
}

TEST(KSpec, FractionUsesCeiling) {
    EXPECT_EQ(KSpec::fraction(0.5).resolve(4), 2u);
    EXPECT_EQ(KSpec::fraction(0.5).resolve(5), 3u);
    EXPECT_EQ(KSpec::fraction(0.01).resolve(10), 1u);
    EXPECT_EQ(KSpec::fraction(1.0).resolve(7), 7u);
    // 0.3 * 10 is 3.0000000000000004 in binary floating point.
    EXPECT_EQ(KSpec::fraction(0.3).resolve(10), 3u);
    EXPECT_EQ(KSpec::fraction(0.1).resolve(30), 3u);
}

TEST(KSpec, RejectsInvalidSpecs) {
    EXPECT_THROW(KSpec::fixed(0), InvalidConfiguration);
    EXPECT_THROW(KSpec::fixed(-3), InvalidConfiguration);
    EXPECT_THROW(KSpec::fraction(0.0), InvalidConfiguration);
    EXPECT_THROW(KSpec::fraction(-0.2), InvalidConfiguration);
    EXPECT_THROW(KSpec::fraction(1.5), InvalidConfiguration);
    EXPECT_THROW(KSpec::fraction(std::numeric_limits<double>::quiet_NaN()),
                 InvalidConfiguration);
}

TEST(KSpec, ResolveRequiresNeighbours) {
    EXPECT_THROW(KSpec::all().resolve(0), InvalidConfiguration);
}

TEST(KSpec, ParsesTextForms) {
    EXPECT_EQ(KSpec::parse("all"), KSpec::all());
    EXPECT_EQ(KSpec::parse(" ALL "), KSpec::all());
    EXPECT_EQ(KSpec::parse("7"), KSpec::fixed(7));
    EXPECT_EQ(KSpec::parse("0.25"), KSpec::fraction(0.25));
    EXPECT_EQ(KSpec::parse("1.0").kind(), KSpec::Kind::Fraction);

    EXPECT_THROW(KSpec::parse(""), InvalidConfiguration);
    EXPECT_THROW(KSpec::parse("0"), InvalidConfiguration);
    EXPECT_THROW(KSpec::parse("-4"), InvalidConfiguration);
    EXPECT_THROW(KSpec::parse("2.5"), InvalidConfiguration);
    EXPECT_THROW(KSpec::parse("five"), InvalidConfiguration);
    EXPECT_THROW(KSpec::parse("3x"), InvalidConfiguration);
}

TEST(KSpec, ToStringRoundsThroughParse) {
    EXPECT_EQ(KSpec::fixed(12).to_string(), "12");
    EXPECT_EQ(KSpec::all().to_string(), "all");
    EXPECT_EQ(KSpec::parse(KSpec::fraction(0.5).to_string()), KSpec::fraction(0.5));
}
