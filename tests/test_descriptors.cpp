#include <gtest/gtest.h>
#include "data_generator.hpp"
#include "descriptors.hpp"
#include "errors.hpp"
#include "metrics.hpp"

#include <cmath>
#include <memory>
#include <random>
#include <vector>

using namespace frnn;

namespace {

Dataset line_points() {
    return Dataset(std::vector<double>{0.0, 1.0, 3.0}, 1);
}

std::vector<double> q1(std::initializer_list<double> v) { return v; }

}  // namespace

TEST(NND, KthNeighbourProximity) {
    auto m1 = NND().construct(line_points());
    auto s1 = m1->query(q1({5.0, 0.0}).data(), 2, 1);
    EXPECT_DOUBLE_EQ(s1[0], 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(s1[1], 1.0);

    NNDConfig cfg;
    cfg.k = KSpec::fixed(2);
    auto m2 = NND(cfg).construct(line_points());
    EXPECT_DOUBLE_EQ(m2->query(q1({5.0}).data(), 1, 1)[0], 1.0 / 5.0);
    EXPECT_EQ(m2->resolved_k(), 2u);
}

TEST(NND, OWAAggregatedProximity) {
    NNDConfig cfg;
    cfg.k = KSpec::fixed(2);
    cfg.trimmed = false;
    cfg.family = OWAFamily::Uniform;
    auto model = NND(cfg).construct(line_points());
    EXPECT_NEAR(model->query(q1({5.0}).data(), 1, 1)[0], (1.0 / 3.0 + 1.0 / 5.0) / 2.0, 1e-12);

    cfg.k = KSpec::all();
    cfg.family = OWAFamily::Strict;
    auto strict = NND(cfg).construct(line_points());
    EXPECT_EQ(strict->resolved_k(), 3u);
    EXPECT_DOUBLE_EQ(strict->query(q1({5.0}).data(), 1, 1)[0], 1.0 / 3.0);
}

TEST(LNND, LocalDistanceRatio) {
    auto model = LNND().construct(line_points());
    // 5: nearest is 3 at 2; 3's own nearest neighbour is 1 at 2 -> ratio 1.
    // 0.5: 0 and 1 tie, 0 ranks first; ratio 0.5 / 1.
    auto s = model->query(q1({5.0, 0.5}).data(), 2, 1);
    EXPECT_DOUBLE_EQ(s[0], 0.5);
    EXPECT_DOUBLE_EQ(s[1], 1.0 / 1.5);
}

TEST(LNND, ZeroDistancesToDuplicates) {
    auto model = LNND().construct(Dataset(std::vector<double>{0.0, 0.0, 5.0}, 1));
    auto s = model->query(q1({0.0, 0.5}).data(), 2, 1);
    EXPECT_DOUBLE_EQ(s[0], 0.5);   // 0 / 0 counts as ratio 1
    EXPECT_DOUBLE_EQ(s[1], 0.0);   // 0.5 / 0 is infinite
}

TEST(LOF, LocalOutlierFactor) {
    auto model = LOF().construct(line_points());
    auto s = model->query(q1({5.0, 0.0, 10.0}).data(), 3, 1);
    EXPECT_DOUBLE_EQ(s[0], 0.5);
    EXPECT_DOUBLE_EQ(s[1], 0.5);
    EXPECT_DOUBLE_EQ(s[2], 1.0 / 4.5);
}

// Inliers from the training distribution outscore far-away points.
TEST(Descriptors, RankOutliersBelowInliers) {
    const size_t dim = 6;
    Dataset all = generate_labeled_gaussians(900, dim, 1, 71);
    Dataset train(std::vector<double>(all.data(), all.row(800)), dim);

    std::vector<double> queries(all.row(800), all.row(800) + 100 * dim);
    std::mt19937 rng(72);
    std::uniform_real_distribution<double> far(60.0, 90.0);
    for (size_t i = 0; i < 100 * dim; ++i) queries.push_back(far(rng));
    std::vector<bool> positive(200, false);
    for (size_t i = 0; i < 100; ++i) positive[i] = true;

    LocalConfig local;
    local.k = KSpec::fixed(5);
    NNDConfig nnd;
    nnd.k = KSpec::fixed(5);

    std::vector<std::unique_ptr<DataDescriptor>> descriptors;
    descriptors.push_back(std::make_unique<NND>(nnd));
    descriptors.push_back(std::make_unique<LNND>(local));
    descriptors.push_back(std::make_unique<LOF>(local));

    for (const auto& d : descriptors) {
        auto model = d->construct(train);
        std::vector<double> scores = model->query(queries.data(), 200, dim);
        for (double s : scores) {
            EXPECT_GE(s, 0.0) << d->name();
            EXPECT_LE(s, 1.0) << d->name();
        }
        EXPECT_GT(auroc(scores, positive), 0.95) << d->name();
    }
}

TEST(Descriptors, ErrorTaxonomy) {
    EXPECT_THROW(NND().construct(Dataset()), InvalidInput);
    EXPECT_THROW(LNND().construct(Dataset(std::vector<double>{1.0}, 1)), InvalidInput);
    EXPECT_THROW(LOF().construct(Dataset(std::vector<double>{1.0}, 1)), InvalidInput);
    EXPECT_NO_THROW(NND().construct(Dataset(std::vector<double>{1.0}, 1)));

    auto model = LOF().construct(line_points());
    const double two[] = {1.0, 2.0};
    EXPECT_THROW(model->query(two, 1, 2), DimensionMismatch);
    EXPECT_NO_THROW(model->query(two, 2, 1));

    NNDConfig bad;
    bad.trimmed = false;
    bad.family = OWAFamily::Exponential;
    bad.decay = 0.0;
    EXPECT_THROW(NND{bad}, InvalidConfiguration);
}

TEST(Descriptors, NonFiniteQueryLeavesModelUsable) {
    std::vector<std::unique_ptr<DataDescriptor>> descriptors;
    descriptors.push_back(std::make_unique<NND>());
    descriptors.push_back(std::make_unique<LNND>());
    descriptors.push_back(std::make_unique<LOF>());

    for (const auto& d : descriptors) {
        auto model = d->construct(line_points());
        const double bad[] = {1.0, NAN};
        EXPECT_THROW(model->query(bad, 2, 1), InvalidInput) << d->name();
        const double inf[] = {INFINITY};
        EXPECT_THROW(model->query(inf, 1, 1), InvalidInput) << d->name();

        auto s = model->query(q1({1.0}).data(), 1, 1);
        EXPECT_GT(s[0], 0.0) << d->name();
    }
}

// Non-trimmed exponential NND with decay 1 averages like uniform.
TEST(NND, ExponentialDecayIsConfigurable) {
    NNDConfig cfg;
    cfg.k = KSpec::fixed(2);
    cfg.trimmed = false;
    cfg.family = OWAFamily::Exponential;
    cfg.decay = 1.0;
    auto model = NND(cfg).construct(line_points());
    EXPECT_NEAR(model->query(q1({5.0}).data(), 1, 1)[0], (1.0 / 3.0 + 1.0 / 5.0) / 2.0, 1e-12);
}
