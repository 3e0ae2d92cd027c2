#include <gtest/gtest.h>
#include "classifier.hpp"
#include "data_generator.hpp"
#include "errors.hpp"
#include "metrics.hpp"
#include "predict.hpp"
#include "timer.hpp"

#include <cmath>
#include <vector>

using namespace frnn;

namespace {

Confidences make_conf(std::vector<int> classes, std::vector<double> scores) {
    Confidences c;
    c.n = scores.size() / classes.size();
    c.classes = std::move(classes);
    c.scores = std::move(scores);
    return c;
}

}  // namespace

TEST(SelectClass, ArgmaxWithSmallestLabelOnTies) {
    Confidences c = make_conf({2, 5, 9}, {
        0.1, 0.7, 0.2,
        0.4, 0.4, 0.2,
        0.0, 0.3, 0.3,
        0.0, 0.0, 0.0,
    });
    EXPECT_EQ(select_class(c), (std::vector<int>{5, 2, 5, 2}));
}

TEST(Threshold, MultiLabelDecision) {
    Confidences c = make_conf({1, 2, 3}, {
        0.6, 0.5, 0.1,
        0.2, 0.2, 0.2,
    });
    auto out = threshold(c, 0.5);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], (std::vector<int>{1, 2}));
    EXPECT_TRUE(out[1].empty());
    EXPECT_EQ(threshold(c, 0.0)[1], (std::vector<int>{1, 2, 3}));
}

TEST(Metrics, AccuracyAndBalancedAccuracy) {
    std::vector<int> truth = {0, 0, 0, 0, 1, 1};
    std::vector<int> pred  = {0, 0, 0, 0, 0, 1};
    EXPECT_DOUBLE_EQ(accuracy(pred, truth), 5.0 / 6.0);
    EXPECT_DOUBLE_EQ(balanced_accuracy(pred, truth), (1.0 + 0.5) / 2.0);

    EXPECT_THROW(accuracy({0, 1}, {0}), InvalidInput);
    EXPECT_THROW(balanced_accuracy({}, {}), InvalidInput);
}

TEST(Metrics, AurocWithTies) {
    EXPECT_DOUBLE_EQ(auroc({0.9, 0.8, 0.1, 0.2}, {true, true, false, false}), 1.0);
    EXPECT_DOUBLE_EQ(auroc({0.1, 0.2, 0.9, 0.8}, {true, true, false, false}), 0.0);
    // One positive tied with one negative counts half.
    EXPECT_DOUBLE_EQ(auroc({0.5, 0.5}, {true, false}), 0.5);
    EXPECT_DOUBLE_EQ(auroc({0.7, 0.5, 0.5}, {true, true, false}), 0.75);

    EXPECT_THROW(auroc({0.1, 0.2}, {true, true}), InvalidInput);
    EXPECT_THROW(auroc({0.1}, {true, false}), InvalidInput);
}

// Round-robin labels, deterministic per seed, per-class spread in [0.5, 2].
TEST(DataGenerator, LabeledGaussians) {
    const size_t n = 3000, dim = 4;
    const int nc = 3;
    Dataset a = generate_labeled_gaussians(n, dim, nc, 13);
    Dataset b = generate_labeled_gaussians(n, dim, nc, 13);
    EXPECT_EQ(a.features(), b.features());
    ASSERT_EQ(a.classes(), (std::vector<int>{0, 1, 2}));
    for (size_t i = 0; i < n; ++i) ASSERT_EQ(a.labels()[i], static_cast<int>(i % nc));

    for (int c = 0; c < nc; ++c) {
        std::vector<double> mean(dim, 0.0);
        size_t count = 0;
        for (size_t i = static_cast<size_t>(c); i < n; i += nc, ++count)
            for (size_t d = 0; d < dim; ++d) mean[d] += a.row(i)[d];
        for (double& m : mean) m /= static_cast<double>(count);

        double var = 0.0;
        for (size_t i = static_cast<size_t>(c); i < n; i += nc)
            for (size_t d = 0; d < dim; ++d) {
                double e = a.row(i)[d] - mean[d];
                var += e * e;
            }
        double sd = std::sqrt(var / static_cast<double>(count * dim));
        EXPECT_GT(sd, 0.45) << "class " << c;
        EXPECT_LT(sd, 2.1) << "class " << c;
    }

    EXPECT_THROW(generate_labeled_gaussians(0, dim, nc, 1), InvalidInput);
    EXPECT_THROW(generate_labeled_gaussians(10, dim, 0, 1), InvalidInput);
}

TEST(Stopwatch, MonotonicAndRestartable) {
    Stopwatch w;
    double a = w.elapsed_ms();
    double b = w.elapsed_ms();
    EXPECT_GE(a, 0.0);
    EXPECT_GE(b, a);
    w.restart();
    EXPECT_GE(w.elapsed_ms(), 0.0);
}
