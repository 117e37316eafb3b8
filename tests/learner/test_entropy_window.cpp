/// @file tests/learner/test_entropy_window.cpp
/// @brief Unit tests for EntropyWindow (rolling ΔH statistics).

#include <gtest/gtest.h>
#include "ska/entropy_window.hpp"
#include "ska/learner.hpp"

#include <cmath>
#include <limits>

using namespace ska;

TEST(EntropyWindow, EmptyWindowReportsZeros) {
    EntropyWindow w(10);
    const auto s = w.stats();
    EXPECT_EQ(s.count, 0u);
    EXPECT_EQ(s.mean, 0.0);
    EXPECT_EQ(s.variance, 0.0);
    EXPECT_EQ(s.roughness, 0.0);
}

TEST(EntropyWindow, MeanVarianceRoughnessOfKnownSeries) {
    EntropyWindow w(10);
    for (double v : {1.0, 2.0, 4.0, 7.0}) {
        w.push(v);
    }
    const auto s = w.stats();
    EXPECT_EQ(s.count, 4u);
    EXPECT_DOUBLE_EQ(s.mean, 3.5);
    // Σ(v − 3.5)² = 6.25 + 2.25 + 0.25 + 12.25 = 21 → 21 / 3
    EXPECT_DOUBLE_EQ(s.variance, 7.0);
    // Second differences: 4 − 4 + 1 = 1, 7 − 8 + 2 = 1
    EXPECT_DOUBLE_EQ(s.roughness, 1.0);
}

TEST(EntropyWindow, LinearSeriesHasZeroRoughness) {
    EntropyWindow w(50);
    for (int i = 0; i < 50; ++i) {
        w.push(0.5 * i);
    }
    EXPECT_NEAR(w.stats().roughness, 0.0, 1e-12);
}

TEST(EntropyWindow, EvictsOldestBeyondCapacity) {
    EntropyWindow w(3);
    for (double v : {100.0, 1.0, 2.0, 3.0}) {
        w.push(v);
    }
    EXPECT_EQ(w.size(), 3u);
    EXPECT_DOUBLE_EQ(w.stats().mean, 2.0);
}

TEST(EntropyWindow, IgnoresNonFiniteValues) {
    EntropyWindow w(5);
    w.push(1.0);
    w.push(std::numeric_limits<double>::quiet_NaN());
    w.push(std::numeric_limits<double>::infinity());
    EXPECT_EQ(w.size(), 1u);
}

TEST(EntropyWindow, ResetClears) {
    EntropyWindow w(5);
    w.push(1.0);
    w.push(2.0);
    w.reset();
    EXPECT_EQ(w.size(), 0u);
    EXPECT_EQ(w.window_size(), 5u);
}

TEST(EntropyWindow, ZeroWindowClampedToOne) {
    EntropyWindow w(0);
    EXPECT_EQ(w.window_size(), 1u);
    w.push(1.0);
    w.push(2.0);
    EXPECT_EQ(w.size(), 1u);
}

TEST(EntropyWindow, LearnerFeedsWindowEveryStep) {
    LearnerConfig cfg;
    cfg.performance_window = 16;
    SkaLearner learner(cfg);
    for (SequenceIndex n = 0; n < 40; ++n) {
        const double x = std::cos(0.1 * static_cast<double>(n));
        ASSERT_TRUE(learner.process(Sample{.sequence = n, .timestamp = 0.0, .value = x}));
    }
    EXPECT_EQ(learner.performance().count, 16u);
}
