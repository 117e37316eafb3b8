/// @file tests/learner/test_ska_learner.cpp
/// @brief Unit tests for the SKA learning core.
///
/// Test categories:
///   - Sigmoid stability and range
///   - First step: no knowledge or entropy, weights unchanged
///   - Hand-computed second step (decision, ΔD, ΔH, weight update)
///   - Clipping and saturation accounting
///   - Divergence and out-of-order rejection leave the state untouched
///   - Seeded initial weights and determinism
///   - Built-in strategies and custom strategy injection
///   - restore() / reset()

#include <gtest/gtest.h>
#include "ska/learner.hpp"

#include <cmath>
#include <limits>
#include <numbers>
#include <vector>

using namespace ska;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static Sample sample_at(SequenceIndex n, double value) {
    return Sample{.sequence = n, .timestamp = static_cast<double>(n) * 0.1, .value = value};
}

/// Learner with deterministic weight w = `weight`.
static LearnerConfig fixed_weight(double weight, double alpha = 0.1) {
    LearnerConfig cfg;
    cfg.initial_weight_mean = weight;
    cfg.initial_weight_std  = 0.0;
    cfg.learning_rate       = alpha;
    return cfg;
}

static double logistic(double a) { return 1.0 / (1.0 + std::exp(-a)); }

static std::vector<double> cosine(std::size_t n, double omega_eps) {
    std::vector<double> xs(n);
    for (std::size_t i = 0; i < n; ++i) {
        xs[i] = std::cos(omega_eps * static_cast<double>(i));
    }
    return xs;
}

// ─── Sigmoid ──────────────────────────────────────────────────────────────────

TEST(SkaLearnerSigmoid, MatchesLogisticAndStaysInOpenInterval) {
    for (double a : {-30.0, -5.0, -0.5, 0.0, 0.5, 5.0, 30.0}) {
        const double d = SkaLearner::sigmoid(a);
        EXPECT_GT(d, 0.0);
        EXPECT_LT(d, 1.0);
        EXPECT_NEAR(d, logistic(a), 1e-15);
    }
    EXPECT_DOUBLE_EQ(SkaLearner::sigmoid(0.0), 0.5);
}

TEST(SkaLearnerSigmoid, NoOverflowForLargeMagnitudes) {
    EXPECT_TRUE(std::isfinite(SkaLearner::sigmoid(-1000.0)));
    EXPECT_TRUE(std::isfinite(SkaLearner::sigmoid(1000.0)));
}

// ─── Step arithmetic ──────────────────────────────────────────────────────────

TEST(SkaLearnerStep, FirstStepHasNoKnowledgeOrEntropy) {
    SkaLearner learner(fixed_weight(0.5));
    const auto out = learner.process(sample_at(0, 1.0));
    ASSERT_TRUE(out.has_value());
    EXPECT_DOUBLE_EQ(out->decision, logistic(0.5));
    EXPECT_DOUBLE_EQ(out->knowledge, 0.0);
    EXPECT_DOUBLE_EQ(out->entropy, 0.0);
    EXPECT_DOUBLE_EQ(learner.state().weights(0), 0.5);
    EXPECT_EQ(learner.state().step, 1u);
    EXPECT_TRUE(learner.state().has_history);
}

TEST(SkaLearnerStep, SecondStepMatchesHandComputation) {
    const double w0    = 0.5;
    const double alpha = 0.1;
    SkaLearner learner(fixed_weight(w0, alpha));
    ASSERT_TRUE(learner.process(sample_at(0, 1.0)).has_value());
    const auto out = learner.process(sample_at(1, 0.5));
    ASSERT_TRUE(out.has_value());

    const double d1      = logistic(w0 * 1.0);
    const double d2      = logistic(w0 * 0.5);
    const double delta_d = std::abs(d2 - d1);
    const double delta_h = -(1.0 / std::numbers::ln2) * 0.5 * delta_d;
    const double g       = -delta_h * d2 * (1.0 - d2) * 0.5;

    EXPECT_NEAR(out->decision, d2, 1e-15);
    EXPECT_NEAR(out->knowledge, delta_d, 1e-15);
    EXPECT_NEAR(out->entropy, delta_h, 1e-15);
    EXPECT_NEAR(learner.state().weights(0), w0 + alpha * g, 1e-15);
    EXPECT_EQ(out->sequence, 1u);
    EXPECT_DOUBLE_EQ(out->timestamp, 0.1);
    EXPECT_DOUBLE_EQ(out->value, 0.5);
}

TEST(SkaLearnerStep, KnowledgeIsMonotone) {
    LearnerConfig cfg;
    cfg.seed = 3;
    SkaLearner learner(cfg);
    const auto xs = cosine(2'000, 0.015);
    double prev = 0.0;
    for (std::size_t i = 0; i < xs.size(); ++i) {
        const auto out = learner.process(sample_at(i, xs[i]));
        ASSERT_TRUE(out.has_value());
        ASSERT_GE(out->knowledge, prev);
        prev = out->knowledge;
    }
}

TEST(SkaLearnerStep, ZeroLearningRateFreezesWeights) {
    SkaLearner learner(fixed_weight(0.8, 0.0));
    const auto xs = cosine(500, 0.1);
    for (std::size_t i = 0; i < xs.size(); ++i) {
        ASSERT_TRUE(learner.process(sample_at(i, xs[i])).has_value());
    }
    EXPECT_DOUBLE_EQ(learner.state().weights(0), 0.8);
}

TEST(SkaLearnerStep, PureStepDoesNotMutateInput) {
    const auto cfg      = fixed_weight(0.3);
    const auto strategy = LearningStrategy::from_config(cfg);
    const auto s0       = SkaLearner::initial_state(cfg);
    const auto t1 = SkaLearner::step(s0, sample_at(0, 2.0), cfg, strategy);
    ASSERT_TRUE(t1.has_value());
    const auto t2 = SkaLearner::step(t1->state, sample_at(1, -1.0), cfg, strategy);
    ASSERT_TRUE(t2.has_value());
    EXPECT_EQ(s0.step, 0u);
    EXPECT_EQ(t1->state.step, 1u);
    EXPECT_EQ(t2->state.step, 2u);

    const auto again = SkaLearner::step(t1->state, sample_at(1, -1.0), cfg, strategy);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->output.entropy, t2->output.entropy);
    EXPECT_EQ(again->state.weights(0), t2->state.weights(0));
}

// ─── Clipping ─────────────────────────────────────────────────────────────────

TEST(SkaLearnerClip, SaturationIsClippedAndCounted) {
    auto cfg = fixed_weight(100.0, 0.0);
    cfg.clip_bound = 10.0;
    SkaLearner learner(cfg);

    const auto hi = learner.process(sample_at(0, 1.0));
    ASSERT_TRUE(hi.has_value());
    EXPECT_DOUBLE_EQ(hi->decision, logistic(10.0));
    EXPECT_LT(hi->decision, 1.0);

    const auto lo = learner.process(sample_at(1, -1.0));
    ASSERT_TRUE(lo.has_value());
    EXPECT_NEAR(lo->decision, logistic(-10.0), 1e-18);
    EXPECT_GT(lo->decision, 0.0);

    const auto mid = learner.process(sample_at(2, 0.01));
    ASSERT_TRUE(mid.has_value());
    EXPECT_EQ(learner.state().saturations, 2u);
}

TEST(SkaLearnerClip, TransitionFlagsSaturation) {
    auto cfg = fixed_weight(50.0);
    cfg.clip_bound = 5.0;
    const auto t = SkaLearner::step(SkaLearner::initial_state(cfg), sample_at(0, 1.0), cfg,
                                    LearningStrategy::from_config(cfg));
    ASSERT_TRUE(t.has_value());
    EXPECT_TRUE(t->saturated);
    EXPECT_EQ(t->state.saturations, 1u);
}

// ─── Failure handling ─────────────────────────────────────────────────────────

TEST(SkaLearnerFailure, NonFiniteInputRejectedWithoutStateChange) {
    SkaLearner learner(fixed_weight(0.5));
    ASSERT_TRUE(learner.process(sample_at(0, 1.0)).has_value());
    const auto before = learner.state();

    EXPECT_FALSE(learner.process(sample_at(1, std::numeric_limits<double>::quiet_NaN())));
    EXPECT_EQ(learner.last_fault(), StepFault::NonFinite);
    EXPECT_FALSE(learner.process(sample_at(1, std::numeric_limits<double>::infinity())));

    EXPECT_EQ(learner.state().step, before.step);
    EXPECT_EQ(learner.state().weights(0), before.weights(0));
    EXPECT_EQ(learner.last_sequence(), std::optional<SequenceIndex>(0));
}

TEST(SkaLearnerFailure, NonFiniteUpdateIsDivergence) {
    LearningStrategy poison{
        .entropy_feature = strategies::position_feature,
        .update = [](const FeatureVector& phi, double, double) -> WeightVector {
            return WeightVector::Constant(phi.size(), std::numeric_limits<double>::infinity());
        },
    };
    SkaLearner learner(fixed_weight(0.5), poison);
    EXPECT_FALSE(learner.process(sample_at(0, 1.0)).has_value());
    EXPECT_EQ(learner.last_fault(), StepFault::NonFinite);
    EXPECT_EQ(learner.state().step, 0u);
}

TEST(SkaLearnerFailure, OutOfOrderSequenceRejected) {
    SkaLearner learner(fixed_weight(0.5));
    ASSERT_TRUE(learner.process(sample_at(5, 1.0)).has_value());
    EXPECT_FALSE(learner.process(sample_at(5, 0.9)).has_value());
    EXPECT_EQ(learner.last_fault(), StepFault::OutOfOrder);
    EXPECT_FALSE(learner.process(sample_at(3, 0.9)).has_value());
    EXPECT_TRUE(learner.process(sample_at(6, 0.9)).has_value());
    EXPECT_EQ(learner.last_fault(), StepFault::None);
}

// ─── Initialization and determinism ───────────────────────────────────────────

TEST(SkaLearnerInit, ZeroStdGivesExactMean) {
    auto cfg = fixed_weight(0.25);
    cfg.bias = true;
    const auto s = SkaLearner::initial_state(cfg);
    ASSERT_EQ(s.weights.size(), 2);
    EXPECT_EQ(s.weights(0), 0.25);
    EXPECT_EQ(s.weights(1), 0.25);
    EXPECT_EQ(s.knowledge, 0.0);
    EXPECT_FALSE(s.has_history);
    EXPECT_TRUE(s.is_consistent());
}

TEST(SkaLearnerInit, SeedControlsWeights) {
    LearnerConfig a;
    a.seed = 11;
    LearnerConfig b = a;
    LearnerConfig c = a;
    c.seed = 12;
    EXPECT_EQ(SkaLearner::initial_state(a).weights(0), SkaLearner::initial_state(b).weights(0));
    EXPECT_NE(SkaLearner::initial_state(a).weights(0), SkaLearner::initial_state(c).weights(0));
}

TEST(SkaLearnerInit, IdenticalConfigGivesIdenticalOutputs) {
    LearnerConfig cfg;
    cfg.seed = 99;
    cfg.bias = true;
    SkaLearner a(cfg);
    SkaLearner b(cfg);
    const auto xs = cosine(1'000, 0.03);
    for (std::size_t i = 0; i < xs.size(); ++i) {
        const auto oa = a.process(sample_at(i, xs[i]));
        const auto ob = b.process(sample_at(i, xs[i]));
        ASSERT_TRUE(oa && ob);
        ASSERT_EQ(oa->decision, ob->decision);
        ASSERT_EQ(oa->entropy, ob->entropy);
        ASSERT_EQ(oa->knowledge, ob->knowledge);
    }
}

// ─── Strategies ───────────────────────────────────────────────────────────────

TEST(SkaLearnerStrategy, PositionFeatureScalesValue) {
    EntropyContext ctx{.value = 0.4, .previous_value = 0.9, .has_history = true, .scale = 2.0};
    EXPECT_DOUBLE_EQ(strategies::position_feature(ctx), 0.8);
}

TEST(SkaLearnerStrategy, ReturnFeatureIsNegativeAbsoluteReturn) {
    EntropyContext ctx{.value = 0.4, .previous_value = 0.9, .has_history = true, .scale = 2.0};
    EXPECT_DOUBLE_EQ(strategies::return_feature(ctx), -1.0);
    ctx.has_history = false;
    EXPECT_DOUBLE_EQ(strategies::return_feature(ctx), 0.0);
}

TEST(SkaLearnerStrategy, HebbianRule) {
    FeatureVector phi(2);
    phi << 2.0, 1.0;
    const auto g = strategies::hebbian(phi, 0.75, 123.0);
    EXPECT_DOUBLE_EQ(g(0), 0.5);
    EXPECT_DOUBLE_EQ(g(1), 0.25);
}

TEST(SkaLearnerStrategy, EntropyDescentRule) {
    FeatureVector phi(1);
    phi << 2.0;
    const auto g = strategies::entropy_descent(phi, 0.5, -0.1);
    EXPECT_DOUBLE_EQ(g(0), 0.1 * 0.25 * 2.0);
}

TEST(SkaLearnerStrategy, ConfigSelectsBuiltins) {
    LearnerConfig cfg;
    cfg.feature = EntropyFeature::Return;
    cfg.rule    = UpdateRule::Hebbian;
    const auto s = LearningStrategy::from_config(cfg);
    EntropyContext ctx{.value = 1.0, .previous_value = 0.5, .has_history = true, .scale = 1.0};
    EXPECT_DOUBLE_EQ(s.entropy_feature(ctx), -0.5);
    FeatureVector phi(1);
    phi << 1.0;
    EXPECT_DOUBLE_EQ(s.update(phi, 0.9, 0.0)(0), 0.4);
}

TEST(SkaLearnerStrategy, CustomStrategyIsUsed) {
    int feature_calls = 0;
    LearningStrategy custom{
        .entropy_feature = [&feature_calls](const EntropyContext&) {
            ++feature_calls;
            return 1.0;
        },
        .update = [](const FeatureVector& phi, double, double) -> WeightVector {
            return WeightVector::Ones(phi.size());
        },
    };
    SkaLearner learner(fixed_weight(0.0, 0.5), custom);
    ASSERT_TRUE(learner.process(sample_at(0, 1.0)).has_value());
    ASSERT_TRUE(learner.process(sample_at(1, 1.0)).has_value());
    EXPECT_EQ(feature_calls, 2);
    EXPECT_DOUBLE_EQ(learner.state().weights(0), 1.0);
}

TEST(SkaLearnerStrategy, BiasFeatureAppendsOne) {
    const auto phi = SkaLearner::features(0.3, true);
    ASSERT_EQ(phi.size(), 2);
    EXPECT_DOUBLE_EQ(phi(0), 0.3);
    EXPECT_DOUBLE_EQ(phi(1), 1.0);
    EXPECT_EQ(SkaLearner::features(0.3, false).size(), 1);
}

// ─── restore / reset ──────────────────────────────────────────────────────────

TEST(SkaLearnerRestore, RestoredLearnerContinuesIdentically) {
    LearnerConfig cfg;
    cfg.seed = 5;
    SkaLearner full(cfg);
    SkaLearner part(cfg);
    const auto xs = cosine(600, 0.02);

    for (std::size_t i = 0; i < 300; ++i) {
        ASSERT_TRUE(full.process(sample_at(i, xs[i])));
        ASSERT_TRUE(part.process(sample_at(i, xs[i])));
    }
    SkaLearner resumed(cfg);
    ASSERT_TRUE(resumed.restore(part.state(), 299));
    for (std::size_t i = 300; i < xs.size(); ++i) {
        const auto a = full.process(sample_at(i, xs[i]));
        const auto b = resumed.process(sample_at(i, xs[i]));
        ASSERT_TRUE(a && b);
        ASSERT_EQ(a->entropy, b->entropy);
    }
    EXPECT_EQ(full.state().weights(0), resumed.state().weights(0));
    EXPECT_EQ(full.state().knowledge, resumed.state().knowledge);
}

TEST(SkaLearnerRestore, RejectsInconsistentState) {
    SkaLearner learner(fixed_weight(0.5));
    auto bad = learner.state();
    bad.knowledge = -1.0;
    EXPECT_FALSE(learner.restore(bad, 10));

    bad = learner.state();
    bad.weights(0) = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(learner.restore(bad, 10));

    bad = learner.state();
    bad.last_decision = 1.0;
    EXPECT_FALSE(learner.restore(bad, 10));

    EXPECT_FALSE(learner.last_sequence().has_value());
}

TEST(SkaLearnerRestore, RejectsDimensionMismatch) {
    SkaLearner learner(fixed_weight(0.5));
    auto other = learner.state();
    other.weights = WeightVector::Zero(2);
    EXPECT_FALSE(learner.restore(other, 0));
}

TEST(SkaLearnerRestore, ResetReturnsToColdStart) {
    LearnerConfig cfg;
    SkaLearner learner(cfg);
    const double w0 = learner.state().weights(0);
    const auto xs = cosine(100, 0.1);
    for (std::size_t i = 0; i < xs.size(); ++i) {
        ASSERT_TRUE(learner.process(sample_at(i, xs[i])));
    }
    learner.reset();
    EXPECT_EQ(learner.state().weights(0), w0);
    EXPECT_EQ(learner.state().step, 0u);
    EXPECT_EQ(learner.state().knowledge, 0.0);
    EXPECT_FALSE(learner.last_sequence().has_value());
    EXPECT_EQ(learner.performance().count, 0u);
}
