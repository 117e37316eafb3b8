/// @file src/learner/ska_learner.cpp
/// @brief SkaLearner — pure SKA transition and its stateful wrapper.

#include "ska/learner.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <utility>

namespace ska {

// ─── LearnerState::is_consistent ──────────────────────────────────────────────

bool LearnerState::is_consistent() const noexcept {
    if (weights.size() == 0 || !weights.allFinite()) {
        return false;
    }
    if (!std::isfinite(knowledge) || knowledge < 0.0) {
        return false;
    }
    if (!std::isfinite(clip_bound) || clip_bound <= 0.0 ||
        clip_bound > constants::MAX_CLIP_BOUND) {
        return false;
    }
    if (!std::isfinite(learning_rate) || learning_rate < 0.0) {
        return false;
    }
    if (!std::isfinite(last_value)) {
        return false;
    }
    // d is strictly inside (0, 1) by construction.
    return std::isfinite(last_decision) && last_decision > 0.0 && last_decision < 1.0;
}

// ─── Construction ─────────────────────────────────────────────────────────────

SkaLearner::SkaLearner(const LearnerConfig& config)
    : SkaLearner(config, LearningStrategy::from_config(config)) {}

SkaLearner::SkaLearner(const LearnerConfig& config, LearningStrategy strategy)
    : config_(config)
    , strategy_(std::move(strategy))
    , state_(initial_state(config))
    , window_(config.performance_window)
{}

LearnerState SkaLearner::initial_state(const LearnerConfig& config) {
    const auto dim = static_cast<Eigen::Index>(config.feature_dimension());

    WeightVector w = WeightVector::Constant(dim, config.initial_weight_mean);
    if (config.initial_weight_std > 0.0) {
        std::mt19937_64 rng(config.seed);
        std::normal_distribution<double> dist(config.initial_weight_mean,
                                              config.initial_weight_std);
        for (Eigen::Index i = 0; i < dim; ++i) {
            w(i) = dist(rng);
        }
    }

    LearnerState s;
    s.weights       = std::move(w);
    s.clip_bound    = config.clip_bound;
    s.learning_rate = config.learning_rate;
    return s;
}

// ─── Static helpers ───────────────────────────────────────────────────────────

FeatureVector SkaLearner::features(double value, bool bias) {
    FeatureVector phi(bias ? 2 : 1);
    phi(0) = value;
    if (bias) {
        phi(1) = 1.0;
    }
    return phi;
}

double SkaLearner::sigmoid(double activation) noexcept {
    if (activation >= 0.0) {
        return 1.0 / (1.0 + std::exp(-activation));
    }
    const double e = std::exp(activation);
    return e / (1.0 + e);
}

// ─── step ─────────────────────────────────────────────────────────────────────

std::optional<Transition>
SkaLearner::step(const LearnerState&     state,
                 const Sample&           sample,
                 const LearnerConfig&    config,
                 const LearningStrategy& strategy) {
    if (!std::isfinite(sample.value)) {
        return std::nullopt;
    }

    // ── 1. Clipped activation ────────────────────────────────────────────────
    const FeatureVector phi = features(sample.value, config.bias);
    if (phi.size() != state.weights.size()) {
        return std::nullopt;
    }
    const double raw = state.weights.dot(phi);
    if (std::isnan(raw)) {
        return std::nullopt;
    }
    const double c         = state.clip_bound;
    const bool   saturated = std::abs(raw) > c;
    const double a         = std::clamp(raw, -c, c);

    // ── 2. Decision ──────────────────────────────────────────────────────────
    const double d = sigmoid(a);

    // ── 3. Knowledge increment (change in decision confidence) ───────────────
    const double delta_d = state.has_history ? std::abs(d - state.last_decision) : 0.0;

    // ── 4. Entropy increment ─────────────────────────────────────────────────
    const double z = strategy.entropy_feature(EntropyContext{
        .value          = sample.value,
        .previous_value = state.last_value,
        .has_history    = state.has_history,
        .scale          = config.entropy_scale,
    });
    const double delta_h = -constants::INV_LN2 * z * delta_d;

    // ── 5. Forward-only weight update ────────────────────────────────────────
    const WeightVector g = strategy.update(phi, d, delta_h);
    if (g.size() != state.weights.size()) {
        return std::nullopt;
    }

    LearnerState next = state;
    next.weights       = state.weights + state.learning_rate * g;
    next.knowledge     = state.knowledge + delta_d;
    next.step          = state.step + 1;
    next.last_decision = d;
    next.last_value    = sample.value;
    next.has_history   = true;
    if (saturated) {
        ++next.saturations;
    }

    // A diverged learner must not emit poisoned output.
    if (!next.weights.allFinite() || !std::isfinite(next.knowledge) ||
        !std::isfinite(delta_h)) {
        return std::nullopt;
    }

    // ── 6. Output record ─────────────────────────────────────────────────────
    return Transition{
        .state  = std::move(next),
        .output = StepOutput{
            .timestamp = sample.timestamp,
            .sequence  = sample.sequence,
            .value     = sample.value,
            .decision  = d,
            .entropy   = delta_h,
            .knowledge = state.knowledge + delta_d,
        },
        .saturated = saturated,
    };
}

// ─── process ──────────────────────────────────────────────────────────────────

std::optional<StepOutput> SkaLearner::process(const Sample& sample) {
    if (last_sequence_ && sample.sequence <= *last_sequence_) {
        last_fault_ = StepFault::OutOfOrder;
        return std::nullopt;
    }

    auto t = step(state_, sample, config_, strategy_);
    if (!t) {
        last_fault_ = StepFault::NonFinite;
        return std::nullopt;
    }

    state_         = std::move(t->state);
    last_sequence_ = sample.sequence;
    last_fault_    = StepFault::None;
    window_.push(t->output.entropy);
    return t->output;
}

// ─── restore / reset ──────────────────────────────────────────────────────────

bool SkaLearner::restore(const LearnerState& state, SequenceIndex last_sequence) {
    if (!state.is_consistent()) {
        return false;
    }
    if (static_cast<std::size_t>(state.weights.size()) != config_.feature_dimension()) {
        return false;
    }
    state_         = state;
    last_sequence_ = last_sequence;
    last_fault_    = StepFault::None;
    window_.reset();
    return true;
}

void SkaLearner::reset() {
    state_ = initial_state(config_);
    last_sequence_.reset();
    last_fault_ = StepFault::None;
    window_.reset();
}

} // namespace ska
