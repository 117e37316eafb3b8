/// @file src/learner/learning_strategy.cpp
/// @brief Built-in entropy-feature transforms and forward-only update rules.

#include "ska/learner.hpp"

#include <cmath>

namespace ska {

namespace strategies {

// ─── Entropy features z_n ─────────────────────────────────────────────────────

double position_feature(const EntropyContext& ctx) noexcept {
    return ctx.scale * ctx.value;
}

double return_feature(const EntropyContext& ctx) noexcept {
    if (!ctx.has_history) {
        return 0.0;
    }
    // Non-positive: ΔH = (κ/ln2)·|Δx|·ΔD tracks the speed of the motion.
    return -ctx.scale * std::abs(ctx.value - ctx.previous_value);
}

// ─── Update rules g(φ, d, ΔH) ─────────────────────────────────────────────────

WeightVector entropy_descent(const FeatureVector& phi,
                             double decision,
                             double entropy) {
    // Local step against ΔH through the sigmoid slope at the current decision.
    const double slope = decision * (1.0 - decision);
    return (-entropy * slope) * phi;
}

WeightVector hebbian(const FeatureVector& phi,
                     double decision,
                     double /*entropy*/) {
    return (decision - 0.5) * phi;
}

} // namespace strategies

// ─── LearningStrategy::from_config ────────────────────────────────────────────

LearningStrategy LearningStrategy::from_config(const LearnerConfig& config) {
    LearningStrategy s;
    switch (config.feature) {
        case EntropyFeature::Position: s.entropy_feature = strategies::position_feature; break;
        case EntropyFeature::Return:   s.entropy_feature = strategies::return_feature;   break;
    }
    switch (config.rule) {
        case UpdateRule::EntropyDescent: s.update = strategies::entropy_descent; break;
        case UpdateRule::Hebbian:        s.update = strategies::hebbian;         break;
    }
    return s;
}

} // namespace ska
