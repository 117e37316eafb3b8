/// @file src/oscillator/discretization_engine.cpp
/// @brief DiscretizationEngine — exact three-term recurrence for K components.

#include "ska/oscillator.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace ska {

// ─── Static helpers ───────────────────────────────────────────────────────────

Periodicity DiscretizationEngine::classify(const OscillatorComponent& component,
                                           double epsilon) noexcept {
    const double c = std::cos(component.omega * epsilon);
    if (std::abs(c - 1.0) <= constants::DEGENERATE_COS_TOLERANCE) {
        return Periodicity::DegenerateConstant;
    }
    if (std::abs(c + 1.0) <= constants::DEGENERATE_COS_TOLERANCE) {
        return Periodicity::DegenerateAlternating;
    }
    return Periodicity::Periodic;
}

double DiscretizationEngine::closed_form(const OscillatorComponent& component,
                                         double t) noexcept {
    // x(t) = x0·cos(ωt + φ) + (v0/ω)·sin(ωt + φ); ω ≠ 0 is a validated precondition.
    const double theta = component.omega * t + component.phi;
    return component.x0 * std::cos(theta) +
           (component.v0 / component.omega) * std::sin(theta);
}

// ─── Construction ─────────────────────────────────────────────────────────────

std::optional<DiscretizationEngine>
DiscretizationEngine::create(const OscillatorConfig& config) noexcept {
    if (auto err = config.validate()) {
        fmt::print(stderr, "[ska] error: oscillator config rejected: {}\n",
                   to_string(*err));
        return std::nullopt;
    }

    DiscretizationEngine engine(config);
    if (engine.is_degenerate()) {
        fmt::print(stderr,
            "[ska] warning: degenerate-period configuration (cos(omega*epsilon) = +/-1, "
            "epsilon = {}); samples alias to constant or alternating motion\n",
            config.epsilon);
    }
    return engine;
}

DiscretizationEngine::DiscretizationEngine(const OscillatorConfig& config)
    : epsilon_(config.epsilon)
    , limit_(config.effective_limit())
    , noise_cfg_(config.noise)
{
    channels_.reserve(config.components.size());
    for (const auto& c : config.components) {
        channels_.push_back(Channel{
            .params      = c,
            .two_cos     = 2.0 * std::cos(c.omega * epsilon_),
            .periodicity = classify(c, epsilon_),
            .state       = DiscretizationState{0.0, 0.0},
        });
    }
    seed_at(0);
}

// ─── seed_at ──────────────────────────────────────────────────────────────────

void DiscretizationEngine::seed_at(SequenceIndex index) noexcept {
    const double t0 = timestamp_of(index);
    const double t1 = timestamp_of(index + 1);
    for (auto& ch : channels_) {
        ch.state.x_prev = closed_form(ch.params, t0);
        ch.state.x_curr = closed_form(ch.params, t1);
    }
    next_index_ = index;
}

// ─── noise_at ─────────────────────────────────────────────────────────────────

double DiscretizationEngine::noise_at(SequenceIndex index) const noexcept {
    // One generator per index: the draw for sample n does not depend on where
    // the stream was started or sought to.
    std::mt19937_64 rng(noise_cfg_.seed ^ (index * 0x9e3779b97f4a7c15ULL));
    std::normal_distribution<double> dist(0.0, 1.0);
    return dist(rng);
}

// ─── next ─────────────────────────────────────────────────────────────────────

std::optional<Sample> DiscretizationEngine::next() noexcept {
    if (exhausted()) {
        return std::nullopt;
    }

    double value = 0.0;
    for (auto& ch : channels_) {
        value += ch.state.x_prev;

        // x_{n+2} = 2cos(ωε)·x_{n+1} − x_n
        const double x_next = ch.two_cos * ch.state.x_curr - ch.state.x_prev;
        ch.state.x_prev = ch.state.x_curr;
        ch.state.x_curr = x_next;
    }

    if (noise_cfg_.stddev > 0.0) {
        value += noise_cfg_.stddev * noise_at(next_index_);
    }

    const SequenceIndex n = next_index_++;
    return Sample{
        .sequence  = n,
        .timestamp = timestamp_of(n),
        .value     = value,
    };
}

// ─── take ─────────────────────────────────────────────────────────────────────

std::vector<Sample> DiscretizationEngine::take(std::size_t count) noexcept {
    // Reserve no more than the bound can deliver; an unbounded engine grows
    // the vector on demand past a small initial block.
    constexpr std::uint64_t UNBOUNDED_RESERVE = 4'096;
    const std::uint64_t remaining =
        limit_ ? (*limit_ > next_index_ ? *limit_ - next_index_ : 0) : UNBOUNDED_RESERVE;

    std::vector<Sample> out;
    out.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(count, remaining)));
    for (std::size_t i = 0; i < count; ++i) {
        auto s = next();
        if (!s) {
            break;
        }
        out.push_back(*s);
    }
    return out;
}

// ─── previous ─────────────────────────────────────────────────────────────────

std::optional<Sample> DiscretizationEngine::previous() noexcept {
    if (next_index_ == 0) {
        return std::nullopt;
    }

    double value = 0.0;
    for (auto& ch : channels_) {
        // x_{n−1} = 2cos(ωε)·x_n − x_{n+1}
        const double x_before = ch.two_cos * ch.state.x_prev - ch.state.x_curr;
        ch.state.x_curr = ch.state.x_prev;
        ch.state.x_prev = x_before;
        value += x_before;
    }

    --next_index_;
    return Sample{
        .sequence  = next_index_,
        .timestamp = timestamp_of(next_index_),
        .value     = value,
    };
}

// ─── reset / seek ─────────────────────────────────────────────────────────────

void DiscretizationEngine::reset() noexcept {
    seed_at(0);
}

bool DiscretizationEngine::seek(SequenceIndex index) noexcept {
    if (limit_ && index > *limit_) {
        return false;
    }
    seed_at(index);
    return true;
}

// ─── Queries ──────────────────────────────────────────────────────────────────

double DiscretizationEngine::analytic(SequenceIndex index) const noexcept {
    const double t = timestamp_of(index);
    double sum = 0.0;
    for (const auto& ch : channels_) {
        sum += closed_form(ch.params, t);
    }
    return sum;
}

bool DiscretizationEngine::exhausted() const noexcept {
    return limit_ && next_index_ >= *limit_;
}

bool DiscretizationEngine::is_degenerate() const noexcept {
    for (const auto& ch : channels_) {
        if (ch.periodicity != Periodicity::Periodic) {
            return true;
        }
    }
    return false;
}

EngineSnapshot DiscretizationEngine::state() const {
    EngineSnapshot snap{
        .next_index = next_index_,
        .epsilon    = epsilon_,
        .components = {},
        .states     = {},
    };
    snap.components.reserve(channels_.size());
    snap.states.reserve(channels_.size());
    for (const auto& ch : channels_) {
        snap.components.push_back(ch.params);
        snap.states.push_back(ch.state);
    }
    return snap;
}

} // namespace ska
