#pragma once

/// @file include/ska/oscillator.hpp
/// @brief Exact discretization engine for superposed harmonic oscillators.
///
/// # Module: Discretization Engine
///
/// ## Responsibility
/// Produce the sample-by-sample trajectory of K ≥ 1 superposed harmonic
/// oscillators on a fixed time grid t_n = n·ε, without integration error.
///
/// ## Core Formula
/// Per component, the three-term recurrence
/// ```
/// x_{n+2} = 2·cos(ωε)·x_{n+1} − x_n
/// ```
/// seeded from the closed form
/// ```
/// x(t) = x0·cos(ωt + φ) + (v0/ω)·sin(ωt + φ)
/// ```
/// at t = 0 and t = ε. The recurrence is satisfied exactly by the continuous
/// solution at the sample instants, so the only error is floating-point
/// rounding. It is also time-reversible:
/// ```
/// x_n = 2·cos(ωε)·x_{n+1} − x_{n+2}
/// ```
///
/// ## Degenerate Periods
/// When cos(ωε) = ±1 the grid aliases the oscillation (constant or
/// alternating motion). Such components are classified, never turned into
/// NaN; `create()` rejects them unless `allow_degenerate` is set.
///
/// ## Guarantees
/// - All methods are noexcept; fallible paths return `std::optional`
/// - Observation noise (if configured) is added to the emitted value only;
///   the recurrence state is never perturbed
/// - Restartable: `reset()` and `seek()` reseed from the closed form
///
/// ## NOT Responsible For
/// - Buffering or pacing (see stream_runner.hpp)
/// - Estimating oscillator parameters from data

#include "ska/config.hpp"
#include "ska/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace ska {

// ─── Periodicity ──────────────────────────────────────────────────────────────

/// Character of one component's recurrence on the chosen grid.
enum class Periodicity {
    Periodic,               ///< |cos(ωε)| < 1: genuine oscillation
    DegenerateConstant,     ///< cos(ωε) = +1: samples repeat x_0 / drift linearly
    DegenerateAlternating,  ///< cos(ωε) = −1: samples alternate sign
};

// ─── DiscretizationState ──────────────────────────────────────────────────────

/// Two-sample history of one component.
///
/// `x_prev` is the value at the engine cursor (the next index to emit) and
/// `x_curr` the value one step after it.
struct DiscretizationState {
    double x_prev;
    double x_curr;
};

/// Read-only view of the engine for diagnostics.
struct EngineSnapshot {
    SequenceIndex                    next_index;
    double                           epsilon;
    std::vector<OscillatorComponent> components;
    std::vector<DiscretizationState> states;
};

// ─── DiscretizationEngine ─────────────────────────────────────────────────────

/// Lazy, restartable generator of exact oscillator samples.
///
/// ```cpp
/// OscillatorConfig cfg;
/// cfg.components = {{.omega = 0.15, .x0 = 1.0}};
/// cfg.epsilon    = 0.1;
/// auto engine = DiscretizationEngine::create(cfg);
/// while (auto s = engine->next()) { /* ... */ }
/// ```
class DiscretizationEngine {
public:
    /// Validate `config` and build an engine positioned at n = 0.
    ///
    /// # Returns
    /// `nullopt` if `config.validate()` reports an error. Degenerate
    /// components are accepted only with `allow_degenerate` (a warning is
    /// printed to stderr).
    [[nodiscard]] static std::optional<DiscretizationEngine>
    create(const OscillatorConfig& config) noexcept;

    /// Classify the recurrence of `component` on a grid of step `epsilon`.
    [[nodiscard]] static Periodicity
    classify(const OscillatorComponent& component, double epsilon) noexcept;

    /// Closed-form value of one component at time t.
    [[nodiscard]] static double
    closed_form(const OscillatorComponent& component, double t) noexcept;

    /// Emit the sample at the cursor and advance.
    ///
    /// # Returns
    /// `nullopt` once the configured sample bound is reached.
    [[nodiscard]] std::optional<Sample> next() noexcept;

    /// Emit up to `count` samples (fewer if the bound is hit). On a bounded
    /// engine `take(SIZE_MAX)` returns everything that remains.
    [[nodiscard]] std::vector<Sample> take(std::size_t count) noexcept;

    /// Step the cursor back by one using the reversed recurrence and return
    /// the (noise-free) sample now at the cursor, i.e. the one most recently
    /// emitted. `nullopt` at n = 0.
    [[nodiscard]] std::optional<Sample> previous() noexcept;

    /// Reposition at n = 0 with analytic seeds.
    void reset() noexcept;

    /// Reposition so the next emitted sample has index `index`.
    ///
    /// # Returns
    /// `false` (cursor unchanged) if `index` lies beyond the sample bound.
    bool seek(SequenceIndex index) noexcept;

    /// Noise-free superposed closed form at t = index·ε.
    [[nodiscard]] double analytic(SequenceIndex index) const noexcept;

    /// True once the sample bound has been reached.
    [[nodiscard]] bool exhausted() const noexcept;

    /// True if any component has a degenerate period.
    [[nodiscard]] bool is_degenerate() const noexcept;

    [[nodiscard]] SequenceIndex next_index() const noexcept { return next_index_; }
    [[nodiscard]] double epsilon() const noexcept { return epsilon_; }
    [[nodiscard]] std::size_t component_count() const noexcept { return channels_.size(); }
    [[nodiscard]] std::optional<std::uint64_t> sample_limit() const noexcept { return limit_; }

    [[nodiscard]] EngineSnapshot state() const;

private:
    /// One component together with its recurrence coefficient and state.
    struct Channel {
        OscillatorComponent params;
        double              two_cos;  ///< 2·cos(ωε)
        Periodicity         periodicity;
        DiscretizationState state;
    };

    explicit DiscretizationEngine(const OscillatorConfig& config);

    /// Seed every channel from the closed form at `index` and `index + 1`.
    void seed_at(SequenceIndex index) noexcept;

    /// Standard-normal draw owned by sample `index`.
    [[nodiscard]] double noise_at(SequenceIndex index) const noexcept;

    [[nodiscard]] double timestamp_of(SequenceIndex index) const noexcept {
        return static_cast<double>(index) * epsilon_;
    }

    std::vector<Channel>             channels_;
    double                           epsilon_;
    std::optional<std::uint64_t>     limit_;
    SequenceIndex                    next_index_ = 0;

    NoiseConfig                      noise_cfg_;
};

} // namespace ska
