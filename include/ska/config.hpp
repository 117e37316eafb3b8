#pragma once

/// @file include/ska/config.hpp
/// @brief Immutable configuration structs for every SKA stream component.
///
/// # Module: Configuration
///
/// ## Responsibility
/// Hold the parameters of one run: oscillator components and time step,
/// learner hyper-parameters, buffer capacity and backpressure policy,
/// checkpoint cadence and the runner's operational knobs. Each struct is
/// built once before the stream starts and passed by const reference into
/// the engine and learner constructors.
///
/// ## Validation
/// `validate()` returns the first `ConfigError` found, or `nullopt` when the
/// struct is usable. Invalid values are never replaced by defaults; the
/// caller must reject the run.
///
/// ## NOT Responsible For
/// - Parsing configuration files (out of scope; the CLI maps flags directly)

#include "ska/constants.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace ska {

// ─── ConfigError ──────────────────────────────────────────────────────────────

/// Structural configuration failures. All are fatal before the stream starts.
enum class ConfigError {
    EmptyComponentSet,        ///< No oscillator component given
    NonPositiveTimeStep,      ///< ε ≤ 0 or non-finite
    ZeroFrequency,            ///< ω = 0 (closed form undefined)
    NonFiniteParameter,       ///< ω, x0, v0 or φ is NaN / ±Inf
    DegenerateRecurrence,     ///< cos(ωε) = ±1 and degenerate periods not allowed
    InvalidSampleBound,       ///< Sample limit of 0, or duration non-positive or too long to index
    InvalidNoise,             ///< Negative or non-finite noise stddev
    InvalidPace,              ///< Negative or non-finite pace scale
    InvalidClipBound,         ///< C ∉ (0, MAX_CLIP_BOUND]
    InvalidLearningRate,      ///< α < 0 or non-finite
    InvalidWeightInit,        ///< Negative std or non-finite mean / std
    InvalidEntropyScale,      ///< κ non-finite
    InvalidPerformanceWindow, ///< Window of 0 samples
    InvalidBufferSize,        ///< Capacity of 0 samples
    InvalidBatchSize,         ///< Batch of 0 samples
    InvalidTimeout,           ///< Negative idle / shutdown / write budget
    InvalidCheckpointInterval,///< Interval of 0 steps or empty path
};

/// Stable human-readable name of a ConfigError.
[[nodiscard]] std::string_view to_string(ConfigError error) noexcept;

// ─── Oscillator ───────────────────────────────────────────────────────────────

/// One harmonic component: x(t) = x0·cos(ωt+φ) + (v0/ω)·sin(ωt+φ).
struct OscillatorComponent {
    double omega = constants::DEFAULT_OMEGA;  ///< Angular frequency ω (rad/s)
    double x0    = 1.0;                       ///< Initial amplitude
    double v0    = 0.0;                       ///< Initial velocity
    double phi   = 0.0;                       ///< Phase φ (rad)
};

/// Observation noise added to the emitted feature (never to the recurrence).
struct NoiseConfig {
    double        stddev = 0.0;  ///< 0 disables the noise source
    std::uint64_t seed   = 7;
};

/// Discretization engine parameters.
struct OscillatorConfig {
    std::vector<OscillatorComponent> components{OscillatorComponent{}};
    double epsilon = constants::DEFAULT_EPSILON;     ///< Time step ε (s)

    /// Emit at most this many samples. Takes precedence over `duration`.
    std::optional<std::uint64_t> sample_limit;

    /// Simulated duration in seconds, mapped to ⌊duration/ε⌋ + 1 samples.
    std::optional<double> duration;

    /// Build engines whose ωε puts cos(ωε) at exactly ±1 instead of
    /// rejecting them. Such engines report `is_degenerate()`.
    bool allow_degenerate = false;

    NoiseConfig noise{};

    /// Wall-clock pacing: sample n is released no earlier than
    /// start + n·ε·pace_scale. 0 disables pacing.
    double pace_scale = 0.0;

    [[nodiscard]] std::optional<ConfigError> validate() const noexcept;

    /// Sample bound after resolving `sample_limit` / `duration`;
    /// `nullopt` means an infinite stream. A duration whose sample count does
    /// not fit in 64 bits also yields `nullopt`; `validate()` rejects it.
    [[nodiscard]] std::optional<std::uint64_t> effective_limit() const noexcept;
};

// ─── Learner ──────────────────────────────────────────────────────────────────

/// Functional form of z_n in ΔH_n = −(1/ln2)·z_n·ΔD_n.
enum class EntropyFeature {
    Position,  ///< z_n = κ·x_n (baseline)
    Return,    ///< z_n = −κ·|x_n − x_{n−1}|
};

/// Forward-only weight update g(φ, d, ΔH).
enum class UpdateRule {
    EntropyDescent,  ///< g = −ΔH·d(1−d)·φ (baseline)
    Hebbian,         ///< g = (d − ½)·φ
};

/// SKA learning-core hyper-parameters.
struct LearnerConfig {
    double        initial_weight_mean = 0.0;
    double        initial_weight_std  = constants::DEFAULT_INITIAL_WEIGHT_STD;
    std::uint64_t seed                = constants::DEFAULT_WEIGHT_SEED;
    double        learning_rate       = constants::DEFAULT_LEARNING_RATE;  ///< α
    double        clip_bound          = constants::DEFAULT_CLIP_BOUND;     ///< C
    double        entropy_scale       = constants::DEFAULT_ENTROPY_SCALE;  ///< κ
    bool          bias                = false;  ///< φ(x) = [x, 1] instead of [x]
    std::size_t   performance_window  = constants::DEFAULT_PERFORMANCE_WINDOW;
    EntropyFeature feature            = EntropyFeature::Position;
    UpdateRule     rule               = UpdateRule::EntropyDescent;

    [[nodiscard]] std::optional<ConfigError> validate() const noexcept;

    /// Dimension of φ(x) and w.
    [[nodiscard]] std::size_t feature_dimension() const noexcept {
        return bias ? 2 : 1;
    }
};

// ─── Buffer ───────────────────────────────────────────────────────────────────

/// What the producer does when the buffer is full.
enum class OverflowPolicy {
    Block,       ///< Producer suspends until space frees up (no loss)
    DropOldest,  ///< Oldest unconsumed sample is evicted and counted
};

struct BufferConfig {
    std::size_t    max_buffer_size = constants::DEFAULT_MAX_BUFFER_SIZE;
    OverflowPolicy policy          = OverflowPolicy::Block;

    [[nodiscard]] std::optional<ConfigError> validate() const noexcept;
};

// ─── Checkpoint ───────────────────────────────────────────────────────────────

struct CheckpointConfig {
    bool                      enabled  = false;
    std::filesystem::path     path     = "ska_checkpoint.txt";
    std::size_t               interval = constants::DEFAULT_CHECKPOINT_INTERVAL;
    std::chrono::milliseconds write_budget{constants::DEFAULT_CHECKPOINT_BUDGET_MS};

    [[nodiscard]] std::optional<ConfigError> validate() const noexcept;
};

// ─── Stream ───────────────────────────────────────────────────────────────────

struct StreamConfig {
    std::size_t               batch_size = constants::DEFAULT_BATCH_SIZE;
    std::chrono::milliseconds idle_poll_interval{constants::DEFAULT_IDLE_POLL_MS};
    std::chrono::milliseconds shutdown_timeout{constants::DEFAULT_SHUTDOWN_TIMEOUT_MS};
    bool                      resume  = false;  ///< Restore from checkpoint on start
    bool                      verbose = false;  ///< Per-run diagnostics to stderr

    [[nodiscard]] std::optional<ConfigError> validate() const noexcept;
};

// ─── RunConfig ────────────────────────────────────────────────────────────────

/// Everything one stream run needs.
struct RunConfig {
    OscillatorConfig oscillator{};
    LearnerConfig    learner{};
    BufferConfig     buffer{};
    CheckpointConfig checkpoint{};
    StreamConfig     stream{};

    /// First error across all sections, in data-flow order.
    [[nodiscard]] std::optional<ConfigError> validate() const noexcept;
};

} // namespace ska
