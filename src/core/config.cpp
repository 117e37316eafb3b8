/// @file src/core/config.cpp
/// @brief Validation for the SKA configuration structs.

#include "ska/config.hpp"
#include "ska/oscillator.hpp"

#include <cmath>

namespace ska {

namespace {

/// 2^64: first step count that no longer converts to std::uint64_t.
constexpr double MAX_DURATION_STEPS = 18446744073709551616.0;

} // namespace

// ─── to_string ────────────────────────────────────────────────────────────────

std::string_view to_string(ConfigError error) noexcept {
    switch (error) {
        case ConfigError::EmptyComponentSet:         return "empty oscillator component set";
        case ConfigError::NonPositiveTimeStep:       return "time step must be positive and finite";
        case ConfigError::ZeroFrequency:             return "angular frequency must be non-zero";
        case ConfigError::NonFiniteParameter:        return "oscillator parameter is not finite";
        case ConfigError::DegenerateRecurrence:      return "cos(omega*epsilon) is +/-1 (degenerate period)";
        case ConfigError::InvalidSampleBound:        return "sample limit / duration must be positive and representable";
        case ConfigError::InvalidNoise:              return "noise stddev must be finite and >= 0";
        case ConfigError::InvalidPace:               return "pace scale must be finite and >= 0";
        case ConfigError::InvalidClipBound:          return "clip bound must lie in (0, 30]";
        case ConfigError::InvalidLearningRate:       return "learning rate must be finite and >= 0";
        case ConfigError::InvalidWeightInit:         return "initial weight mean/std must be finite, std >= 0";
        case ConfigError::InvalidEntropyScale:       return "entropy scale must be finite";
        case ConfigError::InvalidPerformanceWindow:  return "performance window must hold at least one sample";
        case ConfigError::InvalidBufferSize:         return "max buffer size must be positive";
        case ConfigError::InvalidBatchSize:          return "batch size must be positive";
        case ConfigError::InvalidTimeout:            return "timeouts must be non-negative";
        case ConfigError::InvalidCheckpointInterval: return "checkpoint interval must be positive with a path";
    }
    return "unknown configuration error";
}

// ─── OscillatorConfig ─────────────────────────────────────────────────────────

std::optional<ConfigError> OscillatorConfig::validate() const noexcept {
    if (components.empty()) {
        return ConfigError::EmptyComponentSet;
    }
    if (!std::isfinite(epsilon) || epsilon <= 0.0) {
        return ConfigError::NonPositiveTimeStep;
    }

    for (const auto& c : components) {
        if (!std::isfinite(c.omega) || !std::isfinite(c.x0) ||
            !std::isfinite(c.v0)    || !std::isfinite(c.phi)) {
            return ConfigError::NonFiniteParameter;
        }
        if (c.omega == 0.0) {
            return ConfigError::ZeroFrequency;
        }
        if (!allow_degenerate &&
            DiscretizationEngine::classify(c, epsilon) != Periodicity::Periodic) {
            return ConfigError::DegenerateRecurrence;
        }
    }

    if (sample_limit && *sample_limit == 0) {
        return ConfigError::InvalidSampleBound;
    }
    if (duration && (!std::isfinite(*duration) || *duration <= 0.0)) {
        return ConfigError::InvalidSampleBound;
    }
    // The sample count derived from the duration must fit in a SequenceIndex.
    if (duration && !sample_limit && *duration / epsilon >= MAX_DURATION_STEPS) {
        return ConfigError::InvalidSampleBound;
    }
    if (!std::isfinite(noise.stddev) || noise.stddev < 0.0) {
        return ConfigError::InvalidNoise;
    }
    if (!std::isfinite(pace_scale) || pace_scale < 0.0) {
        return ConfigError::InvalidPace;
    }
    return std::nullopt;
}

std::optional<std::uint64_t> OscillatorConfig::effective_limit() const noexcept {
    if (sample_limit) {
        return sample_limit;
    }
    if (duration && std::isfinite(*duration) && *duration > 0.0 && epsilon > 0.0) {
        // Samples at t = 0, ε, 2ε, … up to and including the duration.
        const double steps = std::floor(*duration / epsilon + constants::FLOAT_EPSILON);
        if (!(steps < MAX_DURATION_STEPS)) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(steps) + 1;
    }
    return std::nullopt;
}

// ─── LearnerConfig ────────────────────────────────────────────────────────────

std::optional<ConfigError> LearnerConfig::validate() const noexcept {
    if (!std::isfinite(clip_bound) || clip_bound <= 0.0 ||
        clip_bound > constants::MAX_CLIP_BOUND) {
        return ConfigError::InvalidClipBound;
    }
    if (!std::isfinite(learning_rate) || learning_rate < 0.0) {
        return ConfigError::InvalidLearningRate;
    }
    if (!std::isfinite(initial_weight_mean) || !std::isfinite(initial_weight_std) ||
        initial_weight_std < 0.0) {
        return ConfigError::InvalidWeightInit;
    }
    if (!std::isfinite(entropy_scale)) {
        return ConfigError::InvalidEntropyScale;
    }
    if (performance_window == 0) {
        return ConfigError::InvalidPerformanceWindow;
    }
    return std::nullopt;
}

// ─── BufferConfig / CheckpointConfig / StreamConfig ───────────────────────────

std::optional<ConfigError> BufferConfig::validate() const noexcept {
    if (max_buffer_size == 0) {
        return ConfigError::InvalidBufferSize;
    }
    return std::nullopt;
}

std::optional<ConfigError> CheckpointConfig::validate() const noexcept {
    if (!enabled) {
        return std::nullopt;
    }
    if (interval == 0 || path.empty()) {
        return ConfigError::InvalidCheckpointInterval;
    }
    if (write_budget.count() < 0) {
        return ConfigError::InvalidTimeout;
    }
    return std::nullopt;
}

std::optional<ConfigError> StreamConfig::validate() const noexcept {
    if (batch_size == 0) {
        return ConfigError::InvalidBatchSize;
    }
    if (idle_poll_interval.count() < 0 || shutdown_timeout.count() < 0) {
        return ConfigError::InvalidTimeout;
    }
    return std::nullopt;
}

// ─── RunConfig ────────────────────────────────────────────────────────────────

std::optional<ConfigError> RunConfig::validate() const noexcept {
    if (auto e = oscillator.validate()) return e;
    if (auto e = buffer.validate())     return e;
    if (auto e = learner.validate())    return e;
    if (auto e = checkpoint.validate()) return e;
    if (auto e = stream.validate())     return e;
    return std::nullopt;
}

} // namespace ska
