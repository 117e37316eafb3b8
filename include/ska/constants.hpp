#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/ska/constants.hpp
/// @brief Numerical tolerances and configuration defaults for the SKA stream.

namespace ska::constants {

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

/// |cos(ωε)| within this distance of 1 is treated as a degenerate period.
/// The recurrence degenerates to constant (cos = 1) or alternating (cos = −1)
/// motion, i.e. the sample grid aliases the oscillation completely.
static constexpr double DEGENERATE_COS_TOLERANCE = 4e-16;

/// 1 / ln 2, the bit-normalisation factor of the SKA entropy.
static constexpr double INV_LN2 = 1.4426950408889634;

/// Largest admissible activation clip bound. σ(±C) must stay strictly inside
/// (0, 1) in double precision; σ(36.8) already rounds to 1.0.
static constexpr double MAX_CLIP_BOUND = 30.0;

// ─── Discretization Defaults ──────────────────────────────────────────────────

/// Default angular frequency ω (rad/s).
static constexpr double DEFAULT_OMEGA = 1.0;

/// Default time step ε (s).
static constexpr double DEFAULT_EPSILON = 0.01;

// ─── Learner Defaults ─────────────────────────────────────────────────────────

static constexpr double DEFAULT_LEARNING_RATE      = 0.01;
static constexpr double DEFAULT_CLIP_BOUND         = 10.0;
static constexpr double DEFAULT_INITIAL_WEIGHT_STD = 0.1;
static constexpr double DEFAULT_ENTROPY_SCALE      = 1.0;   ///< κ in z_n
static constexpr std::uint64_t DEFAULT_WEIGHT_SEED = 42;

/// Number of ΔH values kept by the rolling performance window.
static constexpr std::size_t DEFAULT_PERFORMANCE_WINDOW = 100;

// ─── Streaming Defaults ───────────────────────────────────────────────────────

static constexpr std::size_t DEFAULT_MAX_BUFFER_SIZE = 1024;
static constexpr std::size_t DEFAULT_BATCH_SIZE      = 64;

/// Consumer wait when the buffer is empty (milliseconds).
static constexpr std::int64_t DEFAULT_IDLE_POLL_MS = 5;

/// Drain budget after a shutdown request (milliseconds).
static constexpr std::int64_t DEFAULT_SHUTDOWN_TIMEOUT_MS = 2000;

// ─── Checkpoint Defaults ──────────────────────────────────────────────────────

static constexpr std::size_t  DEFAULT_CHECKPOINT_INTERVAL = 1000;

/// Longest a learning step may wait on a checkpoint write (milliseconds).
static constexpr std::int64_t DEFAULT_CHECKPOINT_BUDGET_MS = 20;

/// Format version written in the checkpoint header.
static constexpr int CHECKPOINT_FORMAT_VERSION = 1;

/// Upper bound on the weight count a checkpoint may declare.
static constexpr std::size_t MAX_CHECKPOINT_WEIGHTS = 64;

} // namespace ska::constants
