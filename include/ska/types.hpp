#pragma once

/// @file include/ska/types.hpp
/// @brief Shared value types for the SKA oscillator stream.
///
/// Every module includes this file. It defines the records that flow between
/// the discretization engine, the streaming buffer, the learner and the
/// checkpoint manager, plus the Eigen aliases used by the learner.

#include <Eigen/Dense>

#include <cstdint>

namespace ska {

/// Monotone, gapless sample index within one run.
using SequenceIndex = std::uint64_t;

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Learner weight vector w. Dimension equals the feature-map dimension
/// (1 for the bare position feature, 2 when the bias term is enabled).
using WeightVector = Eigen::VectorXd;

/// Feature representation φ(x_n) of one sample.
using FeatureVector = Eigen::VectorXd;

// ─── Stream Records ───────────────────────────────────────────────────────────

/// One observation emitted by the discretization engine.
///
/// Immutable once produced; flows by value through the buffer.
struct Sample {
    SequenceIndex sequence;   ///< n, starting at 0
    double        timestamp;  ///< Simulation time t_n = n·ε
    double        value;      ///< Observed feature x_n (sum of components)
};

/// Public product of one learning step.
struct StepOutput {
    double        timestamp;  ///< Copied from the consumed sample
    SequenceIndex sequence;   ///< Copied from the consumed sample
    double        value;      ///< x_n
    double        decision;   ///< d_n ∈ (0, 1)
    double        entropy;    ///< ΔH_n (signed increment)
    double        knowledge;  ///< D_n after this step
};

} // namespace ska
