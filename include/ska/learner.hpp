#pragma once

/// @file include/ska/learner.hpp
/// @brief SKA Learning Core — forward-only entropy / knowledge / decision update.
///
/// # Module: SKA Learning Core
///
/// ## Responsibility
/// Consume one Sample at a time and derive three correlated signals without
/// any backward pass:
///   - decision   d_n  = σ(clip(w·φ(x_n), −C, C)) ∈ (0, 1)
///   - knowledge  D_n  = D_{n−1} + ΔD_n,  ΔD_n = |d_n − d_{n−1}|
///   - entropy    ΔH_n = −(1/ln2)·z_n·ΔD_n
/// and update the weights with w ← w + α·g(φ(x_n), d_n, ΔH_n).
///
/// ## Transition Function
/// `SkaLearner::step` is a pure function of (state, sample, config,
/// strategy). It holds no computation graph and never looks ahead: the
/// update at step n depends only on w and what was observed up to n.
///
/// ## Pluggable Strategy
/// The functional form of z_n and of g(·) are swappable callables
/// (`LearningStrategy`). The built-ins are selected by `LearnerConfig`;
/// the position-based entropy feature with entropy-descent updates is the
/// baseline.
///
/// ## Failure Modes
/// - |w·φ| > C before clipping: clipped and counted (`saturations`)
/// - Non-finite input, weights or knowledge: `step` returns `nullopt`;
///   the run must halt
///
/// ## NOT Responsible For
/// - Scheduling, buffering or persistence (see stream_runner.hpp,
///   checkpoint.hpp)

#include "ska/config.hpp"
#include "ska/entropy_window.hpp"
#include "ska/types.hpp"

#include <cstdint>
#include <functional>
#include <optional>

namespace ska {

// ─── LearnerState ─────────────────────────────────────────────────────────────

/// Complete mutable state of the learner; exactly what a checkpoint stores.
struct LearnerState {
    WeightVector  weights;                ///< w
    double        knowledge     = 0.0;    ///< D
    double        clip_bound    = constants::DEFAULT_CLIP_BOUND;     ///< C
    double        learning_rate = constants::DEFAULT_LEARNING_RATE;  ///< α
    std::uint64_t step          = 0;      ///< Steps taken so far
    double        last_decision = 0.5;    ///< d_{n−1}
    double        last_value    = 0.0;    ///< x_{n−1}
    bool          has_history   = false;  ///< False before the first step
    std::uint64_t saturations   = 0;      ///< Clip events so far

    /// Internal consistency: finite values, C ∈ (0, MAX_CLIP_BOUND],
    /// α ≥ 0, D ≥ 0, d_{n−1} ∈ (0, 1), non-empty weights.
    [[nodiscard]] bool is_consistent() const noexcept;
};

// ─── Strategy ─────────────────────────────────────────────────────────────────

/// Inputs to the entropy-feature transform z_n.
struct EntropyContext {
    double value;           ///< x_n
    double previous_value;  ///< x_{n−1} (meaningless without history)
    bool   has_history;
    double scale;           ///< κ
};

using EntropyFeatureFn = std::function<double(const EntropyContext&)>;

/// g(φ(x_n), d_n, ΔH_n); must return a vector of φ's dimension.
using UpdateRuleFn =
    std::function<WeightVector(const FeatureVector&, double decision, double entropy)>;

/// The two swappable seams of the learning step.
struct LearningStrategy {
    EntropyFeatureFn entropy_feature;
    UpdateRuleFn     update;

    /// Built-in strategy selected by `config.feature` / `config.rule`.
    [[nodiscard]] static LearningStrategy from_config(const LearnerConfig& config);
};

namespace strategies {

/// z_n = κ·x_n
[[nodiscard]] double position_feature(const EntropyContext& ctx) noexcept;

/// z_n = −κ·|x_n − x_{n−1}|, 0 on the first step.
[[nodiscard]] double return_feature(const EntropyContext& ctx) noexcept;

/// g = −ΔH·d(1−d)·φ
[[nodiscard]] WeightVector entropy_descent(const FeatureVector& phi,
                                           double decision,
                                           double entropy);

/// g = (d − ½)·φ
[[nodiscard]] WeightVector hebbian(const FeatureVector& phi,
                                   double decision,
                                   double entropy);

} // namespace strategies

// ─── Transition ───────────────────────────────────────────────────────────────

/// Result of one pure learning step.
struct Transition {
    LearnerState state;      ///< State after the step
    StepOutput   output;     ///< Public record of the step
    bool         saturated;  ///< Pre-clip activation exceeded C
};

/// Why `SkaLearner::process` refused a sample.
enum class StepFault {
    None,
    NonFinite,   ///< Input or resulting state not finite (divergence)
    OutOfOrder,  ///< Sequence index not strictly increasing
};

// ─── SkaLearner ───────────────────────────────────────────────────────────────

/// Stateful wrapper around `step`: owns the state, the immutable config, the
/// strategy and the rolling entropy window.
///
/// ```cpp
/// SkaLearner learner(cfg);
/// for (const auto& s : samples) {
///     auto out = learner.process(s);
///     if (!out) break;  // diverged
/// }
/// ```
class SkaLearner {
public:
    /// Build with the built-in strategy named by `config`.
    /// Precondition: `config.validate()` is `nullopt`.
    explicit SkaLearner(const LearnerConfig& config);

    /// Build with a custom strategy.
    SkaLearner(const LearnerConfig& config, LearningStrategy strategy);

    /// Cold-start state: seeded weights, D = 0, no history.
    [[nodiscard]] static LearnerState initial_state(const LearnerConfig& config);

    /// Pure transition (state, sample) → (state', output).
    ///
    /// # Returns
    /// `nullopt` if the sample value is not finite or the updated weights /
    /// knowledge / entropy are not finite.
    [[nodiscard]] static std::optional<Transition>
    step(const LearnerState&     state,
         const Sample&           sample,
         const LearnerConfig&    config,
         const LearningStrategy& strategy);

    /// φ(x) = [x] or [x, 1].
    [[nodiscard]] static FeatureVector features(double value, bool bias);

    /// Logistic function in the overflow-free two-branch form.
    [[nodiscard]] static double sigmoid(double activation) noexcept;

    /// Apply `step` to the owned state and update the entropy window.
    ///
    /// # Returns
    /// The step's output, or `nullopt` with `last_fault()` set; the state is
    /// left unchanged on failure.
    [[nodiscard]] std::optional<StepOutput> process(const Sample& sample);

    /// Replace the state with a restored one; `last_sequence` is the index of
    /// the last sample the state has seen. The entropy window starts empty.
    ///
    /// # Returns
    /// `false` (state unchanged) if `state` fails `is_consistent()` or its
    /// weight dimension does not match the config.
    bool restore(const LearnerState& state, SequenceIndex last_sequence);

    /// Explicit reinitialization to the cold-start state.
    void reset();

    [[nodiscard]] const LearnerState& state() const noexcept { return state_; }
    [[nodiscard]] const LearnerConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::optional<SequenceIndex> last_sequence() const noexcept { return last_sequence_; }
    [[nodiscard]] StepFault last_fault() const noexcept { return last_fault_; }
    [[nodiscard]] EntropyStats performance() const noexcept { return window_.stats(); }

private:
    LearnerConfig                config_;
    LearningStrategy             strategy_;
    LearnerState                 state_;
    EntropyWindow                window_;
    std::optional<SequenceIndex> last_sequence_;
    StepFault                    last_fault_ = StepFault::None;
};

} // namespace ska
