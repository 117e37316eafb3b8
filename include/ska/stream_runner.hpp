#pragma once

/// @file include/ska/stream_runner.hpp
/// @brief StreamRunner — producer/consumer orchestration of one SKA run.
///
/// # Module: Stream Runner
///
/// ## Responsibility
/// Wire the pipeline
/// ```
/// DiscretizationEngine ──(producer thread)──▶ SampleBuffer
///        ──(calling thread)──▶ SkaLearner ──▶ sink ──▶ CheckpointManager
/// ```
/// and own its lifecycle: resume, steady-state streaming, graceful shutdown
/// and the final report.
///
/// ## Shutdown
/// `request_stop()` may be called from any thread (including a signal
/// handler via an atomic flag). The producer stops emitting, the consumer
/// drains what is buffered until `shutdown_timeout` expires, whatever remains
/// is discarded and counted, and a final checkpoint is written.
///
/// ## Guarantees
/// - The learner sees strictly increasing, gapless sequence indices (unless
///   the DropOldest policy evicts samples, which are counted)
/// - LearnerState is only touched by the calling thread
/// - A diverged state is never checkpointed
///
/// ## NOT Responsible For
/// - Signal installation (the CLI does that)

#include "ska/checkpoint.hpp"
#include "ska/config.hpp"
#include "ska/learner.hpp"
#include "ska/oscillator.hpp"
#include "ska/sample_buffer.hpp"
#include "ska/types.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace ska {

/// How a run ended.
enum class RunStatus {
    Completed,  ///< Sample bound reached and every sample consumed
    Stopped,    ///< Graceful shutdown after `request_stop()`
    Diverged,   ///< The learner produced a non-finite state
};

[[nodiscard]] std::string_view to_string(RunStatus status) noexcept;

/// Summary of one run.
struct RunReport {
    RunStatus                    status            = RunStatus::Completed;
    std::uint64_t                produced          = 0;  ///< Samples pushed by the producer
    std::uint64_t                consumed          = 0;  ///< Samples processed by the learner
    std::uint64_t                saturations       = 0;  ///< Clip events (cumulative across resumes)
    std::uint64_t                dropped_overflow  = 0;  ///< DropOldest evictions
    std::uint64_t                dropped_shutdown  = 0;  ///< Discarded after the drain timeout
    CheckpointCounters           checkpoints{};
    bool                         resumed           = false;
    std::optional<SequenceIndex> last_sequence;           ///< Last index the learner accepted

    [[nodiscard]] std::string to_string() const;
};

/// Per-step callback receiving every StepOutput in order.
using StepSink = std::function<void(const StepOutput&)>;

class StreamRunner {
public:
    /// Build the engine, learner and (if enabled) checkpoint manager.
    ///
    /// # Returns
    /// `nullopt` if `config.validate()` reports an error (printed to stderr).
    [[nodiscard]] static std::optional<StreamRunner> create(const RunConfig& config);

    /// Same as `create`, with a custom learning strategy.
    [[nodiscard]] static std::optional<StreamRunner>
    create(const RunConfig& config, LearningStrategy strategy);

    StreamRunner(StreamRunner&&) noexcept;
    StreamRunner& operator=(StreamRunner&&) noexcept;
    StreamRunner(const StreamRunner&)            = delete;
    StreamRunner& operator=(const StreamRunner&) = delete;
    ~StreamRunner();

    /// Restore the learner from the newest valid checkpoint and position the
    /// engine at the next unseen index.
    ///
    /// # Returns
    /// `true` if a checkpoint was applied; `false` means cold start.
    bool resume();

    /// Stream until the sample bound is reached, `request_stop()` is called,
    /// or the learner diverges. Blocks the calling thread.
    [[nodiscard]] RunReport run(const StepSink& sink = {});

    /// Ask a running `run()` to shut down gracefully. Thread-safe.
    void request_stop() noexcept;

    [[nodiscard]] bool stop_requested() const noexcept;

    [[nodiscard]] const SkaLearner& learner() const noexcept { return learner_; }
    [[nodiscard]] const DiscretizationEngine& engine() const noexcept { return engine_; }
    [[nodiscard]] const RunConfig& config() const noexcept { return config_; }

private:
    StreamRunner(const RunConfig& config, DiscretizationEngine engine, LearningStrategy strategy);

    /// Producer thread body.
    void produce(SampleBuffer& buffer, std::atomic<std::uint64_t>& produced);

    RunConfig                          config_;
    DiscretizationEngine               engine_;
    SkaLearner                         learner_;
    std::unique_ptr<CheckpointManager> checkpoints_;  ///< Null when disabled
    std::unique_ptr<std::atomic<bool>> stop_;
    bool                               resumed_ = false;
};

} // namespace ska
