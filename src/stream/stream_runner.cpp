/// @file src/stream/stream_runner.cpp
/// @brief StreamRunner — producer thread, consumer loop, drain and report.

#include "ska/stream_runner.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <thread>
#include <utility>
#include <vector>

namespace ska {

using Clock = std::chrono::steady_clock;

// ─── RunStatus / RunReport ────────────────────────────────────────────────────

std::string_view to_string(RunStatus status) noexcept {
    switch (status) {
        case RunStatus::Completed: return "completed";
        case RunStatus::Stopped:   return "stopped";
        case RunStatus::Diverged:  return "diverged";
    }
    return "unknown";
}

std::string RunReport::to_string() const {
    const std::string last = last_sequence ? fmt::format("{}", *last_sequence) : std::string("none");
    return fmt::format(
        "status={} resumed={} produced={} consumed={} last_sequence={} saturations={} "
        "dropped_overflow={} dropped_shutdown={} checkpoints_written={} "
        "checkpoints_deferred={} checkpoints_failed={}",
        ska::to_string(status), resumed, produced, consumed, last, saturations,
        dropped_overflow, dropped_shutdown, checkpoints.written,
        checkpoints.deferred, checkpoints.failed);
}

// ─── Construction ─────────────────────────────────────────────────────────────

StreamRunner::StreamRunner(const RunConfig& config,
                           DiscretizationEngine engine,
                           LearningStrategy strategy)
    : config_(config)
    , engine_(std::move(engine))
    , learner_(config.learner, std::move(strategy))
    , checkpoints_(config.checkpoint.enabled
                       ? std::make_unique<CheckpointManager>(config.checkpoint)
                       : nullptr)
    , stop_(std::make_unique<std::atomic<bool>>(false))
{}

StreamRunner::StreamRunner(StreamRunner&&) noexcept            = default;
StreamRunner& StreamRunner::operator=(StreamRunner&&) noexcept = default;
StreamRunner::~StreamRunner()                                  = default;

std::optional<StreamRunner> StreamRunner::create(const RunConfig& config) {
    return create(config, LearningStrategy::from_config(config.learner));
}

std::optional<StreamRunner>
StreamRunner::create(const RunConfig& config, LearningStrategy strategy) {
    if (const auto err = config.validate()) {
        fmt::print(stderr, "[ska] error: run config rejected: {}\n", to_string(*err));
        return std::nullopt;
    }
    auto engine = DiscretizationEngine::create(config.oscillator);
    if (!engine) {
        return std::nullopt;
    }

    std::optional<StreamRunner> runner(StreamRunner(config, std::move(*engine), std::move(strategy)));
    if (config.stream.resume) {
        runner->resume();
    }
    return runner;
}

// ─── resume ───────────────────────────────────────────────────────────────────

bool StreamRunner::resume() {
    if (!checkpoints_) {
        if (config_.stream.verbose) {
            fmt::print(stderr, "[ska] resume requested but checkpointing is disabled\n");
        }
        return false;
    }

    const auto cp = checkpoints_->restore();
    if (!cp) {
        return false;
    }
    if (!learner_.restore(cp->state, cp->last_sequence)) {
        fmt::print(stderr,
                   "[ska] warning: checkpoint does not match the learner configuration, "
                   "starting cold\n");
        return false;
    }
    if (!engine_.seek(cp->last_sequence + 1)) {
        fmt::print(stderr,
                   "[ska] warning: checkpoint index {} lies beyond the sample bound, "
                   "starting cold\n", cp->last_sequence);
        learner_.reset();
        return false;
    }

    resumed_ = true;
    if (config_.stream.verbose) {
        fmt::print(stderr, "[ska] resumed at sequence {} (step {})\n",
                   cp->last_sequence + 1, cp->state.step);
    }
    return true;
}

// ─── Stop control ─────────────────────────────────────────────────────────────

void StreamRunner::request_stop() noexcept {
    stop_->store(true, std::memory_order_release);
}

bool StreamRunner::stop_requested() const noexcept {
    return stop_->load(std::memory_order_acquire);
}

// ─── Producer ─────────────────────────────────────────────────────────────────

void StreamRunner::produce(SampleBuffer& buffer, std::atomic<std::uint64_t>& produced) {
    const double        pace  = config_.oscillator.pace_scale;
    const auto          start = Clock::now();
    const SequenceIndex first = engine_.next_index();
    const auto          slice = config_.stream.idle_poll_interval;

    while (!stop_requested()) {
        const auto sample = engine_.next();
        if (!sample) {
            break;  // sample bound reached
        }

        if (pace > 0.0) {
            const auto offset = std::chrono::duration<double>(
                static_cast<double>(sample->sequence - first) * engine_.epsilon() * pace);
            const auto due = start + std::chrono::duration_cast<Clock::duration>(offset);
            // Sleep in slices so a stop request or a closed buffer is seen promptly.
            while (!stop_requested() && !buffer.closed()) {
                const auto now = Clock::now();
                if (now >= due) {
                    break;
                }
                std::this_thread::sleep_for(
                    std::min<Clock::duration>(due - now, slice));
            }
        }

        if (buffer.push(*sample) == PushResult::Closed) {
            break;
        }
        produced.fetch_add(1, std::memory_order_relaxed);
    }
    buffer.close();
}

// ─── run ──────────────────────────────────────────────────────────────────────

RunReport StreamRunner::run(const StepSink& sink) {
    RunReport report;
    report.resumed = resumed_;

    SampleBuffer               buffer(config_.buffer);
    std::atomic<std::uint64_t> produced{0};
    std::vector<Sample>        batch;
    batch.reserve(config_.stream.batch_size);

    bool diverged = false;

    // Feed one batch through learner → sink → checkpoint. False on divergence.
    auto consume = [&](const std::vector<Sample>& samples) -> bool {
        for (const auto& s : samples) {
            const auto out = learner_.process(s);
            if (!out) {
                if (learner_.last_fault() == StepFault::OutOfOrder) {
                    fmt::print(stderr, "[ska] warning: out-of-order sample {} skipped\n",
                               s.sequence);
                    continue;
                }
                fmt::print(stderr, "[ska] error: learner diverged at sequence {}\n",
                           s.sequence);
                return false;
            }
            ++report.consumed;
            if (sink) {
                sink(*out);
            }
            if (checkpoints_) {
                checkpoints_->on_step(learner_.state(), s.sequence);
            }
        }
        return true;
    };

    if (config_.stream.verbose) {
        fmt::print(stderr, "[ska] stream starting at sequence {}\n", engine_.next_index());
    }

    {
        std::jthread producer([this, &buffer, &produced] { produce(buffer, produced); });

        // ── Steady state ─────────────────────────────────────────────────────
        while (!stop_requested()) {
            batch.clear();
            const std::size_t n = buffer.pop_batch(batch, config_.stream.batch_size,
                                                   config_.stream.idle_poll_interval);
            if (n == 0) {
                if (buffer.closed() && buffer.size() == 0) {
                    break;  // producer finished and everything was consumed
                }
                continue;
            }
            if (!consume(batch)) {
                diverged = true;
                break;
            }
        }

        // ── Graceful drain ───────────────────────────────────────────────────
        if (!diverged && stop_requested()) {
            const auto deadline = Clock::now() + config_.stream.shutdown_timeout;
            while (Clock::now() < deadline) {
                const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - Clock::now());
                batch.clear();
                const std::size_t n = buffer.pop_batch(
                    batch, config_.stream.batch_size,
                    std::min(remaining, config_.stream.idle_poll_interval));
                if (n == 0) {
                    if (buffer.closed() && buffer.size() == 0) {
                        break;
                    }
                    continue;
                }
                if (!consume(batch)) {
                    diverged = true;
                    break;
                }
            }
            buffer.close();
            report.dropped_shutdown = buffer.discard_remaining();
        }

        // Unblocks a producer waiting on a full buffer; jthread joins here.
        buffer.close();
    }

    if (diverged) {
        report.status = RunStatus::Diverged;
    } else if (stop_requested()) {
        report.status = RunStatus::Stopped;
    } else {
        report.status = RunStatus::Completed;
    }

    // Final checkpoint of the last good state.
    if (!diverged && checkpoints_ && learner_.last_sequence()) {
        if (!checkpoints_->flush(learner_.state(), *learner_.last_sequence())) {
            fmt::print(stderr, "[ska] warning: final checkpoint could not be written\n");
        }
    }

    report.produced         = produced.load(std::memory_order_relaxed);
    report.saturations      = learner_.state().saturations;
    report.dropped_overflow = buffer.dropped();
    report.last_sequence    = learner_.last_sequence();
    if (checkpoints_) {
        report.checkpoints = checkpoints_->counters();
    }

    if (config_.stream.verbose) {
        fmt::print(stderr, "[ska] {}\n", report.to_string());
    }
    return report;
}

} // namespace ska
