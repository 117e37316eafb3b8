#pragma once

/// @file include/ska/sample_buffer.hpp
/// @brief Bounded FIFO between the discretization engine and the learner.
///
/// # Module: Streaming Buffer
///
/// ## Responsibility
/// Decouple sample production from learner consumption with a fixed
/// capacity and an explicit backpressure policy:
///   - `Block`:      `push` waits while the buffer is full (no loss)
///   - `DropOldest`: `push` evicts the oldest unconsumed sample and counts it
///
/// ## Guarantees
/// - Strict FIFO: samples leave in the order they entered
/// - Thread-safe for one producer and one consumer
/// - `close()` wakes every waiter; a closed buffer rejects pushes but still
///   hands out what it holds

#include "ska/config.hpp"
#include "ska/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace ska {

/// Outcome of a single push.
enum class PushResult {
    Accepted,       ///< Sample enqueued without loss
    DroppedOldest,  ///< Sample enqueued, oldest sample evicted
    Closed,         ///< Buffer closed; sample not enqueued
};

/// Bounded single-producer / single-consumer sample queue.
class SampleBuffer {
public:
    explicit SampleBuffer(const BufferConfig& config);

    SampleBuffer(const SampleBuffer&)            = delete;
    SampleBuffer& operator=(const SampleBuffer&) = delete;

    /// Enqueue `sample` following the configured overflow policy.
    PushResult push(const Sample& sample);

    /// Dequeue the oldest sample without waiting.
    [[nodiscard]] std::optional<Sample> try_pop();

    /// Move up to `max_count` samples into `out` (appended, FIFO order).
    ///
    /// Waits at most `wait` for the first sample when the buffer is empty.
    ///
    /// # Returns
    /// Number of samples appended; 0 on timeout or when closed and empty.
    std::size_t pop_batch(std::vector<Sample>& out,
                          std::size_t max_count,
                          std::chrono::milliseconds wait);

    /// Reject further pushes and wake all waiters.
    void close() noexcept;

    /// Discard everything still queued and return how many samples were lost.
    std::size_t discard_remaining();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] OverflowPolicy policy() const noexcept { return policy_; }
    [[nodiscard]] bool closed() const;

    /// Samples evicted by the DropOldest policy so far.
    [[nodiscard]] std::uint64_t dropped() const;

private:
    const std::size_t      capacity_;
    const OverflowPolicy   policy_;

    mutable std::mutex      mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<Sample>      queue_;
    std::uint64_t           dropped_ = 0;
    bool                    closed_  = false;
};

} // namespace ska
