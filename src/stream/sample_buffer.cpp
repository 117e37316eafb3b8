/// @file src/stream/sample_buffer.cpp
/// @brief SampleBuffer — bounded FIFO with block / drop-oldest backpressure.

#include "ska/sample_buffer.hpp"

#include <algorithm>

namespace ska {

SampleBuffer::SampleBuffer(const BufferConfig& config)
    : capacity_(config.max_buffer_size < 1 ? 1 : config.max_buffer_size)
    , policy_(config.policy)
{}

// ─── push ─────────────────────────────────────────────────────────────────────

PushResult SampleBuffer::push(const Sample& sample) {
    std::unique_lock<std::mutex> lock{mutex_};
    if (closed_) {
        return PushResult::Closed;
    }

    PushResult result = PushResult::Accepted;
    if (queue_.size() >= capacity_) {
        if (policy_ == OverflowPolicy::Block) {
            not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
            if (closed_) {
                return PushResult::Closed;
            }
        } else {
            queue_.pop_front();
            ++dropped_;
            result = PushResult::DroppedOldest;
        }
    }

    queue_.push_back(sample);
    lock.unlock();
    not_empty_.notify_one();
    return result;
}

// ─── try_pop ──────────────────────────────────────────────────────────────────

std::optional<Sample> SampleBuffer::try_pop() {
    std::unique_lock<std::mutex> lock{mutex_};
    if (queue_.empty()) {
        return std::nullopt;
    }
    const Sample s = queue_.front();
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return s;
}

// ─── pop_batch ────────────────────────────────────────────────────────────────

std::size_t SampleBuffer::pop_batch(std::vector<Sample>& out,
                                    std::size_t max_count,
                                    std::chrono::milliseconds wait) {
    if (max_count == 0) {
        return 0;
    }

    std::unique_lock<std::mutex> lock{mutex_};
    if (queue_.empty() && !closed_) {
        not_empty_.wait_for(lock, wait, [this] { return closed_ || !queue_.empty(); });
    }

    const std::size_t n = std::min(max_count, queue_.size());
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(queue_.front());
        queue_.pop_front();
    }
    lock.unlock();

    if (n > 0) {
        not_full_.notify_all();
    }
    return n;
}

// ─── close / discard_remaining ────────────────────────────────────────────────

void SampleBuffer::close() noexcept {
    {
        std::lock_guard<std::mutex> lock{mutex_};
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

std::size_t SampleBuffer::discard_remaining() {
    std::size_t lost = 0;
    {
        std::lock_guard<std::mutex> lock{mutex_};
        lost = queue_.size();
        queue_.clear();
    }
    not_full_.notify_all();
    return lost;
}

// ─── Accessors ────────────────────────────────────────────────────────────────

std::size_t SampleBuffer::size() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return queue_.size();
}

bool SampleBuffer::closed() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return closed_;
}

std::uint64_t SampleBuffer::dropped() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return dropped_;
}

} // namespace ska
