#pragma once

/// @file include/ska/checkpoint.hpp
/// @brief Checkpoint Manager — durable, bounded-latency learner snapshots.
///
/// # Module: Checkpoint Manager
///
/// ## Responsibility
/// Persist the complete LearnerState plus the last consumed sequence index so
/// an interrupted stream can resume exactly where it stopped.
///
/// ## File Format (version 1)
/// Line-oriented text, one `key value` pair per line. Doubles are written as
/// hexadecimal float literals so a round trip is bit-exact:
/// ```
/// ska-checkpoint 1
/// last_sequence 4999
/// step 5000
/// knowledge 0x1.3c5a...p-3
/// clip_bound 0x1.4p+3
/// learning_rate 0x1.47ae147ae147bp-7
/// last_decision 0x1.0000...p-1
/// last_value 0x1.ff...p-1
/// has_history 1
/// saturations 0
/// weights 1 0x1.99999999999ap-4
/// checksum 9a3f0c...
/// ```
/// The checksum is FNV-1a 64 over every byte preceding the `checksum` line.
///
/// ## Durability
/// Writes go to `<path>.tmp` and are fsync'd before being renamed over
/// `<path>`; the parent directory is fsync'd after the rename. The file being
/// replaced is kept as `<path>.prev`, rotated by hard link and rename so it is
/// never copied. A crash or power loss at any point leaves at least one
/// complete, checksummed file (POSIX filesystems).
///
/// ## Guarantees
/// - `encode` / `decode` are pure; `decode` never throws
/// - `on_step` never blocks longer than the configured write budget
/// - A missing or corrupt checkpoint yields `nullopt` (cold start), never a
///   partially restored state
///
/// ## NOT Responsible For
/// - Deciding when a run ends (see stream_runner.hpp)

#include "ska/config.hpp"
#include "ska/learner.hpp"
#include "ska/types.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <future>
#include <optional>
#include <string>
#include <string_view>

namespace ska {

/// Everything needed to resume a stream.
struct Checkpoint {
    LearnerState  state;
    SequenceIndex last_sequence = 0;  ///< Index of the last consumed sample
};

/// Result of one `on_step` call.
enum class CheckpointOutcome {
    NotDue,    ///< Interval not reached
    Written,   ///< Write completed within the budget
    Deferred,  ///< Write still running past the budget, or previous write busy
    Failed,    ///< Write finished with an I/O error
};

/// Running totals of checkpoint activity.
///
/// Every started write lands in exactly one of `written` / `failed`, counted
/// when it finishes (a write that overruns its budget is counted once it is
/// collected). `deferred` counts due saves that were skipped because the
/// previous write was still in flight; those never started a write.
struct CheckpointCounters {
    std::uint64_t written  = 0;  ///< Writes that committed
    std::uint64_t deferred = 0;  ///< Due saves skipped, previous write busy
    std::uint64_t failed   = 0;  ///< Writes that ended in an I/O error
};

// ─── Codec ────────────────────────────────────────────────────────────────────

namespace checkpoint_codec {

/// 64-bit FNV-1a hash.
[[nodiscard]] std::uint64_t fnv1a(std::string_view bytes) noexcept;

/// Serialize to the versioned text format, checksum line included.
[[nodiscard]] std::string encode(const Checkpoint& checkpoint);

/// Parse and verify a serialized checkpoint.
///
/// # Returns
/// `nullopt` on a wrong header or version, checksum mismatch, missing or
/// duplicated keys, malformed numbers, a state that fails
/// `LearnerState::is_consistent()`, or a `last_sequence` that is the maximum
/// index or smaller than `step - 1`.
[[nodiscard]] std::optional<Checkpoint> decode(std::string_view text) noexcept;

} // namespace checkpoint_codec

// ─── CheckpointWriter ─────────────────────────────────────────────────────────

/// RAII temp-file writer. `commit()` fsyncs and closes the temp file,
/// rotates the target to `.prev`, renames the temp file over the target and
/// fsyncs the directory; if the writer is destroyed uncommitted the temp file
/// is removed.
class CheckpointWriter {
public:
    explicit CheckpointWriter(std::filesystem::path target);
    ~CheckpointWriter();

    CheckpointWriter(const CheckpointWriter&)            = delete;
    CheckpointWriter& operator=(const CheckpointWriter&) = delete;

    /// True if the temp file opened successfully.
    [[nodiscard]] bool ok() const noexcept { return ok_; }

    /// Append bytes to the temp file.
    bool write(std::string_view bytes);

    /// Sync, close, rotate the current target to `.prev` and rename.
    ///
    /// # Returns
    /// `false` on any I/O or filesystem error. Before the rename the target is
    /// left intact; a failed directory sync after it still reports `false`.
    [[nodiscard]] bool commit();

    [[nodiscard]] static std::filesystem::path temp_path(const std::filesystem::path& target);
    [[nodiscard]] static std::filesystem::path previous_path(const std::filesystem::path& target);

private:
    /// Keep the current target as `.prev`; no-op if there is none yet.
    [[nodiscard]] bool rotate_previous() const;
    [[nodiscard]] bool sync_directory() const;

    std::filesystem::path target_;
    std::filesystem::path temp_;
    std::FILE*            file_      = nullptr;
    bool                  ok_        = false;
    bool                  committed_ = false;
};

// ─── CheckpointManager ────────────────────────────────────────────────────────

/// Schedules periodic checkpoints and loads the newest valid one.
///
/// Not thread-safe: call from the consumer thread only. At most one write is
/// in flight at any time. `CheckpointConfig::enabled` is the caller's switch;
/// a constructed manager always writes.
class CheckpointManager {
public:
    explicit CheckpointManager(CheckpointConfig config);
    ~CheckpointManager();

    CheckpointManager(const CheckpointManager&)            = delete;
    CheckpointManager& operator=(const CheckpointManager&) = delete;

    /// Synchronous durable write of `checkpoint`.
    [[nodiscard]] bool save(const Checkpoint& checkpoint);

    /// Called after every learner step. Every `interval` steps starts an
    /// asynchronous write and waits at most `write_budget` for it; past the
    /// budget it returns Deferred and the write finishes in the background.
    /// If the previous write is still running the save is skipped (Deferred,
    /// counted in `deferred`) and retried at the next interval; a failed
    /// write is retried the same way.
    CheckpointOutcome on_step(const LearnerState& state, SequenceIndex sequence);

    /// Wait for any in-flight write, then write `state` synchronously.
    [[nodiscard]] bool flush(const LearnerState& state, SequenceIndex sequence);

    /// Load `<path>`, falling back to `<path>.prev`.
    ///
    /// # Returns
    /// `nullopt` (with a warning on stderr) if neither file holds a valid
    /// checkpoint; silent `nullopt` if neither exists.
    [[nodiscard]] std::optional<Checkpoint> restore() const;

    [[nodiscard]] const CheckpointCounters& counters() const noexcept { return counters_; }
    [[nodiscard]] const CheckpointConfig& config() const noexcept { return config_; }

private:
    /// Collect a finished background write, if any.
    void reap();

    CheckpointConfig   config_;
    CheckpointCounters counters_;
    std::future<bool>  pending_;
    std::uint64_t      steps_since_save_ = 0;
};

} // namespace ska
