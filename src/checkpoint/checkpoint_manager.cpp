/// @file src/checkpoint/checkpoint_manager.cpp
/// @brief CheckpointWriter (fsync + atomic rename commit) and CheckpointManager.

#include "ska/checkpoint.hpp"

#include <fmt/core.h>
#include <fmt/std.h>

#include <fcntl.h>
#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace ska {

namespace {

/// Encode and durably write one checkpoint. Runs on the writer thread.
bool write_checkpoint(const std::filesystem::path& path, const Checkpoint& checkpoint) {
    const std::string text = checkpoint_codec::encode(checkpoint);
    CheckpointWriter writer(path);
    if (!writer.ok() || !writer.write(text)) {
        return false;
    }
    return writer.commit();
}

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return ss.str();
}

} // namespace

// ─── CheckpointWriter ─────────────────────────────────────────────────────────

std::filesystem::path CheckpointWriter::temp_path(const std::filesystem::path& target) {
    auto p = target;
    p += ".tmp";
    return p;
}

std::filesystem::path CheckpointWriter::previous_path(const std::filesystem::path& target) {
    auto p = target;
    p += ".prev";
    return p;
}

CheckpointWriter::CheckpointWriter(std::filesystem::path target)
    : target_(std::move(target))
    , temp_(temp_path(target_))
{
    file_ = std::fopen(temp_.c_str(), "wb");
    ok_   = (file_ != nullptr);
}

CheckpointWriter::~CheckpointWriter() {
    if (file_ != nullptr) {
        std::fclose(file_);
    }
    if (committed_) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(temp_, ec);
}

bool CheckpointWriter::write(std::string_view bytes) {
    if (!ok_ || file_ == nullptr) {
        return false;
    }
    ok_ = std::fwrite(bytes.data(), 1, bytes.size(), file_) == bytes.size();
    return ok_;
}

bool CheckpointWriter::commit() {
    if (!ok_ || committed_ || file_ == nullptr) {
        return false;
    }

    // Data must reach the disk before the rename can publish it.
    bool synced = std::fflush(file_) == 0 && ::fsync(::fileno(file_)) == 0;
    synced = (std::fclose(file_) == 0) && synced;
    file_  = nullptr;
    if (!synced) {
        ok_ = false;
        return false;
    }

    if (!rotate_previous()) {
        ok_ = false;
        return false;
    }
    std::error_code ec;
    std::filesystem::rename(temp_, target_, ec);
    if (ec) {
        ok_ = false;
        return false;
    }
    committed_ = true;
    return sync_directory();
}

bool CheckpointWriter::rotate_previous() const {
    std::error_code ec;
    if (!std::filesystem::exists(target_, ec)) {
        return !ec;
    }

    // Hard-link the current target under a staging name, then rename it over
    // `.prev`: the target stays in place and `.prev` is replaced atomically.
    const auto previous = previous_path(target_);
    auto staging = previous;
    staging += ".tmp";
    std::filesystem::remove(staging, ec);
    std::filesystem::create_hard_link(target_, staging, ec);
    if (!ec) {
        std::filesystem::rename(staging, previous, ec);
        return !ec;
    }

    // No hard links on this filesystem: move the target aside. Until the
    // caller's rename lands, `.prev` is the only complete file.
    std::filesystem::rename(target_, previous, ec);
    return !ec;
}

bool CheckpointWriter::sync_directory() const {
    auto dir = target_.parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return false;
    }
    const int rc = ::fsync(fd);
    ::close(fd);
    return rc == 0;
}

// ─── CheckpointManager ────────────────────────────────────────────────────────

CheckpointManager::CheckpointManager(CheckpointConfig config)
    : config_(std::move(config)) {}

CheckpointManager::~CheckpointManager() {
    if (pending_.valid()) {
        pending_.wait();
        reap();
    }
}

void CheckpointManager::reap() {
    if (!pending_.valid()) {
        return;
    }
    if (pending_.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
        return;
    }
    if (pending_.get()) {
        ++counters_.written;
    } else {
        ++counters_.failed;
        fmt::print(stderr, "[ska] warning: checkpoint write to {} failed\n", config_.path);
    }
}

bool CheckpointManager::save(const Checkpoint& checkpoint) {
    const bool ok = write_checkpoint(config_.path, checkpoint);
    if (ok) {
        ++counters_.written;
    } else {
        ++counters_.failed;
        fmt::print(stderr, "[ska] warning: checkpoint write to {} failed\n", config_.path);
    }
    return ok;
}

CheckpointOutcome CheckpointManager::on_step(const LearnerState& state, SequenceIndex sequence) {
    reap();

    if (++steps_since_save_ < config_.interval) {
        return CheckpointOutcome::NotDue;
    }
    steps_since_save_ = 0;

    // Previous write still running past its budget: skip this save and try
    // again next interval.
    if (pending_.valid()) {
        ++counters_.deferred;
        return CheckpointOutcome::Deferred;
    }

    try {
        pending_ = std::async(std::launch::async,
                              [path = config_.path, cp = Checkpoint{state, sequence}] {
                                  return write_checkpoint(path, cp);
                              });
    } catch (const std::system_error& e) {
        ++counters_.failed;
        fmt::print(stderr, "[ska] warning: checkpoint writer could not start: {}\n", e.what());
        return CheckpointOutcome::Failed;
    }

    // Over budget: the write keeps running and reap() counts its outcome.
    if (pending_.wait_for(config_.write_budget) != std::future_status::ready) {
        return CheckpointOutcome::Deferred;
    }
    if (pending_.get()) {
        ++counters_.written;
        return CheckpointOutcome::Written;
    }
    ++counters_.failed;
    fmt::print(stderr, "[ska] warning: checkpoint write to {} failed\n", config_.path);
    return CheckpointOutcome::Failed;
}

bool CheckpointManager::flush(const LearnerState& state, SequenceIndex sequence) {
    if (pending_.valid()) {
        pending_.wait();
        reap();
    }
    steps_since_save_ = 0;
    return save(Checkpoint{state, sequence});
}

std::optional<Checkpoint> CheckpointManager::restore() const {
    bool any_found = false;
    for (const auto& candidate : {config_.path, CheckpointWriter::previous_path(config_.path)}) {
        std::error_code ec;
        if (!std::filesystem::exists(candidate, ec)) {
            continue;
        }
        any_found = true;

        const auto text = read_file(candidate);
        if (!text) {
            fmt::print(stderr, "[ska] warning: cannot read checkpoint {}\n", candidate);
            continue;
        }
        if (auto cp = checkpoint_codec::decode(*text)) {
            return cp;
        }
        fmt::print(stderr, "[ska] warning: checkpoint {} is invalid, ignoring\n", candidate);
    }
    if (any_found) {
        fmt::print(stderr, "[ska] warning: no valid checkpoint, starting cold\n");
    }
    return std::nullopt;
}

} // namespace ska
