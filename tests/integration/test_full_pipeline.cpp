/// @file tests/integration/test_full_pipeline.cpp
/// @brief End-to-end tests for the full streaming pipeline.
///
/// These tests exercise the complete path:
///   DiscretizationEngine → SampleBuffer → SkaLearner → sink → CheckpointManager
///
/// Test categories:
///   - Determinism: two identical runs emit identical outputs
///   - Restart idempotence: checkpoint at m, resume for k more steps, and the
///     outputs match an uninterrupted run of m + k steps to within rounding
///   - Restart after a graceful stop mid-stream
///   - Resume beyond the sample bound falls back to a cold start

#include <gtest/gtest.h>
#include "ska/stream_runner.hpp"

#include <cmath>
#include <cstring>
#include <filesystem>
#include <vector>

using namespace ska;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

constexpr double RESUME_TOLERANCE = 1e-9;

bool bit_equal(double a, double b) {
    return std::memcmp(&a, &b, sizeof(double)) == 0;
}

class FullPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("ska_pipeline_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    /// Two-component signal with a little observation noise.
    RunConfig config(std::uint64_t limit, bool checkpoints) const {
        RunConfig cfg;
        cfg.oscillator.components = {
            {.omega = 0.15, .x0 = 1.0},
            {.omega = 0.4, .x0 = 0.0, .v0 = 0.2},
        };
        cfg.oscillator.epsilon      = 0.1;
        cfg.oscillator.sample_limit = limit;
        cfg.oscillator.noise        = NoiseConfig{.stddev = 1e-3, .seed = 99};
        cfg.learner.initial_weight_mean = 0.5;
        cfg.learner.initial_weight_std  = 0.1;
        cfg.learner.seed                = 7;
        cfg.learner.learning_rate       = 0.05;
        cfg.buffer.max_buffer_size      = 32;
        cfg.stream.batch_size           = 8;
        cfg.stream.idle_poll_interval   = 2ms;
        if (checkpoints) {
            cfg.checkpoint.enabled      = true;
            cfg.checkpoint.path         = dir_ / "pipeline.ckpt";
            cfg.checkpoint.interval     = 64;
            cfg.checkpoint.write_budget = 1'000ms;
        }
        return cfg;
    }

    static std::vector<StepOutput> collect(StreamRunner& runner, RunReport* report = nullptr) {
        std::vector<StepOutput> out;
        const auto r = runner.run([&out](const StepOutput& s) { out.push_back(s); });
        if (report) {
            *report = r;
        }
        return out;
    }

    /// Compare `tail` against the last `tail.size()` outputs of `full`.
    /// `tolerance == 0` demands bit equality.
    static void expect_same_tail(const std::vector<StepOutput>& full,
                                 const std::vector<StepOutput>& tail,
                                 double tolerance = 0.0) {
        ASSERT_LE(tail.size(), full.size());
        const std::size_t offset = full.size() - tail.size();
        auto same = [tolerance](double a, double b) {
            return tolerance == 0.0 ? bit_equal(a, b) : std::abs(a - b) <= tolerance;
        };
        for (std::size_t i = 0; i < tail.size(); ++i) {
            const auto& a = full[offset + i];
            const auto& b = tail[i];
            ASSERT_EQ(a.sequence, b.sequence);
            ASSERT_TRUE(same(a.value, b.value))         << "value at " << a.sequence;
            ASSERT_TRUE(same(a.decision, b.decision))   << "decision at " << a.sequence;
            ASSERT_TRUE(same(a.entropy, b.entropy))     << "entropy at " << a.sequence;
            ASSERT_TRUE(same(a.knowledge, b.knowledge)) << "knowledge at " << a.sequence;
        }
    }

    fs::path dir_;
};

} // namespace

// ─── Determinism ──────────────────────────────────────────────────────────────

TEST_F(FullPipelineTest, IdenticalRunsAreIdentical) {
    auto a = StreamRunner::create(config(500, false));
    auto b = StreamRunner::create(config(500, false));
    ASSERT_TRUE(a && b);
    const auto out_a = collect(*a);
    const auto out_b = collect(*b);
    ASSERT_EQ(out_a.size(), 500u);
    expect_same_tail(out_a, out_b);
    EXPECT_GT(out_a.back().knowledge, 0.0);
}

// ─── Restart idempotence ──────────────────────────────────────────────────────

TEST_F(FullPipelineTest, ResumeMatchesUninterruptedRun) {
    constexpr std::uint64_t m = 300;
    constexpr std::uint64_t k = 400;

    auto reference = StreamRunner::create(config(m + k, false));
    ASSERT_TRUE(reference.has_value());
    const auto full = collect(*reference);
    ASSERT_EQ(full.size(), m + k);

    auto first = StreamRunner::create(config(m, true));
    ASSERT_TRUE(first.has_value());
    RunReport first_report;
    const auto head = collect(*first, &first_report);
    ASSERT_EQ(first_report.status, RunStatus::Completed);
    ASSERT_EQ(head.size(), m);
    expect_same_tail(std::vector<StepOutput>(full.begin(), full.begin() + m), head);

    auto cfg = config(m + k, true);
    cfg.stream.resume = true;
    auto second = StreamRunner::create(cfg);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->engine().next_index(), m);
    EXPECT_EQ(second->learner().last_sequence(), std::optional<SequenceIndex>(m - 1));

    RunReport second_report;
    const auto tail = collect(*second, &second_report);
    EXPECT_TRUE(second_report.resumed);
    EXPECT_EQ(second_report.status, RunStatus::Completed);
    ASSERT_EQ(tail.size(), k);
    EXPECT_EQ(tail.front().sequence, m);
    // The engine reseeds from the closed form, so x differs from the
    // uninterrupted recurrence only by accumulated rounding.
    expect_same_tail(full, tail, RESUME_TOLERANCE);
    EXPECT_EQ(second->learner().state().step, m + k);
}

TEST_F(FullPipelineTest, ResumeAfterGracefulStop) {
    constexpr std::uint64_t total = 800;

    auto reference = StreamRunner::create(config(total, false));
    ASSERT_TRUE(reference.has_value());
    const auto full = collect(*reference);

    auto first = StreamRunner::create(config(total, true));
    ASSERT_TRUE(first.has_value());
    StreamRunner* self = &*first;
    const auto stopped = first->run([self](const StepOutput& s) {
        if (s.sequence == 250) {
            self->request_stop();
        }
    });
    ASSERT_EQ(stopped.status, RunStatus::Stopped);
    ASSERT_TRUE(stopped.last_sequence.has_value());
    const SequenceIndex last = *stopped.last_sequence;
    ASSERT_LT(last + 1, total);

    auto cfg = config(total, true);
    cfg.stream.resume = true;
    auto second = StreamRunner::create(cfg);
    ASSERT_TRUE(second.has_value());
    const auto tail = collect(*second);
    ASSERT_EQ(tail.size(), total - (last + 1));
    expect_same_tail(full, tail, RESUME_TOLERANCE);
}

TEST_F(FullPipelineTest, ResumeBeyondBoundStartsCold) {
    auto first = StreamRunner::create(config(200, true));
    ASSERT_TRUE(first.has_value());
    ASSERT_EQ(first->run().status, RunStatus::Completed);

    // Checkpoint says 199; a run bounded at 100 samples cannot continue from 200.
    auto cfg = config(100, true);
    cfg.stream.resume = true;
    auto second = StreamRunner::create(cfg);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->engine().next_index(), 0u);
    EXPECT_EQ(second->learner().state().step, 0u);

    const auto report = second->run();
    EXPECT_FALSE(report.resumed);
    EXPECT_EQ(report.consumed, 100u);
}

TEST_F(FullPipelineTest, MismatchedDimensionStartsCold) {
    auto first = StreamRunner::create(config(100, true));
    ASSERT_TRUE(first.has_value());
    ASSERT_EQ(first->run().status, RunStatus::Completed);

    auto cfg = config(200, true);
    cfg.learner.bias   = true;  // weight vector grows by one
    cfg.stream.resume  = true;
    auto second = StreamRunner::create(cfg);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->engine().next_index(), 0u);
    EXPECT_EQ(second->run().consumed, 200u);
}
