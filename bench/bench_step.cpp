/**
 * @file  bench/bench_step.cpp
 * @brief Google Benchmark suite for the per-sample hot path.
 *
 * Benchmarks
 * ----------
 *   BM_Engine_Next            — one recurrence step, K components
 *   BM_Engine_NextNoisy       — same, with observation noise enabled
 *   BM_Learner_Step           — pure SkaLearner::step on a fixed state
 *   BM_Learner_Process        — stateful process() incl. performance window
 *   BM_Codec_Encode / Decode  — checkpoint serialization round
 *   BM_Runner_Unpaced         — end-to-end producer/consumer throughput
 *
 * Build (CMake):
 *   cmake -B build -DSKA_BENCH=ON
 *   cmake --build build --target bench_step
 *   ./build/bench_step --benchmark_format=json
 *
 * Throughput units: items/second (samples processed).
 */

#include "benchmark/benchmark.h"

#include "ska/checkpoint.hpp"
#include "ska/learner.hpp"
#include "ska/oscillator.hpp"
#include "ska/stream_runner.hpp"

#include <cmath>
#include <cstdint>
#include <string>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// K components with spread frequencies, unbounded stream.
static ska::OscillatorConfig make_oscillator(std::size_t k, double noise = 0.0) {
    ska::OscillatorConfig cfg;
    cfg.components.clear();
    for (std::size_t i = 0; i < k; ++i) {
        cfg.components.push_back({.omega = 0.15 + 0.07 * static_cast<double>(i), .x0 = 1.0});
    }
    cfg.epsilon      = 0.1;
    cfg.noise.stddev = noise;
    return cfg;
}

// ── Engine ─────────────────────────────────────────────────────────────────────

static void BM_Engine_Next(benchmark::State& state) {
    auto engine = ska::DiscretizationEngine::create(
        make_oscillator(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        auto s = engine->next();
        benchmark::DoNotOptimize(s);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Engine_Next)->Arg(1)->Arg(4)->Arg(16);

static void BM_Engine_NextNoisy(benchmark::State& state) {
    auto engine = ska::DiscretizationEngine::create(make_oscillator(1, 1e-3));
    for (auto _ : state) {
        auto s = engine->next();
        benchmark::DoNotOptimize(s);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Engine_NextNoisy);

// ── Learner ────────────────────────────────────────────────────────────────────

static void BM_Learner_Step(benchmark::State& state) {
    ska::LearnerConfig cfg;
    cfg.initial_weight_std = 0.0;
    cfg.initial_weight_mean = 1.0;
    const auto strategy = ska::LearningStrategy::from_config(cfg);
    auto learner_state  = ska::SkaLearner::initial_state(cfg);
    learner_state.has_history   = true;
    learner_state.step          = 1;
    learner_state.last_value    = 0.3;
    learner_state.last_decision = 0.55;

    ska::Sample sample{.sequence = 1, .timestamp = 0.1, .value = 0.0};
    for (auto _ : state) {
        auto t = ska::SkaLearner::step(learner_state, sample, cfg, strategy);
        benchmark::DoNotOptimize(t);
        sample.value += 0.01;
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Learner_Step);

static void BM_Learner_Process(benchmark::State& state) {
    ska::LearnerConfig cfg;
    cfg.performance_window = static_cast<std::size_t>(state.range(0));
    ska::SkaLearner learner(cfg);

    ska::SequenceIndex n = 0;
    for (auto _ : state) {
        const ska::Sample s{.sequence = n, .timestamp = 0.1 * static_cast<double>(n),
                            .value = std::sin(0.015 * static_cast<double>(n))};
        auto out = learner.process(s);
        benchmark::DoNotOptimize(out);
        ++n;
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Learner_Process)->Arg(64)->Arg(1024);

// ── Checkpoint codec ───────────────────────────────────────────────────────────

static ska::Checkpoint make_checkpoint() {
    ska::Checkpoint cp;
    cp.state.weights       = ska::WeightVector::Constant(2, 0.123456789);
    cp.state.knowledge     = 12.5;
    cp.state.step          = 100'000;
    cp.state.has_history   = true;
    cp.state.last_decision = 0.61;
    cp.state.last_value    = -0.25;
    cp.last_sequence       = 99'999;
    return cp;
}

static void BM_Codec_Encode(benchmark::State& state) {
    const auto cp = make_checkpoint();
    for (auto _ : state) {
        auto text = ska::checkpoint_codec::encode(cp);
        benchmark::DoNotOptimize(text);
    }
}
BENCHMARK(BM_Codec_Encode);

static void BM_Codec_Decode(benchmark::State& state) {
    const std::string text = ska::checkpoint_codec::encode(make_checkpoint());
    for (auto _ : state) {
        auto cp = ska::checkpoint_codec::decode(text);
        benchmark::DoNotOptimize(cp);
    }
}
BENCHMARK(BM_Codec_Decode);

// ── End-to-end ─────────────────────────────────────────────────────────────────

static void BM_Runner_Unpaced(benchmark::State& state) {
    const auto samples = static_cast<std::uint64_t>(state.range(0));
    ska::RunConfig cfg;
    cfg.oscillator              = make_oscillator(1);
    cfg.oscillator.sample_limit = samples;
    cfg.buffer.max_buffer_size  = 4'096;
    cfg.stream.batch_size       = 256;

    for (auto _ : state) {
        auto runner = ska::StreamRunner::create(cfg);
        auto report = runner->run();
        benchmark::DoNotOptimize(report);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(samples));
}
BENCHMARK(BM_Runner_Unpaced)->Arg(100'000)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
