/**
 * @file  fuzz_learner.cpp
 * @brief libFuzzer target for SkaLearner::process on arbitrary value streams.
 *
 * Build:
 *   cmake -DSKA_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_learner
 *
 * Run for 60 seconds:
 *   ./fuzz_learner -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every accepted step:
 *      a. d ∈ (0, 1)
 *      b. ΔH and D are finite, D non-decreasing
 *   3. A rejected step leaves the state untouched and reports a fault.
 *   4. The final state is consistent (what a checkpoint would store).
 *
 * Fuzzer strategy:
 *   The first byte selects the strategy (feature, rule, bias). The rest of
 *   the input is reinterpreted as a stream of doubles, so NaN, ±inf,
 *   subnormals and huge magnitudes all reach the learner.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include "ska/learner.hpp"

using namespace ska;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 1) {
        return 0;
    }

    LearnerConfig cfg;
    cfg.feature = (data[0] & 1) ? EntropyFeature::Return : EntropyFeature::Position;
    cfg.rule    = (data[0] & 2) ? UpdateRule::Hebbian : UpdateRule::EntropyDescent;
    cfg.bias    = (data[0] & 4) != 0;
    cfg.performance_window = 16;
    ++data;
    --size;

    SkaLearner learner(cfg);
    double previous_knowledge = 0.0;

    const std::size_t count = size / sizeof(double);
    for (std::size_t i = 0; i < count; ++i) {
        double x = 0.0;
        std::memcpy(&x, data + i * sizeof(double), sizeof(double));

        const auto before = learner.state();
        const auto out = learner.process(
            Sample{.sequence = i, .timestamp = static_cast<double>(i), .value = x});

        if (out) {
            // Invariant 2
            assert(out->decision > 0.0 && out->decision < 1.0);
            assert(std::isfinite(out->entropy));
            assert(std::isfinite(out->knowledge));
            assert(out->knowledge >= previous_knowledge);
            previous_knowledge = out->knowledge;
        } else {
            // Invariant 3
            assert(learner.last_fault() == StepFault::NonFinite);
            assert(learner.state().step == before.step);
            assert(learner.state().knowledge == before.knowledge);
            if (std::isfinite(x)) {
                // Finite input but non-finite result: the stream must halt.
                break;
            }
        }
    }

    assert(learner.state().is_consistent());
    return 0;
}
