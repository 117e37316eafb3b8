/**
 * @file  fuzz_checkpoint.cpp
 * @brief libFuzzer target for the checkpoint text codec.
 *
 * Build:
 *   cmake -DSKA_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_checkpoint
 *
 * Run for 60 seconds:
 *   ./fuzz_checkpoint -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. If decode() accepts the input:
 *      a. the state passes is_consistent()
 *      b. has_history matches step > 0 and saturations <= step
 *      c. last_sequence leaves a next index and covers every step
 *      d. encode() of the result decodes again to the same values
 *   3. Empty input is always rejected.
 *
 * Fuzzer strategy:
 *   Raw bytes are handed to decode() as a string_view. Interesting inputs
 *   need a valid FNV-1a trailer, so seed the corpus with real checkpoints
 *   (e.g. the files a `ska --run --checkpoint` session writes).
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

#include "ska/checkpoint.hpp"

using namespace ska;

static bool same_bits(double a, double b) {
    return std::memcmp(&a, &b, sizeof(double)) == 0;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{reinterpret_cast<const char*>(data), size};

    const auto cp = checkpoint_codec::decode(input);
    if (size == 0) {
        assert(!cp.has_value());
    }
    if (!cp) {
        return 0;
    }

    // Invariant 2a / 2b / 2c
    assert(cp->state.is_consistent());
    assert(cp->state.has_history == (cp->state.step > 0));
    assert(cp->state.saturations <= cp->state.step);
    assert(cp->last_sequence < UINT64_MAX);
    assert(cp->state.step <= cp->last_sequence + 1);

    // Invariant 2d: canonical re-encoding is stable
    const std::string text  = checkpoint_codec::encode(*cp);
    const auto        again = checkpoint_codec::decode(text);
    assert(again.has_value());
    assert(again->last_sequence == cp->last_sequence);
    assert(again->state.step == cp->state.step);
    assert(again->state.saturations == cp->state.saturations);
    assert(same_bits(again->state.knowledge, cp->state.knowledge));
    assert(same_bits(again->state.last_decision, cp->state.last_decision));
    assert(again->state.weights.size() == cp->state.weights.size());
    for (Eigen::Index i = 0; i < cp->state.weights.size(); ++i) {
        assert(same_bits(again->state.weights(i), cp->state.weights(i)));
    }
    assert(checkpoint_codec::encode(*again) == text);

    return 0;
}
