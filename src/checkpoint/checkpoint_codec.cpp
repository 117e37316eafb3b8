/// @file src/checkpoint/checkpoint_codec.cpp
/// @brief Versioned text codec for learner checkpoints.

#include "ska/checkpoint.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iterator>
#include <limits>
#include <vector>

namespace ska::checkpoint_codec {

namespace {

constexpr std::string_view MAGIC        = "ska-checkpoint";
constexpr std::string_view CHECKSUM_KEY = "checksum";

/// Split `line` on single spaces.
std::vector<std::string> tokenize(std::string_view line) {
    std::vector<std::string> tokens;
    std::size_t start = 0;
    while (start <= line.size()) {
        const std::size_t end = line.find(' ', start);
        const std::size_t stop = (end == std::string_view::npos) ? line.size() : end;
        tokens.emplace_back(line.substr(start, stop - start));
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return tokens;
}

std::optional<double> parse_double(const std::string& token) noexcept {
    if (token.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double v = std::strtod(token.c_str(), &end);
    if (end != token.c_str() + token.size()) {
        return std::nullopt;
    }
    // Overflow yields ±HUGE_VAL and is caught here with NaN / Inf.
    if (!std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

std::optional<std::uint64_t> parse_uint(const std::string& token, int base = 10) noexcept {
    if (token.empty() || token.size() > 20) {
        return std::nullopt;
    }
    for (char c : token) {
        const bool digit = (c >= '0' && c <= '9');
        const bool hex   = (c >= 'a' && c <= 'f');
        if (!digit && !(base == 16 && hex)) {
            return std::nullopt;
        }
    }
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(token.c_str(), &end, base);
    if (end != token.c_str() + token.size() || errno == ERANGE) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(v);
}

/// Fields collected while parsing; every one must appear exactly once.
struct Fields {
    std::optional<std::uint64_t> last_sequence;
    std::optional<std::uint64_t> step;
    std::optional<double>        knowledge;
    std::optional<double>        clip_bound;
    std::optional<double>        learning_rate;
    std::optional<double>        last_decision;
    std::optional<double>        last_value;
    std::optional<std::uint64_t> has_history;
    std::optional<std::uint64_t> saturations;
    std::optional<WeightVector>  weights;
};

/// Assign `value` to `slot` unless it is already set or `value` is empty.
template <typename T>
bool assign_once(std::optional<T>& slot, std::optional<T> value) {
    if (slot.has_value() || !value.has_value()) {
        return false;
    }
    slot = std::move(value);
    return true;
}

bool parse_line(const std::vector<std::string>& tok, Fields& f) {
    const std::string& key = tok[0];

    if (key == "weights") {
        if (tok.size() < 2) return false;
        const auto count = parse_uint(tok[1]);
        if (!count || *count == 0 || *count > constants::MAX_CHECKPOINT_WEIGHTS) {
            return false;
        }
        if (tok.size() != 2 + *count) return false;
        WeightVector w(static_cast<Eigen::Index>(*count));
        for (std::uint64_t i = 0; i < *count; ++i) {
            const auto v = parse_double(tok[2 + i]);
            if (!v) return false;
            w(static_cast<Eigen::Index>(i)) = *v;
        }
        return assign_once(f.weights, std::optional<WeightVector>(std::move(w)));
    }

    if (tok.size() != 2) return false;
    const std::string& val = tok[1];

    if (key == "last_sequence") return assign_once(f.last_sequence, parse_uint(val));
    if (key == "step")          return assign_once(f.step,          parse_uint(val));
    if (key == "knowledge")     return assign_once(f.knowledge,     parse_double(val));
    if (key == "clip_bound")    return assign_once(f.clip_bound,    parse_double(val));
    if (key == "learning_rate") return assign_once(f.learning_rate, parse_double(val));
    if (key == "last_decision") return assign_once(f.last_decision, parse_double(val));
    if (key == "last_value")    return assign_once(f.last_value,    parse_double(val));
    if (key == "has_history")   return assign_once(f.has_history,   parse_uint(val));
    if (key == "saturations")   return assign_once(f.saturations,   parse_uint(val));
    return false;  // unknown key
}

} // namespace

// ─── fnv1a ────────────────────────────────────────────────────────────────────

std::uint64_t fnv1a(std::string_view bytes) noexcept {
    std::uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : bytes) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

// ─── encode ───────────────────────────────────────────────────────────────────

std::string encode(const Checkpoint& checkpoint) {
    const LearnerState& s = checkpoint.state;

    fmt::memory_buffer buf;
    auto out = std::back_inserter(buf);
    fmt::format_to(out, "{} {}\n", MAGIC, constants::CHECKPOINT_FORMAT_VERSION);
    fmt::format_to(out, "last_sequence {}\n", checkpoint.last_sequence);
    fmt::format_to(out, "step {}\n", s.step);
    fmt::format_to(out, "knowledge {:a}\n", s.knowledge);
    fmt::format_to(out, "clip_bound {:a}\n", s.clip_bound);
    fmt::format_to(out, "learning_rate {:a}\n", s.learning_rate);
    fmt::format_to(out, "last_decision {:a}\n", s.last_decision);
    fmt::format_to(out, "last_value {:a}\n", s.last_value);
    fmt::format_to(out, "has_history {}\n", s.has_history ? 1 : 0);
    fmt::format_to(out, "saturations {}\n", s.saturations);
    fmt::format_to(out, "weights {}", s.weights.size());
    for (Eigen::Index i = 0; i < s.weights.size(); ++i) {
        fmt::format_to(out, " {:a}", s.weights(i));
    }
    fmt::format_to(out, "\n");

    std::string body = fmt::to_string(buf);
    const std::uint64_t sum = fnv1a(body);
    body += fmt::format("{} {:016x}\n", CHECKSUM_KEY, sum);
    return body;
}

// ─── decode ───────────────────────────────────────────────────────────────────

std::optional<Checkpoint> decode(std::string_view text) noexcept {
    // ── 1. Split off and verify the checksum line ────────────────────────────
    if (!text.empty() && text.back() == '\n') {
        text.remove_suffix(1);
    }
    const std::size_t sum_pos = text.rfind('\n');
    if (sum_pos == std::string_view::npos) {
        return std::nullopt;
    }
    const std::string_view body     = text.substr(0, sum_pos + 1);
    const std::string_view sum_line = text.substr(sum_pos + 1);

    const auto sum_tok = tokenize(sum_line);
    if (sum_tok.size() != 2 || sum_tok[0] != CHECKSUM_KEY || sum_tok[1].size() != 16) {
        return std::nullopt;
    }
    const auto stored = parse_uint(sum_tok[1], 16);
    if (!stored || *stored != fnv1a(body)) {
        return std::nullopt;
    }

    // ── 2. Header ────────────────────────────────────────────────────────────
    std::string_view rest = body;
    const std::size_t header_end = rest.find('\n');
    const auto header = tokenize(rest.substr(0, header_end));
    if (header.size() != 2 || header[0] != MAGIC) {
        return std::nullopt;
    }
    const auto version = parse_uint(header[1]);
    if (!version || *version != static_cast<std::uint64_t>(constants::CHECKPOINT_FORMAT_VERSION)) {
        return std::nullopt;
    }
    rest.remove_prefix(header_end + 1);

    // ── 3. Key / value lines ─────────────────────────────────────────────────
    Fields f;
    while (!rest.empty()) {
        const std::size_t eol = rest.find('\n');
        const std::string_view line = rest.substr(0, eol);
        rest.remove_prefix(eol == std::string_view::npos ? rest.size() : eol + 1);

        const auto tok = tokenize(line);
        if (!parse_line(tok, f)) {
            return std::nullopt;
        }
    }

    if (!f.last_sequence || !f.step || !f.knowledge || !f.clip_bound ||
        !f.learning_rate || !f.last_decision || !f.last_value ||
        !f.has_history || !f.saturations || !f.weights) {
        return std::nullopt;
    }
    if (*f.has_history > 1) {
        return std::nullopt;
    }

    // ── 4. Assemble and validate ─────────────────────────────────────────────
    Checkpoint cp;
    cp.last_sequence       = *f.last_sequence;
    cp.state.weights       = std::move(*f.weights);
    cp.state.knowledge     = *f.knowledge;
    cp.state.clip_bound    = *f.clip_bound;
    cp.state.learning_rate = *f.learning_rate;
    cp.state.step          = *f.step;
    cp.state.last_decision = *f.last_decision;
    cp.state.last_value    = *f.last_value;
    cp.state.has_history   = (*f.has_history == 1);
    cp.state.saturations   = *f.saturations;

    if (!cp.state.is_consistent()) {
        return std::nullopt;
    }
    // History exists exactly when at least one step was taken.
    if (cp.state.has_history != (cp.state.step > 0)) {
        return std::nullopt;
    }
    if (cp.state.saturations > cp.state.step) {
        return std::nullopt;
    }
    // A gapless run consumes indices 0..last_sequence, so resuming needs
    // last_sequence + 1 to exist and at most that many steps to have run.
    if (cp.last_sequence == std::numeric_limits<SequenceIndex>::max() ||
        cp.state.step > cp.last_sequence + 1) {
        return std::nullopt;
    }
    return cp;
}

} // namespace ska::checkpoint_codec
