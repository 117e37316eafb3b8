/// @file src/main.cpp
/// @brief SKA CLI entry point.
///
/// Usage:
///   ska --run [options]      Stream oscillator samples through the SKA learner
///   ska --generate <N>       Print the first N oscillator samples
///   ska --help               Print usage

#include "ska/config.hpp"
#include "ska/oscillator.hpp"
#include "ska/stream_runner.hpp"

#include <fmt/core.h>

#include <atomic>
#include <csignal>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

/// Runner currently streaming; the SIGINT handler asks it to stop.
std::atomic<ska::StreamRunner*> g_active_runner{nullptr};

void handle_sigint(int /*signum*/) {
    if (auto* runner = g_active_runner.load()) {
        runner->request_stop();
    }
}

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  ska --run [options]      Stream samples through the SKA learner\n"
        "  ska --generate <N>       Print the first N oscillator samples\n"
        "  ska --help               Show this help\n"
        "\n"
        "Oscillator options (shared by --run and --generate):\n"
        "  --omega <w>              Angular frequency (default 1.0)\n"
        "  --epsilon <e>            Time step in seconds (default 0.01)\n"
        "  --x0 <x>                 Initial amplitude (default 1.0)\n"
        "  --v0 <v>                 Initial velocity (default 0.0)\n"
        "  --phi <p>                Phase in radians (default 0.0)\n"
        "  --noise <s>              Observation noise stddev (default 0)\n"
        "  --allow-degenerate       Accept cos(omega*epsilon) = +-1\n"
        "\n"
        "Run options:\n"
        "  --steps <N>              Stop after N samples (default: until Ctrl-C)\n"
        "  --feature <f>            Entropy feature: position | return\n"
        "  --rule <r>               Update rule: descent | hebbian\n"
        "  --learning-rate <a>      Learning rate (default 0.01)\n"
        "  --checkpoint <path>      Enable checkpoints at <path>\n"
        "  --interval <N>           Steps between checkpoints (default 1000)\n"
        "  --resume                 Resume from the checkpoint if valid\n"
        "  --pace <k>               Real-time pacing factor (0 = as fast as possible)\n"
        "  --drop-oldest            Drop oldest samples instead of blocking\n"
        "  --quiet                  Print only the final report\n"
        "  --verbose                Diagnostics to stderr\n"
        "\n"
        "Output (--run): sequence,timestamp,value,decision,entropy,knowledge\n"
    );
}

std::optional<double> parse_double(const std::string& text) {
    try {
        std::size_t pos = 0;
        const double v = std::stod(text, &pos);
        if (pos != text.size()) {
            return std::nullopt;
        }
        return v;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::optional<std::uint64_t> parse_count(const std::string& text) {
    if (text.empty() || text[0] == '-') {
        return std::nullopt;
    }
    try {
        std::size_t pos = 0;
        const auto v = std::stoull(text, &pos);
        if (pos != text.size()) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(v);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

/// Flags collected from argv after the mode.
struct CliOptions {
    ska::RunConfig config;
    bool           quiet = false;
};

/// Map flags onto `opts`. Returns false (after printing why) on bad input.
bool parse_options(int argc, char* argv[], int first, CliOptions& opts) {
    auto& osc     = opts.config.oscillator;
    auto& comp    = osc.components.front();
    auto& learner = opts.config.learner;

    for (int i = first; i < argc; ++i) {
        const std::string flag(argv[i]);

        // Flags without a value.
        if (flag == "--resume")           { opts.config.stream.resume = true; continue; }
        if (flag == "--verbose")          { opts.config.stream.verbose = true; continue; }
        if (flag == "--quiet")            { opts.quiet = true; continue; }
        if (flag == "--allow-degenerate") { osc.allow_degenerate = true; continue; }
        if (flag == "--drop-oldest") {
            opts.config.buffer.policy = ska::OverflowPolicy::DropOldest;
            continue;
        }

        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", flag);
            return false;
        }
        const std::string value(argv[++i]);

        if (flag == "--feature") {
            if (value == "position")    learner.feature = ska::EntropyFeature::Position;
            else if (value == "return") learner.feature = ska::EntropyFeature::Return;
            else {
                fmt::print(stderr, "Error: unknown entropy feature '{}'\n", value);
                return false;
            }
            continue;
        }
        if (flag == "--rule") {
            if (value == "descent")      learner.rule = ska::UpdateRule::EntropyDescent;
            else if (value == "hebbian") learner.rule = ska::UpdateRule::Hebbian;
            else {
                fmt::print(stderr, "Error: unknown update rule '{}'\n", value);
                return false;
            }
            continue;
        }
        if (flag == "--checkpoint") {
            opts.config.checkpoint.enabled = true;
            opts.config.checkpoint.path    = value;
            continue;
        }
        if (flag == "--steps" || flag == "--interval") {
            const auto n = parse_count(value);
            if (!n) {
                fmt::print(stderr, "Error: {} expects a non-negative integer, got '{}'\n",
                           flag, value);
                return false;
            }
            if (flag == "--steps") osc.sample_limit = *n;
            else                   opts.config.checkpoint.interval = static_cast<std::size_t>(*n);
            continue;
        }

        const auto v = parse_double(value);
        if (!v) {
            fmt::print(stderr, "Error: {} expects a number, got '{}'\n", flag, value);
            return false;
        }
        if (flag == "--omega")              comp.omega = *v;
        else if (flag == "--epsilon")       osc.epsilon = *v;
        else if (flag == "--x0")            comp.x0 = *v;
        else if (flag == "--v0")            comp.v0 = *v;
        else if (flag == "--phi")           comp.phi = *v;
        else if (flag == "--noise")         osc.noise.stddev = *v;
        else if (flag == "--pace")          osc.pace_scale = *v;
        else if (flag == "--learning-rate") learner.learning_rate = *v;
        else {
            fmt::print(stderr, "Unknown option: {}\n", flag);
            return false;
        }
    }
    return true;
}

/// Print the first `count` samples of the configured oscillator.
/// Returns 0 on success, 1 on error.
int run_generate(const ska::OscillatorConfig& config, std::uint64_t count) {
    ska::OscillatorConfig bounded = config;
    bounded.sample_limit = count;

    auto engine = ska::DiscretizationEngine::create(bounded);
    if (!engine) {
        return 1;
    }

    fmt::print("sequence,timestamp,value\n");
    while (const auto s = engine->next()) {
        fmt::print("{},{:.6f},{:.17g}\n", s->sequence, s->timestamp, s->value);
    }
    return 0;
}

/// Stream through the learner until the bound, Ctrl-C, or divergence.
/// Returns 0 on completion or graceful stop, 1 on error or divergence.
int run_stream(const CliOptions& opts) {
    auto runner = ska::StreamRunner::create(opts.config);
    if (!runner) {
        return 1;
    }

    g_active_runner.store(&*runner);
    std::signal(SIGINT, handle_sigint);

    if (!opts.quiet) {
        fmt::print("sequence,timestamp,value,decision,entropy,knowledge\n");
    }
    const auto report = runner->run([&opts](const ska::StepOutput& out) {
        if (opts.quiet) {
            return;
        }
        fmt::print("{},{:.6f},{:.10g},{:.10g},{:.6e},{:.10g}\n",
                   out.sequence, out.timestamp, out.value,
                   out.decision, out.entropy, out.knowledge);
    });

    std::signal(SIGINT, SIG_DFL);
    g_active_runner.store(nullptr);

    fmt::print(stderr, "{}\n", report.to_string());
    return report.status == ska::RunStatus::Diverged ? 1 : 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--generate") {
        if (argc < 3) {
            fmt::print(stderr, "Error: --generate requires a sample count\n");
            print_usage();
            return 1;
        }
        const auto count = parse_count(argv[2]);
        if (!count || *count == 0) {
            fmt::print(stderr, "Error: invalid sample count '{}'\n", argv[2]);
            return 1;
        }
        CliOptions opts;
        if (!parse_options(argc, argv, 3, opts)) {
            return 1;
        }
        return run_generate(opts.config.oscillator, *count);
    }

    if (mode == "--run") {
        CliOptions opts;
        if (!parse_options(argc, argv, 2, opts)) {
            print_usage();
            return 1;
        }
        return run_stream(opts);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
