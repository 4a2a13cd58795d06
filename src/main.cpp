/// @file src/main.cpp
/// @brief RRG CLI entry point.
///
/// Usage:
///   rrg [options]                 Compute RRG tables and frames for every source
///   rrg --help                    Print usage

#include "rrg/engine.hpp"
#include "rrg/quadrant.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  rrg [options]\n"
        "\n"
        "Options:\n"
        "  --benchmark <id>          Benchmark identifier (default ^GSPC)\n"
        "  --tickers <a,b,...>       Instrument identifiers\n"
        "  --window <n>              Rolling window (default 15)\n"
        "  --tail <n>                Trail length, 1-10 (default 3)\n"
        "  --frames <n>              Historical frames (default 10)\n"
        "  --source <Label>=<dir>    Frequency folder; repeatable.\n"
        "                            Default: Daily/Weekly/Monthly under datasets/\n"
        "  --out <dir>               Output directory (default datasets)\n"
        "  --dry-run                 Do not write output files\n"
        "  --verbose                 Per-step detail on stderr\n"
        "  --help                    Show this help\n"
        "\n"
        "Each folder holds <id>.csv files with Date and Close columns.\n"
    );
}

std::optional<std::size_t> parse_size(std::string_view text) {
    std::size_t value = 0;
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::vector<std::string> split_list(std::string_view text) {
    std::vector<std::string> out;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        auto comma = text.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = text.size();
        }
        if (comma > pos) {
            out.emplace_back(text.substr(pos, comma - pos));
        }
        pos = comma + 1;
    }
    return out;
}

/// Parse argv into `cfg`. Returns false (after printing why) on bad input.
bool parse_args(int argc, char* argv[], rrg::core::EngineConfig& cfg, bool& help) {
    std::vector<rrg::core::FrequencySource> sources;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            help = true;
            return true;
        }
        if (arg == "--verbose") {
            cfg.verbose = true;
            continue;
        }
        if (arg == "--dry-run") {
            cfg.write_outputs = false;
            continue;
        }

        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", arg);
            return false;
        }
        const std::string_view value(argv[++i]);

        if (arg == "--benchmark") {
            cfg.benchmark = std::string(value);
        } else if (arg == "--tickers") {
            cfg.tickers = split_list(value);
        } else if (arg == "--out") {
            cfg.output_dir = std::string(value);
        } else if (arg == "--source") {
            const auto eq = value.find('=');
            if (eq == std::string_view::npos || eq == 0 || eq + 1 == value.size()) {
                fmt::print(stderr, "Error: --source expects <Label>=<dir>, got '{}'\n", value);
                return false;
            }
            sources.push_back({std::string(value.substr(0, eq)),
                               std::string(value.substr(eq + 1))});
        } else if (arg == "--window" || arg == "--tail" || arg == "--frames") {
            const auto n = parse_size(value);
            if (!n) {
                fmt::print(stderr, "Error: {} expects a non-negative integer, got '{}'\n",
                           arg, value);
                return false;
            }
            if (arg == "--window") {
                cfg.window = *n;
            } else if (arg == "--tail") {
                cfg.tail = *n;
            } else {
                cfg.frame_count = *n;
            }
        } else {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            return false;
        }
    }

    if (!sources.empty()) {
        cfg.sources = std::move(sources);
    }
    return true;
}

/// Print where each instrument sits in the most recent frame of each view.
void print_summary(const rrg::rotation::RotationView& view) {
    for (const auto& fv : view.views) {
        if (fv.frames.empty()) {
            continue;
        }
        const auto& frame = fv.frames.frames[fv.active_step];
        fmt::print("{}{} [{}]\n", fv.label,
                   fv.label == view.default_label ? " (default)" : "", frame.key);
        for (const auto& trace : frame.traces) {
            const auto q = rrg::frames::head_quadrant(trace);
            const auto head = trace.markers.empty()
                                  ? std::string_view("-")
                                  : rrg::frames::to_string(trace.markers.back().symbol);
            fmt::print("  {:<8} {:<10} {}\n", trace.instrument,
                       q ? rrg::frames::to_string(*q) : std::string_view("n/a"), head);
        }
    }
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    rrg::core::EngineConfig cfg;
    bool help = false;
    if (!parse_args(argc, argv, cfg, help)) {
        print_usage();
        return 1;
    }
    if (help) {
        print_usage();
        return 0;
    }
    if (auto err = cfg.validate()) {
        fmt::print(stderr, "Error: invalid configuration: {}\n", rrg::to_string(*err));
        return 1;
    }

    const rrg::core::Engine engine(cfg);
    const auto reports = engine.run();
    if (reports.empty()) {
        fmt::print(stderr, "Error: no frequency could be processed\n");
        return 1;
    }

    const auto view = engine.compose(reports);
    if (!view) {
        return 1;
    }

    print_summary(*view);
    return 0;
}
