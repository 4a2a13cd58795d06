/// @file src/core/engine.cpp
/// @brief RRG Engine — per-frequency pipeline orchestration.

#include "rrg/engine.hpp"
#include "rrg/table_writer.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace rrg::core {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

}  // anonymous namespace

// ─── EngineConfig::validate ───────────────────────────────────────────────────

std::optional<InputError> EngineConfig::validate() const noexcept {
    if (window < 1) {
        return InputError::InvalidWindow;
    }
    if (tail < constants::MIN_TAIL || tail > constants::MAX_TAIL) {
        return InputError::InvalidTail;
    }
    if (sources.empty()) {
        return InputError::NoBundles;
    }
    std::unordered_set<std::string_view> labels;
    for (const auto& s : sources) {
        if (s.label.empty()) {
            return InputError::EmptyLabel;
        }
        if (!labels.insert(s.label).second) {
            return InputError::DuplicateLabel;
        }
    }
    return std::nullopt;
}

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
{}

// ─── Engine::ratio_path / frames_path ─────────────────────────────────────────

std::filesystem::path Engine::ratio_path(const std::string& label) const {
    return config_.output_dir / ("rrg_output_" + lowercase(label) + ".csv");
}

std::filesystem::path Engine::frames_path(const std::string& label) const {
    return config_.output_dir / ("rrg_frames_" + lowercase(label) + ".csv");
}

// ─── Engine::process ──────────────────────────────────────────────────────────

std::optional<FrequencyReport>
Engine::process(const std::string& label, io::LoadResult data) const {
    if (auto err = metrics::MetricsEngine::check(data.benchmark, data.instruments,
                                                 config_.window)) {
        fmt::print(stderr, "Error: {} metrics rejected: {}\n", label, to_string(*err));
        return std::nullopt;
    }
    auto series = metrics::MetricsEngine::compute(data.benchmark, data.instruments,
                                                  config_.window);
    if (!series) {
        return std::nullopt;
    }

    if (auto err = frames::FrameBuilder::check(series->ratio, series->momentum,
                                               config_.tail)) {
        fmt::print(stderr, "Error: {} frames rejected: {}\n", label, to_string(*err));
        return std::nullopt;
    }
    auto set = frames::FrameBuilder::build(series->ratio, series->momentum,
                                           config_.tail, config_.frame_count);
    if (!set) {
        return std::nullopt;
    }

    if (config_.verbose) {
        fmt::print(stderr, "[{}] {} rows x {} instruments, window={}, {} frames\n",
                   label, series->ratio.rows(), series->ratio.cols(),
                   config_.window, set->size());
    }

    FrequencyReport report{
        .label      = label,
        .data       = std::move(data),
        .series     = std::move(*series),
        .frames     = std::move(*set),
        .ratio_csv  = {},
        .frames_csv = {},
    };

    if (config_.write_outputs) {
        const auto ratio_file = ratio_path(label);
        if (io::TableWriter::write_csv(report.series.ratio, ratio_file)) {
            report.ratio_csv = ratio_file;
            fmt::print("{} RRG calculation done. Saved to {}\n", label, ratio_file.string());
        } else {
            fmt::print(stderr, "Error: cannot write '{}'\n", ratio_file.string());
        }

        const auto frames_file = frames_path(label);
        if (io::TableWriter::write_frames(report.frames, frames_file)) {
            report.frames_csv = frames_file;
        } else {
            fmt::print(stderr, "Error: cannot write '{}'\n", frames_file.string());
        }
    }

    return report;
}

// ─── Engine::run_source ───────────────────────────────────────────────────────

std::optional<FrequencyReport>
Engine::run_source(const FrequencySource& source) const {
    if (config_.verbose) {
        fmt::print(stderr, "[{}] loading '{}'\n", source.label, source.folder.string());
    }

    auto data = io::DataLoader::load_folder(source.folder, config_.benchmark,
                                            config_.tickers);
    if (!data) {
        fmt::print(stderr, "Error: missing or malformed benchmark file: {}\n",
                   (source.folder / (config_.benchmark + ".csv")).string());
        return std::nullopt;
    }
    for (const auto& t : data->missing) {
        fmt::print(stderr, "Warning: Missing file {}, skipping.\n",
                   (source.folder / (t + ".csv")).string());
    }
    for (const auto& t : data->malformed) {
        fmt::print(stderr, "Warning: {} has no Date/Close columns, skipping.\n",
                   (source.folder / (t + ".csv")).string());
    }

    return process(source.label, std::move(*data));
}

// ─── Engine::run ──────────────────────────────────────────────────────────────

std::vector<FrequencyReport> Engine::run() const {
    std::vector<FrequencyReport> reports;
    if (auto err = config_.validate()) {
        fmt::print(stderr, "Error: invalid configuration: {}\n", to_string(*err));
        return reports;
    }

    reports.reserve(config_.sources.size());
    for (const auto& source : config_.sources) {
        if (auto report = run_source(source)) {
            reports.push_back(std::move(*report));
        }
    }
    return reports;
}

// ─── Engine::compose ──────────────────────────────────────────────────────────

std::optional<rotation::RotationView>
Engine::compose(std::span<const FrequencyReport> reports) const {
    std::vector<rotation::FrequencyBundle> bundles;
    bundles.reserve(reports.size());
    for (const auto& r : reports) {
        auto bundle = rotation::FrequencyBundle::make(r.label, r.series.ratio,
                                                      r.series.momentum);
        if (!bundle) {
            return std::nullopt;
        }
        bundles.push_back(std::move(*bundle));
    }

    const rotation::RotationConfig cfg{
        .tail          = config_.tail,
        .frame_count   = config_.frame_count,
        .default_label = config_.sources.empty() ? std::string("Daily")
                                                 : config_.sources.front().label,
    };
    if (auto err = rotation::RotationComposer::check(bundles, cfg)) {
        fmt::print(stderr, "Error: cannot compose rotation view: {}\n", to_string(*err));
        return std::nullopt;
    }
    return rotation::RotationComposer::compose(bundles, cfg);
}

}  // namespace rrg::core
