#pragma once

/// @file include/rrg/engine.hpp
/// @brief RRG Engine — per-frequency load → compute → persist → frame pipeline.
///
/// # Module: Engine
///
/// ## Responsibility
/// Orchestrate the full RRG pipeline for each configured reporting frequency:
///   folder of CSVs → DataLoader → MetricsEngine → TableWriter (ratio CSV)
///                  → FrameBuilder (frames CSV) → RotationComposer
///
/// ## Usage
/// ```cpp
/// EngineConfig cfg;
/// cfg.sources = {{"Daily", "datasets/cleaned_daily"}};
/// Engine engine(cfg);
/// auto reports = engine.run();
/// auto view    = engine.compose(reports);
/// ```
///
/// ## Guarantees
/// - All configuration is explicit; nothing is read from global state
/// - One failed frequency does not stop the others
/// - Progress and warnings go through fmt; the pure core never logs

#include "rrg/constants.hpp"
#include "rrg/data_loader.hpp"
#include "rrg/frames.hpp"
#include "rrg/input_error.hpp"
#include "rrg/metrics.hpp"
#include "rrg/rotation.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace rrg::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

/// One reporting frequency and the folder holding its CSV files.
struct FrequencySource {
    std::string           label;
    std::filesystem::path folder;
};

/// Configuration parameters for the engine.
struct EngineConfig {
    /// Benchmark identifier; `<benchmark>.csv` must exist in every folder.
    std::string benchmark = "^GSPC";

    /// Instrument identifiers, in output column order.
    std::vector<std::string> tickers = {
        "AAPL", "AMZN", "AVGO", "BRK-B", "GOOGL", "META",
        "MSFT", "NVDA", "TSLA", "TSM",   "MCD",   "BA",
    };

    /// Rolling-statistic window.
    std::size_t window = constants::DEFAULT_WINDOW;

    /// Points per frame trail.
    std::size_t tail = constants::DEFAULT_TAIL;

    /// Historical frames beyond the most recent one.
    std::size_t frame_count = constants::DEFAULT_FRAME_COUNT;

    /// Frequencies to process, in selector order.
    std::vector<FrequencySource> sources = {
        {"Daily",   "datasets/cleaned_daily"},
        {"Weekly",  "datasets/cleaned_weekly"},
        {"Monthly", "datasets/cleaned_monthly"},
    };

    /// Directory receiving `rrg_output_<freq>.csv` and `rrg_frames_<freq>.csv`.
    std::filesystem::path output_dir = "datasets";

    /// Write output files. Disable for dry runs.
    bool write_outputs = true;

    /// If true, emit per-step detail to stderr.
    bool verbose = false;

    /// First violated constraint, or `nullopt`.
    [[nodiscard]] std::optional<InputError> validate() const noexcept;
};

// ─── FrequencyReport ──────────────────────────────────────────────────────────

/// Everything produced for one frequency.
struct FrequencyReport {
    std::string               label;
    io::LoadResult            data;
    metrics::RrgSeries        series;
    frames::FrameSet          frames;
    std::filesystem::path     ratio_csv;   ///< Empty if not written
    std::filesystem::path     frames_csv;  ///< Empty if not written
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Process every configured frequency.
    ///
    /// Frequencies whose benchmark cannot be loaded, or whose inputs fail
    /// validation, are reported on stderr and left out of the result.
    [[nodiscard]] std::vector<FrequencyReport> run() const;

    /// Process one frequency from already-aligned data.
    ///
    /// # Returns
    /// `nullopt` if the Metrics Engine or Frame Builder rejects the inputs.
    [[nodiscard]] std::optional<FrequencyReport>
    process(const std::string& label, io::LoadResult data) const;

    /// Build the composer view from finished reports.
    [[nodiscard]] std::optional<rotation::RotationView>
    compose(std::span<const FrequencyReport> reports) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

    /// `<output_dir>/rrg_output_<label>.csv` with the label lower-cased.
    [[nodiscard]] std::filesystem::path ratio_path(const std::string& label) const;

    /// `<output_dir>/rrg_frames_<label>.csv` with the label lower-cased.
    [[nodiscard]] std::filesystem::path frames_path(const std::string& label) const;

private:
    [[nodiscard]] std::optional<FrequencyReport>
    run_source(const FrequencySource& source) const;

    EngineConfig config_;
};

}  // namespace rrg::core
