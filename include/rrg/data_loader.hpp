#pragma once

/// @file include/rrg/data_loader.hpp
/// @brief CSV data source for benchmark and instrument closing prices.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Read one `<ticker>.csv` file per instrument from a frequency folder,
/// forward-fill each instrument's closes, and align everything on the dates
/// common to the benchmark and the instruments.
///
/// ## Expected CSV Format
/// ```
/// Date,Open,High,Low,Close,Volume
/// 2024-01-02,187.15,188.44,183.89,185.64,82488700
/// ```
/// Only `Date` and `Close` are read (header names are case-insensitive).
/// Rows with an unparseable date are skipped; an empty or non-numeric close
/// is read as NaN (and later forward-filled for instruments).
///
/// ## Guarantees
/// - Never throws; returns `nullopt` on unrecoverable errors, allocation
///   failure included
/// - Output tables satisfy the SeriesTable / PriceSeries invariants
/// - Does not modify any file or external state

#include "rrg/types.hpp"

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rrg::io {

/// Dates and closes read from a single file, sorted by date, one row per date.
struct CloseSeries {
    TimeIndex           dates;
    std::vector<double> closes;
};

/// Aligned inputs for the Metrics Engine.
struct LoadResult {
    PriceSeries              benchmark;
    SeriesTable              instruments;
    std::vector<std::string> missing;    ///< Tickers whose file does not exist
    std::vector<std::string> malformed;  ///< Tickers whose file lacks Date/Close
};

/// A named instrument series prior to alignment.
using NamedCloseSeries = std::pair<std::string, CloseSeries>;

class DataLoader {
public:
    /// Parse a CSV document with a header row containing Date and Close.
    ///
    /// # Returns
    /// `nullopt` if there is no header or it lacks either column.
    /// Later duplicates of a date replace earlier ones.
    [[nodiscard]] static std::optional<CloseSeries>
    parse_close_csv(std::string_view text) noexcept;

    /// Read and parse a file. `nullopt` if it cannot be opened or parsed.
    [[nodiscard]] static std::optional<CloseSeries>
    load_close_csv(const std::filesystem::path& path) noexcept;

    /// Replace each NaN with the last preceding non-NaN value.
    /// Leading NaNs stay NaN.
    static void forward_fill(std::vector<double>& values) noexcept;

    /// Align a benchmark with instrument series.
    ///
    /// Instruments are outer-joined on date (NaN where a ticker has no row),
    /// then restricted to dates the benchmark also has. Instruments are
    /// forward-filled before the join; the benchmark is not.
    [[nodiscard]] static std::optional<LoadResult>
    align(std::string benchmark_name,
          const CloseSeries& benchmark,
          std::span<const NamedCloseSeries> instruments) noexcept;

    /// Load `<benchmark>.csv` and `<ticker>.csv` for every ticker in `folder`.
    ///
    /// # Returns
    /// `nullopt` if the benchmark file is missing or malformed. Missing or
    /// malformed ticker files are skipped and listed in the result.
    [[nodiscard]] static std::optional<LoadResult>
    load_folder(const std::filesystem::path& folder,
                const std::string& benchmark,
                std::span<const std::string> tickers) noexcept;

private:
    /// Split on commas, trimming whitespace and surrounding quotes.
    [[nodiscard]] static std::vector<std::string_view>
    split_row(std::string_view line) noexcept;

    /// Parse a close value; NaN for empty or non-numeric text.
    [[nodiscard]] static double parse_close(std::string_view field) noexcept;
};

}  // namespace rrg::io
