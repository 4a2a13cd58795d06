#pragma once

/// @file include/rrg/table_writer.hpp
/// @brief CSV sink for computed RRG tables and frame sequences.
///
/// Table layout: header `Date,<id>...`, one row per timestamp, ISO dates,
/// shortest round-trip formatting for doubles, NaN written as `na_rep`.
///
/// Frame layout: header `frame,instrument,point,ratio,momentum,label,symbol,size`,
/// one row per trail point, frames in chronological order.

#include "rrg/frames.hpp"
#include "rrg/types.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace rrg::io {

class TableWriter {
public:
    /// Render a table as CSV text.
    [[nodiscard]] static std::string
    to_csv(const SeriesTable& table, std::string_view na_rep = "");

    /// Render a frame sequence as CSV text.
    [[nodiscard]] static std::string
    frames_to_csv(const frames::FrameSet& set, std::string_view na_rep = "");

    /// Write `to_csv(table)` to `path`, creating parent directories.
    /// Returns false if the file cannot be written.
    [[nodiscard]] static bool
    write_csv(const SeriesTable& table,
              const std::filesystem::path& path,
              std::string_view na_rep = "") noexcept;

    /// Write `frames_to_csv(set)` to `path`, creating parent directories.
    [[nodiscard]] static bool
    write_frames(const frames::FrameSet& set,
                 const std::filesystem::path& path,
                 std::string_view na_rep = "") noexcept;

private:
    [[nodiscard]] static bool
    write_text(const std::filesystem::path& path, const std::string& text) noexcept;
};

}  // namespace rrg::io
