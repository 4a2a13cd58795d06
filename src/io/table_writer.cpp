/// @file src/io/table_writer.cpp
/// @brief CSV rendering of ratio tables and frames.

#include "rrg/table_writer.hpp"

#include <fmt/format.h>

#include <cmath>
#include <fstream>
#include <iterator>
#include <new>
#include <system_error>

namespace rrg::io {

namespace {

void append_value(std::string& out, double value, std::string_view na_rep) {
    if (std::isnan(value)) {
        out.append(na_rep);
    } else {
        fmt::format_to(std::back_inserter(out), "{}", value);
    }
}

}  // anonymous namespace

// ─── TableWriter::to_csv ──────────────────────────────────────────────────────

std::string TableWriter::to_csv(const SeriesTable& table, std::string_view na_rep) {
    std::string out = "Date";
    for (const auto& id : table.columns) {
        out += ',';
        out += id;
    }
    out += '\n';

    for (std::size_t r = 0; r < table.rows(); ++r) {
        out += format_date(table.index[r]);
        for (std::size_t j = 0; j < table.cols(); ++j) {
            out += ',';
            append_value(out, table.values(static_cast<Eigen::Index>(r),
                                           static_cast<Eigen::Index>(j)), na_rep);
        }
        out += '\n';
    }
    return out;
}

// ─── TableWriter::frames_to_csv ───────────────────────────────────────────────

std::string TableWriter::frames_to_csv(const frames::FrameSet& set,
                                       std::string_view na_rep) {
    std::string out = "frame,instrument,point,ratio,momentum,label,symbol,size\n";
    for (const auto& frame : set.frames) {
        for (const auto& trace : frame.traces) {
            for (std::size_t p = 0; p < trace.size(); ++p) {
                fmt::format_to(std::back_inserter(out), "{},{},{},",
                               frame.key, trace.instrument, p);
                append_value(out, trace.ratio[p], na_rep);
                out += ',';
                append_value(out, trace.momentum[p], na_rep);
                fmt::format_to(std::back_inserter(out), ",{},{},{}\n",
                               trace.labels[p],
                               frames::to_string(trace.markers[p].symbol),
                               trace.markers[p].size);
            }
        }
    }
    return out;
}

// ─── TableWriter::write_text ──────────────────────────────────────────────────

bool TableWriter::write_text(const std::filesystem::path& path,
                             const std::string& text) noexcept {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return false;
        }
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file << text;
    return static_cast<bool>(file);
}

// ─── TableWriter::write_csv / write_frames ────────────────────────────────────

bool TableWriter::write_csv(const SeriesTable& table,
                            const std::filesystem::path& path,
                            std::string_view na_rep) noexcept {
    try {
        return write_text(path, to_csv(table, na_rep));
    } catch (const std::bad_alloc&) {
        return false;
    }
}

bool TableWriter::write_frames(const frames::FrameSet& set,
                               const std::filesystem::path& path,
                               std::string_view na_rep) noexcept {
    try {
        return write_text(path, frames_to_csv(set, na_rep));
    } catch (const std::bad_alloc&) {
        return false;
    }
}

}  // namespace rrg::io
