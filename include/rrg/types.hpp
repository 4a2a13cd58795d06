#pragma once

/// @file include/rrg/types.hpp
/// @brief Shared time-indexed table types for the Relative Rotation Graph
///        (RRG) system.
///
/// # Module: Core Types
///
/// ## Responsibility
/// Hold aligned price and indicator data in a shape every module agrees on:
/// a strictly increasing `TimeIndex`, ordered unique column identifiers and
/// an Eigen matrix with one row per timestamp and one column per instrument.
///
/// ## Guarantees
/// - Values obtained through `make()` are well-formed: shapes agree, column
///   ids are unique and the time index is strictly increasing
/// - Matrices are column-major, so `column(j)` is a contiguous view
/// - No reindexing ever happens inside the core; derived tables reuse the
///   input's index verbatim

#include <Eigen/Dense>

#include <chrono>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rrg {

// ─── Time ─────────────────────────────────────────────────────────────────────

/// A calendar day. Intraday resolution is never needed by the indicators.
using Date = std::chrono::year_month_day;

/// Ordered timestamps shared by every series of one computation.
using TimeIndex = std::vector<Date>;

/// Parse `YYYY-MM-DD`, ignoring anything after the day (e.g. a time or
/// timezone suffix such as `2024-01-02 00:00:00-05:00`).
///
/// # Returns
/// `nullopt` if the prefix is not a valid calendar date.
[[nodiscard]] std::optional<Date> parse_date(std::string_view text) noexcept;

/// Format as ISO `YYYY-MM-DD`.
[[nodiscard]] std::string format_date(const Date& date);

/// True if every element is strictly greater than its predecessor.
[[nodiscard]] bool is_strictly_increasing(const TimeIndex& index) noexcept;

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Dense column of observations (one value per timestamp).
using SeriesVector = Eigen::VectorXd;

/// Dense table of observations: rows = timestamps, cols = instruments.
using SeriesMatrix = Eigen::MatrixXd;

// ─── PriceSeries ──────────────────────────────────────────────────────────────

/// A single named series over a time index (e.g. the benchmark close).
struct PriceSeries {
    std::string  name;
    TimeIndex    index;
    SeriesVector values;

    /// Validated factory.
    ///
    /// # Returns
    /// `nullopt` if `values.size() != index.size()` or the index is not
    /// strictly increasing.
    [[nodiscard]] static std::optional<PriceSeries>
    make(std::string name, TimeIndex index, SeriesVector values) noexcept;

    [[nodiscard]] std::size_t size() const noexcept {
        return static_cast<std::size_t>(values.size());
    }

    [[nodiscard]] std::span<const double> view() const noexcept {
        return {values.data(), size()};
    }
};

// ─── SeriesTable ──────────────────────────────────────────────────────────────

/// A time-indexed table with one column per instrument identifier.
///
/// Used for the instrument price table as well as the derived ratio and
/// momentum tables.
struct SeriesTable {
    TimeIndex                index;
    std::vector<std::string> columns;
    SeriesMatrix             values;

    /// Validated factory.
    ///
    /// # Returns
    /// `nullopt` if the matrix shape disagrees with `index` / `columns`,
    /// a column id is repeated, the index is not strictly increasing, or
    /// allocation fails.
    [[nodiscard]] static std::optional<SeriesTable>
    make(TimeIndex index,
         std::vector<std::string> columns,
         SeriesMatrix values) noexcept;

    /// Number of timestamps.
    [[nodiscard]] std::size_t rows() const noexcept {
        return static_cast<std::size_t>(values.rows());
    }

    /// Number of instruments.
    [[nodiscard]] std::size_t cols() const noexcept {
        return static_cast<std::size_t>(values.cols());
    }

    /// Contiguous read-only view of column `j`. Precondition: j < cols().
    [[nodiscard]] std::span<const double> column(std::size_t j) const noexcept {
        return {values.col(static_cast<Eigen::Index>(j)).data(), rows()};
    }

    /// Position of `id` in `columns`, or `nullopt`.
    [[nodiscard]] std::optional<std::size_t>
    find_column(std::string_view id) const noexcept;

    /// True if `other` has the same index and the same ordered columns.
    [[nodiscard]] bool same_shape(const SeriesTable& other) const noexcept;
};

} // namespace rrg
