#pragma once

/// @file include/rrg/metrics.hpp
/// @brief Metrics Engine — JdK-style RS-Ratio and RS-Momentum.
///
/// # Module: Metrics Engine
///
/// ## Responsibility
/// Turn an aligned benchmark series and instrument price table into the two
/// normalised RRG tables via chained rolling statistics.
///
/// ## Formula
/// For each instrument column, window `w`:
///   raw[t]      = instrument[t] / benchmark[t]
///   ratio[t]    = 100 + (raw[t] − mean_w(raw)[t]) / pstdev_w(raw)[t]
///   roc[t]      = (ratio[t] / ratio[t−5] − 1) · 100
///   momentum[t] = 101 + (roc[t] − mean_w(roc)[t]) / pstdev_w(roc)[t]
///
/// `pstdev` is the population standard deviation (denominator w).
///
/// ## Edge Cases
/// - First w−1 ratio rows and first 2w+3 momentum rows are NaN
/// - pstdev == 0 (flat window) → NaN, propagated (not clamped)
/// - Division by a zero benchmark yields ±inf / NaN, propagated
///
/// ## Guarantees
/// - Pure and reentrant: no shared state, no I/O
/// - Output index and columns are exactly the input's
/// - Only precondition violations fail; see `check()`

#include "rrg/constants.hpp"
#include "rrg/input_error.hpp"
#include "rrg/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace rrg::metrics {

// ─── Rolling Statistics ───────────────────────────────────────────────────────

/// Trailing mean over `window` observations (inclusive of the current one).
///
/// Entries with fewer than `window` observations, or with a NaN inside the
/// window, are NaN. A window of identical values yields that value exactly.
/// Precondition: window >= 1.
[[nodiscard]] std::vector<double>
rolling_mean(std::span<const double> values, std::size_t window) noexcept;

/// Trailing population standard deviation (ddof = 0), same NaN rules as
/// `rolling_mean`. A window of identical values yields exactly 0.
/// Precondition: window >= 1.
[[nodiscard]] std::vector<double>
rolling_pstdev(std::span<const double> values, std::size_t window) noexcept;

/// Fractional change over `periods` observations: x[t] / x[t−p] − 1.
/// NaN for t < p or when either operand is NaN.
[[nodiscard]] std::vector<double>
pct_change(std::span<const double> values, std::size_t periods) noexcept;

/// Rolling z-score recentred on `center`:
///   center + (x[t] − mean[t]) / pstdev[t]
/// NaN wherever the statistics are undefined or pstdev is exactly 0.
[[nodiscard]] std::vector<double>
normalize(std::span<const double> values,
          std::size_t window,
          double center) noexcept;

// ─── RrgSeries ────────────────────────────────────────────────────────────────

/// Output of one Metrics Engine invocation.
struct RrgSeries {
    SeriesTable ratio;     ///< JdK RS-Ratio, centred on 100
    SeriesTable momentum;  ///< JdK RS-Momentum, centred on 101
};

// ─── MetricsEngine ────────────────────────────────────────────────────────────

/// Stateless RS-Ratio / RS-Momentum calculator.
class MetricsEngine {
public:
    /// Validate the inputs of `compute()`.
    ///
    /// # Returns
    /// The first violated precondition, or `nullopt` if the inputs are usable:
    /// - `InvalidWindow` if `window < 1`
    /// - `IndexMismatch` if benchmark and instruments do not share an
    ///   identical time index
    [[nodiscard]] static std::optional<InputError>
    check(const PriceSeries& benchmark,
          const SeriesTable& instruments,
          std::size_t window) noexcept;

    /// Compute the normalised ratio and momentum tables.
    ///
    /// # Returns
    /// `nullopt` exactly when `check()` reports an error.
    [[nodiscard]] static std::optional<RrgSeries>
    compute(const PriceSeries& benchmark,
            const SeriesTable& instruments,
            std::size_t window = constants::DEFAULT_WINDOW) noexcept;

    /// Raw relative strength: instrument / benchmark, elementwise per column.
    /// Precondition: `check()` passed.
    [[nodiscard]] static SeriesMatrix
    raw_ratio(const PriceSeries& benchmark,
              const SeriesTable& instruments) noexcept;
};

} // namespace rrg::metrics
