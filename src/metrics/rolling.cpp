/// @file src/metrics/rolling.cpp
/// @brief Explicit trailing-window statistics with NaN propagation.
///
/// Every window is recomputed directly (two-pass mean / deviation) rather
/// than via running sums, so results do not drift across long series and
/// a flat window produces an exact zero deviation.

#include "rrg/metrics.hpp"

#include <cmath>
#include <limits>

namespace rrg::metrics {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/// Window statistics; `valid` is false if the window holds a NaN.
struct WindowStats {
    double mean;
    double pstdev;
    bool   valid;
};

WindowStats window_stats(std::span<const double> window) noexcept {
    const double first = window.front();
    bool flat = true;
    double sum = 0.0;
    for (double v : window) {
        if (std::isnan(v)) {
            return {NaN, NaN, false};
        }
        flat = flat && (v == first);
        sum += v;
    }

    if (flat) {
        // Constant window: exact mean, zero deviation.
        return {first, 0.0, true};
    }

    const double n    = static_cast<double>(window.size());
    const double mean = sum / n;
    double sq_sum = 0.0;
    for (double v : window) {
        const double d = v - mean;
        sq_sum += d * d;
    }
    // Population (ddof = 0) standard deviation.
    return {mean, std::sqrt(sq_sum / n), true};
}

template <typename Select>
std::vector<double> rolling_apply(std::span<const double> values,
                                  std::size_t window,
                                  Select select) noexcept {
    std::vector<double> out(values.size(), NaN);
    if (window == 0 || values.size() < window) {
        return out;
    }
    for (std::size_t t = window - 1; t < values.size(); ++t) {
        const auto stats = window_stats(values.subspan(t + 1 - window, window));
        if (stats.valid) {
            out[t] = select(stats);
        }
    }
    return out;
}

}  // anonymous namespace

// ─── rolling_mean ─────────────────────────────────────────────────────────────

std::vector<double>
rolling_mean(std::span<const double> values, std::size_t window) noexcept {
    return rolling_apply(values, window,
                         [](const WindowStats& s) { return s.mean; });
}

// ─── rolling_pstdev ───────────────────────────────────────────────────────────

std::vector<double>
rolling_pstdev(std::span<const double> values, std::size_t window) noexcept {
    return rolling_apply(values, window,
                         [](const WindowStats& s) { return s.pstdev; });
}

// ─── pct_change ───────────────────────────────────────────────────────────────

std::vector<double>
pct_change(std::span<const double> values, std::size_t periods) noexcept {
    std::vector<double> out(values.size(), NaN);
    for (std::size_t t = periods; t < values.size(); ++t) {
        const double prev = values[t - periods];
        const double curr = values[t];
        if (std::isnan(prev) || std::isnan(curr)) {
            continue;
        }
        out[t] = curr / prev - 1.0;
    }
    return out;
}

// ─── normalize ────────────────────────────────────────────────────────────────

std::vector<double>
normalize(std::span<const double> values,
          std::size_t window,
          double center) noexcept {
    std::vector<double> out(values.size(), NaN);
    if (window == 0 || values.size() < window) {
        return out;
    }
    for (std::size_t t = window - 1; t < values.size(); ++t) {
        const auto stats = window_stats(values.subspan(t + 1 - window, window));
        if (!stats.valid || stats.pstdev == 0.0) {
            // Zero variance is propagated as NaN, never clamped.
            continue;
        }
        out[t] = center + (values[t] - stats.mean) / stats.pstdev;
    }
    return out;
}

}  // namespace rrg::metrics
