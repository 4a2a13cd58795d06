/// @file src/metrics/metrics_engine.cpp
/// @brief MetricsEngine — RS-Ratio and RS-Momentum tables.

#include "rrg/metrics.hpp"

#include <algorithm>

namespace rrg::metrics {

namespace {

/// Copy a computed column into column `j` of `dst`.
void store_column(SeriesMatrix& dst,
                  std::size_t j,
                  const std::vector<double>& column) noexcept {
    const auto col = static_cast<Eigen::Index>(j);
    std::copy(column.begin(), column.end(), dst.col(col).data());
}

}  // anonymous namespace

// ─── MetricsEngine::check ─────────────────────────────────────────────────────

std::optional<InputError>
MetricsEngine::check(const PriceSeries& benchmark,
                     const SeriesTable& instruments,
                     std::size_t window) noexcept {
    if (window < 1) {
        return InputError::InvalidWindow;
    }
    if (benchmark.index != instruments.index ||
        benchmark.size() != instruments.rows()) {
        return InputError::IndexMismatch;
    }
    return std::nullopt;
}

// ─── MetricsEngine::raw_ratio ─────────────────────────────────────────────────

SeriesMatrix
MetricsEngine::raw_ratio(const PriceSeries& benchmark,
                         const SeriesTable& instruments) noexcept {
    // Elementwise; a zero benchmark yields inf / NaN by IEEE rules.
    return (instruments.values.array().colwise() / benchmark.values.array()).matrix();
}

// ─── MetricsEngine::compute ───────────────────────────────────────────────────

std::optional<RrgSeries>
MetricsEngine::compute(const PriceSeries& benchmark,
                       const SeriesTable& instruments,
                       std::size_t window) noexcept {
    if (check(benchmark, instruments, window)) {
        return std::nullopt;
    }

    const auto rows = static_cast<Eigen::Index>(instruments.rows());
    const auto cols = static_cast<Eigen::Index>(instruments.cols());

    const SeriesMatrix raw = raw_ratio(benchmark, instruments);
    SeriesMatrix ratio(rows, cols);
    SeriesMatrix momentum(rows, cols);

    for (std::size_t j = 0; j < instruments.cols(); ++j) {
        const auto col = static_cast<Eigen::Index>(j);
        const std::span<const double> raw_col{raw.col(col).data(),
                                              instruments.rows()};

        // ── RS-Ratio ─────────────────────────────────────────────────────────
        const auto ratio_col = normalize(raw_col, window, constants::RATIO_CENTER);

        // ── Rate of change of the ratio, in percent ──────────────────────────
        auto roc = pct_change(ratio_col, constants::ROC_PERIODS);
        for (double& v : roc) {
            v *= constants::ROC_SCALE;
        }

        // ── RS-Momentum ──────────────────────────────────────────────────────
        const auto momentum_col = normalize(roc, window, constants::MOMENTUM_CENTER);

        store_column(ratio, j, ratio_col);
        store_column(momentum, j, momentum_col);
    }

    return RrgSeries{
        .ratio = SeriesTable{
            .index   = instruments.index,
            .columns = instruments.columns,
            .values  = std::move(ratio),
        },
        .momentum = SeriesTable{
            .index   = instruments.index,
            .columns = instruments.columns,
            .values  = std::move(momentum),
        },
    };
}

}  // namespace rrg::metrics
