/// @file tests/integration/test_full_pipeline.cpp
/// @brief End-to-end integration tests for the RRG pipeline.
///
/// These tests exercise the complete path:
///   CSV text → DataLoader → MetricsEngine → FrameBuilder →
///   RotationComposer / TableWriter

#include "rrg/constants.hpp"
#include "rrg/data_loader.hpp"
#include "rrg/frames.hpp"
#include "rrg/metrics.hpp"
#include "rrg/quadrant.hpp"
#include "rrg/rotation.hpp"
#include "rrg/table_writer.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <sstream>
#include <string>
#include <vector>

using namespace rrg;

// ─── Synthetic data helpers ───────────────────────────────────────────────────

namespace {

/// Aligned benchmark + instruments over `n` consecutive days from 2024-01-01.
/// "LEAD" outperforms the benchmark, "LAG" underperforms, "WAVE" oscillates.
io::LoadResult make_market(std::size_t n) {
    using namespace std::chrono;
    io::CloseSeries bench;
    std::vector<io::NamedCloseSeries> inst{{"LEAD", {}}, {"LAG", {}}, {"WAVE", {}}};
    const sys_days first{year{2024} / January / 1};
    for (std::size_t i = 0; i < n; ++i) {
        const Date d = first + days{static_cast<int>(i)};
        const double x = static_cast<double>(i);
        bench.dates.push_back(d);
        bench.closes.push_back(4000.0 * (1.0 + 0.001 * x));
        for (auto& [name, s] : inst) {
            s.dates.push_back(d);
        }
        inst[0].second.closes.push_back(100.0 * std::pow(1.004, x) + std::sin(x));
        inst[1].second.closes.push_back(100.0 * std::pow(0.997, x) + std::cos(x));
        inst[2].second.closes.push_back(100.0 + 5.0 * std::sin(0.3 * x));
    }
    return *io::DataLoader::align("^GSPC", bench, inst);
}

}  // namespace

// ─── Scenario: 20 days, window 5, tail 3, 4 historical frames ────────────────

TEST(FullPipeline, TwentyDayScenario) {
    auto market = make_market(20);
    market.instruments = *SeriesTable::make(
        market.instruments.index,
        {"LEAD", "LAG"},
        SeriesMatrix(market.instruments.values.leftCols(2)));

    auto series = metrics::MetricsEngine::compute(market.benchmark, market.instruments, 5);
    ASSERT_TRUE(series.has_value());
    EXPECT_EQ(series->ratio.rows(), 20u);
    EXPECT_EQ(series->momentum.rows(), 20u);
    EXPECT_EQ(series->ratio.columns, market.instruments.columns);

    auto set = frames::FrameBuilder::build(series->ratio, series->momentum, 3, 4);
    ASSERT_TRUE(set.has_value());
    ASSERT_EQ(set->frames.size(), 5u);
    ASSERT_EQ(set->steps.size(), 5u);

    for (std::size_t k = 0; k < 5; ++k) {
        EXPECT_EQ(set->steps[k].frame_key, set->frames[k].key);
        if (k > 0) {
            EXPECT_LT(set->frames[k - 1].key, set->frames[k].key);
        }
    }
    const auto& last = set->frames.back();
    EXPECT_EQ(last.start, 17u);
    EXPECT_EQ(last.end, 20u);
    EXPECT_EQ(last.key, "2024-01-18 - 2024-01-20");
    for (const auto& trace : last.traces) {
        EXPECT_EQ(trace.size(), 3u);
        EXPECT_EQ(trace.labels.back(), trace.instrument);
    }
}

// ─── Scenario: multiple frequencies composed into one view ───────────────────

TEST(FullPipeline, ComposesDailyAndWeeklyViews) {
    std::vector<rotation::FrequencyBundle> bundles;
    for (const auto& [label, rows] : {std::pair<std::string, std::size_t>{"Daily", 120},
                                      std::pair<std::string, std::size_t>{"Weekly", 40}}) {
        const auto market = make_market(rows);
        auto series = metrics::MetricsEngine::compute(market.benchmark, market.instruments,
                                                   constants::DEFAULT_WINDOW);
        ASSERT_TRUE(series.has_value());
        auto bundle = rotation::FrequencyBundle::make(label, std::move(*series));
        ASSERT_TRUE(bundle.has_value());
        bundles.push_back(std::move(*bundle));
    }

    auto view = rotation::RotationComposer::compose(bundles);
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->default_view().label, "Daily");

    for (const auto& fv : view->views) {
        EXPECT_EQ(fv.frames.size(), constants::DEFAULT_FRAME_COUNT + 1);
        const auto& head = fv.frames.frames[fv.active_step];
        ASSERT_EQ(head.traces.size(), 3u);
        for (const auto& trace : head.traces) {
            // Series long enough for every point to be defined.
            EXPECT_TRUE(frames::head_quadrant(trace).has_value()) << trace.instrument;
        }
    }
}

// ─── Scenario: persistence of the ratio table ────────────────────────────────

TEST(FullPipeline, RatioTableSerialisesOneRowPerTimestamp) {
    const auto market = make_market(25);
    auto series = metrics::MetricsEngine::compute(market.benchmark, market.instruments, 5);
    ASSERT_TRUE(series.has_value());

    const auto csv = io::TableWriter::to_csv(series->ratio);
    std::istringstream in(csv);
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line, "Date,LEAD,LAG,WAVE");

    std::size_t rows = 0;
    while (std::getline(in, line)) {
        ++rows;
        if (rows == 1) {
            // Window not yet full: every ratio is missing.
            EXPECT_EQ(line, "2024-01-01,,,");
        }
    }
    EXPECT_EQ(rows, 25u);
}
