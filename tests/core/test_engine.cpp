/// @file tests/core/test_engine.cpp
/// @brief Unit tests for EngineConfig validation and Engine orchestration.

#include <gtest/gtest.h>
#include "rrg/engine.hpp"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace rrg;
using namespace rrg::core;

namespace {

io::LoadResult make_data(std::size_t rows) {
    using namespace std::chrono;
    TimeIndex index;
    const sys_days first{year{2024} / January / 1};
    for (std::size_t i = 0; i < rows; ++i) {
        index.emplace_back(first + days{static_cast<int>(i)});
    }
    const auto n = static_cast<Eigen::Index>(rows);
    SeriesVector bench(n);
    SeriesMatrix prices(n, 2);
    for (Eigen::Index t = 0; t < n; ++t) {
        const double x = static_cast<double>(t);
        bench[t]     = 4000.0 + 5.0 * x;
        prices(t, 0) = 180.0 + 4.0 * std::sin(0.7 * x);
        prices(t, 1) = 90.0 + 0.3 * x + 2.0 * std::cos(0.4 * x);
    }
    return io::LoadResult{
        .benchmark   = *PriceSeries::make("^GSPC", index, bench),
        .instruments = *SeriesTable::make(index, {"AAPL", "MSFT"}, prices),
        .missing     = {},
        .malformed   = {},
    };
}

EngineConfig quiet_config() {
    EngineConfig cfg;
    cfg.window        = 5;
    cfg.tail          = 3;
    cfg.frame_count   = 4;
    cfg.write_outputs = false;
    return cfg;
}

}  // namespace

// ─── EngineConfig ────────────────────────────────────────────────────────────

TEST(EngineConfig, DefaultsMatchReferenceSetup) {
    const EngineConfig cfg;
    EXPECT_EQ(cfg.benchmark, "^GSPC");
    EXPECT_EQ(cfg.tickers.size(), 12u);
    EXPECT_EQ(cfg.window, 15u);
    EXPECT_EQ(cfg.tail, 3u);
    EXPECT_EQ(cfg.frame_count, 10u);
    ASSERT_EQ(cfg.sources.size(), 3u);
    EXPECT_EQ(cfg.sources[0].label, "Daily");
    EXPECT_FALSE(cfg.validate().has_value());
}

TEST(EngineConfig, ValidateRejectsBadValues) {
    EngineConfig cfg;
    cfg.window = 0;
    EXPECT_EQ(cfg.validate(), InputError::InvalidWindow);

    cfg = EngineConfig{};
    cfg.tail = 11;
    EXPECT_EQ(cfg.validate(), InputError::InvalidTail);

    cfg = EngineConfig{};
    cfg.sources.push_back({"Daily", "elsewhere"});
    EXPECT_EQ(cfg.validate(), InputError::DuplicateLabel);

    cfg = EngineConfig{};
    cfg.sources = {{"", "x"}};
    EXPECT_EQ(cfg.validate(), InputError::EmptyLabel);

    cfg = EngineConfig{};
    cfg.sources.clear();
    EXPECT_EQ(cfg.validate(), InputError::NoBundles);
}

TEST(Engine, OutputPathsUseLowercaseLabel) {
    EngineConfig cfg;
    cfg.output_dir = "out";
    const Engine engine(cfg);
    EXPECT_EQ(engine.ratio_path("Weekly"), std::filesystem::path("out/rrg_output_weekly.csv"));
    EXPECT_EQ(engine.frames_path("Daily"), std::filesystem::path("out/rrg_frames_daily.csv"));
}

// ─── Engine::process ─────────────────────────────────────────────────────────

TEST(Engine, ProcessComputesSeriesAndFrames) {
    const Engine engine(quiet_config());
    auto report = engine.process("Daily", make_data(40));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->label, "Daily");
    EXPECT_EQ(report->series.ratio.rows(), 40u);
    EXPECT_EQ(report->frames.size(), 5u);
    EXPECT_TRUE(report->ratio_csv.empty());
    EXPECT_TRUE(report->frames_csv.empty());
}

TEST(Engine, ProcessRejectsMisalignedData) {
    auto data = make_data(10);
    data.benchmark = *PriceSeries::make("^GSPC", {}, SeriesVector(0));
    const Engine engine(quiet_config());
    EXPECT_FALSE(engine.process("Daily", std::move(data)).has_value());
}

TEST(Engine, ComposeBuildsOneViewPerReport) {
    const Engine engine(quiet_config());
    std::vector<FrequencyReport> reports;
    reports.push_back(*engine.process("Daily", make_data(40)));
    reports.push_back(*engine.process("Weekly", make_data(20)));

    auto view = engine.compose(reports);
    ASSERT_TRUE(view.has_value());
    ASSERT_EQ(view->views.size(), 2u);
    EXPECT_EQ(view->default_label, "Daily");
    EXPECT_EQ(view->views[1].label, "Weekly");
}

// ─── Engine::run ─────────────────────────────────────────────────────────────

TEST(Engine, RunLoadsFoldersAndWritesOutputs) {
    const auto root = std::filesystem::temp_directory_path() /
                      ("rrg_engine_" + std::to_string(
                           std::chrono::steady_clock::now().time_since_epoch().count()));
    const auto daily = root / "daily";
    std::filesystem::create_directories(daily);

    {
        std::ofstream bench(daily / "^GSPC.csv");
        std::ofstream aapl(daily / "AAPL.csv");
        bench << "Date,Close\n";
        aapl  << "Date,Open,Close\n";
        for (int i = 0; i < 30; ++i) {
            const auto date = format_date(std::chrono::sys_days{
                std::chrono::year{2024} / std::chrono::January / 1} + std::chrono::days{i});
            bench << date << ',' << 4000.0 + 3.0 * i << '\n';
            aapl  << date << ",0," << 180.0 + 5.0 * std::sin(0.5 * i) << '\n';
        }
    }

    EngineConfig cfg = quiet_config();
    cfg.tickers       = {"AAPL", "MSFT"};
    cfg.sources       = {{"Daily", daily}, {"Weekly", root / "missing"}};
    cfg.output_dir    = root / "out";
    cfg.write_outputs = true;

    const Engine engine(cfg);
    const auto reports = engine.run();
    ASSERT_EQ(reports.size(), 1u);  // Weekly has no benchmark file
    const auto& r = reports[0];
    EXPECT_EQ(r.data.missing, (std::vector<std::string>{"MSFT"}));
    EXPECT_EQ(r.series.ratio.columns, (std::vector<std::string>{"AAPL"}));
    EXPECT_TRUE(std::filesystem::exists(root / "out" / "rrg_output_daily.csv"));
    EXPECT_TRUE(std::filesystem::exists(root / "out" / "rrg_frames_daily.csv"));
    EXPECT_EQ(r.ratio_csv, root / "out" / "rrg_output_daily.csv");

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}

TEST(Engine, RunWithInvalidConfigProducesNothing) {
    EngineConfig cfg = quiet_config();
    cfg.window = 0;
    const Engine engine(cfg);
    EXPECT_TRUE(engine.run().empty());
}
