/**
 * @file  bench/bench_rrg.cpp
 * @brief Google Benchmark suite for the RRG Metrics Engine and Frame Builder.
 *
 * Benchmarks
 * ----------
 *   BM_RollingPstdev      — single column, window 15
 *   BM_MetricsEngine      — rows × 12 instruments, window 15
 *   BM_FrameBuilder       — 12 instruments, tail 3, 10 historical frames
 *
 * Build (CMake):
 *   cmake -DRRG_BENCH=ON ..
 *   cmake --build build --target bench_rrg
 *   ./build/bench_rrg --benchmark_format=json
 *
 * Throughput units: items/second (rows processed).
 */

#include "benchmark/benchmark.h"

#include "rrg/frames.hpp"
#include "rrg/metrics.hpp"
#include "rrg/types.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

namespace {

constexpr std::size_t INSTRUMENTS = 12;

rrg::TimeIndex make_index(std::size_t n) {
    using namespace std::chrono;
    rrg::TimeIndex index;
    index.reserve(n);
    const sys_days first{year{1990} / January / 1};
    for (std::size_t i = 0; i < n; ++i) {
        index.emplace_back(first + days{static_cast<int>(i)});
    }
    return index;
}

/// Benchmark and instrument prices following smooth, distinct paths.
std::pair<rrg::PriceSeries, rrg::SeriesTable> make_market(std::size_t n) {
    const auto rows = static_cast<Eigen::Index>(n);
    rrg::SeriesVector bench(rows);
    rrg::SeriesMatrix prices(rows, static_cast<Eigen::Index>(INSTRUMENTS));
    std::vector<std::string> ids;
    for (std::size_t j = 0; j < INSTRUMENTS; ++j) {
        ids.push_back("T" + std::to_string(j));
    }
    for (Eigen::Index t = 0; t < rows; ++t) {
        const double x = static_cast<double>(t);
        bench[t] = 1000.0 + 0.1 * x + 5.0 * std::sin(0.01 * x);
        for (Eigen::Index j = 0; j < prices.cols(); ++j) {
            prices(t, j) = 100.0 + 10.0 * std::sin(0.02 * x + static_cast<double>(j));
        }
    }
    auto index = make_index(n);
    return {*rrg::PriceSeries::make("B", index, bench),
            *rrg::SeriesTable::make(index, ids, prices)};
}

}  // namespace

// ── Rolling statistics ─────────────────────────────────────────────────────────

static void BM_RollingPstdev(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto [bench, prices] = make_market(n);
    for (auto _ : state) {
        auto sd = rrg::metrics::rolling_pstdev(prices.column(0), 15);
        benchmark::DoNotOptimize(sd.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_RollingPstdev)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

// ── Metrics Engine ─────────────────────────────────────────────────────────────

static void BM_MetricsEngine(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto [bench, prices] = make_market(n);
    for (auto _ : state) {
        auto series = rrg::metrics::MetricsEngine::compute(bench, prices, 15);
        benchmark::DoNotOptimize(series);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(n * INSTRUMENTS));
}
BENCHMARK(BM_MetricsEngine)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

// ── Frame Builder ──────────────────────────────────────────────────────────────

static void BM_FrameBuilder(benchmark::State& state) {
    const auto [bench, prices] = make_market(2048);
    const auto series = rrg::metrics::MetricsEngine::compute(bench, prices, 15);
    const auto frames = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        auto set = rrg::frames::FrameBuilder::build(series->ratio, series->momentum, 3, frames);
        benchmark::DoNotOptimize(set);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(frames + 1));
}
BENCHMARK(BM_FrameBuilder)->Arg(10)->Arg(100)->Arg(1000)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
