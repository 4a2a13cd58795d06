/// @file tests/io/test_data_loader.cpp
/// @brief Unit tests for DataLoader (CSV parsing, forward fill, alignment).

#include <gtest/gtest.h>
#include "rrg/data_loader.hpp"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <vector>

using namespace rrg;
using namespace rrg::io;
using namespace std::chrono;

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() /
                ("rrg_loader_" + std::to_string(
                     std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    const std::filesystem::path& path() const { return path_; }

    void write(const std::string& name, const std::string& text) const {
        std::ofstream(path_ / name) << text;
    }

private:
    std::filesystem::path path_;
};

}  // namespace

// ─── parse_close_csv ─────────────────────────────────────────────────────────

TEST(DataLoader, ParsesDateAndClose) {
    const std::string csv =
        "Date,Open,High,Low,Close,Volume\n"
        "2024-01-03,1,1,1,10.5,100\n"
        "2024-01-02,1,1,1,10.0,100\n";
    auto s = DataLoader::parse_close_csv(csv);
    ASSERT_TRUE(s.has_value());
    ASSERT_EQ(s->dates.size(), 2u);
    EXPECT_EQ(s->dates[0], year{2024} / January / 2);  // sorted
    EXPECT_DOUBLE_EQ(s->closes[0], 10.0);
    EXPECT_DOUBLE_EQ(s->closes[1], 10.5);
}

TEST(DataLoader, HeaderIsCaseInsensitiveAndOrderFree) {
    const std::string csv =
        "close,DATE\r\n"
        "3.5,2024-02-01\r\n";
    auto s = DataLoader::parse_close_csv(csv);
    ASSERT_TRUE(s.has_value());
    ASSERT_EQ(s->closes.size(), 1u);
    EXPECT_DOUBLE_EQ(s->closes[0], 3.5);
}

TEST(DataLoader, MissingColumnsRejected) {
    EXPECT_FALSE(DataLoader::parse_close_csv("Date,Open\n2024-01-02,1\n").has_value());
    EXPECT_FALSE(DataLoader::parse_close_csv("").has_value());
}

TEST(DataLoader, BadDatesSkippedBadClosesAreNaN) {
    const std::string csv =
        "Date,Close\n"
        "not-a-date,1\n"
        "2024-01-02,\n"
        "2024-01-03,abc\n"
        "2024-01-04,7\n"
        "2024-01-05\n";
    auto s = DataLoader::parse_close_csv(csv);
    ASSERT_TRUE(s.has_value());
    ASSERT_EQ(s->dates.size(), 3u);
    EXPECT_TRUE(std::isnan(s->closes[0]));
    EXPECT_TRUE(std::isnan(s->closes[1]));
    EXPECT_DOUBLE_EQ(s->closes[2], 7.0);
}

TEST(DataLoader, LaterDuplicateDateWins) {
    const std::string csv = "Date,Close\n2024-01-02,1\n2024-01-02,2\n";
    auto s = DataLoader::parse_close_csv(csv);
    ASSERT_TRUE(s.has_value());
    ASSERT_EQ(s->closes.size(), 1u);
    EXPECT_DOUBLE_EQ(s->closes[0], 2.0);
}

// ─── forward_fill ────────────────────────────────────────────────────────────

TEST(DataLoader, ForwardFillKeepsLeadingNaN) {
    std::vector<double> v{NaN, 1.0, NaN, NaN, 4.0, NaN};
    DataLoader::forward_fill(v);
    EXPECT_TRUE(std::isnan(v[0]));
    EXPECT_DOUBLE_EQ(v[1], 1.0);
    EXPECT_DOUBLE_EQ(v[2], 1.0);
    EXPECT_DOUBLE_EQ(v[3], 1.0);
    EXPECT_DOUBLE_EQ(v[4], 4.0);
    EXPECT_DOUBLE_EQ(v[5], 4.0);
}

// ─── align ───────────────────────────────────────────────────────────────────

TEST(DataLoader, AlignIntersectsWithBenchmark) {
    CloseSeries bench{{year{2024} / January / 2, year{2024} / January / 3,
                       year{2024} / January / 4, year{2024} / January / 5},
                      {100, 101, 102, 103}};
    CloseSeries a{{year{2024} / January / 1, year{2024} / January / 3,
                   year{2024} / January / 4},
                  {10, 11, NaN}};
    CloseSeries b{{year{2024} / January / 4, year{2024} / January / 5},
                  {20, 21}};
    const std::vector<NamedCloseSeries> inst{{"A", a}, {"B", b}};

    auto r = DataLoader::align("BENCH", bench, inst);
    ASSERT_TRUE(r.has_value());

    // Union of instrument dates ∩ benchmark dates = Jan 3, 4, 5.
    ASSERT_EQ(r->instruments.rows(), 3u);
    EXPECT_EQ(r->instruments.index.front(), year{2024} / January / 3);
    EXPECT_EQ(r->benchmark.index, r->instruments.index);
    EXPECT_EQ(r->instruments.columns, (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(r->benchmark.name, "BENCH");
    EXPECT_DOUBLE_EQ(r->benchmark.values[0], 101.0);

    const auto col_a = r->instruments.column(0);
    EXPECT_DOUBLE_EQ(col_a[0], 11.0);
    EXPECT_DOUBLE_EQ(col_a[1], 11.0);   // forward-filled
    EXPECT_TRUE(std::isnan(col_a[2]));  // A has no Jan 5 row

    const auto col_b = r->instruments.column(1);
    EXPECT_TRUE(std::isnan(col_b[0]));
    EXPECT_DOUBLE_EQ(col_b[2], 21.0);
}

TEST(DataLoader, AlignRejectsDuplicateTickers) {
    CloseSeries s{{year{2024} / January / 2}, {1.0}};
    const std::vector<NamedCloseSeries> inst{{"A", s}, {"A", s}};
    EXPECT_FALSE(DataLoader::align("B", s, inst).has_value());
}

// ─── load_folder ─────────────────────────────────────────────────────────────

TEST(DataLoader, LoadFolderReportsMissingAndMalformed) {
    TempDir dir;
    dir.write("^GSPC.csv", "Date,Close\n2024-01-02,100\n2024-01-03,101\n");
    dir.write("AAPL.csv", "Date,Close\n2024-01-02,10\n2024-01-03,11\n");
    dir.write("BAD.csv",  "Foo,Bar\n1,2\n");

    const std::vector<std::string> tickers{"AAPL", "MSFT", "BAD"};
    auto r = DataLoader::load_folder(dir.path(), "^GSPC", tickers);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->instruments.columns, (std::vector<std::string>{"AAPL"}));
    EXPECT_EQ(r->missing, (std::vector<std::string>{"MSFT"}));
    EXPECT_EQ(r->malformed, (std::vector<std::string>{"BAD"}));
    EXPECT_EQ(r->instruments.rows(), 2u);
}

TEST(DataLoader, LoadFolderWithoutBenchmarkFails) {
    TempDir dir;
    dir.write("AAPL.csv", "Date,Close\n2024-01-02,10\n");
    const std::vector<std::string> tickers{"AAPL"};
    EXPECT_FALSE(DataLoader::load_folder(dir.path(), "^GSPC", tickers).has_value());
}

TEST(DataLoader, LoadMissingFileIsNullopt) {
    EXPECT_FALSE(DataLoader::load_close_csv("/nonexistent/rrg/file.csv").has_value());
}
