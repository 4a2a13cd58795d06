/// @file src/io/data_loader.cpp
/// @brief CSV DataLoader for benchmark / instrument closes.

#include "rrg/data_loader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <map>
#include <new>
#include <set>
#include <sstream>

namespace rrg::io {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n\"");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n\"");
    return s.substr(first, last - first + 1);
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

/// Column position of a header name (case-insensitive), or -1.
int find_col(const std::vector<std::string_view>& header, std::string_view name) noexcept {
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (iequals(header[i], name)) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

/// Value of `series` at `date`, or NaN if the series has no such row.
double value_at(const CloseSeries& series, const Date& date) noexcept {
    const auto it = std::lower_bound(series.dates.begin(), series.dates.end(), date);
    if (it == series.dates.end() || *it != date) {
        return NaN;
    }
    return series.closes[static_cast<std::size_t>(it - series.dates.begin())];
}

}  // anonymous namespace

// ─── DataLoader::split_row ────────────────────────────────────────────────────

std::vector<std::string_view> DataLoader::split_row(std::string_view line) noexcept {
    std::vector<std::string_view> fields;
    std::size_t pos = 0;
    while (true) {
        const auto comma = line.find(',', pos);
        if (comma == std::string_view::npos) {
            fields.push_back(trim(line.substr(pos)));
            break;
        }
        fields.push_back(trim(line.substr(pos, comma - pos)));
        pos = comma + 1;
    }
    return fields;
}

// ─── DataLoader::parse_close ──────────────────────────────────────────────────

double DataLoader::parse_close(std::string_view field) noexcept {
    if (field.empty()) {
        return NaN;
    }
    double value = 0.0;
    const auto* last = field.data() + field.size();
    const auto [ptr, ec] = std::from_chars(field.data(), last, value);
    if (ec != std::errc{} || ptr != last) {
        return NaN;
    }
    return value;
}

// ─── DataLoader::parse_close_csv ──────────────────────────────────────────────

std::optional<CloseSeries> DataLoader::parse_close_csv(std::string_view text) noexcept {
    try {
        std::map<Date, double> rows;
        int col_date  = -1;
        int col_close = -1;
        bool have_header = false;

        std::size_t pos = 0;
        while (pos <= text.size()) {
            auto nl = text.find('\n', pos);
            if (nl == std::string_view::npos) {
                nl = text.size();
            }
            std::string_view line = text.substr(pos, nl - pos);
            pos = nl + 1;

            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            if (trim(line).empty() || line.front() == '#') {
                continue;
            }

            const auto fields = split_row(line);
            if (!have_header) {
                col_date    = find_col(fields, "date");
                col_close   = find_col(fields, "close");
                have_header = true;
                if (col_date < 0 || col_close < 0) {
                    return std::nullopt;
                }
                continue;
            }

            const auto need = static_cast<std::size_t>(std::max(col_date, col_close));
            if (fields.size() <= need) {
                continue;  // short row
            }
            const auto date = parse_date(fields[static_cast<std::size_t>(col_date)]);
            if (!date) {
                continue;
            }
            rows[*date] = parse_close(fields[static_cast<std::size_t>(col_close)]);
        }

        if (!have_header) {
            return std::nullopt;
        }

        CloseSeries series;
        series.dates.reserve(rows.size());
        series.closes.reserve(rows.size());
        for (const auto& [date, close] : rows) {
            series.dates.push_back(date);
            series.closes.push_back(close);
        }
        return series;
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

// ─── DataLoader::load_close_csv ───────────────────────────────────────────────

std::optional<CloseSeries>
DataLoader::load_close_csv(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            return std::nullopt;
        }
        std::ostringstream contents;
        contents << file.rdbuf();
        return parse_close_csv(contents.str());
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

// ─── DataLoader::forward_fill ─────────────────────────────────────────────────

void DataLoader::forward_fill(std::vector<double>& values) noexcept {
    double last = NaN;
    for (double& v : values) {
        if (std::isnan(v)) {
            v = last;
        } else {
            last = v;
        }
    }
}

// ─── DataLoader::align ────────────────────────────────────────────────────────

std::optional<LoadResult>
DataLoader::align(std::string benchmark_name,
                  const CloseSeries& benchmark,
                  std::span<const NamedCloseSeries> instruments) noexcept {
    try {
        // Outer join of instrument dates.
        std::set<Date> joined;
        for (const auto& [name, series] : instruments) {
            joined.insert(series.dates.begin(), series.dates.end());
        }

        // Restrict to dates the benchmark also has (both inputs are sorted).
        TimeIndex common;
        std::set_intersection(benchmark.dates.begin(), benchmark.dates.end(),
                              joined.begin(), joined.end(),
                              std::back_inserter(common));

        const auto rows = static_cast<Eigen::Index>(common.size());
        SeriesVector bench_values(rows);
        for (Eigen::Index r = 0; r < rows; ++r) {
            bench_values[r] = value_at(benchmark, common[static_cast<std::size_t>(r)]);
        }

        std::vector<std::string> columns;
        SeriesMatrix values(rows, static_cast<Eigen::Index>(instruments.size()));
        for (std::size_t j = 0; j < instruments.size(); ++j) {
            const auto& [name, raw] = instruments[j];
            CloseSeries filled = raw;
            forward_fill(filled.closes);
            for (Eigen::Index r = 0; r < rows; ++r) {
                values(r, static_cast<Eigen::Index>(j)) =
                    value_at(filled, common[static_cast<std::size_t>(r)]);
            }
            columns.push_back(name);
        }

        auto bench = PriceSeries::make(std::move(benchmark_name), common, std::move(bench_values));
        auto table = SeriesTable::make(std::move(common), std::move(columns), std::move(values));
        if (!bench || !table) {
            return std::nullopt;  // duplicate ticker names
        }

        return LoadResult{
            .benchmark   = std::move(*bench),
            .instruments = std::move(*table),
            .missing     = {},
            .malformed   = {},
        };
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

// ─── DataLoader::load_folder ──────────────────────────────────────────────────

std::optional<LoadResult>
DataLoader::load_folder(const std::filesystem::path& folder,
                        const std::string& benchmark,
                        std::span<const std::string> tickers) noexcept {
    try {
        const auto bench = load_close_csv(folder / (benchmark + ".csv"));
        if (!bench) {
            return std::nullopt;
        }

        std::vector<NamedCloseSeries> loaded;
        std::vector<std::string> missing;
        std::vector<std::string> malformed;

        for (const auto& ticker : tickers) {
            const auto path = folder / (ticker + ".csv");
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) {
                missing.push_back(ticker);
                continue;
            }
            auto series = load_close_csv(path);
            if (!series) {
                malformed.push_back(ticker);
                continue;
            }
            loaded.emplace_back(ticker, std::move(*series));
        }

        auto result = align(benchmark, *bench, loaded);
        if (!result) {
            return std::nullopt;
        }
        result->missing   = std::move(missing);
        result->malformed = std::move(malformed);
        return result;
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

}  // namespace rrg::io
