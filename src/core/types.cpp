/// @file src/core/types.cpp
/// @brief Date helpers and validated factories for PriceSeries / SeriesTable.

#include "rrg/types.hpp"
#include "rrg/input_error.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <new>
#include <unordered_set>

namespace rrg {

namespace {

/// Parse exactly `text.size()` decimal digits.
std::optional<int> parse_fixed_int(std::string_view text) noexcept {
    int value = 0;
    const auto* first = text.data();
    const auto* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

}  // anonymous namespace

// ─── Dates ────────────────────────────────────────────────────────────────────

std::optional<Date> parse_date(std::string_view text) noexcept {
    // Strip leading whitespace and an optional quote (some exports quote dates).
    while (!text.empty() && (text.front() == ' ' || text.front() == '"')) {
        text.remove_prefix(1);
    }
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    if (text.size() > 10) {
        const char next = text[10];
        if (next != ' ' && next != 'T' && next != '"') {
            return std::nullopt;
        }
    }

    const auto y = parse_fixed_int(text.substr(0, 4));
    const auto m = parse_fixed_int(text.substr(5, 2));
    const auto d = parse_fixed_int(text.substr(8, 2));
    if (!y || !m || !d) {
        return std::nullopt;
    }

    const Date date{std::chrono::year{*y},
                    std::chrono::month{static_cast<unsigned>(*m)},
                    std::chrono::day{static_cast<unsigned>(*d)}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

std::string format_date(const Date& date) {
    return fmt::format("{:04d}-{:02d}-{:02d}",
                       static_cast<int>(date.year()),
                       static_cast<unsigned>(date.month()),
                       static_cast<unsigned>(date.day()));
}

bool is_strictly_increasing(const TimeIndex& index) noexcept {
    return std::adjacent_find(index.begin(), index.end(),
                              [](const Date& a, const Date& b) { return !(a < b); })
           == index.end();
}

// ─── PriceSeries ──────────────────────────────────────────────────────────────

std::optional<PriceSeries>
PriceSeries::make(std::string name, TimeIndex index, SeriesVector values) noexcept {
    if (static_cast<std::size_t>(values.size()) != index.size()) {
        return std::nullopt;
    }
    if (!is_strictly_increasing(index)) {
        return std::nullopt;
    }
    return PriceSeries{
        .name   = std::move(name),
        .index  = std::move(index),
        .values = std::move(values),
    };
}

// ─── SeriesTable ──────────────────────────────────────────────────────────────

std::optional<SeriesTable>
SeriesTable::make(TimeIndex index,
                  std::vector<std::string> columns,
                  SeriesMatrix values) noexcept {
    if (static_cast<std::size_t>(values.rows()) != index.size() ||
        static_cast<std::size_t>(values.cols()) != columns.size()) {
        return std::nullopt;
    }
    if (!is_strictly_increasing(index)) {
        return std::nullopt;
    }

    try {
        std::unordered_set<std::string_view> seen;
        for (const auto& id : columns) {
            if (!seen.insert(id).second) {
                return std::nullopt;  // duplicate column id
            }
        }

        return SeriesTable{
            .index   = std::move(index),
            .columns = std::move(columns),
            .values  = std::move(values),
        };
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

std::optional<std::size_t>
SeriesTable::find_column(std::string_view id) const noexcept {
    const auto it = std::find(columns.begin(), columns.end(), id);
    if (it == columns.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - columns.begin());
}

bool SeriesTable::same_shape(const SeriesTable& other) const noexcept {
    return index == other.index &&
           columns == other.columns &&
           values.rows() == other.values.rows() &&
           values.cols() == other.values.cols();
}

// ─── InputError ───────────────────────────────────────────────────────────────

std::string_view to_string(InputError error) noexcept {
    switch (error) {
        case InputError::InvalidWindow:  return "rolling window must be at least 1";
        case InputError::InvalidTail:    return "tail length out of range";
        case InputError::IndexMismatch:  return "time indices are not identical";
        case InputError::ColumnMismatch: return "ratio and momentum columns differ";
        case InputError::EmptyLabel:     return "frequency label is empty";
        case InputError::DuplicateLabel: return "frequency label used more than once";
        case InputError::NoBundles:      return "no frequency bundles to compose";
    }
    return "unknown input error";
}

}  // namespace rrg
