#pragma once

/// @file include/rrg/input_error.hpp
/// @brief Contract violations reported by the RRG core.
///
/// Numeric degeneracy (zero variance, insufficient history) is never an
/// error: it yields not-a-number entries. Only malformed inputs are.

#include <string_view>

namespace rrg {

/// Precondition violated by the caller of a core operation.
enum class InputError {
    InvalidWindow,      ///< Rolling window < 1
    InvalidTail,        ///< Tail length < 1 (or outside the composer range)
    IndexMismatch,      ///< Two inputs do not share an identical time index
    ColumnMismatch,     ///< Ratio and momentum tables differ in columns
    EmptyLabel,         ///< Frequency label is empty
    DuplicateLabel,     ///< Frequency label used twice in one view
    NoBundles,          ///< Nothing to compose
};

/// Human-readable description.
[[nodiscard]] std::string_view to_string(InputError error) noexcept;

} // namespace rrg
