#pragma once

/// @file include/rrg/quadrant.hpp
/// @brief RRG quadrant classification of a (ratio, momentum) point.
///
/// The plane is split at 100 on both axes:
///
///   momentum
///      ^   Improving | Leading
///      |  -----------+-----------
///      |   Lagging   | Weakening
///      +-----------------------> ratio
///
/// Points on a split line belong to the upper / right quadrant.

#include "rrg/frames.hpp"

#include <optional>
#include <string_view>

namespace rrg::frames {

enum class Quadrant {
    Leading,
    Weakening,
    Lagging,
    Improving,
};

[[nodiscard]] std::string_view to_string(Quadrant quadrant) noexcept;

/// Quadrant of a point, or `nullopt` if either coordinate is NaN.
[[nodiscard]] std::optional<Quadrant> classify_quadrant(PlanePoint point) noexcept;

/// Quadrant of a trace's head (its last point), or `nullopt` for an empty
/// trace or a NaN head.
[[nodiscard]] std::optional<Quadrant> head_quadrant(const InstrumentTrace& trace) noexcept;

} // namespace rrg::frames
