#pragma once

#include <cstddef>

/// @file include/rrg/constants.hpp
/// @brief Indicator constants and configuration defaults for the RRG system.

namespace rrg::constants {

// ─── Indicator Formula ────────────────────────────────────────────────────────

/// Centre of the normalised RS-ratio axis.
static constexpr double RATIO_CENTER = 100.0;

/// Centre of the normalised RS-momentum axis.
static constexpr double MOMENTUM_CENTER = 101.0;

/// Lag (in observations) of the rate-of-change applied to the RS ratio.
static constexpr std::size_t ROC_PERIODS = 5;

/// Rate-of-change is expressed in percent.
static constexpr double ROC_SCALE = 100.0;

// ─── Defaults ─────────────────────────────────────────────────────────────────

/// Default rolling-statistic window.
static constexpr std::size_t DEFAULT_WINDOW = 15;

/// Default number of points per frame trail.
static constexpr std::size_t DEFAULT_TAIL = 3;

/// Default number of historical frames beyond the most recent one.
static constexpr std::size_t DEFAULT_FRAME_COUNT = 10;

/// Tail lengths selectable by the composer's tail control.
static constexpr std::size_t MIN_TAIL = 1;
static constexpr std::size_t MAX_TAIL = 10;

// ─── Markers ──────────────────────────────────────────────────────────────────

/// Marker size for every trail point except the last.
static constexpr int TRAIL_MARKER_SIZE = 8;

/// Marker size for the directional head of a trail.
static constexpr int HEAD_MARKER_SIZE = 14;

// ─── Quadrant Layout ──────────────────────────────────────────────────────────

/// Both axes split into quadrants at this value.
static constexpr double QUADRANT_SPLIT = 100.0;

/// Visible axis range used by the composer for both axes.
static constexpr double AXIS_MIN = 94.0;
static constexpr double AXIS_MAX = 106.0;

} // namespace rrg::constants
