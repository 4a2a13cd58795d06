#pragma once
/**
 * @file  frames.hpp
 * @brief Frame Builder: tail-windowed RRG snapshots for animated display.
 *
 * Module:  src/frames/
 *
 * Responsibility
 * --------------
 * Slice the ratio / momentum tables into a chronologically ordered sequence
 * of tail windows.  Each Frame carries, per instrument, the window's points,
 * a label on the final point and a marker per point: small circles for the
 * trail, a directional triangle for the head.  Each Frame is paired with a
 * NavigationStep that jumps to it instantly.
 *
 * Window Rule
 * -----------
 *   for i = frame_count .. 0:
 *       start = max(0, rows − tail − i)
 *       end   = rows − i              (from the unclamped start)
 *
 * Oldest window first.  While history is shorter than the offset the
 * window grows from row 0 ([0,1), [0,2), ...); offsets with end <= 0 give
 * empty windows and are skipped.  Keys are unique because every emitted
 * window has a distinct end.
 *
 * Design Constraints
 * ------------------
 *   • Pure function of its inputs; no rendering-library types.
 *   • All public methods are noexcept; allocation failure yields nullopt.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rrg/constants.hpp"
#include "rrg/input_error.hpp"
#include "rrg/types.hpp"

namespace rrg::frames {

// ── Markers ───────────────────────────────────────────────────────────────────

enum class MarkerSymbol {
    Circle,
    TriangleUp,
    TriangleDown,
    TriangleLeft,
    TriangleRight,
};

/// Plotting-style symbol name ("circle", "triangle-up", ...).
[[nodiscard]] std::string_view to_string(MarkerSymbol symbol) noexcept;

struct Marker {
    MarkerSymbol symbol{MarkerSymbol::Circle};
    int          size{constants::TRAIL_MARKER_SIZE};

    bool operator==(const Marker&) const = default;
};

/// A point in the ratio / momentum plane.
struct PlanePoint {
    double ratio{0.0};
    double momentum{0.0};
};

// ── Frame ─────────────────────────────────────────────────────────────────────

/**
 * @brief One instrument's trail inside a Frame.
 *
 * `ratio`, `momentum`, `labels` and `markers` are parallel and have the
 * window's length.  Only the last label is non-empty (the instrument id).
 */
struct InstrumentTrace {
    std::string              instrument;
    std::vector<double>      ratio;
    std::vector<double>      momentum;
    std::vector<std::string> labels;
    std::vector<Marker>      markers;

    [[nodiscard]] std::size_t size() const noexcept { return ratio.size(); }
};

/**
 * @brief Snapshot of every instrument over one tail window.
 */
struct Frame {
    std::string                  key;     ///< "<start> - <end>" or "SingleFrame"
    std::size_t                  start{0};///< First row of the window
    std::size_t                  end{0};  ///< One past the last row
    std::vector<InstrumentTrace> traces;  ///< In table column order
};

enum class TransitionMode {
    Immediate,
};

/**
 * @brief Control descriptor that jumps the display to one Frame.
 */
struct NavigationStep {
    std::string    frame_key;
    std::string    label;
    double         frame_duration_ms{0.0};
    double         transition_duration_ms{0.0};
    bool           redraw{true};
    TransitionMode mode{TransitionMode::Immediate};
};

/**
 * @brief Frames and their navigation steps, index-aligned.
 */
struct FrameSet {
    std::vector<Frame>          frames;
    std::vector<NavigationStep> steps;

    [[nodiscard]] bool empty() const noexcept { return frames.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return frames.size(); }
};

/// Key of the frame produced for inputs with fewer than two rows.
inline constexpr std::string_view SINGLE_FRAME_KEY = "SingleFrame";

// ── FrameBuilder ──────────────────────────────────────────────────────────────

/**
 * @brief Stateless builder of Frame / NavigationStep sequences.
 *
 * @example
 * @code
 *   auto rrg = metrics::MetricsEngine::compute(bench, prices, 15);
 *   auto set = FrameBuilder::build(rrg->ratio, rrg->momentum, 3, 10);
 *   // set->frames.back() covers the three most recent rows
 * @endcode
 */
class FrameBuilder {
public:
    /**
     * @brief Validate the inputs of build().
     * @return InvalidTail if tail == 0, IndexMismatch / ColumnMismatch if the
     *         tables are not aligned, otherwise nullopt.
     */
    [[nodiscard]] static std::optional<InputError>
    check(const SeriesTable& ratio,
          const SeriesTable& momentum,
          std::size_t tail) noexcept;

    /**
     * @brief Build the frame sequence.
     * @param ratio        RS-Ratio table (x axis)
     * @param momentum     RS-Momentum table (y axis), same shape as ratio
     * @param tail         Points per trail, >= 1
     * @param frame_count  Historical windows beyond the most recent one
     * @return FrameSet, or nullopt when check() reports an error or
     *         allocation fails.
     */
    [[nodiscard]] static std::optional<FrameSet>
    build(const SeriesTable& ratio,
          const SeriesTable& momentum,
          std::size_t tail = constants::DEFAULT_TAIL,
          std::size_t frame_count = constants::DEFAULT_FRAME_COUNT) noexcept;

    /**
     * @brief Direction of the move prev → last.
     *
     * Mostly horizontal (|dx| > |dy|): right if dx > 0, else left.
     * Otherwise vertical: up if dy > 0, else down.  Ties go vertical.
     * A NaN dx fails the horizontal test and falls through to the vertical
     * branch, decided by dy; a NaN dy resolves to TriangleDown.
     */
    [[nodiscard]] static MarkerSymbol
    classify_direction(PlanePoint prev, PlanePoint last) noexcept;

    /// "<YYYY-MM-DD> - <YYYY-MM-DD>" for rows [start, end).
    [[nodiscard]] static std::string
    window_key(const TimeIndex& index, std::size_t start, std::size_t end);

private:
    /// Trace for column `j` over rows [start, end).
    [[nodiscard]] static InstrumentTrace
    make_trace(const SeriesTable& ratio,
               const SeriesTable& momentum,
               std::size_t j,
               std::size_t start,
               std::size_t end);

    [[nodiscard]] static NavigationStep make_step(const std::string& key);

    /// Body of build() once the inputs are validated; may throw bad_alloc.
    [[nodiscard]] static FrameSet
    assemble(const SeriesTable& ratio,
             const SeriesTable& momentum,
             std::size_t tail,
             std::size_t frame_count);
};

} // namespace rrg::frames
