/**
 * @file  frame_builder.cpp
 * @brief FrameBuilder implementation.
 */

#include "rrg/frames.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <new>

namespace rrg::frames {

// ── to_string ─────────────────────────────────────────────────────────────────

std::string_view to_string(MarkerSymbol symbol) noexcept {
    switch (symbol) {
        case MarkerSymbol::Circle:        return "circle";
        case MarkerSymbol::TriangleUp:    return "triangle-up";
        case MarkerSymbol::TriangleDown:  return "triangle-down";
        case MarkerSymbol::TriangleLeft:  return "triangle-left";
        case MarkerSymbol::TriangleRight: return "triangle-right";
    }
    return "circle";
}

// ── FrameBuilder::check ───────────────────────────────────────────────────────

std::optional<InputError>
FrameBuilder::check(const SeriesTable& ratio,
                    const SeriesTable& momentum,
                    std::size_t tail) noexcept {
    if (tail < 1) {
        return InputError::InvalidTail;
    }
    if (ratio.index != momentum.index || ratio.rows() != momentum.rows()) {
        return InputError::IndexMismatch;
    }
    if (ratio.columns != momentum.columns || ratio.cols() != momentum.cols()) {
        return InputError::ColumnMismatch;
    }
    return std::nullopt;
}

// ── FrameBuilder::classify_direction ──────────────────────────────────────────

MarkerSymbol FrameBuilder::classify_direction(PlanePoint prev,
                                              PlanePoint last) noexcept {
    const double dx = last.ratio    - prev.ratio;
    const double dy = last.momentum - prev.momentum;

    if (std::abs(dx) > std::abs(dy)) {
        return dx > 0.0 ? MarkerSymbol::TriangleRight : MarkerSymbol::TriangleLeft;
    }
    return dy > 0.0 ? MarkerSymbol::TriangleUp : MarkerSymbol::TriangleDown;
}

// ── FrameBuilder::window_key ──────────────────────────────────────────────────

std::string FrameBuilder::window_key(const TimeIndex& index,
                                     std::size_t start,
                                     std::size_t end) {
    return format_date(index[start]) + " - " + format_date(index[end - 1]);
}

// ── FrameBuilder::make_trace ──────────────────────────────────────────────────

InstrumentTrace FrameBuilder::make_trace(const SeriesTable& ratio,
                                         const SeriesTable& momentum,
                                         std::size_t j,
                                         std::size_t start,
                                         std::size_t end) {
    const auto xs = ratio.column(j).subspan(start, end - start);
    const auto ys = momentum.column(j).subspan(start, end - start);
    const std::size_t n = xs.size();

    InstrumentTrace trace;
    trace.instrument = ratio.columns[j];
    trace.ratio.assign(xs.begin(), xs.end());
    trace.momentum.assign(ys.begin(), ys.end());
    if (n == 0) {
        return trace;
    }

    trace.labels.assign(n, std::string{});
    trace.labels.back() = trace.instrument;

    MarkerSymbol head = MarkerSymbol::TriangleUp;
    if (n >= 2) {
        head = classify_direction({xs[n - 2], ys[n - 2]}, {xs[n - 1], ys[n - 1]});
    }

    trace.markers.assign(n - 1, Marker{MarkerSymbol::Circle,
                                       constants::TRAIL_MARKER_SIZE});
    trace.markers.push_back(Marker{head, constants::HEAD_MARKER_SIZE});
    return trace;
}

// ── FrameBuilder::make_step ───────────────────────────────────────────────────

NavigationStep FrameBuilder::make_step(const std::string& key) {
    return NavigationStep{
        .frame_key              = key,
        .label                  = key,
        .frame_duration_ms      = 0.0,
        .transition_duration_ms = 0.0,
        .redraw                 = true,
        .mode                   = TransitionMode::Immediate,
    };
}

// ── FrameBuilder::build ───────────────────────────────────────────────────────

std::optional<FrameSet>
FrameBuilder::build(const SeriesTable& ratio,
                    const SeriesTable& momentum,
                    std::size_t tail,
                    std::size_t frame_count) noexcept {
    if (check(ratio, momentum, tail)) {
        return std::nullopt;
    }
    try {
        return assemble(ratio, momentum, tail, frame_count);
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

// ── FrameBuilder::assemble ────────────────────────────────────────────────────

FrameSet FrameBuilder::assemble(const SeriesTable& ratio,
                                const SeriesTable& momentum,
                                std::size_t tail,
                                std::size_t frame_count) {
    FrameSet set;
    const std::size_t rows = ratio.rows();

    // ── Degenerate input: one frame with whatever is there ───────────────────
    if (rows < 2) {
        Frame frame{.key = std::string(SINGLE_FRAME_KEY), .start = 0, .end = rows};
        for (std::size_t j = 0; j < ratio.cols(); ++j) {
            frame.traces.push_back(make_trace(ratio, momentum, j, 0, rows));
        }
        set.steps.push_back(make_step(frame.key));
        set.frames.push_back(std::move(frame));
        return set;
    }

    // Offsets i >= rows leave an empty window.
    const std::size_t offsets = std::min(frame_count, rows - 1) + 1;
    set.frames.reserve(offsets);
    set.steps.reserve(offsets);

    const auto n = static_cast<std::ptrdiff_t>(rows);
    const auto t = static_cast<std::ptrdiff_t>(std::min(tail, rows));

    for (std::size_t k = offsets; k-- > 0;) {
        const auto i = static_cast<std::ptrdiff_t>(k);
        // End follows the unclamped start, so short history grows the window.
        const std::ptrdiff_t start = std::max<std::ptrdiff_t>(0, n - t - i);
        const std::ptrdiff_t end   = std::clamp<std::ptrdiff_t>(n - i, 0, n);
        if (end - start < 1) {
            continue;
        }
        const auto s = static_cast<std::size_t>(start);
        const auto e = static_cast<std::size_t>(end);

        Frame frame{.key = window_key(ratio.index, s, e), .start = s, .end = e};
        frame.traces.reserve(ratio.cols());
        for (std::size_t j = 0; j < ratio.cols(); ++j) {
            frame.traces.push_back(make_trace(ratio, momentum, j, s, e));
        }
        set.steps.push_back(make_step(frame.key));
        set.frames.push_back(std::move(frame));
    }

    return set;
}

} // namespace rrg::frames
