/// @file src/frames/quadrant.cpp
/// @brief Quadrant classification.

#include "rrg/quadrant.hpp"

#include <cmath>

namespace rrg::frames {

std::string_view to_string(Quadrant quadrant) noexcept {
    switch (quadrant) {
        case Quadrant::Leading:   return "Leading";
        case Quadrant::Weakening: return "Weakening";
        case Quadrant::Lagging:   return "Lagging";
        case Quadrant::Improving: return "Improving";
    }
    return "Unknown";
}

std::optional<Quadrant> classify_quadrant(PlanePoint point) noexcept {
    if (std::isnan(point.ratio) || std::isnan(point.momentum)) {
        return std::nullopt;
    }
    const bool strong  = point.ratio    >= constants::QUADRANT_SPLIT;
    const bool rising  = point.momentum >= constants::QUADRANT_SPLIT;
    if (strong) {
        return rising ? Quadrant::Leading : Quadrant::Weakening;
    }
    return rising ? Quadrant::Improving : Quadrant::Lagging;
}

std::optional<Quadrant> head_quadrant(const InstrumentTrace& trace) noexcept {
    if (trace.ratio.empty() || trace.momentum.empty()) {
        return std::nullopt;
    }
    return classify_quadrant({trace.ratio.back(), trace.momentum.back()});
}

} // namespace rrg::frames
