/// @file src/rotation/rotation_view.cpp
/// @brief FrequencyBundle validation and RotationComposer.

#include "rrg/rotation.hpp"

#include <algorithm>
#include <unordered_set>

namespace rrg::rotation {

// ─── FrequencyBundle ──────────────────────────────────────────────────────────

std::optional<InputError>
FrequencyBundle::check(std::string_view label,
                       const SeriesTable& ratio,
                       const SeriesTable& momentum) noexcept {
    if (label.empty()) {
        return InputError::EmptyLabel;
    }
    if (ratio.index != momentum.index || ratio.rows() != momentum.rows()) {
        return InputError::IndexMismatch;
    }
    if (ratio.columns != momentum.columns || ratio.cols() != momentum.cols()) {
        return InputError::ColumnMismatch;
    }
    return std::nullopt;
}

std::optional<FrequencyBundle>
FrequencyBundle::make(std::string label,
                      SeriesTable ratio,
                      SeriesTable momentum) noexcept {
    if (check(label, ratio, momentum)) {
        return std::nullopt;
    }
    return FrequencyBundle{
        .label    = std::move(label),
        .ratio    = std::move(ratio),
        .momentum = std::move(momentum),
    };
}

std::optional<FrequencyBundle>
FrequencyBundle::make(std::string label, metrics::RrgSeries series) noexcept {
    return make(std::move(label), std::move(series.ratio), std::move(series.momentum));
}

// ─── RotationView ─────────────────────────────────────────────────────────────

const FrequencyView* RotationView::find(std::string_view label) const noexcept {
    const auto it = std::find_if(views.begin(), views.end(),
                                 [&](const FrequencyView& v) { return v.label == label; });
    return it == views.end() ? nullptr : &*it;
}

const FrequencyView& RotationView::default_view() const noexcept {
    if (const auto* view = find(default_label)) {
        return *view;
    }
    return views.front();
}

std::vector<std::string> RotationView::labels() const {
    std::vector<std::string> out;
    out.reserve(views.size());
    for (const auto& v : views) {
        out.push_back(v.label);
    }
    return out;
}

// ─── RotationComposer ─────────────────────────────────────────────────────────

std::optional<InputError>
RotationComposer::check(std::span<const FrequencyBundle> bundles,
                        const RotationConfig& config) noexcept {
    if (bundles.empty()) {
        return InputError::NoBundles;
    }
    if (config.tail < constants::MIN_TAIL || config.tail > constants::MAX_TAIL) {
        return InputError::InvalidTail;
    }
    std::unordered_set<std::string_view> seen;
    for (const auto& b : bundles) {
        if (!seen.insert(b.label).second) {
            return InputError::DuplicateLabel;
        }
    }
    return std::nullopt;
}

std::optional<RotationView>
RotationComposer::compose(std::span<const FrequencyBundle> bundles,
                          const RotationConfig& config) noexcept {
    if (check(bundles, config)) {
        return std::nullopt;
    }

    RotationView view;
    view.tail = config.tail;
    view.views.reserve(bundles.size());

    for (const auto& bundle : bundles) {
        auto set = frames::FrameBuilder::build(bundle.ratio, bundle.momentum,
                                               config.tail, config.frame_count);
        if (!set) {
            return std::nullopt;
        }
        const std::size_t active = set->steps.empty() ? 0 : set->steps.size() - 1;
        view.views.push_back(FrequencyView{
            .label       = bundle.label,
            .frames      = std::move(*set),
            .active_step = active,
        });
    }

    view.default_label = view.find(config.default_label) != nullptr
                             ? config.default_label
                             : view.views.front().label;
    return view;
}

} // namespace rrg::rotation
