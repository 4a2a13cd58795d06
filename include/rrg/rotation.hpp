#pragma once

/// @file include/rrg/rotation.hpp
/// @brief Per-frequency rotation views handed to the visualisation composer.
///
/// # Module: Rotation View
///
/// ## Responsibility
/// Bundle one RRG result per reporting frequency ("Daily", "Weekly", ...),
/// validate the bundles at the boundary, and build the frame sequence for
/// each so a composer can switch between frequencies with a selector keyed
/// by label.
///
/// ## Guarantees
/// - Bundles are validated once, in `FrequencyBundle::make`
/// - Views keep bundle input order
/// - Each view's `active_step` addresses its most recent frame
/// - No rendering-library types; the composer owns presentation

#include "rrg/constants.hpp"
#include "rrg/frames.hpp"
#include "rrg/input_error.hpp"
#include "rrg/metrics.hpp"
#include "rrg/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rrg::rotation {

// ─── FrequencyBundle ──────────────────────────────────────────────────────────

/// Ratio and momentum tables for one reporting frequency.
struct FrequencyBundle {
    std::string label;
    SeriesTable ratio;
    SeriesTable momentum;

    /// Validate why `make()` would reject these inputs.
    ///
    /// # Returns
    /// - `EmptyLabel` for an empty label
    /// - `IndexMismatch` / `ColumnMismatch` if the tables are not aligned
    [[nodiscard]] static std::optional<InputError>
    check(std::string_view label,
          const SeriesTable& ratio,
          const SeriesTable& momentum) noexcept;

    /// Validated factory; `nullopt` exactly when `check()` reports an error.
    [[nodiscard]] static std::optional<FrequencyBundle>
    make(std::string label, SeriesTable ratio, SeriesTable momentum) noexcept;

    /// Convenience overload taking a Metrics Engine result.
    [[nodiscard]] static std::optional<FrequencyBundle>
    make(std::string label, metrics::RrgSeries series) noexcept;
};

// ─── RotationConfig ───────────────────────────────────────────────────────────

struct RotationConfig {
    std::size_t tail        = constants::DEFAULT_TAIL;
    std::size_t frame_count = constants::DEFAULT_FRAME_COUNT;

    /// View shown first. Falls back to the first bundle if absent.
    std::string default_label = "Daily";
};

// ─── RotationView ─────────────────────────────────────────────────────────────

/// Frames for one frequency plus the step the composer starts on.
struct FrequencyView {
    std::string      label;
    frames::FrameSet frames;
    std::size_t      active_step = 0;
};

/// Everything the composer needs to render the selector-driven figure.
struct RotationView {
    std::vector<FrequencyView> views;
    std::string                default_label;
    std::size_t                tail = constants::DEFAULT_TAIL;

    /// View with the given label, or nullptr.
    [[nodiscard]] const FrequencyView* find(std::string_view label) const noexcept;

    /// The view selected by `default_label`. Precondition: views non-empty.
    [[nodiscard]] const FrequencyView& default_view() const noexcept;

    /// Labels in selector order.
    [[nodiscard]] std::vector<std::string> labels() const;
};

// ─── RotationComposer ─────────────────────────────────────────────────────────

class RotationComposer {
public:
    /// Validate a compose request.
    ///
    /// # Returns
    /// - `NoBundles` for an empty bundle list
    /// - `InvalidTail` if tail is outside [MIN_TAIL, MAX_TAIL]
    /// - `DuplicateLabel` if two bundles share a label
    [[nodiscard]] static std::optional<InputError>
    check(std::span<const FrequencyBundle> bundles,
          const RotationConfig& config) noexcept;

    /// Build one FrequencyView per bundle.
    ///
    /// # Returns
    /// `nullopt` exactly when `check()` reports an error.
    [[nodiscard]] static std::optional<RotationView>
    compose(std::span<const FrequencyBundle> bundles,
            const RotationConfig& config = RotationConfig{}) noexcept;
};

} // namespace rrg::rotation
