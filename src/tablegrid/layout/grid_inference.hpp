#pragma once

#include "tablegrid/core/log.hpp"
#include "tablegrid/core/types.hpp"
#include <span>
#include <vector>

namespace tablegrid::inference {

constexpr double GRID_POSITION_TOLERANCE = 15.0;
constexpr double CELL_FILL_RATIO = 0.95; ///< Share of a gap or display a cell occupies
constexpr size_t MIN_SLOTS_FOR_INFERENCE = 3;

/**
 * @brief Cluster coordinates into distinct grid lines.
 *
 * A value joins the first cluster whose representative (its first member) is
 * within `tolerance`; otherwise it starts a new cluster. Returns the
 * representatives sorted ascending.
 */
std::vector<double> cluster_positions(std::span<double const> values, double tolerance = GRID_POSITION_TOLERANCE);

/**
 * @brief Regularize the slots of a single display.
 *
 * Fewer than three slots are returned unchanged. Otherwise the left and top
 * edges are clustered into columns and rows; the inferred grid is kept when
 * slots <= rows * columns <= 2 * slots, else a regular grid of
 * floor(sqrt(n)) columns over 95% of the display replaces it.
 * Throws LayoutError if the fallback is needed and `display_bounds` is
 * degenerate.
 */
std::vector<Slot> infer_display_grid(
    std::span<Slot const> slots,
    Rect const& display_bounds,
    log::LoggerPtr const& logger = nullptr,
    double tolerance = GRID_POSITION_TOLERANCE
);

/// Regular rows x columns slots over 95% of the display, centred.
std::vector<Slot> regular_grid_slots(int rows, int columns, Rect const& display_bounds, DisplayId display);

/**
 * @brief Layout with one slot per window at its current frame.
 *
 * Slot ids follow a four-wide grid pattern ("index/4_index%4").
 */
Layout capture_layout(std::span<ManagedWindow const> windows);

/**
 * @brief Clean up a captured layout display by display.
 *
 * Displays are processed in order of first appearance and their results
 * concatenated. The matching strategy is preserved; the name gets an
 * "Optimized " prefix. With several displays each slot id is prefixed
 * with "d<display position>_" so ids stay unique within the layout.
 * Throws LayoutError for a display missing from `displays` when its slots
 * need the regular-grid fallback.
 */
Layout optimize_layout(Layout const& captured, std::span<Display const> displays, log::LoggerPtr const& logger = nullptr);

/// capture_layout() then optimize_layout(), wrapped in a new configuration.
Configuration capture_configuration(
    std::string name,
    std::span<ManagedWindow const> windows,
    std::span<Display const> displays,
    log::LoggerPtr const& logger = nullptr
);

} // namespace tablegrid::inference
