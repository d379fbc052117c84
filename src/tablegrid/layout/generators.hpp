#pragma once

#include "tablegrid/core/types.hpp"

namespace tablegrid::generators {

constexpr double DEFAULT_OVERLAP = 0.3;
constexpr double MAX_OVERLAP = 0.5;
constexpr double POKER_TABLE_ASPECT_RATIO = 1.25;
constexpr double ASPECT_RATIO_TOLERANCE = 0.2;

struct GridSize
{
    int rows = 0;
    int columns = 0;

    bool operator==(GridSize const&) const = default;
};

/**
 * @brief Near-square grid covering `count` cells.
 *
 * Fixed table up to 16 (1x1, 1x2, 2x2, 2x3, 3x3, 3x4, 4x4), square-root
 * approximation above. Throws LayoutError for count <= 0.
 */
GridSize optimal_grid_size(int count);

/**
 * @brief rows x columns equal cells covering the whole display.
 *
 * Slots are id'd "row_col" in row-major order with priority 0.
 * Throws LayoutError on non-positive dimensions or degenerate bounds.
 */
Layout uniform_grid(int rows, int columns, DisplayId display, Rect const& bounds);

/**
 * @brief Grid whose neighbouring cells overlap.
 *
 * Cells are (1 + overlap) times the plain cell size and placed on a stride
 * scaled by (1 - overlap). `overlap` is clamped to [0, 0.5].
 */
Layout overlapping_grid(int rows, int columns, double overlap, DisplayId display, Rect const& bounds);

/**
 * @brief Grid for `count` tables sized towards a target aspect ratio.
 *
 * When the natural cell ratio is off by more than the tolerance, the cell is
 * narrowed or shortened to the target ratio and centred in its grid cell.
 * Emits exactly `count` slots even if the grid has spare cells.
 */
Layout poker_grid(int count, DisplayId display, Rect const& bounds, double target_aspect_ratio = POKER_TABLE_ASPECT_RATIO);

} // namespace tablegrid::generators
