#pragma once

#include "tablegrid/core/types.hpp"
#include <optional>
#include <span>

namespace tablegrid::display {

std::optional<size_t> display_index_at_point(std::span<Display const> displays, Point point);

/**
 * @brief Display a window belongs to: the one containing the frame centre.
 *
 * Falls back to the first (primary) display when the centre is off every
 * display, and to display id 0 when there are no displays at all.
 */
DisplayId display_for_frame(std::span<Display const> displays, Rect const& frame);

std::optional<Rect> bounds_of(std::span<Display const> displays, DisplayId id);

} // namespace tablegrid::display
