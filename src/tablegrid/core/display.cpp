#include "tablegrid/core/display.hpp"

namespace tablegrid::display {

std::optional<size_t> display_index_at_point(std::span<Display const> displays, Point point)
{
    for (size_t i = 0; i < displays.size(); ++i)
    {
        if (displays[i].bounds.contains(point))
        {
            return i;
        }
    }
    return std::nullopt;
}

DisplayId display_for_frame(std::span<Display const> displays, Rect const& frame)
{
    if (displays.empty())
        return 0;

    auto index = display_index_at_point(displays, Point{ frame.mid_x(), frame.mid_y() });
    return displays[index.value_or(0)].id;
}

std::optional<Rect> bounds_of(std::span<Display const> displays, DisplayId id)
{
    for (auto const& d : displays)
    {
        if (d.id == id)
            return d.bounds;
    }
    return std::nullopt;
}

} // namespace tablegrid::display
