#include "tablegrid/layout/generators.hpp"
#include "tablegrid/core/error.hpp"
#include "tablegrid/core/window_types.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace tablegrid::generators {

namespace {

void require_grid(int rows, int columns)
{
    if (rows <= 0 || columns <= 0)
        throw LayoutError(fmt::format("grid needs positive rows and columns, got {}x{}", rows, columns));
}

void require_bounds(Rect const& bounds)
{
    if (bounds.is_degenerate() || !std::isfinite(bounds.x) || !std::isfinite(bounds.y))
        throw LayoutError(
            fmt::format("degenerate display bounds {}x{} at {},{}", bounds.width, bounds.height, bounds.x, bounds.y)
        );
}

std::string cell_id(int row, int column) { return fmt::format("{}_{}", row, column); }

Layout make_layout(std::string name, std::vector<Slot> slots)
{
    Layout layout;
    layout.id = generate_id();
    layout.name = std::move(name);
    layout.slots = std::move(slots);
    layout.strategy = MatchingStrategy::Sequential;
    return layout;
}

}

GridSize optimal_grid_size(int count)
{
    if (count <= 0)
        throw LayoutError(fmt::format("table count must be positive, got {}", count));

    switch (count)
    {
        case 1:
            return { 1, 1 };
        case 2:
            return { 1, 2 };
        case 3:
        case 4:
            return { 2, 2 };
        case 5:
        case 6:
            return { 2, 3 };
        case 7:
        case 8:
        case 9:
            return { 3, 3 };
        case 10:
        case 11:
        case 12:
            return { 3, 4 };
        case 13:
        case 14:
        case 15:
        case 16:
            return { 4, 4 };
        default:
            break;
    }

    int root = static_cast<int>(std::sqrt(static_cast<double>(count)));
    if (root * root >= count)
        return { root, root };
    if (root * (root + 1) >= count)
        return { root, root + 1 };
    return { root + 1, root + 1 };
}

Layout uniform_grid(int rows, int columns, DisplayId display, Rect const& bounds)
{
    require_grid(rows, columns);
    require_bounds(bounds);

    double width = bounds.width / columns;
    double height = bounds.height / rows;

    std::vector<Slot> slots;
    slots.reserve(static_cast<size_t>(rows) * columns);
    for (int row = 0; row < rows; ++row)
    {
        for (int col = 0; col < columns; ++col)
        {
            Rect frame{ bounds.x + width * col, bounds.y + height * row, width, height };
            slots.push_back(Slot{ cell_id(row, col), frame, display, 0 });
        }
    }

    return make_layout(fmt::format("Grid {}x{}", rows, columns), std::move(slots));
}

Layout overlapping_grid(int rows, int columns, double overlap, DisplayId display, Rect const& bounds)
{
    require_grid(rows, columns);
    require_bounds(bounds);

    double safe_overlap = std::isnan(overlap) ? 0.0 : std::clamp(overlap, 0.0, MAX_OVERLAP);

    double full_width = bounds.width / columns;
    double full_height = bounds.height / rows;
    double width = full_width * (1.0 + safe_overlap);
    double height = full_height * (1.0 + safe_overlap);

    std::vector<Slot> slots;
    slots.reserve(static_cast<size_t>(rows) * columns);
    for (int row = 0; row < rows; ++row)
    {
        for (int col = 0; col < columns; ++col)
        {
            double x = bounds.x + full_width * col * (1.0 - safe_overlap);
            double y = bounds.y + full_height * row * (1.0 - safe_overlap);
            slots.push_back(Slot{ cell_id(row, col), Rect{ x, y, width, height }, display, 0 });
        }
    }

    return make_layout(fmt::format("Overlapping Grid {}x{}", rows, columns), std::move(slots));
}

Layout poker_grid(int count, DisplayId display, Rect const& bounds, double target_aspect_ratio)
{
    require_bounds(bounds);
    if (!(target_aspect_ratio > 0.0))
        throw LayoutError(fmt::format("aspect ratio must be positive, got {}", target_aspect_ratio));

    auto [rows, columns] = optimal_grid_size(count);

    double raw_width = bounds.width / columns;
    double raw_height = bounds.height / rows;
    double width = raw_width;
    double height = raw_height;

    double current_ratio = raw_width / raw_height;
    if (std::abs(current_ratio - target_aspect_ratio) > ASPECT_RATIO_TOLERANCE)
    {
        if (current_ratio > target_aspect_ratio)
            width = height * target_aspect_ratio; // too wide
        else
            height = width / target_aspect_ratio; // too tall
    }

    double x_offset = (raw_width - width) / 2.0;
    double y_offset = (raw_height - height) / 2.0;

    std::vector<Slot> slots;
    slots.reserve(static_cast<size_t>(count));
    for (int row = 0; row < rows && static_cast<int>(slots.size()) < count; ++row)
    {
        for (int col = 0; col < columns && static_cast<int>(slots.size()) < count; ++col)
        {
            Rect frame{ bounds.x + raw_width * col + x_offset, bounds.y + raw_height * row + y_offset, width, height };
            slots.push_back(Slot{ cell_id(row, col), frame, display, 0 });
        }
    }

    return make_layout(fmt::format("Poker {} Tables", count), std::move(slots));
}

} // namespace tablegrid::generators
