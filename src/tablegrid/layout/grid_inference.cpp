#include "tablegrid/layout/grid_inference.hpp"
#include "tablegrid/core/display.hpp"
#include "tablegrid/core/error.hpp"
#include "tablegrid/core/window_types.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <spdlog/fmt/fmt.h>

namespace tablegrid::inference {

namespace {

double average_gap(std::vector<double> const& sorted)
{
    double total = 0.0;
    for (size_t i = 0; i + 1 < sorted.size(); ++i)
        total += sorted[i + 1] - sorted[i];
    return total / static_cast<double>(sorted.size() - 1);
}

template <typename Extent>
double average_extent(std::span<Slot const> slots, Extent extent)
{
    double total = std::accumulate(
        slots.begin(), slots.end(), 0.0, [&](double sum, Slot const& slot) { return sum + extent(slot.frame); }
    );
    return total / static_cast<double>(slots.size());
}

std::vector<Slot> grid_slots_at(
    std::vector<double> const& columns,
    std::vector<double> const& rows,
    double average_width,
    double average_height,
    DisplayId display
)
{
    std::vector<Slot> slots;
    slots.reserve(rows.size() * columns.size());
    for (size_t row = 0; row < rows.size(); ++row)
    {
        // Cells stop short of the next grid line; the last row/column has none
        double height = row + 1 < rows.size() ? (rows[row + 1] - rows[row]) * CELL_FILL_RATIO : average_height;
        for (size_t col = 0; col < columns.size(); ++col)
        {
            double width = col + 1 < columns.size() ? (columns[col + 1] - columns[col]) * CELL_FILL_RATIO : average_width;
            Rect frame{ columns[col], rows[row], width, height };
            slots.push_back(Slot{ fmt::format("{}_{}", row, col), frame, display, 0 });
        }
    }
    return slots;
}

}

std::vector<double> cluster_positions(std::span<double const> values, double tolerance)
{
    std::vector<double> representatives;
    for (double value : values)
    {
        bool known = std::ranges::any_of(representatives, [&](double rep) { return std::abs(rep - value) <= tolerance; });
        if (!known)
            representatives.push_back(value);
    }
    std::ranges::sort(representatives);
    return representatives;
}

std::vector<Slot> regular_grid_slots(int rows, int columns, Rect const& display_bounds, DisplayId display)
{
    if (rows <= 0 || columns <= 0)
        throw LayoutError(fmt::format("grid needs positive rows and columns, got {}x{}", rows, columns));
    if (display_bounds.is_degenerate())
        throw LayoutError(fmt::format("degenerate bounds for display {}", display));

    double usable_width = display_bounds.width * CELL_FILL_RATIO;
    double usable_height = display_bounds.height * CELL_FILL_RATIO;
    double x_offset = (display_bounds.width - usable_width) / 2.0;
    double y_offset = (display_bounds.height - usable_height) / 2.0;
    double width = usable_width / columns;
    double height = usable_height / rows;

    std::vector<Slot> slots;
    slots.reserve(static_cast<size_t>(rows) * columns);
    for (int row = 0; row < rows; ++row)
    {
        for (int col = 0; col < columns; ++col)
        {
            Rect frame{ display_bounds.x + x_offset + width * col, display_bounds.y + y_offset + height * row, width, height };
            slots.push_back(Slot{ fmt::format("{}_{}", row, col), frame, display, 0 });
        }
    }
    return slots;
}

std::vector<Slot> infer_display_grid(
    std::span<Slot const> slots,
    Rect const& display_bounds,
    log::LoggerPtr const& logger,
    double tolerance
)
{
    auto log = log::or_default(logger);

    if (slots.size() < MIN_SLOTS_FOR_INFERENCE)
    {
        SPDLOG_LOGGER_DEBUG(log, "Too few slots ({}) to detect grid pattern, keeping original", slots.size());
        return { slots.begin(), slots.end() };
    }

    DisplayId display = slots.front().display;

    std::vector<double> xs;
    std::vector<double> ys;
    xs.reserve(slots.size());
    ys.reserve(slots.size());
    for (auto const& slot : slots)
    {
        xs.push_back(slot.frame.min_x());
        ys.push_back(slot.frame.min_y());
    }

    auto columns = cluster_positions(xs, tolerance);
    auto rows = cluster_positions(ys, tolerance);

    double average_width = columns.size() > 1 ? average_gap(columns)
                                              : average_extent(slots, [](Rect const& r) { return r.width; });
    double average_height = rows.size() > 1 ? average_gap(rows)
                                            : average_extent(slots, [](Rect const& r) { return r.height; });

    size_t cells = rows.size() * columns.size();
    if (cells >= slots.size() && cells <= slots.size() * 2)
    {
        SPDLOG_LOGGER_INFO(log, "Detected grid pattern: {}x{} for {} windows", rows.size(), columns.size(), slots.size());
        return grid_slots_at(columns, rows, average_width, average_height, display);
    }

    SPDLOG_LOGGER_INFO(log, "Could not detect clear grid pattern, creating regular grid");
    int fallback_columns = static_cast<int>(std::sqrt(static_cast<double>(slots.size())));
    int count = static_cast<int>(slots.size());
    int fallback_rows = (count + fallback_columns - 1) / fallback_columns;
    return regular_grid_slots(fallback_rows, fallback_columns, display_bounds, display);
}

Layout capture_layout(std::span<ManagedWindow const> windows)
{
    Layout layout;
    layout.id = generate_id();
    layout.name = "Captured Layout";
    layout.strategy = MatchingStrategy::Sequential;
    layout.slots.reserve(windows.size());
    for (size_t i = 0; i < windows.size(); ++i)
    {
        auto const& window = windows[i];
        layout.slots.push_back(Slot{ fmt::format("{}_{}", i / 4, i % 4), window.frame, window.display, 0 });
    }
    return layout;
}

Layout optimize_layout(Layout const& captured, std::span<Display const> displays, log::LoggerPtr const& logger)
{
    auto log = log::or_default(logger);
    SPDLOG_LOGGER_INFO(log, "Optimizing captured layout with {} slots", captured.slots.size());

    // Partition by display, keeping first-appearance order so results are stable
    std::vector<DisplayId> order;
    std::vector<std::vector<Slot>> groups;
    for (auto const& slot : captured.slots)
    {
        auto it = std::ranges::find(order, slot.display);
        if (it == order.end())
        {
            order.push_back(slot.display);
            groups.emplace_back();
            groups.back().push_back(slot);
        }
        else
        {
            groups[static_cast<size_t>(it - order.begin())].push_back(slot);
        }
    }

    Layout optimized;
    optimized.id = generate_id();
    optimized.name = "Optimized " + captured.name;
    optimized.strategy = captured.strategy;

    for (size_t i = 0; i < order.size(); ++i)
    {
        // Unknown displays get empty bounds; only the regular-grid fallback needs them
        Rect bounds = display::bounds_of(displays, order[i]).value_or(Rect{});
        auto slots = infer_display_grid(groups[i], bounds, log);
        SPDLOG_LOGGER_DEBUG(
            log, "Optimized {} slots on display {} to {} grid slots", groups[i].size(), order[i], slots.size()
        );
        // Every display numbers its grid from 0_0; qualify ids so they stay unique in the layout
        if (order.size() > 1)
        {
            for (auto& slot : slots)
                slot.id = fmt::format("d{}_{}", i, slot.id);
        }
        optimized.slots.insert(optimized.slots.end(), slots.begin(), slots.end());
    }

    return optimized;
}

Configuration capture_configuration(
    std::string name,
    std::span<ManagedWindow const> windows,
    std::span<Display const> displays,
    log::LoggerPtr const& logger
)
{
    Configuration config;
    config.id = generate_id();
    config.name = std::move(name);
    config.layout = optimize_layout(capture_layout(windows), displays, logger);
    return config;
}

} // namespace tablegrid::inference
