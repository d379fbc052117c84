#include "window_picker.hpp"
#include "tablegrid/core/window_detector.hpp"

namespace tablegrid::picker {

bool is_system_owner(std::string_view window_class, std::span<std::string_view const> prefixes)
{
    for (auto prefix : prefixes)
    {
        if (window_class.starts_with(prefix))
            return true;
    }
    return false;
}

std::optional<WindowInfo> pick_at(
    std::span<RawWindow const> windows,
    std::span<std::string const> classes,
    Point point,
    std::span<std::string_view const> system_prefixes
)
{
    std::optional<WindowInfo> best;
    int best_layer = 0;

    for (size_t i = 0; i < windows.size(); ++i)
    {
        auto const& window = windows[i];
        if (!window.pid || !window.bounds)
            continue;

        Rect const& frame = *window.bounds;
        if (frame.width <= MIN_PICK_DIMENSION || frame.height <= MIN_PICK_DIMENSION)
            continue;
        if (window.alpha.value_or(1.0) <= MIN_PICK_ALPHA)
            continue;

        std::string const& window_class = i < classes.size() ? classes[i] : std::string();
        if (is_system_owner(window_class, system_prefixes))
            continue;
        if (!frame.contains(point))
            continue;

        // Strictly lower layer only, so the first record wins ties
        if (best && window.layer >= best_layer)
            continue;

        best = WindowInfo{ window.id, *window.pid, window.title.value_or(""), window_class, frame };
        best_layer = window.layer;
    }

    return best;
}

std::optional<WindowInfo> pick_at(WindowSource& source, Point point, log::LoggerPtr const& logger)
{
    auto log = log::or_default(logger);
    SPDLOG_LOGGER_DEBUG(log, "Picking window at position: {}, {}", point.x, point.y);

    auto windows = source.enumerate_windows();

    auto classes = resolve_window_classes(source, windows);

    auto picked = pick_at(windows, classes, point);
    if (picked)
        SPDLOG_LOGGER_DEBUG(log, "Found window: {}, Class: {}", picked->title, picked->window_class);
    return picked;
}

} // namespace tablegrid::picker
