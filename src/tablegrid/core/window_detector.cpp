#include "window_detector.hpp"
#include "tablegrid/core/display.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace tablegrid {

namespace {

std::string lowercase(std::string value)
{
    std::ranges::transform(value, value.begin(), [](unsigned char c) { return std::tolower(c); });
    return value;
}

bool is_well_formed(RawWindow const& window)
{
    return window.pid.has_value() && window.title.has_value() && window.bounds.has_value();
}

}

std::string resolve_window_class(OwnerInfo const& owner)
{
    if (owner.app_id && !owner.app_id->empty())
        return *owner.app_id;

    if (owner.app_name && !owner.app_name->empty())
    {
        std::string name = lowercase(*owner.app_name);
        std::erase(name, ' ');
        return "app." + name;
    }

    if (owner.executable && !owner.executable->empty())
    {
        std::string const& path = *owner.executable;
        auto slash = path.find_last_of('/');
        std::string base = slash == std::string::npos ? path : path.substr(slash + 1);
        if (!base.empty())
            return "process." + lowercase(base);
    }

    return "unknown";
}

std::vector<std::string> resolve_window_classes(WindowSource& source, std::span<RawWindow const> windows)
{
    // Owner lookups can be slow (process table, properties); resolve each pid once per pass
    std::unordered_map<ProcessId, std::string> class_by_pid;
    std::vector<std::string> classes;
    classes.reserve(windows.size());
    for (auto const& window : windows)
    {
        if (window.owner)
        {
            classes.push_back(*window.owner);
            continue;
        }
        if (!window.pid)
        {
            classes.emplace_back();
            continue;
        }
        auto it = class_by_pid.find(*window.pid);
        if (it == class_by_pid.end())
            it = class_by_pid.emplace(*window.pid, resolve_window_class(source.resolve_owner(*window.pid))).first;
        classes.push_back(it->second);
    }
    return classes;
}

WindowDetector::WindowDetector(WindowSource& source, DisplayTopology& topology, PatternMatcher& matcher, log::LoggerPtr logger)
    : source_(source)
    , topology_(topology)
    , matcher_(matcher)
    , logger_(log::or_default(std::move(logger)))
{ }

std::vector<ManagedWindow> WindowDetector::detect(std::span<WindowType const> types)
{
    bool any_enabled = std::ranges::any_of(types, [](WindowType const& t) { return t.enabled; });
    if (!any_enabled)
    {
        SPDLOG_LOGGER_DEBUG(logger_, "No enabled window types, skipping detection");
        return {};
    }

    auto raw = source_.enumerate_windows();
    auto displays = topology_.displays();

    auto classes = resolve_window_classes(source_, raw);
    return classify(raw, classes, types, displays);
}

std::vector<ManagedWindow> WindowDetector::classify(
    std::span<RawWindow const> windows,
    std::span<std::string const> classes,
    std::span<WindowType const> types,
    std::span<Display const> displays
)
{
    std::vector<ManagedWindow> result;
    std::unordered_set<WindowId> seen;

    for (size_t i = 0; i < windows.size(); ++i)
    {
        auto const& window = windows[i];

        if (!is_well_formed(window))
        {
            SPDLOG_LOGGER_TRACE(logger_, "Skipping malformed window record {:#x}", window.id);
            continue;
        }

        Rect const& bounds = *window.bounds;
        if (bounds.width <= 0.0 || bounds.height <= 0.0)
            continue;
        if (window.alpha.value_or(1.0) <= 0.0)
            continue;
        if (seen.contains(window.id))
            continue;

        std::string const& window_class = i < classes.size() ? classes[i] : std::string();

        for (auto const& type : types)
        {
            if (!matcher_.matches(type, *window.title, window_class))
                continue;

            ManagedWindow managed;
            managed.id = window.id;
            managed.pid = *window.pid;
            managed.title = *window.title;
            managed.window_class = window_class;
            managed.frame = bounds;
            managed.display = display::display_for_frame(displays, bounds);
            managed.type = type;

            SPDLOG_LOGGER_DEBUG(logger_, "Detected window: {} [{}]", managed.title, type.name);
            seen.insert(window.id);
            result.push_back(std::move(managed));
            break;
        }
    }

    return result;
}

} // namespace tablegrid
