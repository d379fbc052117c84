#include "tablegrid/core/activation.hpp"
#include <unordered_map>

namespace tablegrid::activation {

bool condition_met(AutoActivationCondition const& condition, std::span<ManagedWindow const> windows)
{
    if (auto const* by_count = std::get_if<WindowCountCondition>(&condition))
    {
        return by_count->count >= 0 && windows.size() == static_cast<size_t>(by_count->count);
    }

    auto const& by_type = std::get<WindowTypeCountCondition>(condition);

    std::unordered_map<std::string, int> actual;
    for (auto const& window : windows)
        ++actual[window.type.id];

    for (auto const& [type_id, required] : by_type.counts)
    {
        auto it = actual.find(type_id);
        int count = it == actual.end() ? 0 : it->second;
        if (count != required)
            return false;
    }
    return true;
}

std::optional<Configuration>
select_auto_activation(std::span<Configuration const> configurations, std::span<ManagedWindow const> windows, bool has_active)
{
    if (has_active)
        return std::nullopt;

    for (auto const& config : configurations)
    {
        if (config.auto_activation && condition_met(*config.auto_activation, windows))
            return config;
    }
    return std::nullopt;
}

HoverTracker::HoverTracker(HoverSettings settings)
    : settings_(settings)
{ }

void HoverTracker::reset()
{
    hovered_.reset();
    hover_start_.reset();
}

std::optional<WindowInfo> HoverTracker::update(
    Clock::time_point now,
    std::optional<WindowInfo> const& hovered,
    std::unordered_set<WindowId> const& managed
)
{
    if (!hovered || !managed.contains(hovered->id))
    {
        reset();
        return std::nullopt;
    }

    if (hovered_ != hovered->id)
    {
        // Started hovering a new window
        hovered_ = hovered->id;
        hover_start_ = now;
        return std::nullopt;
    }

    if (!hover_start_ || now - *hover_start_ < settings_.delay)
        return std::nullopt;

    if (last_activation_ && now - *last_activation_ < settings_.cooldown)
        return std::nullopt;

    last_activation_ = now;
    reset();
    return hovered;
}

} // namespace tablegrid::activation
