#include "tablegrid/layout/assignment.hpp"
#include "tablegrid/core/error.hpp"
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace tablegrid {

std::string_view to_string(MatchingStrategy strategy)
{
    switch (strategy)
    {
        case MatchingStrategy::Sequential:
            return "sequential";
        case MatchingStrategy::ByType:
            return "byType";
    }
    return "sequential";
}

MatchingStrategy parse_matching_strategy(std::string_view name)
{
    if (name == "sequential")
        return MatchingStrategy::Sequential;
    if (name == "byType")
        return MatchingStrategy::ByType;
    throw LayoutError("unknown matching strategy '" + std::string(name) + "'");
}

namespace assignment {

namespace {

template <typename T, typename KeyFn>
std::vector<std::pair<DisplayId, std::vector<T>>> group_by_display(std::span<T const> items, KeyFn display_of)
{
    std::vector<std::pair<DisplayId, std::vector<T>>> groups;
    for (auto const& item : items)
    {
        DisplayId display = display_of(item);
        auto it = std::ranges::find_if(groups, [&](auto const& g) { return g.first == display; });
        if (it == groups.end())
        {
            groups.emplace_back(display, std::vector<T>{});
            it = std::prev(groups.end());
        }
        it->second.push_back(item);
    }
    return groups;
}

std::vector<Slot> by_priority(std::vector<Slot> slots)
{
    std::ranges::stable_sort(slots, [](Slot const& a, Slot const& b) { return a.priority > b.priority; });
    return slots;
}

std::vector<ManagedWindow> unique_windows(std::span<ManagedWindow const> windows)
{
    std::vector<ManagedWindow> result;
    std::unordered_set<WindowId> seen;
    for (auto const& window : windows)
    {
        if (seen.insert(window.id).second)
            result.push_back(window);
    }
    return result;
}

// Re-emit in window input order
Assignments in_window_order(std::span<ManagedWindow const> windows, std::unordered_map<WindowId, Slot> const& slots)
{
    Assignments result;
    result.reserve(slots.size());
    for (auto const& window : windows)
    {
        if (auto it = slots.find(window.id); it != slots.end())
            result.push_back(Assignment{ window, it->second });
    }
    return result;
}

}

Assignments assign(Layout const& layout, std::span<ManagedWindow const> windows)
{
    if (layout.slots.empty())
        throw LayoutError("layout '" + layout.name + "' has no slots");

    switch (layout.strategy)
    {
        case MatchingStrategy::Sequential:
            return assign_sequential(layout.slots, windows);
        case MatchingStrategy::ByType:
            return assign_by_type(layout.slots, windows);
    }
    throw LayoutError("unknown matching strategy");
}

Assignments assign_sequential(std::span<Slot const> slots, std::span<ManagedWindow const> windows)
{
    auto unique = unique_windows(windows);
    auto slot_groups = group_by_display(slots, [](Slot const& s) { return s.display; });
    auto window_groups =
        group_by_display(std::span<ManagedWindow const>(unique), [](ManagedWindow const& w) { return w.display; });

    std::unordered_map<WindowId, Slot> placed;
    for (auto const& group : window_groups)
    {
        auto it = std::ranges::find_if(slot_groups, [&](auto const& g) { return g.first == group.first; });
        if (it == slot_groups.end())
            continue;

        auto const& display_windows = group.second;
        auto sorted = by_priority(it->second);
        size_t count = std::min(sorted.size(), display_windows.size());
        for (size_t i = 0; i < count; ++i)
            placed.emplace(display_windows[i].id, sorted[i]);
    }

    return in_window_order(unique, placed);
}

Assignments assign_by_type(std::span<Slot const> slots, std::span<ManagedWindow const> windows)
{
    auto unique = unique_windows(windows);

    // Type groups in order of first appearance
    std::vector<std::string> type_order;
    for (auto const& window : unique)
    {
        if (std::ranges::find(type_order, window.type.id) == type_order.end())
            type_order.push_back(window.type.id);
    }

    std::unordered_map<WindowId, Slot> placed;
    std::unordered_set<std::string> used_slots;

    auto take = [&](ManagedWindow const& window, Slot const& slot) {
        placed.emplace(window.id, slot);
        used_slots.insert(slot.id);
    };

    for (auto const& [display, display_slots] : group_by_display(slots, [](Slot const& s) { return s.display; }))
    {
        auto pool = by_priority(display_slots);
        size_t next = 0; // pool front

        for (auto const& type_id : type_order)
        {
            std::vector<ManagedWindow const*> group;
            for (auto const& window : unique)
            {
                if (window.display == display && window.type.id == type_id)
                    group.push_back(&window);
            }
            if (group.empty())
                continue;

            size_t count = std::min(group.size(), pool.size() - next);
            for (size_t i = 0; i < count; ++i)
                take(*group[i], pool[next + i]);
            next += count;

            if (next == pool.size())
                break;
        }

        // Anything on this display that did not fit its group takes what is left
        for (auto const& window : unique)
        {
            if (next == pool.size())
                break;
            if (window.display != display || placed.contains(window.id))
                continue;
            take(window, pool[next++]);
        }
    }

    // Windows whose display has no free slots may land on any unused slot
    size_t cursor = 0;
    for (auto const& window : unique)
    {
        if (placed.contains(window.id))
            continue;
        while (cursor < slots.size() && used_slots.contains(slots[cursor].id))
            ++cursor;
        if (cursor == slots.size())
            break;
        take(window, slots[cursor++]);
    }

    return in_window_order(unique, placed);
}

std::optional<Slot> slot_for(Assignments const& assignments, WindowId window)
{
    auto it = std::ranges::find_if(assignments, [&](Assignment const& a) { return a.window.id == window; });
    if (it == assignments.end())
        return std::nullopt;
    return it->slot;
}

std::vector<ManagedWindow> unassigned(Assignments const& assignments, std::span<ManagedWindow const> windows)
{
    std::unordered_set<WindowId> placed;
    for (auto const& a : assignments)
        placed.insert(a.window.id);

    std::vector<ManagedWindow> result;
    for (auto const& window : windows)
    {
        if (placed.insert(window.id).second)
            result.push_back(window);
    }
    return result;
}

} // namespace assignment

} // namespace tablegrid
