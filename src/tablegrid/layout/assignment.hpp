#pragma once

#include "tablegrid/core/types.hpp"
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tablegrid {

struct Assignment
{
    ManagedWindow window;
    Slot slot;
};

/// Window-to-slot mapping, ordered by the windows' input order.
using Assignments = std::vector<Assignment>;

std::string_view to_string(MatchingStrategy strategy);

/// Parses "sequential" or "byType"; throws LayoutError otherwise.
MatchingStrategy parse_matching_strategy(std::string_view name);

namespace assignment {

/**
 * @brief Map windows to slots under the layout's matching strategy.
 *
 * Pure and deterministic: identical inputs give identical mappings. Windows
 * are keyed by id; a repeated id keeps its first occurrence. No slot is used
 * twice. Windows that cannot be placed are simply absent from the result.
 * Throws LayoutError for a layout without slots.
 */
Assignments assign(Layout const& layout, std::span<ManagedWindow const> windows);

/**
 * @brief Per display, i-th window (input order) to i-th slot by priority.
 *
 * Slots are stable-sorted by descending priority. Excess windows stay
 * unplaced.
 */
Assignments assign_sequential(std::span<Slot const> slots, std::span<ManagedWindow const> windows);

/**
 * @brief Per display, same-type windows take consecutive slots.
 *
 * Type groups are visited in order of first appearance among the windows.
 * Leftover windows on a display take the remaining slots of that display;
 * anything still unplaced then takes any unused slot of the layout (layout
 * order), possibly on another display.
 */
Assignments assign_by_type(std::span<Slot const> slots, std::span<ManagedWindow const> windows);

std::optional<Slot> slot_for(Assignments const& assignments, WindowId window);

/// Windows with no slot, in input order.
std::vector<ManagedWindow> unassigned(Assignments const& assignments, std::span<ManagedWindow const> windows);

} // namespace assignment

} // namespace tablegrid
