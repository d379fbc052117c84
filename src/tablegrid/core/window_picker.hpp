#pragma once

#include "tablegrid/core/interfaces.hpp"
#include "tablegrid/core/log.hpp"
#include "tablegrid/core/types.hpp"
#include <array>
#include <optional>
#include <span>
#include <string_view>

namespace tablegrid::picker {

/// Panels, desktops and notification daemons, matched by resolved class prefix.
inline constexpr std::array<std::string_view, 10> SYSTEM_OWNER_PREFIXES = {
    "app.plasmashell",
    "app.xfce4-panel",
    "app.xfdesktop",
    "app.xfce4-notifyd",
    "app.nautilus",
    "org.gnome.Nautilus",
    "app.pcmanfm",
    "app.lxpanel",
    "app.polybar",
    "app.dunst",
};

constexpr double MIN_PICK_DIMENSION = 10.0;
constexpr double MIN_PICK_ALPHA = 0.1;

bool is_system_owner(std::string_view window_class, std::span<std::string_view const> prefixes = SYSTEM_OWNER_PREFIXES);

/**
 * @brief Topmost pickable window containing a point.
 *
 * Stricter than detection: both dimensions must exceed 10px and alpha must
 * exceed 0.1 (a window without alpha is opaque). The lowest layer wins; ties go to the earlier record.
 * `classes` is parallel to `windows`.
 */
std::optional<WindowInfo> pick_at(
    std::span<RawWindow const> windows,
    std::span<std::string const> classes,
    Point point,
    std::span<std::string_view const> system_prefixes = SYSTEM_OWNER_PREFIXES
);

/// Enumerate through the source and pick.
std::optional<WindowInfo> pick_at(WindowSource& source, Point point, log::LoggerPtr const& logger = nullptr);

} // namespace tablegrid::picker
