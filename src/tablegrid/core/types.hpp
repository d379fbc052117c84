#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tablegrid {

using WindowId = uint32_t;
using DisplayId = uint32_t;
using ProcessId = int32_t;

// ─────────────────────────────────────────────────────────────────────────────
// Geometry
// ─────────────────────────────────────────────────────────────────────────────

struct Point
{
    double x = 0.0;
    double y = 0.0;
};

/**
 * @brief Axis-aligned rectangle in global screen coordinates.
 *
 * Origin is the top-left corner; width and height extend right and down.
 * Doubles are used so that fractional layout math (margins, overlap,
 * aspect-ratio fitting) never truncates before the mover rounds.
 */
struct Rect
{
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    double min_x() const { return x; }
    double min_y() const { return y; }
    double max_x() const { return x + width; }
    double max_y() const { return y + height; }
    double mid_x() const { return x + width / 2.0; }
    double mid_y() const { return y + height / 2.0; }

    /// Half-open containment: the right and bottom edges are outside.
    bool contains(Point p) const { return p.x >= x && p.x < max_x() && p.y >= y && p.y < max_y(); }

    bool is_degenerate() const { return !(width > 0.0) || !(height > 0.0); }

    bool operator==(Rect const&) const = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// Window classification
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Classification rule used to recognize windows of interest.
 *
 * Both patterns are case-insensitive globs anchored at both ends; `*` matches
 * any run of characters and an empty pattern behaves like `*`.
 * Two window types are the same type when their ids are equal.
 */
struct WindowType
{
    std::string id;
    std::string name;
    std::string title_pattern = "*";
    std::string class_pattern = "*";
    bool enabled = true;

    bool operator==(WindowType const& other) const { return id == other.id; }
};

/**
 * @brief Raw on-screen window as reported by the window source.
 *
 * Every field except `id` is optional because the platform may omit any of
 * them; records missing pid, title or bounds are treated as malformed.
 * Lower `layer` values are closer to the viewer (0 is topmost).
 */
struct RawWindow
{
    WindowId id = 0;
    std::optional<ProcessId> pid;
    std::optional<std::string> title;
    std::optional<Rect> bounds;
    int layer = 0;
    std::optional<double> alpha;
    std::optional<std::string> owner; ///< Owner identity if the source knows it already
};

/**
 * @brief Whatever the platform knows about the application owning a process.
 *
 * Resolved into a window class string by resolve_window_class().
 */
struct OwnerInfo
{
    std::optional<std::string> app_id;     ///< Stable application identifier
    std::optional<std::string> app_name;   ///< Human-readable application name
    std::optional<std::string> executable; ///< Executable path or name
};

/**
 * @brief Detected, classified window eligible for placement.
 *
 * Snapshots are rebuilt on every detection pass. Identity is the platform
 * window id alone: two snapshots of the same window compare equal even if
 * title, frame or display changed between passes.
 */
struct ManagedWindow
{
    WindowId id = 0;
    ProcessId pid = 0;
    std::string title;
    std::string window_class;
    Rect frame;
    DisplayId display = 0;
    WindowType type;

    bool operator==(ManagedWindow const& other) const { return id == other.id; }
};

/// Window found by a point query (window picker).
struct WindowInfo
{
    WindowId id = 0;
    ProcessId pid = 0;
    std::string title;
    std::string window_class;
    Rect frame;
};

// ─────────────────────────────────────────────────────────────────────────────
// Layouts
// ─────────────────────────────────────────────────────────────────────────────

enum class MatchingStrategy
{
    Sequential,
    ByType,
};

/// Placement target. `id` is unique within its layout; higher priority fills first.
struct Slot
{
    std::string id;
    Rect frame;
    DisplayId display = 0;
    int priority = 0;
};

struct Layout
{
    std::string id;
    std::string name;
    std::vector<Slot> slots;
    MatchingStrategy strategy = MatchingStrategy::Sequential;
};

// ─────────────────────────────────────────────────────────────────────────────
// Configurations
// ─────────────────────────────────────────────────────────────────────────────

/// Activate when exactly `count` windows are detected.
struct WindowCountCondition
{
    int count = 0;

    bool operator==(WindowCountCondition const&) const = default;
};

/// Activate when every listed window type id has exactly the listed count.
struct WindowTypeCountCondition
{
    std::map<std::string, int> counts;

    bool operator==(WindowTypeCountCondition const&) const = default;
};

using AutoActivationCondition = std::variant<WindowCountCondition, WindowTypeCountCondition>;

struct Configuration
{
    std::string id;
    std::string name;
    Layout layout;
    std::optional<AutoActivationCondition> auto_activation;
};

// ─────────────────────────────────────────────────────────────────────────────
// Displays
// ─────────────────────────────────────────────────────────────────────────────

struct Display
{
    DisplayId id = 0;
    std::string name;
    Rect bounds;
};

} // namespace tablegrid
