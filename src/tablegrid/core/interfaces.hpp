#pragma once

#include "tablegrid/core/error.hpp"
#include "tablegrid/core/types.hpp"
#include <optional>
#include <vector>

namespace tablegrid {

/**
 * @brief Read-only view of the windowing system.
 *
 * Implementations must never move or alter windows.
 */
class WindowSource
{
public:
    virtual ~WindowSource() = default;

    /// All on-screen windows, in any order.
    virtual std::vector<RawWindow> enumerate_windows() = 0;

    /// Best-effort identity of the application owning a process.
    virtual OwnerInfo resolve_owner(ProcessId pid) = 0;
};

/**
 * @brief Side-effecting window operations.
 *
 * Failures are per window and recoverable; callers log and continue.
 */
class WindowController
{
public:
    virtual ~WindowController() = default;

    virtual WindowOpResult move_resize(WindowId window, ProcessId pid, Rect const& target) = 0;
    virtual WindowOpResult activate(WindowId window, ProcessId pid) = 0;
};

/// Display topology queries.
class DisplayTopology
{
public:
    virtual ~DisplayTopology() = default;

    virtual std::vector<Display> displays() = 0;
    virtual std::optional<Rect> display_bounds(DisplayId display) = 0;
    virtual std::optional<DisplayId> display_containing(Point point) = 0;
};

/// Pointer position, used by hover activation.
class PointerSource
{
public:
    virtual ~PointerSource() = default;

    virtual std::optional<Point> pointer_position() = 0;
};

} // namespace tablegrid
