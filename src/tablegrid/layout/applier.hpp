#pragma once

#include "tablegrid/core/interfaces.hpp"
#include "tablegrid/core/log.hpp"
#include "tablegrid/layout/assignment.hpp"
#include <mutex>
#include <span>
#include <utility>
#include <vector>

namespace tablegrid {

struct ApplyReport
{
    std::vector<WindowId> moved;
    std::vector<std::pair<WindowId, WindowOpResult>> failed;
    std::vector<WindowId> unassigned;

    bool complete() const { return failed.empty() && unassigned.empty(); }

    /// Any move refused for lack of access; the caller should prompt the user.
    bool permission_denied() const;
};

/**
 * @brief Executes assignments through the window controller.
 *
 * Apply requests are serialized: a second apply waits until the first has
 * issued all of its moves, so two requests never interleave on one window.
 * A failed move is logged and recorded; the remaining moves still run.
 */
class LayoutApplier
{
public:
    explicit LayoutApplier(WindowController& controller, log::LoggerPtr logger = nullptr);

    /// Assign then move. Throws LayoutError for a layout without slots.
    ApplyReport apply(Layout const& layout, std::span<ManagedWindow const> windows);

    ApplyReport apply(Assignments const& assignments);

private:
    ApplyReport move_all(Assignments const& assignments);

    WindowController& controller_;
    log::LoggerPtr logger_;
    std::mutex apply_mutex_;
};

} // namespace tablegrid
