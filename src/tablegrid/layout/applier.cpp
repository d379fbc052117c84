#include "tablegrid/layout/applier.hpp"
#include <algorithm>

namespace tablegrid {

bool ApplyReport::permission_denied() const
{
    return std::ranges::any_of(failed, [](auto const& f) { return f.second == WindowOpResult::PermissionDenied; });
}

LayoutApplier::LayoutApplier(WindowController& controller, log::LoggerPtr logger)
    : controller_(controller)
    , logger_(log::or_default(std::move(logger)))
{ }

ApplyReport LayoutApplier::apply(Layout const& layout, std::span<ManagedWindow const> windows)
{
    if (windows.empty())
    {
        SPDLOG_LOGGER_WARN(logger_, "No windows to arrange");
        return {};
    }

    SPDLOG_LOGGER_INFO(logger_, "Applying layout: {} to {} windows", layout.name, windows.size());

    auto assignments = assignment::assign(layout, windows);

    std::lock_guard lock(apply_mutex_);
    ApplyReport report = move_all(assignments);
    for (auto const& window : assignment::unassigned(assignments, windows))
    {
        SPDLOG_LOGGER_DEBUG(logger_, "No slot for window: {}", window.title);
        report.unassigned.push_back(window.id);
    }
    return report;
}

ApplyReport LayoutApplier::apply(Assignments const& assignments)
{
    std::lock_guard lock(apply_mutex_);
    return move_all(assignments);
}

ApplyReport LayoutApplier::move_all(Assignments const& assignments)
{
    ApplyReport report;
    for (auto const& [window, slot] : assignments)
    {
        auto result = controller_.move_resize(window.id, window.pid, slot.frame);
        if (result == WindowOpResult::Ok)
        {
            SPDLOG_LOGGER_DEBUG(logger_, "Moved window: {} to slot: {}", window.title, slot.id);
            report.moved.push_back(window.id);
        }
        else
        {
            SPDLOG_LOGGER_ERROR(
                logger_, "Failed to move window {:#x} ({}) to slot {}: {}", window.id, window.title, slot.id, to_string(result)
            );
            report.failed.emplace_back(window.id, result);
        }
    }

    SPDLOG_LOGGER_INFO(logger_, "Layout applied: {} moved, {} failed", report.moved.size(), report.failed.size());
    return report;
}

} // namespace tablegrid
