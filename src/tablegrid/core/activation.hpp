#pragma once

#include "tablegrid/core/types.hpp"
#include <chrono>
#include <optional>
#include <span>
#include <unordered_set>

namespace tablegrid::activation {

// ─────────────────────────────────────────────────────────────────────────────
// Auto activation of configurations
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Whether a configuration's auto-activation condition holds.
 *
 * windowCount(n) needs exactly n detected windows. windowTypeCount needs the
 * exact count for every listed type id; types it does not list are ignored.
 */
bool condition_met(AutoActivationCondition const& condition, std::span<ManagedWindow const> windows);

/**
 * @brief First configuration (list order) whose condition holds.
 *
 * Returns nothing while another configuration is active.
 */
std::optional<Configuration>
select_auto_activation(std::span<Configuration const> configurations, std::span<ManagedWindow const> windows, bool has_active);

// ─────────────────────────────────────────────────────────────────────────────
// Hover activation
// ─────────────────────────────────────────────────────────────────────────────

struct HoverSettings
{
    std::chrono::milliseconds delay{ 300 };
    std::chrono::milliseconds cooldown{ 500 };
};

/**
 * @brief Decides when the window under the pointer should be activated.
 *
 * Fed once per poll with the picked window (if any) and the currently managed
 * window ids. A managed window hovered continuously for `delay` is activated;
 * activations are at least `cooldown` apart. Tracking resets after an
 * activation and whenever the pointer leaves managed windows.
 */
class HoverTracker
{
public:
    using Clock = std::chrono::steady_clock;

    explicit HoverTracker(HoverSettings settings = {});

    /// Returns the window to activate now, if any.
    std::optional<WindowInfo> update(
        Clock::time_point now,
        std::optional<WindowInfo> const& hovered,
        std::unordered_set<WindowId> const& managed
    );

    void reset();

    std::optional<WindowId> hovered_window() const { return hovered_; }
    HoverSettings const& settings() const { return settings_; }

private:
    HoverSettings settings_;
    std::optional<WindowId> hovered_;
    std::optional<Clock::time_point> hover_start_;
    std::optional<Clock::time_point> last_activation_;
};

} // namespace tablegrid::activation
