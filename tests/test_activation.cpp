#include "tablegrid/core/activation.hpp"
#include "fakes.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace tablegrid;
using namespace tablegrid::activation;
using namespace std::chrono_literals;
using test::managed_window;

namespace {

Configuration configuration(std::string id, std::optional<AutoActivationCondition> condition)
{
    Configuration config;
    config.id = id;
    config.name = std::move(id);
    config.auto_activation = std::move(condition);
    return config;
}

WindowInfo info(WindowId id)
{
    return WindowInfo{ id, static_cast<ProcessId>(id), "Table", "app.poker", Rect{ 0, 0, 100, 100 } };
}

} // namespace

TEST_CASE("Window count condition needs the exact count", "[activation]")
{
    std::vector<ManagedWindow> windows = { managed_window(1, "A"), managed_window(2, "B") };

    REQUIRE(condition_met(WindowCountCondition{ 2 }, windows));
    REQUIRE_FALSE(condition_met(WindowCountCondition{ 1 }, windows));
    REQUIRE_FALSE(condition_met(WindowCountCondition{ 3 }, windows));
    REQUIRE_FALSE(condition_met(WindowCountCondition{ -1 }, windows));
    REQUIRE(condition_met(WindowCountCondition{ 0 }, {}));
}

TEST_CASE("Window type count condition checks every listed type", "[activation]")
{
    std::vector<ManagedWindow> windows = {
        managed_window(1, "A"),
        managed_window(2, "A"),
        managed_window(3, "B"),
    };

    REQUIRE(condition_met(WindowTypeCountCondition{ { { "A", 2 }, { "B", 1 } } }, windows));
    REQUIRE(condition_met(WindowTypeCountCondition{ { { "A", 2 } } }, windows));
    REQUIRE_FALSE(condition_met(WindowTypeCountCondition{ { { "A", 3 } } }, windows));
    REQUIRE(condition_met(WindowTypeCountCondition{ { { "C", 0 } } }, windows));
    REQUIRE_FALSE(condition_met(WindowTypeCountCondition{ { { "C", 1 } } }, windows));
}

TEST_CASE("Auto activation picks the first satisfied configuration", "[activation]")
{
    std::vector<Configuration> configs = {
        configuration("manual", std::nullopt),
        configuration("three", WindowCountCondition{ 3 }),
        configuration("two", WindowCountCondition{ 2 }),
        configuration("two-again", WindowCountCondition{ 2 }),
    };
    std::vector<ManagedWindow> windows = { managed_window(1, "A"), managed_window(2, "A") };

    auto selected = select_auto_activation(configs, windows, false);
    REQUIRE(selected.has_value());
    REQUIRE(selected->id == "two");

    SECTION("Nothing when a configuration is already active")
    {
        REQUIRE_FALSE(select_auto_activation(configs, windows, true).has_value());
    }
}

TEST_CASE("Hover activates a managed window after the delay", "[activation][hover]")
{
    HoverTracker tracker(HoverSettings{ 300ms, 500ms });
    std::unordered_set<WindowId> managed = { 1, 2 };
    auto t0 = HoverTracker::Clock::time_point{};

    REQUIRE_FALSE(tracker.update(t0, info(1), managed).has_value());
    REQUIRE(tracker.hovered_window() == 1);
    REQUIRE_FALSE(tracker.update(t0 + 200ms, info(1), managed).has_value());

    auto activated = tracker.update(t0 + 300ms, info(1), managed);
    REQUIRE(activated.has_value());
    REQUIRE(activated->id == 1);

    // Tracking restarts after an activation
    REQUIRE_FALSE(tracker.hovered_window().has_value());
    REQUIRE_FALSE(tracker.update(t0 + 310ms, info(1), managed).has_value());
}

TEST_CASE("Hover respects the cooldown between activations", "[activation][hover]")
{
    HoverTracker tracker(HoverSettings{ 100ms, 500ms });
    std::unordered_set<WindowId> managed = { 1, 2 };
    auto t0 = HoverTracker::Clock::time_point{};

    tracker.update(t0, info(1), managed);
    REQUIRE(tracker.update(t0 + 100ms, info(1), managed).has_value());

    tracker.update(t0 + 150ms, info(2), managed);
    REQUIRE_FALSE(tracker.update(t0 + 300ms, info(2), managed).has_value());
    REQUIRE(tracker.update(t0 + 600ms, info(2), managed).has_value());
}

TEST_CASE("Hover resets on unmanaged windows or empty space", "[activation][hover]")
{
    HoverTracker tracker(HoverSettings{ 300ms, 500ms });
    std::unordered_set<WindowId> managed = { 1 };
    auto t0 = HoverTracker::Clock::time_point{};

    tracker.update(t0, info(1), managed);

    SECTION("Unmanaged window")
    {
        tracker.update(t0 + 100ms, info(9), managed);
        REQUIRE_FALSE(tracker.hovered_window().has_value());
    }

    SECTION("No window")
    {
        tracker.update(t0 + 100ms, std::nullopt, managed);
        REQUIRE_FALSE(tracker.hovered_window().has_value());
    }

    // The delay starts over
    REQUIRE_FALSE(tracker.update(t0 + 350ms, info(1), managed).has_value());
    REQUIRE(tracker.update(t0 + 650ms, info(1), managed).has_value());
}
