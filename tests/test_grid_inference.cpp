#include "tablegrid/core/error.hpp"
#include "tablegrid/layout/assignment.hpp"
#include "tablegrid/layout/grid_inference.hpp"
#include "fakes.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <set>

using namespace tablegrid;
using namespace tablegrid::inference;
using Catch::Approx;

namespace {

Slot slot_at(double x, double y, double width = 480, double height = 380, DisplayId display = 1)
{
    return Slot{ "s", Rect{ x, y, width, height }, display, 0 };
}

Rect const DISPLAY_BOUNDS{ 0, 0, 1920, 1080 };

} // namespace

TEST_CASE("Positions cluster within the tolerance", "[inference]")
{
    std::vector<double> values = { 510, 0, 8, 500, 1000, 1014, 1030 };

    auto clusters = cluster_positions(values, GRID_POSITION_TOLERANCE);

    REQUIRE(clusters == std::vector<double>{ 0, 510, 1000, 1030 });
}

TEST_CASE("A perfect grid is reproduced", "[inference]")
{
    std::vector<Slot> slots;
    for (int row = 0; row < 2; ++row)
        for (int col = 0; col < 3; ++col)
            slots.push_back(slot_at(col * 500.0, row * 400.0));

    auto result = infer_display_grid(slots, DISPLAY_BOUNDS, log::null_logger());

    REQUIRE(result.size() == 6);
    for (size_t i = 0; i < slots.size(); ++i)
    {
        REQUIRE(result[i].frame.x == Approx(slots[i].frame.x));
        REQUIRE(result[i].frame.y == Approx(slots[i].frame.y));
        REQUIRE(result[i].display == 1);
    }

    // Cells fill 95% of the gap to the next line; the last column uses the average gap
    REQUIRE(result[0].frame.width == Approx(475.0));
    REQUIRE(result[0].frame.height == Approx(380.0));
    REQUIRE(result[2].frame.width == Approx(500.0));
    REQUIRE(result[5].frame.height == Approx(400.0));
    REQUIRE(result[4].id == "1_1");
}

TEST_CASE("Jittered grid snaps to its cluster lines", "[inference]")
{
    std::vector<Slot> slots = {
        slot_at(0, 0),
        slot_at(905, 4),
        slot_at(3, 506),
        slot_at(898, 497),
    };

    auto result = infer_display_grid(slots, DISPLAY_BOUNDS, log::null_logger());

    REQUIRE(result.size() == 4);
    REQUIRE(result[0].frame.x == Approx(0.0));
    REQUIRE(result[1].frame.x == Approx(905.0));
    REQUIRE(result[2].frame.y == Approx(506.0));
    REQUIRE(result[3].frame.x == Approx(905.0));
    REQUIRE(result[3].frame.y == Approx(506.0));
}

TEST_CASE("Scattered windows fall back to a regular grid", "[inference]")
{
    std::vector<Slot> slots = {
        slot_at(0, 0),
        slot_at(130, 270),
        slot_at(410, 90),
        slot_at(760, 610),
        slot_at(1220, 380),
    };

    auto result = infer_display_grid(slots, DISPLAY_BOUNDS, log::null_logger());

    // columns = floor(sqrt(5)) = 2, rows = ceil(5 / 2) = 3
    REQUIRE(result.size() == 6);
    REQUIRE(result[0].frame.width == Approx(1920 * CELL_FILL_RATIO / 2));
    REQUIRE(result[0].frame.height == Approx(1080 * CELL_FILL_RATIO / 3));
    REQUIRE(result[0].frame.x == Approx(1920 * (1 - CELL_FILL_RATIO) / 2));
    REQUIRE(result[0].frame.y == Approx(1080 * (1 - CELL_FILL_RATIO) / 2));
    REQUIRE(result.back().id == "2_1");
}

TEST_CASE("Fewer than three slots are kept as captured", "[inference]")
{
    std::vector<Slot> slots = { slot_at(13, 17), slot_at(700, 33) };

    auto result = infer_display_grid(slots, Rect{}, log::null_logger());

    REQUIRE(result.size() == 2);
    REQUIRE(result[0].frame == slots[0].frame);
    REQUIRE(result[1].frame == slots[1].frame);
}

TEST_CASE("Regular grid rejects degenerate input", "[inference]")
{
    REQUIRE_THROWS_AS(regular_grid_slots(0, 2, DISPLAY_BOUNDS, 1), LayoutError);
    REQUIRE_THROWS_AS(regular_grid_slots(2, 2, Rect{}, 1), LayoutError);
}

TEST_CASE("Capture creates one slot per window", "[inference]")
{
    std::vector<ManagedWindow> windows;
    for (WindowId id = 1; id <= 6; ++id)
        windows.push_back(test::managed_window(id, "a", 1, Rect{ id * 10.0, 0, 300, 200 }));

    auto layout = capture_layout(windows);

    REQUIRE(layout.name == "Captured Layout");
    REQUIRE(layout.strategy == MatchingStrategy::Sequential);
    REQUIRE(layout.slots.size() == 6);
    REQUIRE(layout.slots[0].id == "0_0");
    REQUIRE(layout.slots[3].id == "0_3");
    REQUIRE(layout.slots[4].id == "1_0");
    REQUIRE(layout.slots[5].frame == windows[5].frame);
}

TEST_CASE("Optimize works per display and keeps the strategy", "[inference]")
{
    std::vector<Display> displays = {
        test::display(1, Rect{ 0, 0, 1920, 1080 }),
        test::display(2, Rect{ 1920, 0, 1920, 1080 }),
    };

    Layout captured;
    captured.name = "Evening";
    captured.strategy = MatchingStrategy::ByType;
    for (int row = 0; row < 2; ++row)
        for (int col = 0; col < 2; ++col)
            captured.slots.push_back(slot_at(1920 + col * 900.0, row * 500.0, 480, 380, 2));
    captured.slots.push_back(slot_at(100, 100, 480, 380, 1));

    auto optimized = optimize_layout(captured, displays, log::null_logger());

    REQUIRE(optimized.name == "Optimized Evening");
    REQUIRE(optimized.strategy == MatchingStrategy::ByType);
    REQUIRE(optimized.slots.size() == 5);

    // Display 2 appears first in the capture, so its slots come first
    REQUIRE(optimized.slots[0].display == 2);
    REQUIRE(optimized.slots[3].display == 2);
    REQUIRE(optimized.slots[4].display == 1);
    REQUIRE(optimized.slots[4].frame == captured.slots[4].frame);
    REQUIRE(optimized.slots[0].id == "d0_0_0");
    REQUIRE(optimized.slots[3].id == "d0_1_1");
    REQUIRE(optimized.slots[4].id == "d1_s");
}

TEST_CASE("Slot ids stay unique across displays", "[inference]")
{
    std::vector<Display> displays = {
        test::display(1, Rect{ 0, 0, 1920, 1080 }),
        test::display(2, Rect{ 1920, 0, 1920, 1080 }),
    };

    std::vector<ManagedWindow> windows;
    WindowId id = 1;
    for (auto const& display : displays)
    {
        for (int row = 0; row < 2; ++row)
            for (int col = 0; col < 2; ++col)
                windows.push_back(test::managed_window(
                    id++, "a", display.id, Rect{ display.bounds.x + col * 900.0, row * 500.0, 480, 380 }
                ));
    }

    auto config = capture_configuration("Two screens", windows, displays, log::null_logger());

    REQUIRE(config.layout.slots.size() == 8);
    std::set<std::string> ids;
    for (auto const& slot : config.layout.slots)
        ids.insert(slot.id);
    REQUIRE(ids.size() == 8);

    SECTION("By-type fallback reaches the other display")
    {
        config.layout.strategy = MatchingStrategy::ByType;
        std::vector<ManagedWindow> crowded;
        for (WindowId w = 1; w <= 6; ++w)
            crowded.push_back(test::managed_window(w, "a", 1));

        auto assignments = assignment::assign(config.layout, crowded);

        REQUIRE(assignments.size() == 6);
        REQUIRE(assignment::unassigned(assignments, crowded).empty());
        std::set<std::string> used;
        for (auto const& a : assignments)
            used.insert(a.slot.id);
        REQUIRE(used.size() == 6);
    }
}

TEST_CASE("Capture configuration wraps the optimized layout", "[inference]")
{
    std::vector<Display> displays = { test::display(1, Rect{ 0, 0, 1920, 1080 }) };
    std::vector<ManagedWindow> windows = {
        test::managed_window(1, "a", 1, Rect{ 0, 0, 900, 500 }),
        test::managed_window(2, "a", 1, Rect{ 950, 0, 900, 500 }),
    };

    auto config = capture_configuration("Two tables", windows, displays, log::null_logger());

    REQUIRE(config.name == "Two tables");
    REQUIRE_FALSE(config.id.empty());
    REQUIRE_FALSE(config.auto_activation.has_value());
    REQUIRE(config.layout.name == "Optimized Captured Layout");
    REQUIRE(config.layout.slots.size() == 2);
}
