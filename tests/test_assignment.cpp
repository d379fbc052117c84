#include "tablegrid/core/error.hpp"
#include "tablegrid/layout/assignment.hpp"
#include "fakes.hpp"
#include <catch2/catch_test_macros.hpp>
#include <set>

using namespace tablegrid;
using test::managed_window;

namespace {

Slot make_slot(std::string id, int priority, DisplayId display = 1)
{
    return Slot{ std::move(id), Rect{ 0, 0, 100, 100 }, display, priority };
}

Layout make_layout(std::vector<Slot> slots, MatchingStrategy strategy)
{
    Layout layout;
    layout.id = "layout";
    layout.name = "Test";
    layout.slots = std::move(slots);
    layout.strategy = strategy;
    return layout;
}

std::vector<std::string> slot_ids(Assignments const& assignments)
{
    std::vector<std::string> ids;
    for (auto const& a : assignments)
        ids.push_back(a.slot.id);
    return ids;
}

} // namespace

TEST_CASE("Matching strategy names round through text", "[assignment]")
{
    REQUIRE(to_string(MatchingStrategy::Sequential) == "sequential");
    REQUIRE(to_string(MatchingStrategy::ByType) == "byType");
    REQUIRE(parse_matching_strategy("sequential") == MatchingStrategy::Sequential);
    REQUIRE(parse_matching_strategy("byType") == MatchingStrategy::ByType);
    REQUIRE_THROWS_AS(parse_matching_strategy("bytype"), LayoutError);
}

TEST_CASE("Sequential assignment fills slots by priority", "[assignment]")
{
    auto layout = make_layout(
        { make_slot("low", 0), make_slot("high", 10), make_slot("mid", 5), make_slot("mid2", 5) },
        MatchingStrategy::Sequential
    );
    std::vector<ManagedWindow> windows = { managed_window(1, "a"), managed_window(2, "a"), managed_window(3, "a") };

    auto assignments = assignment::assign(layout, windows);

    REQUIRE(assignments.size() == 3);
    REQUIRE(assignments[0].window.id == 1);
    // Equal priorities keep layout order
    REQUIRE(slot_ids(assignments) == std::vector<std::string>{ "high", "mid", "mid2" });
}

TEST_CASE("Sequential assignment is total when slots suffice", "[assignment]")
{
    std::vector<Slot> slots;
    for (int i = 0; i < 6; ++i)
        slots.push_back(make_slot("s" + std::to_string(i), i % 3));

    std::vector<ManagedWindow> windows;
    for (WindowId id = 1; id <= 6; ++id)
        windows.push_back(managed_window(id, id % 2 ? "a" : "b"));

    auto assignments = assignment::assign_sequential(slots, windows);

    REQUIRE(assignments.size() == windows.size());
    std::set<std::string> used;
    for (auto const& a : assignments)
        REQUIRE(used.insert(a.slot.id).second);
    REQUIRE(assignment::unassigned(assignments, windows).empty());
}

TEST_CASE("Sequential assignment stays on each window's display", "[assignment]")
{
    std::vector<Slot> slots = { make_slot("d1", 0, 1), make_slot("d2a", 0, 2), make_slot("d2b", 0, 2) };
    std::vector<ManagedWindow> windows = {
        managed_window(1, "a", 2),
        managed_window(2, "a", 1),
        managed_window(3, "a", 1),
        managed_window(4, "a", 3),
    };

    auto assignments = assignment::assign_sequential(slots, windows);

    REQUIRE(assignment::slot_for(assignments, 1)->id == "d2a");
    REQUIRE(assignment::slot_for(assignments, 2)->id == "d1");
    REQUIRE_FALSE(assignment::slot_for(assignments, 3).has_value());
    REQUIRE_FALSE(assignment::slot_for(assignments, 4).has_value());

    auto leftover = assignment::unassigned(assignments, windows);
    REQUIRE(leftover.size() == 2);
    REQUIRE(leftover[0].id == 3);
    REQUIRE(leftover[1].id == 4);
}

TEST_CASE("Assignment is deterministic", "[assignment]")
{
    std::vector<Slot> slots;
    for (int i = 0; i < 8; ++i)
        slots.push_back(make_slot("s" + std::to_string(i), (i * 7) % 4, i < 4 ? 1 : 2));

    std::vector<ManagedWindow> windows;
    for (WindowId id = 1; id <= 9; ++id)
        windows.push_back(managed_window(id, id % 3 ? "a" : "b", id % 2 ? 1 : 2));

    for (auto strategy : { MatchingStrategy::Sequential, MatchingStrategy::ByType })
    {
        auto layout = make_layout(slots, strategy);
        auto first = assignment::assign(layout, windows);
        auto second = assignment::assign(layout, windows);

        REQUIRE(first.size() == second.size());
        for (size_t i = 0; i < first.size(); ++i)
        {
            REQUIRE(first[i].window.id == second[i].window.id);
            REQUIRE(first[i].slot.id == second[i].slot.id);
        }
    }
}

TEST_CASE("By-type assignment groups windows of a type", "[assignment]")
{
    std::vector<Slot> slots;
    for (int i = 0; i < 6; ++i)
        slots.push_back(make_slot("p" + std::to_string(6 - i), 6 - i));

    std::vector<ManagedWindow> windows = {
        managed_window(1, "A"),
        managed_window(2, "B"),
        managed_window(3, "A"),
        managed_window(4, "B"),
        managed_window(5, "A"),
        managed_window(6, "A"),
    };

    auto layout = make_layout(slots, MatchingStrategy::ByType);
    auto assignments = assignment::assign(layout, windows);

    REQUIRE(assignments.size() == 6);
    REQUIRE(assignment::unassigned(assignments, windows).empty());

    // Type A takes the four highest priorities in input order, type B the rest
    REQUIRE(assignment::slot_for(assignments, 1)->id == "p6");
    REQUIRE(assignment::slot_for(assignments, 3)->id == "p5");
    REQUIRE(assignment::slot_for(assignments, 5)->id == "p4");
    REQUIRE(assignment::slot_for(assignments, 6)->id == "p3");
    REQUIRE(assignment::slot_for(assignments, 2)->id == "p2");
    REQUIRE(assignment::slot_for(assignments, 4)->id == "p1");

    // Output follows window input order
    REQUIRE(assignments[1].window.id == 2);
}

TEST_CASE("By-type assignment falls back to other displays", "[assignment]")
{
    std::vector<Slot> slots = { make_slot("d1", 0, 1), make_slot("d2", 0, 2) };
    std::vector<ManagedWindow> windows = { managed_window(1, "A", 1), managed_window(2, "A", 1) };

    auto assignments = assignment::assign_by_type(slots, windows);

    REQUIRE(assignments.size() == 2);
    REQUIRE(assignment::slot_for(assignments, 1)->id == "d1");
    REQUIRE(assignment::slot_for(assignments, 2)->id == "d2");
}

TEST_CASE("Duplicate windows are assigned once", "[assignment]")
{
    std::vector<Slot> slots = { make_slot("a", 0), make_slot("b", 0) };
    std::vector<ManagedWindow> windows = { managed_window(1, "A"), managed_window(1, "A") };

    REQUIRE(assignment::assign_sequential(slots, windows).size() == 1);
    REQUIRE(assignment::assign_by_type(slots, windows).size() == 1);
}

TEST_CASE("Empty layout is rejected", "[assignment]")
{
    auto layout = make_layout({}, MatchingStrategy::Sequential);
    std::vector<ManagedWindow> windows = { managed_window(1, "A") };

    REQUIRE_THROWS_AS(assignment::assign(layout, windows), LayoutError);
}
