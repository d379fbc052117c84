#include "tablegrid/core/window_detector.hpp"
#include "tablegrid/core/window_types.hpp"
#include "fakes.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace tablegrid;
using namespace tablegrid::test;

namespace {

struct DetectorFixture
{
    FakeWindowSource source;
    FakeTopology topology;
    PatternMatcher matcher{ PatternMatcher::Cache(DEFAULT_PATTERN_CACHE_CAPACITY), log::null_logger() };
    WindowDetector detector{ source, topology, matcher, log::null_logger() };

    DetectorFixture()
    {
        topology.all = { test::display(1, Rect{ 0, 0, 1920, 1080 }), test::display(2, Rect{ 1920, 0, 1920, 1080 }) };
    }
};

} // namespace

TEST_CASE("Window class resolution prefers the most stable identity", "[detector]")
{
    SECTION("Application id wins")
    {
        OwnerInfo owner{ "com.pokerstars.PokerStarsApp", "PokerStars", "/opt/ps/PokerStars" };
        REQUIRE(resolve_window_class(owner) == "com.pokerstars.PokerStarsApp");
    }

    SECTION("Application name is lowercased without spaces")
    {
        OwnerInfo owner{ std::nullopt, "Party Poker", "/usr/bin/party" };
        REQUIRE(resolve_window_class(owner) == "app.partypoker");
    }

    SECTION("Executable basename")
    {
        OwnerInfo owner{ std::nullopt, std::nullopt, "/usr/lib/poker/Poker888" };
        REQUIRE(resolve_window_class(owner) == "process.poker888");
    }

    SECTION("Nothing known")
    {
        REQUIRE(resolve_window_class(OwnerInfo{}) == "unknown");
        REQUIRE(resolve_window_class(OwnerInfo{ "", "", "" }) == "unknown");
    }
}

TEST_CASE("Detector classifies windows by first matching type", "[detector]")
{
    DetectorFixture f;
    f.source.windows = {
        raw_window(1, 10, "Table 1 - Hold'em", Rect{ 0, 0, 800, 600 }),
        raw_window(2, 10, "Lobby", Rect{ 100, 100, 800, 600 }),
        raw_window(3, 20, "Table 3 - Hold'em", Rect{ 2000, 0, 800, 600 }),
    };
    f.source.set_app_id(10, "com.pokerstars.PokerStarsApp");
    f.source.set_app_id(20, "com.other.app");

    std::vector<WindowType> types = {
        window_type("stars", "*Hold'em*", "com.pokerstars.*"),
        window_type("any-holdem", "*Hold'em*"),
    };

    auto windows = f.detector.detect(types);

    REQUIRE(windows.size() == 2);
    REQUIRE(windows[0].id == 1);
    REQUIRE(windows[0].type.id == "stars");
    REQUIRE(windows[0].window_class == "com.pokerstars.PokerStarsApp");
    REQUIRE(windows[0].display == 1);
    REQUIRE(windows[1].id == 3);
    REQUIRE(windows[1].type.id == "any-holdem");
    REQUIRE(windows[1].display == 2);

    // One owner lookup per pid per pass
    REQUIRE(f.source.owner_lookups[10] == 1);
}

TEST_CASE("Detector skips windows it must not manage", "[detector]")
{
    DetectorFixture f;
    std::vector<WindowType> types = { window_type("all", "*") };

    SECTION("Malformed records")
    {
        RawWindow no_pid = raw_window(1, 10, "A", Rect{ 0, 0, 100, 100 });
        no_pid.pid.reset();
        RawWindow no_title = raw_window(2, 10, "B", Rect{ 0, 0, 100, 100 });
        no_title.title.reset();
        RawWindow no_bounds = raw_window(3, 10, "C", Rect{});
        no_bounds.bounds.reset();
        f.source.windows = { no_pid, no_title, no_bounds, raw_window(4, 10, "D", Rect{ 0, 0, 100, 100 }) };

        auto windows = f.detector.detect(types);
        REQUIRE(windows.size() == 1);
        REQUIRE(windows[0].id == 4);
    }

    SECTION("Empty bounds and invisible windows")
    {
        RawWindow transparent = raw_window(3, 10, "C", Rect{ 0, 0, 100, 100 });
        transparent.alpha = 0.0;
        RawWindow no_alpha = raw_window(4, 10, "D", Rect{ 0, 0, 100, 100 });
        no_alpha.alpha.reset();
        f.source.windows = {
            raw_window(1, 10, "A", Rect{ 0, 0, 0, 100 }),
            raw_window(2, 10, "B", Rect{ 0, 0, 100, 0 }),
            transparent,
            no_alpha,
        };

        auto windows = f.detector.detect(types);
        REQUIRE(windows.size() == 1);
        REQUIRE(windows[0].id == 4);
    }

    SECTION("Duplicate ids keep the first record")
    {
        f.source.windows = {
            raw_window(7, 10, "First", Rect{ 0, 0, 100, 100 }),
            raw_window(7, 10, "Second", Rect{ 0, 0, 100, 100 }),
        };

        auto windows = f.detector.detect(types);
        REQUIRE(windows.size() == 1);
        REQUIRE(windows[0].title == "First");
    }

    SECTION("Unmatched windows are dropped")
    {
        f.source.windows = { raw_window(1, 10, "Lobby", Rect{ 0, 0, 100, 100 }) };
        std::vector<WindowType> holdem = { window_type("holdem", "*Hold'em*") };

        REQUIRE(f.detector.detect(holdem).empty());
    }
}

TEST_CASE("Seeded window types find tables by X11 class", "[detector]")
{
    DetectorFixture f;
    f.source.windows = {
        raw_window(1, 10, "Table 'Altair' - No Limit Hold'em", Rect{ 0, 0, 800, 600 }),
        raw_window(2, 20, "Party Poker - Table 12", Rect{ 800, 0, 800, 600 }),
        raw_window(3, 30, "888poker Blast", Rect{ 0, 600, 800, 400 }),
        raw_window(4, 40, "Inbox", Rect{ 800, 600, 800, 400 }),
    };
    f.source.owners[10].app_name = "PokerStars.exe";
    f.source.owners[20].executable = "/opt/partypoker/PartyPoker";
    f.source.owners[30].app_name = "888poker";
    f.source.set_app_id(40, "org.gnome.Evolution");

    auto types = default_window_types();
    auto windows = f.detector.detect(types);

    REQUIRE(windows.size() == 3);
    REQUIRE(windows[0].window_class == "app.pokerstars.exe");
    REQUIRE(windows[0].type.name == "PokerStars Table");
    REQUIRE(windows[1].window_class == "process.partypoker");
    REQUIRE(windows[1].type.name == "PartyPoker Table");
    REQUIRE(windows[2].type.name == "888poker Table");
}

TEST_CASE("Detector does nothing without enabled types", "[detector]")
{
    DetectorFixture f;
    f.source.windows = { raw_window(1, 10, "Table", Rect{ 0, 0, 100, 100 }) };

    auto disabled = window_type("off", "*");
    disabled.enabled = false;
    std::vector<WindowType> types = { disabled };

    REQUIRE(f.detector.detect(types).empty());
    REQUIRE(f.detector.detect({}).empty());
    REQUIRE(f.source.enumerations == 0);
}

TEST_CASE("Window off every display belongs to the first display", "[detector]")
{
    DetectorFixture f;
    f.source.windows = { raw_window(1, 10, "Table", Rect{ -5000, -5000, 100, 100 }) };
    std::vector<WindowType> types = { window_type("all", "*") };

    auto windows = f.detector.detect(types);
    REQUIRE(windows.size() == 1);
    REQUIRE(windows[0].display == 1);
}

TEST_CASE("Class supplied by the source skips owner lookup", "[detector]")
{
    DetectorFixture f;
    RawWindow window = raw_window(1, 10, "Table", Rect{ 0, 0, 100, 100 });
    window.owner = "com.888poker.app";
    f.source.windows = { window };

    auto classes = resolve_window_classes(f.source, f.source.windows);
    REQUIRE(classes == std::vector<std::string>{ "com.888poker.app" });
    REQUIRE(f.source.owner_lookups.empty());
}
