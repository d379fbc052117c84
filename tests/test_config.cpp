#include "tablegrid/config/config.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>

using namespace tablegrid;

TEST_CASE("Empty config yields defaults", "[config]")
{
    auto config = parse_config("");
    REQUIRE(config.has_value());

    REQUIRE(config->detection.interval_ms == 1000);
    REQUIRE_FALSE(config->hover.enabled);
    REQUIRE(config->hover.delay_ms == 300);
    REQUIRE(config->hover.cooldown_ms == 500);
    REQUIRE(config->hover.poll_ms == 100);
    REQUIRE(config->auto_activation.enabled);
    REQUIRE(config->auto_activation.interval_ms == 5000);
    REQUIRE(config->apply.activation_delay_ms == 500);
    REQUIRE(config->patterns.cache_capacity == 50);
    REQUIRE(config->patterns.eviction == EvictionPolicy::OldestInserted);
    REQUIRE(config->logging.level == "info");
    REQUIRE_FALSE(config->logging.file.has_value());
    REQUIRE(config->store.path == default_store_path());
}

TEST_CASE("Every section is read", "[config]")
{
    auto config = parse_config(R"(
[detection]
interval_ms = 250

[hover]
enabled = true
delay_ms = 150
cooldown_ms = 900
poll_ms = 40

[auto_activation]
enabled = false
interval_ms = 2000

[apply]
activation_delay_ms = 0

[patterns]
cache_capacity = 8
eviction = "lru"

[logging]
level = "debug"
file = "/tmp/tablegrid.log"

[store]
path = "/tmp/tablegrid/store.toml"
)");
    REQUIRE(config.has_value());

    REQUIRE(config->detection.interval_ms == 250);
    REQUIRE(config->hover.enabled);
    REQUIRE(config->hover.delay_ms == 150);
    REQUIRE(config->hover.cooldown_ms == 900);
    REQUIRE(config->hover.poll_ms == 40);
    REQUIRE_FALSE(config->auto_activation.enabled);
    REQUIRE(config->auto_activation.interval_ms == 2000);
    REQUIRE(config->apply.activation_delay_ms == 0);
    REQUIRE(config->patterns.cache_capacity == 8);
    REQUIRE(config->patterns.eviction == EvictionPolicy::LeastRecentlyUsed);
    REQUIRE(config->logging.level == "debug");
    REQUIRE(config->logging.file == "/tmp/tablegrid.log");
    REQUIRE(config->store.path == "/tmp/tablegrid/store.toml");
}

TEST_CASE("Invalid values keep defaults", "[config]")
{
    SECTION("Negative durations")
    {
        auto config = parse_config("[hover]\ndelay_ms = -5\n");
        REQUIRE(config.has_value());
        REQUIRE(config->hover.delay_ms == 300);
    }

    SECTION("Zero detection interval")
    {
        auto config = parse_config("[detection]\ninterval_ms = 0\n");
        REQUIRE(config.has_value());
        REQUIRE(config->detection.interval_ms == 1000);
    }

    SECTION("Unknown eviction policy")
    {
        auto config = parse_config("[patterns]\neviction = \"random\"\n");
        REQUIRE(config.has_value());
        REQUIRE(config->patterns.eviction == EvictionPolicy::OldestInserted);
    }

    SECTION("Unknown log level")
    {
        auto config = parse_config("[logging]\nlevel = \"loud\"\n");
        REQUIRE(config.has_value());
        REQUIRE(config->logging.level == "info");
    }

    SECTION("Wrong value type")
    {
        auto config = parse_config("[hover]\nenabled = \"yes\"\n");
        REQUIRE(config.has_value());
        REQUIRE_FALSE(config->hover.enabled);
    }
}

TEST_CASE("Malformed config is rejected", "[config]")
{
    REQUIRE_FALSE(parse_config("[detection\ninterval_ms = 1").has_value());
}

TEST_CASE("Config is loaded from a file", "[config]")
{
    auto path = std::filesystem::temp_directory_path() / "tablegrid-test-config.toml";
    {
        std::ofstream out(path);
        out << "[hover]\nenabled = true\n";
    }

    auto config = load_config(path.string());
    std::filesystem::remove(path);

    REQUIRE(config.has_value());
    REQUIRE(config->hover.enabled);

    REQUIRE_FALSE(load_config(path.string()).has_value());
}
