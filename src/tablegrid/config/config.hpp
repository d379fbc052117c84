#pragma once

#include "tablegrid/core/bounded_cache.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tablegrid {

struct DetectionConfig
{
    uint32_t interval_ms = 1000;
};

struct HoverConfig
{
    bool enabled = false;
    uint32_t delay_ms = 300;
    uint32_t cooldown_ms = 500;
    uint32_t poll_ms = 100;
};

struct AutoActivationConfig
{
    bool enabled = true;
    uint32_t interval_ms = 5000;
};

struct ApplyConfig
{
    // Wait after (re)starting detection before applying a configuration's layout
    uint32_t activation_delay_ms = 500;
};

struct PatternsConfig
{
    size_t cache_capacity = 50;
    EvictionPolicy eviction = EvictionPolicy::OldestInserted;
};

struct LoggingConfig
{
    std::string level = "info";
    std::optional<std::string> file;
};

struct StoreConfig
{
    std::string path;
};

struct Config
{
    DetectionConfig detection;
    HoverConfig hover;
    AutoActivationConfig auto_activation;
    ApplyConfig apply;
    PatternsConfig patterns;
    LoggingConfig logging;
    StoreConfig store;
};

std::optional<Config> load_config(std::string const& path);
std::optional<Config> parse_config(std::string_view text);
Config default_config();

/// $XDG_DATA_HOME/tablegrid/store.toml, else ~/.local/share/tablegrid/store.toml.
std::string default_store_path();

} // namespace tablegrid
