#include "config.hpp"
#include <algorithm>
#include <array>
#include <cstdlib>
#include <iostream>
#include <toml++/toml.hpp>

namespace tablegrid
{

namespace
{

void read_ms(toml::table const& section, char const* key, uint32_t& out)
{
    if (auto v = section[key].value<int64_t>())
    {
        if (*v >= 0)
            out = static_cast<uint32_t>(*v);
        else
            std::cerr << "Config warning: " << key << " must not be negative, keeping " << out << std::endl;
    }
}

bool is_log_level(std::string const& level)
{
    static constexpr std::array<std::string_view, 8> levels = {
        "trace", "debug", "info", "warn", "warning", "error", "critical", "off",
    };
    return std::ranges::find(levels, level) != levels.end();
}

Config from_table(toml::table const& tbl)
{
    Config cfg = default_config();

    // Detection
    if (auto detection = tbl["detection"].as_table())
    {
        read_ms(*detection, "interval_ms", cfg.detection.interval_ms);
        if (cfg.detection.interval_ms == 0)
            cfg.detection.interval_ms = DetectionConfig{}.interval_ms;
    }

    // Hover activation
    if (auto hover = tbl["hover"].as_table())
    {
        if (auto v = (*hover)["enabled"].value<bool>())
            cfg.hover.enabled = *v;
        read_ms(*hover, "delay_ms", cfg.hover.delay_ms);
        read_ms(*hover, "cooldown_ms", cfg.hover.cooldown_ms);
        read_ms(*hover, "poll_ms", cfg.hover.poll_ms);
    }

    // Auto activation
    if (auto auto_activation = tbl["auto_activation"].as_table())
    {
        if (auto v = (*auto_activation)["enabled"].value<bool>())
            cfg.auto_activation.enabled = *v;
        read_ms(*auto_activation, "interval_ms", cfg.auto_activation.interval_ms);
    }

    // Apply
    if (auto apply = tbl["apply"].as_table())
    {
        read_ms(*apply, "activation_delay_ms", cfg.apply.activation_delay_ms);
    }

    // Pattern cache
    if (auto patterns = tbl["patterns"].as_table())
    {
        if (auto v = (*patterns)["cache_capacity"].value<int64_t>(); v && *v >= 0)
            cfg.patterns.cache_capacity = static_cast<size_t>(*v);
        if (auto v = (*patterns)["eviction"].value<std::string>())
        {
            if (*v == "fifo")
                cfg.patterns.eviction = EvictionPolicy::OldestInserted;
            else if (*v == "lru")
                cfg.patterns.eviction = EvictionPolicy::LeastRecentlyUsed;
            else
                std::cerr << "Config warning: unknown eviction policy '" << *v << "', using fifo" << std::endl;
        }
    }

    // Logging
    if (auto logging = tbl["logging"].as_table())
    {
        if (auto v = (*logging)["level"].value<std::string>())
        {
            if (is_log_level(*v))
                cfg.logging.level = *v;
            else
                std::cerr << "Config warning: unknown log level '" << *v << "', using " << cfg.logging.level << std::endl;
        }
        if (auto v = (*logging)["file"].value<std::string>())
            cfg.logging.file = *v;
    }

    // Store
    if (auto store = tbl["store"].as_table())
    {
        if (auto v = (*store)["path"].value<std::string>())
            cfg.store.path = *v;
    }

    return cfg;
}

}

Config default_config()
{
    Config cfg;
    cfg.store.path = default_store_path();
    return cfg;
}

std::string default_store_path()
{
    if (char const* xdg = std::getenv("XDG_DATA_HOME"))
    {
        return std::string(xdg) + "/tablegrid/store.toml";
    }

    if (char const* home = std::getenv("HOME"))
    {
        return std::string(home) + "/.local/share/tablegrid/store.toml";
    }

    return "tablegrid-store.toml";
}

std::optional<Config> load_config(std::string const& path)
{
    try
    {
        return from_table(toml::parse_file(path));
    }
    catch (toml::parse_error const& err)
    {
        std::cerr << "Config parse error: " << err.description() << std::endl;
        return std::nullopt;
    }
    catch (std::exception const& e)
    {
        std::cerr << "Config error: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<Config> parse_config(std::string_view text)
{
    try
    {
        return from_table(toml::parse(text));
    }
    catch (toml::parse_error const& err)
    {
        std::cerr << "Config parse error: " << err.description() << std::endl;
        return std::nullopt;
    }
}

} // namespace tablegrid
