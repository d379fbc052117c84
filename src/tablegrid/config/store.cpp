#include "store.hpp"
#include "tablegrid/core/window_types.hpp"
#include "tablegrid/layout/assignment.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <toml++/toml.hpp>

namespace fs = std::filesystem;

namespace tablegrid
{

namespace
{

// ─────────────────────────────────────────────────────────────────────────────
// Writing
// ─────────────────────────────────────────────────────────────────────────────

toml::table window_type_to_toml(WindowType const& type)
{
    return toml::table{
        { "id", type.id },
        { "name", type.name },
        { "title_pattern", type.title_pattern },
        { "class_pattern", type.class_pattern },
        { "enabled", type.enabled },
    };
}

toml::table slot_to_toml(Slot const& slot)
{
    return toml::table{
        { "id", slot.id },
        { "display", static_cast<int64_t>(slot.display) },
        { "priority", static_cast<int64_t>(slot.priority) },
        { "x", slot.frame.x },
        { "y", slot.frame.y },
        { "width", slot.frame.width },
        { "height", slot.frame.height },
    };
}

toml::table layout_to_toml(Layout const& layout)
{
    toml::array slots;
    for (auto const& slot : layout.slots)
        slots.push_back(slot_to_toml(slot));

    return toml::table{
        { "id", layout.id },
        { "name", layout.name },
        { "matching_strategy", std::string(to_string(layout.strategy)) },
        { "slots", std::move(slots) },
    };
}

toml::table condition_to_toml(AutoActivationCondition const& condition)
{
    if (auto const* by_count = std::get_if<WindowCountCondition>(&condition))
    {
        return toml::table{ { "type", "windowCount" }, { "count", static_cast<int64_t>(by_count->count) } };
    }

    toml::table counts;
    for (auto const& [type_id, count] : std::get<WindowTypeCountCondition>(condition).counts)
        counts.insert_or_assign(type_id, static_cast<int64_t>(count));

    return toml::table{ { "type", "windowTypeCount" }, { "type_counts", std::move(counts) } };
}

toml::table configuration_to_toml(Configuration const& config)
{
    toml::table tbl{
        { "id", config.id },
        { "name", config.name },
        { "layout", layout_to_toml(config.layout) },
    };
    if (config.auto_activation)
        tbl.insert_or_assign("auto_activation", condition_to_toml(*config.auto_activation));
    return tbl;
}

// ─────────────────────────────────────────────────────────────────────────────
// Reading
// ─────────────────────────────────────────────────────────────────────────────

std::optional<WindowType> window_type_from_toml(toml::table const& tbl)
{
    auto id = tbl["id"].value<std::string>();
    if (!id || id->empty())
        return std::nullopt;

    WindowType type;
    type.id = *id;
    type.name = tbl["name"].value_or(std::string());
    type.title_pattern = tbl["title_pattern"].value_or(std::string("*"));
    type.class_pattern = tbl["class_pattern"].value_or(std::string("*"));
    type.enabled = tbl["enabled"].value_or(true);
    return type;
}

std::optional<Slot> slot_from_toml(toml::table const& tbl)
{
    auto id = tbl["id"].value<std::string>();
    auto x = tbl["x"].value<double>();
    auto y = tbl["y"].value<double>();
    auto width = tbl["width"].value<double>();
    auto height = tbl["height"].value<double>();
    if (!id || !x || !y || !width || !height)
        return std::nullopt;

    Slot slot;
    slot.id = *id;
    slot.frame = Rect{ *x, *y, *width, *height };
    slot.display = static_cast<DisplayId>(tbl["display"].value_or(int64_t{ 0 }));
    slot.priority = static_cast<int>(tbl["priority"].value_or(int64_t{ 0 }));
    return slot;
}

std::optional<AutoActivationCondition> condition_from_toml(toml::table const& tbl)
{
    auto type = tbl["type"].value<std::string>();
    if (!type)
        return std::nullopt;

    if (*type == "windowCount")
    {
        auto count = tbl["count"].value<int64_t>();
        if (!count)
            return std::nullopt;
        return WindowCountCondition{ static_cast<int>(*count) };
    }

    if (*type == "windowTypeCount")
    {
        auto const* counts = tbl["type_counts"].as_table();
        if (!counts)
            return std::nullopt;

        WindowTypeCountCondition condition;
        for (auto const& [key, node] : *counts)
        {
            if (auto n = node.value<int64_t>())
                condition.counts.emplace(std::string(key.str()), static_cast<int>(*n));
        }
        return condition;
    }

    return std::nullopt;
}

std::optional<Configuration> configuration_from_toml(toml::table const& tbl, log::LoggerPtr const& logger)
{
    auto id = tbl["id"].value<std::string>();
    auto const* layout_tbl = tbl["layout"].as_table();
    if (!id || id->empty() || !layout_tbl)
        return std::nullopt;

    Configuration config;
    config.id = *id;
    config.name = tbl["name"].value_or(std::string());

    Layout& layout = config.layout;
    layout.id = (*layout_tbl)["id"].value_or(generate_id());
    layout.name = (*layout_tbl)["name"].value_or(config.name);

    try
    {
        layout.strategy = parse_matching_strategy((*layout_tbl)["matching_strategy"].value_or(std::string("sequential")));
    }
    catch (std::invalid_argument const& e)
    {
        SPDLOG_LOGGER_WARN(logger, "Skipping configuration '{}': {}", config.name, e.what());
        return std::nullopt;
    }

    if (auto const* slots = (*layout_tbl)["slots"].as_array())
    {
        for (auto const& node : *slots)
        {
            auto const* slot_tbl = node.as_table();
            auto slot = slot_tbl ? slot_from_toml(*slot_tbl) : std::nullopt;
            if (slot)
                layout.slots.push_back(std::move(*slot));
            else
                SPDLOG_LOGGER_WARN(logger, "Skipping malformed slot in configuration '{}'", config.name);
        }
    }

    if (auto const* condition_tbl = tbl["auto_activation"].as_table())
    {
        config.auto_activation = condition_from_toml(*condition_tbl);
        if (!config.auto_activation)
            SPDLOG_LOGGER_WARN(logger, "Ignoring malformed auto activation of '{}'", config.name);
    }

    return config;
}

}

std::string serialize_store(StoreData const& data)
{
    toml::array types;
    for (auto const& type : data.window_types)
        types.push_back(window_type_to_toml(type));

    toml::array configurations;
    for (auto const& config : data.configurations)
        configurations.push_back(configuration_to_toml(config));

    toml::table root{
        { "window_types", std::move(types) },
        { "configurations", std::move(configurations) },
    };

    std::ostringstream out;
    out << root << '\n';
    return out.str();
}

std::optional<StoreData> parse_store(std::string_view text, log::LoggerPtr const& logger)
{
    auto log = log::or_default(logger);

    toml::table root;
    try
    {
        root = toml::parse(text);
    }
    catch (toml::parse_error const& err)
    {
        SPDLOG_LOGGER_ERROR(log, "Store parse error: {}", err.description());
        return std::nullopt;
    }

    StoreData data;

    if (auto const* types = root["window_types"].as_array())
    {
        for (auto const& node : *types)
        {
            auto const* tbl = node.as_table();
            auto type = tbl ? window_type_from_toml(*tbl) : std::nullopt;
            if (type)
                data.window_types.push_back(std::move(*type));
            else
                SPDLOG_LOGGER_WARN(log, "Skipping malformed window type record");
        }
    }

    if (auto const* configurations = root["configurations"].as_array())
    {
        for (auto const& node : *configurations)
        {
            auto const* tbl = node.as_table();
            auto config = tbl ? configuration_from_toml(*tbl, log) : std::nullopt;
            if (config)
                data.configurations.push_back(std::move(*config));
            else
                SPDLOG_LOGGER_WARN(log, "Skipping malformed configuration record");
        }
    }

    return data;
}

Store::Store(std::string path, log::LoggerPtr logger)
    : path_(std::move(path))
    , logger_(log::or_default(std::move(logger)))
{ }

bool Store::load()
{
    std::error_code ec;
    if (!fs::exists(path_, ec))
    {
        SPDLOG_LOGGER_INFO(logger_, "No store at {}, creating default window types", path_);
        data_ = {};
        seed_defaults();
        return save();
    }

    std::ifstream in(path_);
    if (!in)
    {
        SPDLOG_LOGGER_ERROR(logger_, "Failed to open store {}", path_);
        data_ = {};
        seed_defaults();
        return false;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    in.close();

    auto parsed = parse_store(buffer.str(), logger_);
    if (!parsed)
    {
        SPDLOG_LOGGER_ERROR(logger_, "Failed to load store {}", path_);
        recover_from_corrupt_file();
        return false;
    }

    data_ = std::move(*parsed);
    SPDLOG_LOGGER_INFO(
        logger_, "Loaded {} window types and {} configurations", data_.window_types.size(), data_.configurations.size()
    );
    return true;
}

bool Store::save() const
{
    std::error_code ec;
    fs::path target(path_);
    if (target.has_parent_path())
        fs::create_directories(target.parent_path(), ec);

    // Keep the previous version around before overwriting it
    if (fs::exists(target, ec))
    {
        fs::copy_file(target, backup_path(), fs::copy_options::overwrite_existing, ec);
        if (ec)
            SPDLOG_LOGGER_ERROR(logger_, "Failed to create backup {}: {}", backup_path(), ec.message());
    }

    std::ofstream out(path_, std::ios::trunc);
    if (!out)
    {
        SPDLOG_LOGGER_ERROR(logger_, "Failed to write store {}", path_);
        return false;
    }

    out << serialize_store(data_);
    out.flush();
    if (!out)
    {
        SPDLOG_LOGGER_ERROR(logger_, "Failed to write store {}", path_);
        return false;
    }

    SPDLOG_LOGGER_DEBUG(
        logger_, "Saved {} window types and {} configurations", data_.window_types.size(), data_.configurations.size()
    );
    return true;
}

bool Store::restore_from_backup()
{
    std::error_code ec;
    if (!fs::exists(backup_path(), ec))
    {
        SPDLOG_LOGGER_WARN(logger_, "No backup at {}", backup_path());
        return false;
    }

    fs::copy_file(backup_path(), path_, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        SPDLOG_LOGGER_ERROR(logger_, "Failed to restore from backup: {}", ec.message());
        return false;
    }

    SPDLOG_LOGGER_INFO(logger_, "Successfully restored from backup");
    return load();
}

WindowType const& Store::add_window_type(WindowType type)
{
    bool taken = std::ranges::any_of(data_.window_types, [&](WindowType const& t) { return t.id == type.id; });
    if (taken || type.id.empty())
        type.id = generate_id();

    data_.window_types.push_back(std::move(type));
    save();
    return data_.window_types.back();
}

bool Store::update_window_type(WindowType const& type)
{
    auto it = std::ranges::find_if(data_.window_types, [&](WindowType const& t) { return t.id == type.id; });
    if (it == data_.window_types.end())
        return false;

    *it = type;
    return save();
}

bool Store::remove_window_type(std::string const& id)
{
    auto removed = std::erase_if(data_.window_types, [&](WindowType const& t) { return t.id == id; });
    if (removed == 0)
        return false;
    return save();
}

Configuration const& Store::add_configuration(Configuration configuration)
{
    bool taken = std::ranges::any_of(data_.configurations, [&](Configuration const& c) { return c.id == configuration.id; });
    if (taken || configuration.id.empty())
        configuration.id = generate_id();

    data_.configurations.push_back(std::move(configuration));
    save();
    return data_.configurations.back();
}

bool Store::update_configuration(Configuration const& configuration)
{
    auto it = std::ranges::find_if(data_.configurations, [&](Configuration const& c) { return c.id == configuration.id; });
    if (it == data_.configurations.end())
        return false;

    *it = configuration;
    return save();
}

bool Store::remove_configuration(std::string const& id)
{
    auto removed = std::erase_if(data_.configurations, [&](Configuration const& c) { return c.id == id; });
    if (removed == 0)
        return false;
    return save();
}

std::optional<Configuration> Store::find_configuration(std::string_view id_or_name) const
{
    for (auto const& config : data_.configurations)
    {
        if (config.id == id_or_name)
            return config;
    }
    for (auto const& config : data_.configurations)
    {
        if (config.name == id_or_name)
            return config;
    }
    return std::nullopt;
}

void Store::recover_from_corrupt_file()
{
    // Move the bad file aside so the next save cannot rotate it over the backup
    std::error_code ec;
    fs::rename(path_, corrupt_path(), ec);
    if (ec)
        SPDLOG_LOGGER_ERROR(logger_, "Failed to move corrupt store to {}: {}", corrupt_path(), ec.message());
    else
        SPDLOG_LOGGER_WARN(logger_, "Corrupt store kept as {}", corrupt_path());

    data_ = {};
    if (fs::exists(backup_path(), ec))
    {
        std::ifstream in(backup_path());
        std::stringstream buffer;
        buffer << in.rdbuf();
        if (auto backup = parse_store(buffer.str(), logger_))
        {
            data_ = std::move(*backup);
            SPDLOG_LOGGER_WARN(
                logger_,
                "Recovered {} window types and {} configurations from {}",
                data_.window_types.size(),
                data_.configurations.size(),
                backup_path()
            );
            return;
        }
    }

    seed_defaults();
}

void Store::seed_defaults()
{
    data_.window_types = default_window_types();
}

} // namespace tablegrid
