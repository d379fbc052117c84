#pragma once

#include "tablegrid/core/log.hpp"
#include "tablegrid/core/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tablegrid {

/// Everything persisted between runs.
struct StoreData
{
    std::vector<WindowType> window_types;
    std::vector<Configuration> configurations;
};

/**
 * @brief TOML text for the store document.
 *
 * Slot frames are written as flat x/y/width/height fields so the file stays
 * readable and diffable.
 */
std::string serialize_store(StoreData const& data);

/**
 * @brief Parse a store document.
 *
 * Returns nullopt when the text is not valid TOML. Individual malformed
 * records (missing id, bad strategy, non-numeric frame) are skipped and
 * logged.
 */
std::optional<StoreData> parse_store(std::string_view text, log::LoggerPtr const& logger = nullptr);

/**
 * @brief Durable store for window types and configurations.
 *
 * Every mutation saves immediately. The previous file is kept as
 * `<path>.bak` and can be restored with restore_from_backup().
 */
class Store
{
public:
    explicit Store(std::string path, log::LoggerPtr logger = nullptr);

    /**
     * @brief Load from disk.
     *
     * A missing file seeds the default window types and saves them. A file
     * that does not parse is moved to `<path>.corrupt` and the contents of
     * the backup are used instead, or the defaults when there is no usable
     * backup; load() then returns false. The backup itself is left as is.
     */
    bool load();
    bool save() const;
    bool restore_from_backup();

    std::string const& path() const { return path_; }
    std::string backup_path() const { return path_ + ".bak"; }
    std::string corrupt_path() const { return path_ + ".corrupt"; }

    // Window types
    std::vector<WindowType> const& window_types() const { return data_.window_types; }
    WindowType const& add_window_type(WindowType type);
    bool update_window_type(WindowType const& type);
    bool remove_window_type(std::string const& id);

    // Configurations
    std::vector<Configuration> const& configurations() const { return data_.configurations; }
    Configuration const& add_configuration(Configuration configuration);
    bool update_configuration(Configuration const& configuration);
    bool remove_configuration(std::string const& id);

    /// Look up by id first, then by name.
    std::optional<Configuration> find_configuration(std::string_view id_or_name) const;

private:
    void recover_from_corrupt_file();
    void seed_defaults();

    std::string path_;
    log::LoggerPtr logger_;
    StoreData data_;
};

} // namespace tablegrid
