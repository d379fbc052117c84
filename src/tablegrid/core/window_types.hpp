#pragma once

#include "tablegrid/core/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace tablegrid {

/// Random identifier in UUID text form (8-4-4-4-12 lowercase hex).
std::string generate_id();

/**
 * @brief Suggested display name for a window type built from a picked window.
 *
 * Uses the last dot-separated component of the class as the application
 * name, appends up to 20 characters of the title when the title does not
 * already mention the application, and caps the result at 30 characters.
 */
std::string suggest_window_type_name(std::string_view title, std::string_view window_class);

/// Window type that matches exactly the picked window's title and class.
WindowType make_window_type_from(WindowInfo const& window);

/// Duplicate with a fresh id and a " (Copy)" name suffix.
WindowType copy_window_type(WindowType const& type);

/// Types seeded into an empty store. They match on title alone, since clients
/// run natively or under Wine report unrelated window classes.
std::vector<WindowType> default_window_types();

} // namespace tablegrid
