#pragma once

#include "tablegrid/core/interfaces.hpp"
#include "tablegrid/core/log.hpp"
#include "tablegrid/core/pattern_matcher.hpp"
#include "tablegrid/core/types.hpp"
#include <span>
#include <string>
#include <vector>

namespace tablegrid {

/**
 * @brief Turn owner information into a window class string.
 *
 * Preference order:
 * 1. application id as reported
 * 2. "app.<name>" (lowercased, spaces removed)
 * 3. "process.<executable basename>" (lowercased)
 * 4. "unknown"
 */
std::string resolve_window_class(OwnerInfo const& owner);

/**
 * @brief Resolve one class per raw window, parallel to `windows`.
 *
 * A class already supplied by the source wins; otherwise the owner of each
 * pid is looked up once. Records without a pid get an empty class.
 */
std::vector<std::string> resolve_window_classes(WindowSource& source, std::span<RawWindow const> windows);

/**
 * @brief Classify raw windows into managed windows.
 *
 * Filtering, in order: malformed records (no pid, title or bounds), empty
 * bounds, fully transparent windows. Each survivor is tested against the
 * enabled window types in list order and takes the first match; unmatched
 * windows are dropped. The result holds each window id at most once.
 */
class WindowDetector
{
public:
    WindowDetector(WindowSource& source, DisplayTopology& topology, PatternMatcher& matcher, log::LoggerPtr logger = nullptr);

    /// One read-only detection pass.
    std::vector<ManagedWindow> detect(std::span<WindowType const> types);

    /**
     * @brief Classification step of detect() over an already enumerated list.
     *
     * `classes` must be parallel to `windows` (one resolved class per record).
     */
    std::vector<ManagedWindow> classify(
        std::span<RawWindow const> windows,
        std::span<std::string const> classes,
        std::span<WindowType const> types,
        std::span<Display const> displays
    );

private:
    WindowSource& source_;
    DisplayTopology& topology_;
    PatternMatcher& matcher_;
    log::LoggerPtr logger_;
};

} // namespace tablegrid
