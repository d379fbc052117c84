#pragma once

#include "tablegrid/core/bounded_cache.hpp"
#include "tablegrid/core/log.hpp"
#include "tablegrid/core/types.hpp"
#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <string_view>

namespace tablegrid {

constexpr size_t DEFAULT_PATTERN_CACHE_CAPACITY = 50;

/**
 * @brief Translate a `*` glob into an anchored ECMAScript expression.
 *
 * Every other character is matched literally.
 */
std::string glob_to_regex(std::string_view pattern);

/// True for patterns that match every string ("" and "*").
inline bool is_match_all(std::string_view pattern) { return pattern.empty() || pattern == "*"; }

/**
 * @brief Glob matcher used to classify windows into window types.
 *
 * Compiled patterns are memoized in a bounded cache keyed by the glob text so
 * that preview tooling generating one-off patterns cannot grow memory without
 * limit. Matching is case-insensitive and anchored at both ends.
 */
class PatternMatcher
{
public:
    using Cache = BoundedCache<std::string, std::shared_ptr<std::regex const>>;

    explicit PatternMatcher(Cache cache = Cache(DEFAULT_PATTERN_CACHE_CAPACITY), log::LoggerPtr logger = nullptr);

    PatternMatcher(PatternMatcher const&) = delete;
    PatternMatcher& operator=(PatternMatcher const&) = delete;

    /**
     * @brief Test a window against a window type.
     *
     * Disabled types never match. Otherwise both the title pattern and the
     * class pattern must match.
     */
    bool matches(WindowType const& type, std::string_view title, std::string_view window_class);

    /**
     * @brief Test one string against one glob.
     *
     * A pattern that fails to compile is logged and matches nothing.
     */
    bool matches_pattern(std::string_view value, std::string_view pattern);

    size_t cached_patterns() const;

private:
    std::shared_ptr<std::regex const> compile(std::string_view pattern);

    mutable std::mutex mutex_;
    Cache cache_;
    log::LoggerPtr logger_;
};

} // namespace tablegrid
