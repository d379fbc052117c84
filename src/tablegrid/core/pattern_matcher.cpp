#include "pattern_matcher.hpp"
#include <cstring>

namespace tablegrid {

namespace {

// Escape special regex characters for literal matching
void append_escaped(std::string& out, char c)
{
    static char const* const metacharacters = R"(\.^$|()[]{}*+?)";
    if (c != '\0' && std::strchr(metacharacters, c) != nullptr)
    {
        out += '\\';
    }
    out += c;
}

}

std::string glob_to_regex(std::string_view pattern)
{
    std::string result;
    result.reserve(pattern.size() * 2 + 2);
    result += '^';
    for (char c : pattern)
    {
        if (c == '*')
            result += ".*";
        else
            append_escaped(result, c);
    }
    result += '$';
    return result;
}

PatternMatcher::PatternMatcher(Cache cache, log::LoggerPtr logger)
    : cache_(std::move(cache))
    , logger_(log::or_default(std::move(logger)))
{ }

bool PatternMatcher::matches(WindowType const& type, std::string_view title, std::string_view window_class)
{
    if (!type.enabled)
        return false;

    return matches_pattern(title, type.title_pattern) && matches_pattern(window_class, type.class_pattern);
}

bool PatternMatcher::matches_pattern(std::string_view value, std::string_view pattern)
{
    if (is_match_all(pattern))
        return true;

    auto regex = compile(pattern);
    if (!regex)
        return false;

    return std::regex_match(value.begin(), value.end(), *regex);
}

size_t PatternMatcher::cached_patterns() const
{
    std::lock_guard lock(mutex_);
    return cache_.size();
}

std::shared_ptr<std::regex const> PatternMatcher::compile(std::string_view pattern)
{
    std::string key(pattern);

    std::lock_guard lock(mutex_);
    if (auto const* cached = cache_.find(key))
        return *cached;

    std::shared_ptr<std::regex const> regex;
    try
    {
        regex = std::make_shared<std::regex const>(
            glob_to_regex(pattern),
            std::regex::ECMAScript | std::regex::icase | std::regex::optimize
        );
    }
    catch (std::regex_error const& e)
    {
        SPDLOG_LOGGER_ERROR(logger_, "Invalid window pattern '{}': {}", key, e.what());
        return nullptr;
    }

    if (auto evicted = cache_.insert(key, regex))
        SPDLOG_LOGGER_TRACE(logger_, "Pattern cache evicted '{}'", *evicted);

    return regex;
}

} // namespace tablegrid
