#include "tablegrid/core/window_types.hpp"
#include <algorithm>
#include <cctype>
#include <random>

namespace tablegrid {

namespace {

constexpr size_t TITLE_PART_LENGTH = 20;
constexpr size_t MAX_NAME_LENGTH = 30;
constexpr size_t TRUNCATED_NAME_LENGTH = 27;

std::string lowercase(std::string_view value)
{
    std::string result(value);
    std::ranges::transform(result, result.begin(), [](unsigned char c) { return std::tolower(c); });
    return result;
}

}

std::string generate_id()
{
    thread_local std::mt19937_64 engine{ std::random_device{}() };
    std::uniform_int_distribution<int> nibble(0, 15);

    static char const* const digits = "0123456789abcdef";
    std::string id;
    id.reserve(36);
    for (int i = 0; i < 32; ++i)
    {
        if (i == 8 || i == 12 || i == 16 || i == 20)
            id += '-';
        int value = nibble(engine);
        if (i == 12)
            value = 4; // version
        else if (i == 16)
            value = 8 | (value & 0x3); // variant
        id += digits[value];
    }
    return id;
}

std::string suggest_window_type_name(std::string_view title, std::string_view window_class)
{
    auto dot = window_class.find_last_of('.');
    std::string app_name(dot == std::string_view::npos ? window_class : window_class.substr(dot + 1));

    std::string name = app_name;
    if (!title.empty() && lowercase(title).find(lowercase(app_name)) == std::string::npos)
    {
        name += " - ";
        name += title.substr(0, TITLE_PART_LENGTH);
    }

    if (name.size() > MAX_NAME_LENGTH)
        name = name.substr(0, TRUNCATED_NAME_LENGTH) + "...";

    return name;
}

WindowType make_window_type_from(WindowInfo const& window)
{
    WindowType type;
    type.id = generate_id();
    type.name = suggest_window_type_name(window.title, window.window_class);
    type.title_pattern = window.title;
    type.class_pattern = window.window_class;
    type.enabled = true;
    return type;
}

WindowType copy_window_type(WindowType const& type)
{
    WindowType copy = type;
    copy.id = generate_id();
    copy.name = type.name + " (Copy)";
    return copy;
}

std::vector<WindowType> default_window_types()
{
    return {
        { generate_id(), "PokerStars Table", "*Hold'em*", "*", true },
        { generate_id(), "PartyPoker Table", "*Party Poker*", "*", true },
        { generate_id(), "888poker Table", "*888poker*", "*", true },
    };
}

} // namespace tablegrid
