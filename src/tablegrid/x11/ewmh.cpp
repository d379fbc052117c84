#include "ewmh.hpp"
#include "tablegrid/core/error.hpp"

namespace tablegrid::x11 {

Ewmh::Ewmh(Connection& conn)
    : conn_(conn)
{
    xcb_intern_atom_cookie_t* cookies = xcb_ewmh_init_atoms(conn_.get(), &ewmh_);
    if (!xcb_ewmh_init_atoms_replies(&ewmh_, cookies, nullptr))
    {
        throw EnvironmentError(EnvironmentError::Kind::ConnectionFailed, "Failed to initialize EWMH atoms");
    }
}

Ewmh::~Ewmh() { xcb_ewmh_connection_wipe(&ewmh_); }

bool Ewmh::supports(xcb_atom_t atom) const
{
    xcb_ewmh_get_atoms_reply_t supported;
    if (!xcb_ewmh_get_supported_reply(
            &ewmh_,
            xcb_ewmh_get_supported(&ewmh_, conn_.screen_number()),
            &supported,
            nullptr
        ))
        return false;

    bool found = false;
    for (uint32_t i = 0; i < supported.atoms_len; ++i)
    {
        if (supported.atoms[i] == atom)
        {
            found = true;
            break;
        }
    }

    xcb_ewmh_get_atoms_reply_wipe(&supported);
    return found;
}

std::optional<std::vector<xcb_window_t>> Ewmh::client_list_stacking() const
{
    xcb_ewmh_get_windows_reply_t list;
    int screen = conn_.screen_number();

    bool ok = xcb_ewmh_get_client_list_stacking_reply(
        &ewmh_,
        xcb_ewmh_get_client_list_stacking(&ewmh_, screen),
        &list,
        nullptr
    );
    if (!ok)
        ok = xcb_ewmh_get_client_list_reply(&ewmh_, xcb_ewmh_get_client_list(&ewmh_, screen), &list, nullptr);
    if (!ok)
        return std::nullopt;

    std::vector<xcb_window_t> windows(list.windows, list.windows + list.windows_len);
    xcb_ewmh_get_windows_reply_wipe(&list);
    return windows;
}

std::optional<uint32_t> Ewmh::window_pid(xcb_window_t window) const
{
    uint32_t pid = 0;
    if (!xcb_ewmh_get_wm_pid_reply(&ewmh_, xcb_ewmh_get_wm_pid(&ewmh_, window), &pid, nullptr))
        return std::nullopt;
    return pid;
}

std::optional<std::string> Ewmh::window_name(xcb_window_t window) const
{
    xcb_ewmh_get_utf8_strings_reply_t name;
    if (!xcb_ewmh_get_wm_name_reply(&ewmh_, xcb_ewmh_get_wm_name(&ewmh_, window), &name, nullptr))
        return std::nullopt;

    std::string result(name.strings, name.strings_len);
    xcb_ewmh_get_utf8_strings_reply_wipe(&name);
    return result;
}

bool Ewmh::has_window_state(xcb_window_t window, xcb_atom_t state) const
{
    xcb_ewmh_get_atoms_reply_t current_state;
    if (!xcb_ewmh_get_wm_state_reply(&ewmh_, xcb_ewmh_get_wm_state(&ewmh_, window), &current_state, nullptr))
        return false;

    bool found = false;
    for (uint32_t i = 0; i < current_state.atoms_len; ++i)
    {
        if (current_state.atoms[i] == state)
        {
            found = true;
            break;
        }
    }

    xcb_ewmh_get_atoms_reply_wipe(&current_state);
    return found;
}

void Ewmh::request_moveresize(xcb_window_t window, int32_t x, int32_t y, uint32_t width, uint32_t height)
{
    auto flags = static_cast<xcb_ewmh_moveresize_window_opt_flags_t>(
        XCB_EWMH_MOVERESIZE_WINDOW_X | XCB_EWMH_MOVERESIZE_WINDOW_Y | XCB_EWMH_MOVERESIZE_WINDOW_WIDTH
        | XCB_EWMH_MOVERESIZE_WINDOW_HEIGHT
    );
    xcb_ewmh_request_moveresize_window(
        &ewmh_,
        conn_.screen_number(),
        window,
        XCB_GRAVITY_STATIC,
        XCB_EWMH_CLIENT_SOURCE_TYPE_OTHER,
        flags,
        static_cast<uint32_t>(x),
        static_cast<uint32_t>(y),
        width,
        height
    );
}

void Ewmh::request_active_window(xcb_window_t window)
{
    xcb_ewmh_request_change_active_window(
        &ewmh_,
        conn_.screen_number(),
        window,
        XCB_EWMH_CLIENT_SOURCE_TYPE_OTHER,
        XCB_CURRENT_TIME,
        XCB_NONE
    );
}

} // namespace tablegrid::x11
