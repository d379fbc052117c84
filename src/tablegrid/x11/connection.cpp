#include "connection.hpp"
#include "tablegrid/core/error.hpp"
#include <cstdlib>
#include <cstring>

namespace tablegrid::x11 {

Connection::Connection(char const* display_name)
    : conn_(xcb_connect(display_name, &screen_number_), xcb_disconnect)
{
    if (xcb_connection_has_error(conn_.get()))
    {
        throw EnvironmentError(EnvironmentError::Kind::ConnectionFailed, "Failed to connect to X server");
    }

    auto it = xcb_setup_roots_iterator(xcb_get_setup(conn_.get()));
    for (int i = 0; i < screen_number_ && it.rem > 0; ++i)
        xcb_screen_next(&it);

    screen_ = it.data;
    if (!screen_)
    {
        throw EnvironmentError(EnvironmentError::Kind::NoDisplays, "Failed to get screen");
    }

    init_randr();
}

xcb_atom_t Connection::intern_atom(char const* name) const
{
    auto cookie = xcb_intern_atom(conn_.get(), 0, static_cast<uint16_t>(strlen(name)), name);
    auto* reply = xcb_intern_atom_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return XCB_NONE;

    xcb_atom_t atom = reply->atom;
    free(reply);
    return atom;
}

void Connection::init_randr()
{
    auto ext_cookie = xcb_query_extension(conn_.get(), 5, "RANDR");
    auto* ext_reply = xcb_query_extension_reply(conn_.get(), ext_cookie, nullptr);
    if (!ext_reply)
        return;

    bool present = ext_reply->present != 0;
    free(ext_reply);
    if (!present)
        return;

    auto cookie = xcb_randr_query_version(conn_.get(), XCB_RANDR_MAJOR_VERSION, XCB_RANDR_MINOR_VERSION);
    auto* reply = xcb_randr_query_version_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return;

    // get_screen_resources_current and get_output_primary need 1.3
    randr_available_ = reply->major_version > 1 || (reply->major_version == 1 && reply->minor_version >= 3);
    free(reply);
}

} // namespace tablegrid::x11
