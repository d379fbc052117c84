#pragma once

#include "connection.hpp"
#include <optional>
#include <string>
#include <vector>
#include <xcb/xcb_ewmh.h>

namespace tablegrid::x11 {

/**
 * @brief Client-side EWMH access: reading other clients' properties and
 * sending requests to the running window manager.
 */
class Ewmh
{
public:
    explicit Ewmh(Connection& conn);
    ~Ewmh();

    Ewmh(Ewmh const&) = delete;
    Ewmh& operator=(Ewmh const&) = delete;

    /// True when the window manager lists `atom` in _NET_SUPPORTED.
    bool supports(xcb_atom_t atom) const;

    /// Managed windows bottom-to-top; falls back to _NET_CLIENT_LIST order.
    std::optional<std::vector<xcb_window_t>> client_list_stacking() const;

    std::optional<uint32_t> window_pid(xcb_window_t window) const;
    std::optional<std::string> window_name(xcb_window_t window) const;
    bool has_window_state(xcb_window_t window, xcb_atom_t state) const;

    void request_moveresize(xcb_window_t window, int32_t x, int32_t y, uint32_t width, uint32_t height);
    void request_active_window(xcb_window_t window);

    xcb_ewmh_connection_t* get() { return &ewmh_; }
    xcb_ewmh_connection_t* get() const { return &ewmh_; }

private:
    Connection& conn_;
    mutable xcb_ewmh_connection_t ewmh_; // mutable: XCB EWMH API isn't const-correct
};

} // namespace tablegrid::x11
