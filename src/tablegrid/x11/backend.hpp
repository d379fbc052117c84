#pragma once

#include "connection.hpp"
#include "ewmh.hpp"
#include "tablegrid/core/interfaces.hpp"
#include "tablegrid/core/log.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tablegrid::x11 {

/**
 * @brief X11 implementation of every platform collaborator.
 *
 * Windows come from the window manager's _NET_CLIENT_LIST_STACKING, geometry
 * from the X server, displays from RandR (whole screen when RandR is absent).
 * Moves and activation are requested through EWMH client messages so that a
 * reparenting window manager places the frame, not the client.
 */
class Backend
    : public WindowSource
    , public WindowController
    , public DisplayTopology
    , public PointerSource
{
public:
    explicit Backend(log::LoggerPtr logger = nullptr, char const* display_name = nullptr);

    // WindowSource
    std::vector<RawWindow> enumerate_windows() override;
    OwnerInfo resolve_owner(ProcessId pid) override;

    // WindowController
    WindowOpResult move_resize(WindowId window, ProcessId pid, Rect const& target) override;
    WindowOpResult activate(WindowId window, ProcessId pid) override;

    // DisplayTopology
    std::vector<Display> displays() override;
    std::optional<Rect> display_bounds(DisplayId display) override;
    std::optional<DisplayId> display_containing(Point point) override;

    // PointerSource
    std::optional<Point> pointer_position() override;

private:
    struct Atoms
    {
        xcb_atom_t utf8_string = XCB_NONE;
        xcb_atom_t gtk_application_id = XCB_NONE;
        xcb_atom_t net_wm_window_opacity = XCB_NONE;
    };

    std::optional<RawWindow> read_window(xcb_window_t window, int layer);
    std::optional<Rect> root_geometry(xcb_window_t window);
    std::optional<double> opacity(xcb_window_t window);
    std::optional<std::string> wm_name(xcb_window_t window);
    std::optional<std::string> wm_class(xcb_window_t window);
    std::optional<std::string> string_property(xcb_window_t window, xcb_atom_t property, xcb_atom_t type);
    bool window_exists(xcb_window_t window);
    std::vector<Display> query_displays();
    std::vector<Display> fallback_display() const;

    log::LoggerPtr logger_;
    Connection conn_;
    Ewmh ewmh_;
    Atoms atoms_;
    bool supports_moveresize_ = false;
    bool supports_active_window_ = false;

    // X is not thread-safe at this level: the applier and the hover tick may
    // call from different threads
    std::mutex mutex_;

    // Last window seen per pid, used to read owner properties
    std::unordered_map<ProcessId, xcb_window_t> window_by_pid_;
};

} // namespace tablegrid::x11
