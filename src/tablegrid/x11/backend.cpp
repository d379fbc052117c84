#include "backend.hpp"
#include "tablegrid/core/display.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <xcb/xcb_icccm.h>

namespace tablegrid::x11 {

namespace {

constexpr uint8_t X_BAD_ACCESS = 10;

struct FreeDeleter
{
    void operator()(void* p) const { free(p); }
};

template<typename T>
using Reply = std::unique_ptr<T, FreeDeleter>;

uint32_t to_dimension(double value)
{
    return static_cast<uint32_t>(std::max(1L, std::lround(value)));
}

WindowOpResult result_of(Reply<xcb_generic_error_t> const& error)
{
    if (!error)
        return WindowOpResult::Ok;
    if (error->error_code == XCB_WINDOW)
        return WindowOpResult::MissingWindow;
    if (error->error_code == X_BAD_ACCESS)
        return WindowOpResult::PermissionDenied;
    return WindowOpResult::Failed;
}

}

Backend::Backend(log::LoggerPtr logger, char const* display_name)
    : logger_(log::or_default(std::move(logger)))
    , conn_(display_name)
    , ewmh_(conn_)
{
    atoms_.utf8_string = conn_.intern_atom("UTF8_STRING");
    atoms_.gtk_application_id = conn_.intern_atom("_GTK_APPLICATION_ID");
    atoms_.net_wm_window_opacity = conn_.intern_atom("_NET_WM_WINDOW_OPACITY");

    supports_moveresize_ = ewmh_.supports(ewmh_.get()->_NET_MOVERESIZE_WINDOW);
    supports_active_window_ = ewmh_.supports(ewmh_.get()->_NET_ACTIVE_WINDOW);

    SPDLOG_LOGGER_DEBUG(
        logger_,
        "X11 backend ready (randr={}, moveresize={}, active_window={})",
        conn_.has_randr(),
        supports_moveresize_,
        supports_active_window_
    );
    if (!supports_moveresize_)
        SPDLOG_LOGGER_WARN(logger_, "Window manager lacks _NET_MOVERESIZE_WINDOW, configuring windows directly");
}

// ─────────────────────────────────────────────────────────────────────────────
// WindowSource
// ─────────────────────────────────────────────────────────────────────────────

std::vector<RawWindow> Backend::enumerate_windows()
{
    std::lock_guard lock(mutex_);

    auto stacking = ewmh_.client_list_stacking();
    if (!stacking)
    {
        throw EnvironmentError(
            EnvironmentError::Kind::Unsupported,
            "Window manager does not publish _NET_CLIENT_LIST; is an EWMH window manager running?"
        );
    }

    window_by_pid_.clear();

    // Stacking order is bottom-to-top; layer 0 is the topmost window
    std::vector<RawWindow> windows;
    windows.reserve(stacking->size());
    int count = static_cast<int>(stacking->size());
    for (int i = 0; i < count; ++i)
    {
        auto window = read_window((*stacking)[i], count - 1 - i);
        if (!window)
            continue;

        if (window->pid)
            window_by_pid_.insert_or_assign(*window->pid, (*stacking)[i]);
        windows.push_back(std::move(*window));
    }

    SPDLOG_LOGGER_TRACE(logger_, "Enumerated {} windows", windows.size());
    return windows;
}

OwnerInfo Backend::resolve_owner(ProcessId pid)
{
    std::lock_guard lock(mutex_);

    OwnerInfo owner;

    if (auto it = window_by_pid_.find(pid); it != window_by_pid_.end())
    {
        if (atoms_.gtk_application_id != XCB_NONE)
            owner.app_id = string_property(it->second, atoms_.gtk_application_id, atoms_.utf8_string);
        owner.app_name = wm_class(it->second);
    }

    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/" + std::to_string(pid) + "/exe", ec);
    if (!ec)
        owner.executable = exe.string();

    return owner;
}

std::optional<RawWindow> Backend::read_window(xcb_window_t window, int layer)
{
    Reply<xcb_get_window_attributes_reply_t> attributes(
        xcb_get_window_attributes_reply(conn_.get(), xcb_get_window_attributes(conn_.get(), window), nullptr)
    );
    if (!attributes)
        return std::nullopt; // Destroyed since the list was read

    RawWindow raw;
    raw.id = window;
    raw.layer = layer;
    raw.bounds = root_geometry(window);

    if (auto pid = ewmh_.window_pid(window))
        raw.pid = static_cast<ProcessId>(*pid);

    raw.title = ewmh_.window_name(window);
    if (!raw.title)
        raw.title = wm_name(window);

    bool hidden = ewmh_.has_window_state(window, ewmh_.get()->_NET_WM_STATE_HIDDEN);
    if (attributes->map_state != XCB_MAP_STATE_VIEWABLE || hidden)
        raw.alpha = 0.0;
    else
        raw.alpha = opacity(window).value_or(1.0);

    return raw;
}

std::optional<Rect> Backend::root_geometry(xcb_window_t window)
{
    Reply<xcb_get_geometry_reply_t> geometry(
        xcb_get_geometry_reply(conn_.get(), xcb_get_geometry(conn_.get(), window), nullptr)
    );
    if (!geometry)
        return std::nullopt;

    Reply<xcb_translate_coordinates_reply_t> origin(xcb_translate_coordinates_reply(
        conn_.get(),
        xcb_translate_coordinates(conn_.get(), window, conn_.screen()->root, 0, 0),
        nullptr
    ));
    if (!origin)
        return std::nullopt;

    return Rect{ static_cast<double>(origin->dst_x),
                 static_cast<double>(origin->dst_y),
                 static_cast<double>(geometry->width),
                 static_cast<double>(geometry->height) };
}

std::optional<double> Backend::opacity(xcb_window_t window)
{
    if (atoms_.net_wm_window_opacity == XCB_NONE)
        return std::nullopt;

    Reply<xcb_get_property_reply_t> reply(xcb_get_property_reply(
        conn_.get(),
        xcb_get_property(conn_.get(), 0, window, atoms_.net_wm_window_opacity, XCB_ATOM_CARDINAL, 0, 1),
        nullptr
    ));
    if (!reply || xcb_get_property_value_length(reply.get()) < static_cast<int>(sizeof(uint32_t)))
        return std::nullopt;

    uint32_t value = *static_cast<uint32_t*>(xcb_get_property_value(reply.get()));
    return static_cast<double>(value) / static_cast<double>(std::numeric_limits<uint32_t>::max());
}

std::optional<std::string> Backend::wm_name(xcb_window_t window)
{
    xcb_icccm_get_text_property_reply_t name;
    if (!xcb_icccm_get_wm_name_reply(conn_.get(), xcb_icccm_get_wm_name(conn_.get(), window), &name, nullptr))
        return std::nullopt;

    std::string result(name.name, name.name_len);
    xcb_icccm_get_text_property_reply_wipe(&name);
    return result;
}

std::optional<std::string> Backend::wm_class(xcb_window_t window)
{
    xcb_icccm_get_wm_class_reply_t wm_class;
    if (!xcb_icccm_get_wm_class_reply(conn_.get(), xcb_icccm_get_wm_class(conn_.get(), window), &wm_class, nullptr))
        return std::nullopt;

    std::optional<std::string> class_name;
    if (wm_class.class_name && *wm_class.class_name)
        class_name = wm_class.class_name;
    xcb_icccm_get_wm_class_reply_wipe(&wm_class);
    return class_name;
}

std::optional<std::string> Backend::string_property(xcb_window_t window, xcb_atom_t property, xcb_atom_t type)
{
    Reply<xcb_get_property_reply_t> reply(xcb_get_property_reply(
        conn_.get(),
        xcb_get_property(conn_.get(), 0, window, property, type, 0, 1024),
        nullptr
    ));
    if (!reply)
        return std::nullopt;

    int len = xcb_get_property_value_length(reply.get());
    if (len <= 0)
        return std::nullopt;

    return std::string(static_cast<char const*>(xcb_get_property_value(reply.get())), len);
}

bool Backend::window_exists(xcb_window_t window)
{
    Reply<xcb_get_window_attributes_reply_t> attributes(
        xcb_get_window_attributes_reply(conn_.get(), xcb_get_window_attributes(conn_.get(), window), nullptr)
    );
    return attributes != nullptr;
}

// ─────────────────────────────────────────────────────────────────────────────
// WindowController
// ─────────────────────────────────────────────────────────────────────────────

WindowOpResult Backend::move_resize(WindowId window, ProcessId, Rect const& target)
{
    std::lock_guard lock(mutex_);

    if (!window_exists(window))
        return WindowOpResult::MissingWindow;

    auto x = static_cast<int32_t>(std::lround(target.x));
    auto y = static_cast<int32_t>(std::lround(target.y));
    uint32_t width = to_dimension(target.width);
    uint32_t height = to_dimension(target.height);

    if (supports_moveresize_)
    {
        ewmh_.request_moveresize(window, x, y, width, height);
        conn_.flush();
        return conn_.has_error() ? WindowOpResult::Failed : WindowOpResult::Ok;
    }

    uint16_t mask = XCB_CONFIG_WINDOW_X | XCB_CONFIG_WINDOW_Y | XCB_CONFIG_WINDOW_WIDTH | XCB_CONFIG_WINDOW_HEIGHT;
    uint32_t values[] = { static_cast<uint32_t>(x), static_cast<uint32_t>(y), width, height };
    Reply<xcb_generic_error_t> error(
        xcb_request_check(conn_.get(), xcb_configure_window_checked(conn_.get(), window, mask, values))
    );
    return result_of(error);
}

WindowOpResult Backend::activate(WindowId window, ProcessId)
{
    std::lock_guard lock(mutex_);

    if (!window_exists(window))
        return WindowOpResult::MissingWindow;

    if (supports_active_window_)
    {
        ewmh_.request_active_window(window);
        conn_.flush();
        return conn_.has_error() ? WindowOpResult::Failed : WindowOpResult::Ok;
    }

    uint32_t stack_mode[] = { XCB_STACK_MODE_ABOVE };
    xcb_configure_window(conn_.get(), window, XCB_CONFIG_WINDOW_STACK_MODE, stack_mode);
    Reply<xcb_generic_error_t> error(xcb_request_check(
        conn_.get(),
        xcb_set_input_focus_checked(conn_.get(), XCB_INPUT_FOCUS_POINTER_ROOT, window, XCB_CURRENT_TIME)
    ));
    return result_of(error);
}

// ─────────────────────────────────────────────────────────────────────────────
// DisplayTopology
// ─────────────────────────────────────────────────────────────────────────────

std::vector<Display> Backend::displays()
{
    std::lock_guard lock(mutex_);
    return query_displays();
}

std::optional<Rect> Backend::display_bounds(DisplayId display)
{
    std::lock_guard lock(mutex_);
    return display::bounds_of(query_displays(), display);
}

std::optional<DisplayId> Backend::display_containing(Point point)
{
    std::lock_guard lock(mutex_);
    auto all = query_displays();
    auto index = display::display_index_at_point(all, point);
    if (!index)
        return std::nullopt;
    return all[*index].id;
}

std::vector<Display> Backend::query_displays()
{
    if (!conn_.has_randr())
        return fallback_display();

    auto res_cookie = xcb_randr_get_screen_resources_current(conn_.get(), conn_.screen()->root);
    Reply<xcb_randr_get_screen_resources_current_reply_t> res_reply(
        xcb_randr_get_screen_resources_current_reply(conn_.get(), res_cookie, nullptr)
    );
    if (!res_reply)
        return fallback_display();

    Reply<xcb_randr_get_output_primary_reply_t> primary_reply(xcb_randr_get_output_primary_reply(
        conn_.get(),
        xcb_randr_get_output_primary(conn_.get(), conn_.screen()->root),
        nullptr
    ));
    xcb_randr_output_t primary = primary_reply ? primary_reply->output : XCB_NONE;

    int num_outputs = xcb_randr_get_screen_resources_current_outputs_length(res_reply.get());
    xcb_randr_output_t* outputs = xcb_randr_get_screen_resources_current_outputs(res_reply.get());

    std::vector<Display> result;
    for (int i = 0; i < num_outputs; ++i)
    {
        auto out_cookie = xcb_randr_get_output_info(conn_.get(), outputs[i], res_reply->config_timestamp);
        Reply<xcb_randr_get_output_info_reply_t> out_reply(
            xcb_randr_get_output_info_reply(conn_.get(), out_cookie, nullptr)
        );

        if (!out_reply)
            continue;
        if (out_reply->connection != XCB_RANDR_CONNECTION_CONNECTED || out_reply->crtc == XCB_NONE)
            continue;

        int name_len = xcb_randr_get_output_info_name_length(out_reply.get());
        uint8_t* name_data = xcb_randr_get_output_info_name(out_reply.get());
        std::string output_name(reinterpret_cast<char*>(name_data), name_len);

        auto crtc_cookie = xcb_randr_get_crtc_info(conn_.get(), out_reply->crtc, res_reply->config_timestamp);
        Reply<xcb_randr_get_crtc_info_reply_t> crtc_reply(
            xcb_randr_get_crtc_info_reply(conn_.get(), crtc_cookie, nullptr)
        );

        if (crtc_reply && crtc_reply->width > 0 && crtc_reply->height > 0)
        {
            Display display;
            display.id = outputs[i];
            display.name = output_name;
            display.bounds = Rect{ static_cast<double>(crtc_reply->x),
                                   static_cast<double>(crtc_reply->y),
                                   static_cast<double>(crtc_reply->width),
                                   static_cast<double>(crtc_reply->height) };
            result.push_back(std::move(display));
        }
    }

    if (result.empty())
        return fallback_display();

    // Left to right, with the primary output first
    std::ranges::sort(result, [](Display const& a, Display const& b) { return a.bounds.x < b.bounds.x; });
    std::ranges::stable_partition(result, [primary](Display const& d) { return d.id == primary; });
    return result;
}

std::vector<Display> Backend::fallback_display() const
{
    Display display;
    display.id = 0;
    display.name = "default";
    display.bounds = Rect{ 0.0,
                           0.0,
                           static_cast<double>(conn_.screen()->width_in_pixels),
                           static_cast<double>(conn_.screen()->height_in_pixels) };
    return { display };
}

// ─────────────────────────────────────────────────────────────────────────────
// PointerSource
// ─────────────────────────────────────────────────────────────────────────────

std::optional<Point> Backend::pointer_position()
{
    std::lock_guard lock(mutex_);

    Reply<xcb_query_pointer_reply_t> reply(
        xcb_query_pointer_reply(conn_.get(), xcb_query_pointer(conn_.get(), conn_.screen()->root), nullptr)
    );
    if (!reply || !reply->same_screen)
        return std::nullopt;

    return Point{ static_cast<double>(reply->root_x), static_cast<double>(reply->root_y) };
}

} // namespace tablegrid::x11
