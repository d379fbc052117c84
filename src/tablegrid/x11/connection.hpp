#pragma once

#include <memory>
#include <xcb/randr.h>
#include <xcb/xcb.h>

namespace tablegrid::x11 {

/**
 * @brief Owning handle on the X server connection.
 *
 * Throws EnvironmentError(ConnectionFailed) when the display cannot be opened.
 */
class Connection
{
public:
    explicit Connection(char const* display_name = nullptr);
    ~Connection() = default;

    Connection(Connection const&) = delete;
    Connection& operator=(Connection const&) = delete;
    Connection(Connection&&) = default;
    Connection& operator=(Connection&&) = default;

    xcb_connection_t* get() const { return conn_.get(); }
    xcb_screen_t* screen() const { return screen_; }
    int screen_number() const { return screen_number_; }

    bool has_randr() const { return randr_available_; }
    bool has_error() const { return xcb_connection_has_error(conn_.get()) != 0; }

    xcb_atom_t intern_atom(char const* name) const;

    void flush() { xcb_flush(conn_.get()); }

private:
    std::unique_ptr<xcb_connection_t, decltype(&xcb_disconnect)> conn_;
    xcb_screen_t* screen_ = nullptr;
    int screen_number_ = 0;

    bool randr_available_ = false;

    void init_randr();
};

} // namespace tablegrid::x11
