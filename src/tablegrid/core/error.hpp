#pragma once

#include <stdexcept>
#include <string>

namespace tablegrid {

/**
 * @brief Caller contract violation at the generator/assignment boundary.
 *
 * Thrown for non-positive rows/columns/counts, degenerate display bounds,
 * empty layouts and unknown strategy names.
 */
class LayoutError : public std::invalid_argument
{
public:
    explicit LayoutError(std::string const& what)
        : std::invalid_argument(what)
    { }
};

/**
 * @brief The environment cannot serve the request at all.
 *
 * Kept distinct from per-window failures so the caller can prompt the user
 * (grant access, plug in a display) instead of retrying.
 */
class EnvironmentError : public std::runtime_error
{
public:
    enum class Kind
    {
        ConnectionFailed,
        NoDisplays,
        PermissionDenied,
        Unsupported, ///< Window manager lacks a required protocol
    };

    EnvironmentError(Kind kind, std::string const& what)
        : std::runtime_error(what)
        , kind_(kind)
    { }

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

inline char const* to_string(EnvironmentError::Kind kind)
{
    switch (kind)
    {
        case EnvironmentError::Kind::ConnectionFailed:
            return "connection failed";
        case EnvironmentError::Kind::NoDisplays:
            return "no displays";
        case EnvironmentError::Kind::PermissionDenied:
            return "permission denied";
        case EnvironmentError::Kind::Unsupported:
            return "unsupported";
    }
    return "unsupported";
}

/// Outcome of a single window operation issued to the window controller.
enum class WindowOpResult
{
    Ok,
    MissingWindow,
    PermissionDenied,
    Failed,
};

inline char const* to_string(WindowOpResult result)
{
    switch (result)
    {
        case WindowOpResult::Ok:
            return "ok";
        case WindowOpResult::MissingWindow:
            return "missing window";
        case WindowOpResult::PermissionDenied:
            return "permission denied";
        case WindowOpResult::Failed:
            return "failed";
    }
    return "failed";
}

} // namespace tablegrid
