#include <atomic>
#include <charconv>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <pthread.h>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <string_view>
#include <tablegrid/config/config.hpp>
#include <tablegrid/config/store.hpp>
#include <tablegrid/core/log.hpp>
#include <tablegrid/core/window_picker.hpp>
#include <tablegrid/core/window_types.hpp>
#include <tablegrid/layout/assignment.hpp>
#include <tablegrid/layout/generators.hpp>
#include <tablegrid/manager.hpp>
#include <tablegrid/x11/backend.hpp>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace tablegrid;

namespace {

constexpr int EXIT_USAGE = 2;

struct UsageError
{
    std::string message;
};

void print_usage()
{
    fmt::print(
        stderr,
        "usage: tablegrid [--config <file>] <command>\n"
        "\n"
        "commands:\n"
        "  run                          detect and arrange continuously\n"
        "  detect                       list managed windows\n"
        "  pick <x> <y> [--add]         show (or add a window type for) the window at a point\n"
        "  capture <name>               save the current arrangement as a configuration\n"
        "  apply <id|name>              arrange windows with a stored configuration\n"
        "  grid <rows> <columns> [display]\n"
        "  poker <count> [display]\n"
        "  list                         list configurations and window types\n"
    );
}

std::string get_config_path(std::optional<std::string> const& explicit_path)
{
    // Command line argument takes priority
    if (explicit_path)
        return *explicit_path;

    // Try XDG_CONFIG_HOME
    if (char const* xdg = std::getenv("XDG_CONFIG_HOME"))
        return std::string(xdg) + "/tablegrid/config.toml";

    // Fall back to ~/.config
    if (char const* home = std::getenv("HOME"))
        return std::string(home) + "/.config/tablegrid/config.toml";

    return "";
}

Config read_config(std::optional<std::string> const& explicit_path)
{
    std::string config_path = get_config_path(explicit_path);

    if (!config_path.empty() && fs::exists(config_path))
    {
        LOG_INFO("Loading config from: {}", config_path);
        if (auto loaded = load_config(config_path))
            return *loaded;
        LOG_WARN("Failed to load config, using defaults");
    }
    else if (explicit_path)
    {
        LOG_WARN("Config file {} not found, using defaults", config_path);
    }
    else
    {
        LOG_DEBUG("No config file found, using defaults");
    }
    return default_config();
}

template<typename T>
T parse_number(std::string_view text, char const* what)
{
    T value{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size())
        throw UsageError{ fmt::format("invalid {}: '{}'", what, text) };
    return value;
}

std::string_view argument(std::vector<std::string> const& args, size_t index, char const* what)
{
    if (index >= args.size())
        throw UsageError{ fmt::format("missing {}", what) };
    return args[index];
}

void print_report(ApplyReport const& report)
{
    fmt::print("moved {} windows", report.moved.size());
    if (!report.failed.empty())
        fmt::print(", {} failed", report.failed.size());
    if (!report.unassigned.empty())
        fmt::print(", {} without a slot", report.unassigned.size());
    fmt::print("\n");
    for (auto const& [id, result] : report.failed)
        fmt::print("  {:#x}: {}\n", id, to_string(result));
}

int exit_code_of(ApplyReport const& report) { return report.failed.empty() ? EXIT_SUCCESS : EXIT_FAILURE; }

Display const& display_argument(Snapshot const& snapshot, std::vector<std::string> const& args, size_t index)
{
    if (snapshot.displays.empty())
        throw EnvironmentError(EnvironmentError::Kind::NoDisplays, "No displays found");

    size_t display = 0;
    if (index < args.size())
        display = parse_number<size_t>(args[index], "display index");
    if (display >= snapshot.displays.size())
        throw UsageError{ fmt::format("display index {} out of range (0-{})", display, snapshot.displays.size() - 1) };
    return snapshot.displays[display];
}

// ─────────────────────────────────────────────────────────────────────────────
// Commands
// ─────────────────────────────────────────────────────────────────────────────

/// Routes SIGINT/SIGTERM to a waiting thread that stops the manager loop.
class SignalStopper
{
public:
    explicit SignalStopper(Manager& manager)
    {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);

        waiter_ = std::thread([this, &manager] {
            int received = 0;
            sigwait(&signals_, &received);
            if (!released_)
                LOG_INFO("Received signal {}, stopping", received);
            manager.stop();
        });
    }

    ~SignalStopper()
    {
        // Wake the waiter when the loop ended some other way
        released_ = true;
        pthread_kill(waiter_.native_handle(), SIGTERM);
        waiter_.join();
    }

    SignalStopper(SignalStopper const&) = delete;
    SignalStopper& operator=(SignalStopper const&) = delete;

private:
    sigset_t signals_;
    std::atomic<bool> released_ = false;
    std::thread waiter_;
};

int cmd_run(Manager& manager)
{
    SignalStopper stopper(manager);
    manager.start_detection();
    manager.run();
    return EXIT_SUCCESS;
}

int cmd_detect(Manager& manager)
{
    auto snapshot = manager.refresh();
    if (manager.status() == ManagerStatus::Error)
    {
        auto kind = manager.last_error();
        if (kind == EnvironmentError::Kind::Unsupported)
            LOG_ERROR("An EWMH compliant window manager is required");
        else if (kind == EnvironmentError::Kind::PermissionDenied)
            LOG_ERROR("Access to the window list was refused");
        return EXIT_FAILURE;
    }

    for (auto const& window : snapshot.windows)
    {
        fmt::print(
            "{:#010x}  {:<16} display {:<10} {:>5.0f},{:<5.0f} {:>5.0f}x{:<5.0f} {}\n",
            window.id,
            window.type.name,
            window.display,
            window.frame.x,
            window.frame.y,
            window.frame.width,
            window.frame.height,
            window.title
        );
    }
    fmt::print("{} managed windows\n", snapshot.windows.size());
    return EXIT_SUCCESS;
}

int cmd_pick(x11::Backend& backend, Store& store, std::vector<std::string> const& args)
{
    Point point{ parse_number<double>(argument(args, 1, "x"), "x"), parse_number<double>(argument(args, 2, "y"), "y") };
    bool add = args.size() > 3 && args[3] == "--add";

    auto picked = picker::pick_at(backend, point);
    if (!picked)
    {
        fmt::print("no window at {},{}\n", point.x, point.y);
        return EXIT_FAILURE;
    }

    fmt::print("window  {:#x}\npid     {}\ntitle   {}\nclass   {}\n", picked->id, picked->pid, picked->title, picked->window_class);

    auto type = make_window_type_from(*picked);
    if (add)
    {
        auto const& added = store.add_window_type(std::move(type));
        fmt::print("added window type '{}' ({})\n", added.name, added.id);
    }
    else
    {
        fmt::print("suggested window type: {}\n", type.name);
    }
    return EXIT_SUCCESS;
}

int cmd_capture(Manager& manager, std::vector<std::string> const& args)
{
    std::string name(argument(args, 1, "configuration name"));
    auto config = manager.capture_configuration(name);
    fmt::print("saved configuration '{}' ({}) with {} slots\n", config.name, config.id, config.layout.slots.size());
    return EXIT_SUCCESS;
}

int cmd_apply(Manager& manager, Store& store, std::vector<std::string> const& args)
{
    auto key = argument(args, 1, "configuration id or name");
    auto config = store.find_configuration(key);
    if (!config)
    {
        LOG_ERROR("No configuration named {}", key);
        return EXIT_FAILURE;
    }

    manager.refresh();
    auto report = manager.apply_layout(config->layout);
    print_report(report);
    return exit_code_of(report);
}

int cmd_grid(Manager& manager, std::vector<std::string> const& args)
{
    int rows = parse_number<int>(argument(args, 1, "rows"), "rows");
    int columns = parse_number<int>(argument(args, 2, "columns"), "columns");

    auto snapshot = manager.refresh();
    auto const& display = display_argument(snapshot, args, 3);
    auto report = manager.apply_layout(generators::uniform_grid(rows, columns, display.id, display.bounds));
    print_report(report);
    return exit_code_of(report);
}

int cmd_poker(Manager& manager, std::vector<std::string> const& args)
{
    int count = parse_number<int>(argument(args, 1, "count"), "count");

    auto snapshot = manager.refresh();
    auto const& display = display_argument(snapshot, args, 2);
    auto report = manager.apply_layout(generators::poker_grid(count, display.id, display.bounds));
    print_report(report);
    return exit_code_of(report);
}

int cmd_list(Store& store)
{
    fmt::print("configurations:\n");
    for (auto const& config : store.configurations())
    {
        fmt::print(
            "  {}  {} ({} slots, {})\n",
            config.id,
            config.name,
            config.layout.slots.size(),
            to_string(config.layout.strategy)
        );
    }

    fmt::print("window types:\n");
    for (auto const& type : store.window_types())
    {
        fmt::print(
            "  {}  {}{}  title '{}' class '{}'\n",
            type.id,
            type.name,
            type.enabled ? "" : " (disabled)",
            type.title_pattern,
            type.class_pattern
        );
    }
    return EXIT_SUCCESS;
}

}

int main(int argc, char* argv[])
{
    tablegrid::log::init();

    std::optional<std::string> config_arg;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "--config" && i + 1 < argc)
            config_arg = argv[++i];
        else if (arg == "-h" || arg == "--help")
        {
            print_usage();
            return EXIT_SUCCESS;
        }
        else
            args.emplace_back(arg);
    }

    if (args.empty())
    {
        print_usage();
        return EXIT_USAGE;
    }

    int status = EXIT_SUCCESS;
    try
    {
        Config config = read_config(config_arg);
        auto level = spdlog::level::from_str(config.logging.level);
        auto logger = tablegrid::log::init(level, config.logging.file);

        Store store(config.store.path, logger);
        store.load();

        std::string const& command = args[0];
        if (command == "list")
        {
            status = cmd_list(store);
        }
        else
        {
            x11::Backend backend(logger);
            Manager manager(Collaborators{ backend, backend, backend, backend }, store, config, logger);

            if (command == "run")
                status = cmd_run(manager);
            else if (command == "detect")
                status = cmd_detect(manager);
            else if (command == "pick")
                status = cmd_pick(backend, store, args);
            else if (command == "capture")
                status = cmd_capture(manager, args);
            else if (command == "apply")
                status = cmd_apply(manager, store, args);
            else if (command == "grid")
                status = cmd_grid(manager, args);
            else if (command == "poker")
                status = cmd_poker(manager, args);
            else
                throw UsageError{ fmt::format("unknown command '{}'", command) };
        }
    }
    catch (UsageError const& e)
    {
        fmt::print(stderr, "tablegrid: {}\n\n", e.message);
        print_usage();
        tablegrid::log::shutdown();
        return EXIT_USAGE;
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Error: {}", e.what());
        tablegrid::log::shutdown();
        return EXIT_FAILURE;
    }

    tablegrid::log::shutdown();
    return status;
}
