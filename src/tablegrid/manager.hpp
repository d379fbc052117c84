#pragma once

#include "tablegrid/config/config.hpp"
#include "tablegrid/config/store.hpp"
#include "tablegrid/core/activation.hpp"
#include "tablegrid/core/interfaces.hpp"
#include "tablegrid/core/log.hpp"
#include "tablegrid/core/pattern_matcher.hpp"
#include "tablegrid/core/window_detector.hpp"
#include "tablegrid/layout/applier.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tablegrid {

enum class ManagerStatus
{
    Idle,
    Detecting,
    Monitoring,
    Arranging,
    NoWindows,
    Error,
};

char const* to_string(ManagerStatus status);

/// Result of one detection pass. Each pass replaces the previous snapshot.
struct Snapshot
{
    uint64_t sequence = 0;
    std::chrono::steady_clock::time_point taken_at;
    std::vector<ManagedWindow> windows;
    std::vector<Display> displays;
};

/// Platform collaborators the manager drives. Not owned.
struct Collaborators
{
    WindowSource& source;
    WindowController& controller;
    DisplayTopology& topology;
    PointerSource& pointer;
};

/**
 * @brief Service loop around the core.
 *
 * Everything time-based is a deadline checked by tick(): periodic detection,
 * the hover poll, the auto-activation check and the delayed layout apply that
 * follows a configuration activation. run() sleeps until the nearest deadline
 * and calls tick() until stop() is called from any thread.
 */
class Manager
{
public:
    using Clock = std::chrono::steady_clock;
    using SnapshotCallback = std::function<void(Snapshot const&)>;

    Manager(Collaborators collaborators, Store& store, Config const& config, log::LoggerPtr logger = nullptr);

    Manager(Manager const&) = delete;
    Manager& operator=(Manager const&) = delete;

    /// Start periodic detection with the store's window types.
    void start_detection();

    /// Start periodic detection with the enabled subset of `types`.
    void start_detection(std::span<WindowType const> types);
    void stop_detection();
    bool detecting() const { return detecting_; }

    /// Run one detection pass now and publish the snapshot.
    Snapshot refresh();

    /// Run every task whose deadline has passed.
    void tick(Clock::time_point now);

    /// Loop until stop(). A stop() issued before run() makes run() return at once.
    void run();
    void stop();

    void on_snapshot(SnapshotCallback callback);

    /// Assign the latest snapshot to `layout` and move the windows.
    ApplyReport apply_layout(Layout const& layout);

    /**
     * @brief Make a stored configuration active.
     *
     * Restarts detection, then applies the layout once the activation delay
     * has passed. Returns false when no configuration has that id or name.
     */
    bool activate_configuration(std::string const& id_or_name);
    std::optional<Configuration> active_configuration() const;

    /// Capture the current windows into a new stored configuration.
    Configuration capture_configuration(std::string name);

    ManagerStatus status() const { return status_; }

    /// Kind of the failure behind the last failed detection pass, cleared by a successful one.
    std::optional<EnvironmentError::Kind> last_error() const;
    Snapshot snapshot() const;

    PatternMatcher& matcher() { return matcher_; }

private:
    void detect_once(Clock::time_point now);
    void check_hover(Clock::time_point now);
    void check_auto_activation(Clock::time_point now);
    void apply_pending();
    std::optional<Clock::time_point> next_deadline() const;
    void publish(Snapshot const& snapshot);
    void set_status(ManagerStatus status);

    Collaborators collaborators_;
    Store& store_;
    Config config_;
    log::LoggerPtr logger_;

    PatternMatcher matcher_;
    WindowDetector detector_;
    LayoutApplier applier_;
    activation::HoverTracker hover_;

    std::vector<WindowType> types_;
    std::optional<Configuration> active_;

    std::atomic<bool> detecting_ = false;
    std::atomic<ManagerStatus> status_ = ManagerStatus::Idle;

    Clock::time_point next_detection_;
    Clock::time_point next_hover_;
    Clock::time_point next_auto_activation_;
    std::optional<Clock::time_point> pending_apply_;

    mutable std::mutex snapshot_mutex_;
    Snapshot snapshot_;
    std::optional<EnvironmentError::Kind> last_error_;
    std::vector<SnapshotCallback> callbacks_;

    std::mutex run_mutex_;
    std::condition_variable wake_;
    bool stop_requested_ = false;
};

} // namespace tablegrid
