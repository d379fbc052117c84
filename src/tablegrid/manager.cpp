#include "manager.hpp"
#include "tablegrid/core/window_picker.hpp"
#include "tablegrid/layout/grid_inference.hpp"
#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace tablegrid {

namespace {

std::chrono::milliseconds ms(uint32_t value) { return std::chrono::milliseconds(value); }

}

char const* to_string(ManagerStatus status)
{
    switch (status)
    {
        case ManagerStatus::Idle:
            return "idle";
        case ManagerStatus::Detecting:
            return "detecting";
        case ManagerStatus::Monitoring:
            return "monitoring";
        case ManagerStatus::Arranging:
            return "arranging";
        case ManagerStatus::NoWindows:
            return "no windows";
        case ManagerStatus::Error:
            return "error";
    }
    return "error";
}

Manager::Manager(Collaborators collaborators, Store& store, Config const& config, log::LoggerPtr logger)
    : collaborators_(collaborators)
    , store_(store)
    , config_(config)
    , logger_(log::or_default(std::move(logger)))
    , matcher_(PatternMatcher::Cache(config.patterns.cache_capacity, config.patterns.eviction), logger_)
    , detector_(collaborators.source, collaborators.topology, matcher_, logger_)
    , applier_(collaborators.controller, logger_)
    , hover_(activation::HoverSettings{ ms(config.hover.delay_ms), ms(config.hover.cooldown_ms) })
{ }

// ─────────────────────────────────────────────────────────────────────────────
// Detection
// ─────────────────────────────────────────────────────────────────────────────

void Manager::start_detection() { start_detection(store_.window_types()); }

void Manager::start_detection(std::span<WindowType const> types)
{
    types_.clear();
    std::ranges::copy_if(types, std::back_inserter(types_), [](WindowType const& t) { return t.enabled; });

    if (types_.empty())
    {
        SPDLOG_LOGGER_WARN(logger_, "No enabled window types to detect");
        detecting_ = false;
        set_status(ManagerStatus::NoWindows);
        return;
    }

    detecting_ = true;
    set_status(ManagerStatus::Detecting);
    hover_.reset();

    auto now = Clock::now();
    next_hover_ = now;
    next_auto_activation_ = now + ms(config_.auto_activation.interval_ms);

    // Initial pass right away, then periodic
    detect_once(now);

    SPDLOG_LOGGER_INFO(logger_, "Started window detection with {} window types", types_.size());
    wake_.notify_all();
}

void Manager::stop_detection()
{
    detecting_ = false;
    pending_apply_.reset();
    hover_.reset();
    set_status(ManagerStatus::Idle);
    SPDLOG_LOGGER_INFO(logger_, "Stopped window detection");
}

Snapshot Manager::refresh()
{
    SPDLOG_LOGGER_INFO(logger_, "Manual window detection refresh triggered");
    if (types_.empty())
        types_ = store_.window_types();

    detect_once(Clock::now());
    return snapshot();
}

void Manager::detect_once(Clock::time_point now)
{
    next_detection_ = now + ms(config_.detection.interval_ms);

    Snapshot next;
    try
    {
        next.displays = collaborators_.topology.displays();
        if (next.displays.empty())
            throw EnvironmentError(EnvironmentError::Kind::NoDisplays, "No displays found");

        next.windows = detector_.detect(types_);
    }
    catch (EnvironmentError const& e)
    {
        SPDLOG_LOGGER_ERROR(logger_, "Window detection failed ({}): {}", to_string(e.kind()), e.what());
        {
            std::lock_guard lock(snapshot_mutex_);
            last_error_ = e.kind();
        }
        set_status(ManagerStatus::Error);
        return;
    }

    next.taken_at = now;
    {
        std::lock_guard lock(snapshot_mutex_);
        next.sequence = snapshot_.sequence + 1;
        snapshot_ = next;
        last_error_.reset();
    }

    SPDLOG_LOGGER_DEBUG(logger_, "Detected {} managed windows", next.windows.size());
    if (status_ != ManagerStatus::Arranging)
        set_status(next.windows.empty() ? ManagerStatus::NoWindows : ManagerStatus::Monitoring);

    publish(next);
}

Snapshot Manager::snapshot() const
{
    std::lock_guard lock(snapshot_mutex_);
    return snapshot_;
}

std::optional<EnvironmentError::Kind> Manager::last_error() const
{
    std::lock_guard lock(snapshot_mutex_);
    return last_error_;
}

void Manager::on_snapshot(SnapshotCallback callback) { callbacks_.push_back(std::move(callback)); }

void Manager::publish(Snapshot const& snapshot)
{
    for (auto const& callback : callbacks_)
        callback(snapshot);
}

void Manager::set_status(ManagerStatus status)
{
    ManagerStatus previous = status_.exchange(status);
    if (previous != status)
        SPDLOG_LOGGER_DEBUG(logger_, "Status: {} -> {}", to_string(previous), to_string(status));
}

// ─────────────────────────────────────────────────────────────────────────────
// Layout application
// ─────────────────────────────────────────────────────────────────────────────

ApplyReport Manager::apply_layout(Layout const& layout)
{
    auto current = snapshot();
    if (current.windows.empty())
    {
        SPDLOG_LOGGER_WARN(logger_, "No windows to arrange");
        return {};
    }

    set_status(ManagerStatus::Arranging);

    ApplyReport report;
    try
    {
        report = applier_.apply(layout, current.windows);
    }
    catch (LayoutError const&)
    {
        set_status(ManagerStatus::Monitoring);
        throw;
    }

    if (report.permission_denied())
    {
        SPDLOG_LOGGER_ERROR(logger_, "Window manager refused to move windows");
        set_status(ManagerStatus::Error);
    }
    else
    {
        set_status(ManagerStatus::Monitoring);
    }
    return report;
}

bool Manager::activate_configuration(std::string const& id_or_name)
{
    auto config = store_.find_configuration(id_or_name);
    if (!config)
    {
        SPDLOG_LOGGER_WARN(logger_, "No configuration named {}", id_or_name);
        return false;
    }

    active_ = std::move(config);
    SPDLOG_LOGGER_INFO(logger_, "Activated configuration: {}", active_->name);

    start_detection();
    if (detecting_)
        pending_apply_ = Clock::now() + ms(config_.apply.activation_delay_ms);
    return true;
}

std::optional<Configuration> Manager::active_configuration() const { return active_; }

void Manager::apply_pending()
{
    pending_apply_.reset();
    if (!active_)
        return;

    try
    {
        auto report = apply_layout(active_->layout);
        if (!report.complete())
        {
            SPDLOG_LOGGER_WARN(
                logger_,
                "Configuration {}: {} windows failed, {} without a slot",
                active_->name,
                report.failed.size(),
                report.unassigned.size()
            );
        }
    }
    catch (LayoutError const& e)
    {
        SPDLOG_LOGGER_ERROR(logger_, "Cannot apply configuration {}: {}", active_->name, e.what());
    }
}

Configuration Manager::capture_configuration(std::string name)
{
    auto current = refresh();
    auto config = inference::capture_configuration(std::move(name), current.windows, current.displays, logger_);
    SPDLOG_LOGGER_INFO(logger_, "Captured layout with {} slots", config.layout.slots.size());
    return store_.add_configuration(std::move(config));
}

// ─────────────────────────────────────────────────────────────────────────────
// Hover and auto activation
// ─────────────────────────────────────────────────────────────────────────────

void Manager::check_hover(Clock::time_point now)
{
    next_hover_ = now + ms(config_.hover.poll_ms);

    std::optional<WindowInfo> hovered;
    if (auto pointer = collaborators_.pointer.pointer_position())
    {
        try
        {
            hovered = picker::pick_at(collaborators_.source, *pointer, logger_);
        }
        catch (EnvironmentError const& e)
        {
            SPDLOG_LOGGER_DEBUG(logger_, "Hover check skipped: {}", e.what());
        }
    }

    std::unordered_set<WindowId> managed;
    {
        std::lock_guard lock(snapshot_mutex_);
        for (auto const& window : snapshot_.windows)
            managed.insert(window.id);
    }

    auto target = hover_.update(now, hovered, managed);
    if (!target)
        return;

    auto result = collaborators_.controller.activate(target->id, target->pid);
    if (result == WindowOpResult::Ok)
        SPDLOG_LOGGER_DEBUG(logger_, "Activated hovered window: {}", target->title);
    else
        SPDLOG_LOGGER_WARN(logger_, "Failed to activate window {:#x}: {}", target->id, to_string(result));
}

void Manager::check_auto_activation(Clock::time_point now)
{
    next_auto_activation_ = now + ms(config_.auto_activation.interval_ms);

    auto current = snapshot();
    auto selected = activation::select_auto_activation(store_.configurations(), current.windows, active_.has_value());
    if (!selected)
        return;

    SPDLOG_LOGGER_INFO(logger_, "Auto-activating configuration: {}", selected->name);
    activate_configuration(selected->id);
}

// ─────────────────────────────────────────────────────────────────────────────
// Loop
// ─────────────────────────────────────────────────────────────────────────────

void Manager::tick(Clock::time_point now)
{
    if (!detecting_)
        return;

    if (now >= next_detection_)
        detect_once(now);

    if (pending_apply_ && now >= *pending_apply_)
        apply_pending();

    if (config_.hover.enabled && now >= next_hover_)
        check_hover(now);

    if (config_.auto_activation.enabled && now >= next_auto_activation_)
        check_auto_activation(now);
}

std::optional<Manager::Clock::time_point> Manager::next_deadline() const
{
    if (!detecting_)
        return std::nullopt;

    auto deadline = next_detection_;
    if (pending_apply_)
        deadline = std::min(deadline, *pending_apply_);
    if (config_.hover.enabled)
        deadline = std::min(deadline, next_hover_);
    if (config_.auto_activation.enabled)
        deadline = std::min(deadline, next_auto_activation_);
    return deadline;
}

void Manager::run()
{
    SPDLOG_LOGGER_INFO(logger_, "Manager loop started");

    std::unique_lock lock(run_mutex_);
    while (!stop_requested_)
    {
        auto deadline = next_deadline();
        if (deadline)
            wake_.wait_until(lock, *deadline, [this] { return stop_requested_; });
        else
            wake_.wait(lock, [this] { return stop_requested_ || detecting_; });

        if (stop_requested_)
            break;

        lock.unlock();
        tick(Clock::now());
        lock.lock();
    }

    SPDLOG_LOGGER_INFO(logger_, "Manager loop stopped");
}

void Manager::stop()
{
    {
        std::lock_guard lock(run_mutex_);
        stop_requested_ = true;
    }
    wake_.notify_all();
}

} // namespace tablegrid
