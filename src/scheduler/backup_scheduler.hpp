/**
 * @file backup_scheduler.hpp
 * @brief Top-level BackupScheduler facade tying all modules together.
 * @author Dimitris Kafetzis
 *
 * Provides a single entry point for:
 *   1. Managing named schedules (add, update, remove, toggle)
 *   2. Running the tick loop that admits and launches due backups
 *   3. Manual triggers, status queries and lifecycle events
 *
 * Threading: schedule state lives on one scheduler thread. While the tick
 * loop runs, public calls from other threads are posted to its mailbox
 * and wait for the result; otherwise they run inline on the caller, and
 * the caller drives progress with check_schedules() and poll(). Backup
 * calls run on a worker pool and report back through the mailbox.
 * Event listeners run on the scheduler thread and must not call stop()
 * or shutdown().
 *
 * Template-parameterized on MonitorT for testability (LinuxMonitor or MockMonitor).
 */

#pragma once

#include "backup/backup_unit.hpp"
#include "core/clock.hpp"
#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/command_queue.hpp"
#include "executor/thread_pool.hpp"
#include "resource_monitor/monitor.hpp"
#include "schedule/schedule.hpp"
#include "schedule/schedule_store.hpp"
#include "scheduler/admission.hpp"
#include "scheduler/events.hpp"
#include "scheduler/execution_coordinator.hpp"
#include "scheduler/status.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace backup_scheduler {

template <ResourceMonitorLike MonitorT = LinuxMonitor>
class BackupScheduler {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Info;
        std::shared_ptr<IBackupUnit> backup_unit;
        std::shared_ptr<IClock> clock;          ///< Defaults to SystemClock
    };

    explicit BackupScheduler(Options opts);
    ~BackupScheduler();

    // Non-copyable, non-movable
    BackupScheduler(const BackupScheduler&) = delete;
    BackupScheduler& operator=(const BackupScheduler&) = delete;

    // ── Lifecycle ────────────────────────────

    /// Load schedules, start the monitor, and start the tick loop if
    /// scheduling is enabled.
    Result<void> initialize();
    Result<void> start();
    void stop();

    /// Stop, drain active executions (bounded), persist, shut the unit down.
    void shutdown();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Schedule management ──────────────────
    Result<Schedule> add_schedule(const ScheduleName& name, const ScheduleSpec& spec);
    Result<Schedule> add_schedule_from_strategy(const ScheduleName& name, const std::string& strategy);
    Result<Schedule> update_schedule(const ScheduleName& name, const ScheduleUpdate& update);
    Result<void> remove_schedule(const ScheduleName& name);

    /// Flip enabled, or set it to @p enabled when given.
    Result<Schedule> toggle_schedule(const ScheduleName& name,
                                     std::optional<bool> enabled = std::nullopt);

    /// Start a backup now, bypassing admission and the due check.
    Result<ExecutionId> trigger_backup(const ScheduleName& name,
                                       std::optional<BackupType> type = std::nullopt);

    // ── Queries ──────────────────────────────
    std::optional<Schedule> get_schedule(const ScheduleName& name);
    std::vector<Schedule> all_schedules();
    SchedulerStatus status();

    // ── Driving ──────────────────────────────

    /// One tick: admit and launch every due schedule in priority order.
    void check_schedules();

    /// Apply backup outcomes, expire timeouts, deliver events.
    void poll();

    /**
     * @brief Poll until no execution is active and the mailbox is empty.
     * @return false if @p timeout elapsed first.
     */
    bool wait_until_idle(Millis timeout);

    // ── Accessors (for testing) ─────────────
    EventBus& events() { return events_; }
    MonitorT& monitor() { return monitor_; }
    Logger& logger() { return logger_; }
    const Config& config() const { return config_; }

private:
    template <typename F>
    auto run_on_scheduler(F&& func) -> std::invoke_result_t<F&>;

    void run_loop(std::stop_token stop);
    Result<ActiveExecutionInfo> launch(const ScheduleName& name,
                                       std::optional<BackupType> type_override,
                                       bool manual);
    Result<BackupResult> run_backup(BackupType type, std::stop_token stop);
    void forward_unit_event(const BackupUnitEvent& event);

    Config config_;
    Logger logger_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<IBackupUnit> backup_unit_;
    MonitorT monitor_;

    ScheduleStore store_;
    EventBus events_;
    AdmissionController admission_;
    ExecutionCoordinator coordinator_;
    CommandQueue mailbox_;

    bool initialized_{false};
    bool shut_down_{false};
    std::atomic<bool> running_{false};
    std::mutex loop_mutex_;                 ///< Guards running_ transitions and loop_thread_id_
    std::thread::id loop_thread_id_;

    // Destroyed first: workers post into mailbox_, the loop touches everything.
    ThreadPool worker_pool_;
    std::jthread tick_thread_;
};

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

template <ResourceMonitorLike MonitorT>
BackupScheduler<MonitorT>::BackupScheduler(Options opts)
    : config_(std::move(opts.config))
    , logger_(std::move(opts.log_sink), opts.log_level)
    , clock_(opts.clock ? std::move(opts.clock) : std::make_shared<SystemClock>())
    , backup_unit_(std::move(opts.backup_unit))
    , monitor_(config_.resources.disk_path, config_.resources.sampling_interval_ms)
    , store_(config_.scheduler.schedule_file, logger_)
    , events_(logger_)
    , admission_(ResourceLimits::from_config(config_))
    , coordinator_(store_, events_, logger_, RetryPolicy::from_config(config_.scheduler))
    , worker_pool_(config_.scheduler.worker_threads == 0
                   ? 2 * static_cast<size_t>(config_.scheduler.max_concurrent_backups)
                   : config_.scheduler.worker_threads) {
}

template <ResourceMonitorLike MonitorT>
BackupScheduler<MonitorT>::~BackupScheduler() {
    stop();
    coordinator_.cancel_all();
    worker_pool_.shutdown();
    if (backup_unit_) backup_unit_->set_event_listener(nullptr);
    monitor_.stop();
}

// ── Lifecycle ────────────────────────────────

template <ResourceMonitorLike MonitorT>
Result<void> BackupScheduler<MonitorT>::initialize() {
    if (initialized_) return Result<void>{};
    if (!backup_unit_) {
        return Error{ErrorCode::InvalidArgument, "No backup unit configured"};
    }

    logger_.info("Initializing Backup Scheduler");

    monitor_.start();
    backup_unit_->set_event_listener([this](const BackupUnitEvent& event) {
        forward_unit_event(event);
    });

    auto outcome = store_.load(clock_->now());
    coordinator_.refresh_next_scheduled();
    initialized_ = true;

    logger_.info("Backup Scheduler initialized: " + std::to_string(store_.size()) + " schedules ("
                 + (outcome == ScheduleStore::LoadOutcome::Bootstrapped ? "defaults" : "loaded")
                 + ")");
    events_.publish(SchedulerEvent{.kind = EventKind::Initialized, .at = clock_->now()});

    if (config_.scheduler.enable_scheduling) {
        return start();
    }
    return Result<void>{};
}

template <ResourceMonitorLike MonitorT>
Result<void> BackupScheduler<MonitorT>::start() {
    if (!initialized_) {
        return Error{ErrorCode::NotRunning, "Scheduler is not initialized"};
    }
    {
        std::lock_guard lock(loop_mutex_);
        if (running_.load()) {
            return Error{ErrorCode::InvalidArgument, "Scheduler is already running"};
        }
        running_.store(true);
        tick_thread_ = std::jthread([this](std::stop_token stop) { run_loop(stop); });
        loop_thread_id_ = tick_thread_.get_id();
    }

    logger_.info("Backup Scheduler started: tick every "
                 + std::to_string(config_.scheduler.tick_interval_ms) + "ms, first check in "
                 + std::to_string(config_.scheduler.warmup_delay_ms) + "ms");
    events_.publish(SchedulerEvent{.kind = EventKind::Started, .at = clock_->now()});
    return Result<void>{};
}

template <ResourceMonitorLike MonitorT>
void BackupScheduler<MonitorT>::stop() {
    {
        std::lock_guard lock(loop_mutex_);
        if (!running_.load()) return;
        running_.store(false);
    }

    tick_thread_.request_stop();
    if (tick_thread_.joinable()) tick_thread_.join();
    {
        std::lock_guard lock(loop_mutex_);
        loop_thread_id_ = std::thread::id{};
    }

    logger_.info("Backup Scheduler stopped");
    events_.publish(SchedulerEvent{.kind = EventKind::Stopped, .at = clock_->now()});
    // Commands posted before running_ flipped still need an answer.
    poll();
}

template <ResourceMonitorLike MonitorT>
void BackupScheduler<MonitorT>::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;

    logger_.info("Shutting down Backup Scheduler");
    stop();

    using SteadyClock = std::chrono::steady_clock;
    const auto deadline = SteadyClock::now() + Millis{config_.scheduler.shutdown_timeout_ms};
    const Millis poll_interval{config_.scheduler.shutdown_poll_interval_ms};

    poll();
    while (coordinator_.active_count() > 0 && SteadyClock::now() < deadline) {
        mailbox_.wait_until(std::stop_token{}, std::min(deadline, SteadyClock::now() + poll_interval));
        poll();
    }

    if (auto outstanding = coordinator_.active_count(); outstanding > 0) {
        logger_.warn(std::to_string(outstanding) + " backups still active after shutdown timeout");
        coordinator_.cancel_all();
    }

    store_.persist();
    if (backup_unit_) backup_unit_->shutdown();
    monitor_.stop();

    events_.publish(SchedulerEvent{.kind = EventKind::Shutdown, .at = clock_->now()});
    events_.dispatch();
    logger_.info("Backup Scheduler shutdown completed");
    logger_.flush();
}

// ── Schedule management ─────────────────────

template <ResourceMonitorLike MonitorT>
Result<Schedule> BackupScheduler<MonitorT>::add_schedule(const ScheduleName& name,
                                                         const ScheduleSpec& spec) {
    return run_on_scheduler([&]() -> Result<Schedule> {
        if (store_.contains(name)) {
            return Error{ErrorCode::ScheduleExists, "Schedule already exists: " + name};
        }
        auto now = clock_->now();
        auto schedule = make_schedule(name, spec, now);
        if (!schedule) return schedule.error();

        store_.put(*schedule);
        store_.persist();
        coordinator_.refresh_next_scheduled();

        logger_.info("Added schedule: " + name + " (" + schedule->frequency + ")");
        events_.publish(SchedulerEvent{.kind = EventKind::ScheduleAdded, .at = now,
                                       .schedule = *schedule});
        return schedule;
    });
}

template <ResourceMonitorLike MonitorT>
Result<Schedule> BackupScheduler<MonitorT>::add_schedule_from_strategy(const ScheduleName& name,
                                                                       const std::string& strategy) {
    auto it = config_.strategies.find(strategy);
    if (it == config_.strategies.end()) {
        return Error{ErrorCode::InvalidArgument, "Unknown strategy: " + strategy};
    }
    return add_schedule(name, spec_from_strategy(it->second));
}

template <ResourceMonitorLike MonitorT>
Result<Schedule> BackupScheduler<MonitorT>::update_schedule(const ScheduleName& name,
                                                            const ScheduleUpdate& update) {
    return run_on_scheduler([&]() -> Result<Schedule> {
        auto* current = store_.find(name);
        if (!current) {
            return Error{ErrorCode::ScheduleNotFound, "Schedule not found: " + name};
        }
        auto now = clock_->now();
        auto updated = apply_update(*current, update, now);
        if (!updated) return updated.error();

        *current = *updated;
        store_.persist();
        coordinator_.refresh_next_scheduled();

        logger_.info("Updated schedule: " + name);
        events_.publish(SchedulerEvent{.kind = EventKind::ScheduleUpdated, .at = now,
                                       .schedule = *updated});
        return updated;
    });
}

template <ResourceMonitorLike MonitorT>
Result<void> BackupScheduler<MonitorT>::remove_schedule(const ScheduleName& name) {
    return run_on_scheduler([&]() -> Result<void> {
        auto removed = store_.get(name);
        if (!removed || !store_.remove(name)) {
            return Error{ErrorCode::ScheduleNotFound, "Schedule not found: " + name};
        }
        store_.persist();
        coordinator_.refresh_next_scheduled();

        logger_.info("Removed schedule: " + name);
        events_.publish(SchedulerEvent{.kind = EventKind::ScheduleRemoved, .at = clock_->now(),
                                       .schedule = std::move(removed)});
        return Result<void>{};
    });
}

template <ResourceMonitorLike MonitorT>
Result<Schedule> BackupScheduler<MonitorT>::toggle_schedule(const ScheduleName& name,
                                                            std::optional<bool> enabled) {
    return run_on_scheduler([&]() -> Result<Schedule> {
        auto* schedule = store_.find(name);
        if (!schedule) {
            return Error{ErrorCode::ScheduleNotFound, "Schedule not found: " + name};
        }
        auto now = clock_->now();
        schedule->enabled = enabled.value_or(!schedule->enabled);
        schedule->updated_at = now;
        store_.persist();
        coordinator_.refresh_next_scheduled();

        logger_.info("Schedule " + name + (schedule->enabled ? " enabled" : " disabled"));
        events_.publish(SchedulerEvent{.kind = EventKind::ScheduleToggled, .at = now,
                                       .schedule = *schedule});
        return *schedule;
    });
}

template <ResourceMonitorLike MonitorT>
Result<ExecutionId> BackupScheduler<MonitorT>::trigger_backup(const ScheduleName& name,
                                                              std::optional<BackupType> type) {
    return run_on_scheduler([&]() -> Result<ExecutionId> {
        logger_.info("Triggering immediate backup: " + name);
        auto started = launch(name, type, true);
        if (!started) return started.error();
        coordinator_.refresh_next_scheduled();
        return started->id;
    });
}

// ── Queries ──────────────────────────────────

template <ResourceMonitorLike MonitorT>
std::optional<Schedule> BackupScheduler<MonitorT>::get_schedule(const ScheduleName& name) {
    return run_on_scheduler([&] { return store_.get(name); });
}

template <ResourceMonitorLike MonitorT>
std::vector<Schedule> BackupScheduler<MonitorT>::all_schedules() {
    return run_on_scheduler([&] { return store_.all(); });
}

template <ResourceMonitorLike MonitorT>
SchedulerStatus BackupScheduler<MonitorT>::status() {
    return run_on_scheduler([&] {
        return SchedulerStatus{
            .running = running_.load(),
            .active_backups = coordinator_.active_count(),
            .total_schedules = store_.size(),
            .enabled_schedules = store_.enabled_count(),
            .stats = coordinator_.stats(),
            .schedules = store_.all(),
            .active_executions = coordinator_.active(),
            .resource_limits = admission_.limits()
        };
    });
}

// ── Driving ──────────────────────────────────

template <ResourceMonitorLike MonitorT>
void BackupScheduler<MonitorT>::check_schedules() {
    run_on_scheduler([&] {
        auto now = clock_->now();
        coordinator_.mark_schedule_check(now);

        auto due = store_.due(now);
        if (!due.empty()) {
            logger_.info("Found " + std::to_string(due.size()) + " due schedules");
        }

        for (const auto& name : due) {
            try {
                const auto* schedule = store_.find(name);
                if (!schedule) continue;

                auto decision = admission_.can_run(*schedule, coordinator_.active_count(),
                                                   monitor_, now);
                if (!decision.admitted()) {
                    logger_.info("Skipping backup " + name + " - " + std::string{to_string(decision.verdict)}
                                 + (decision.detail.empty() ? "" : " (" + decision.detail + ")"));
                    coordinator_.record_skip(name, now);
                    continue;
                }

                auto started = launch(name, std::nullopt, false);
                if (!started) {
                    coordinator_.record_schedule_error(name, started.error(), now);
                }
            } catch (const std::exception& e) {
                coordinator_.record_schedule_error(name, Error{ErrorCode::ExecutionError, e.what()}, now);
            }
        }

        coordinator_.refresh_next_scheduled();
    });
}

template <ResourceMonitorLike MonitorT>
void BackupScheduler<MonitorT>::poll() {
    run_on_scheduler([&] {
        for (auto& command : mailbox_.drain()) {
            command();
        }
        coordinator_.expire_overdue(clock_->now());
        events_.dispatch();
    });
}

template <ResourceMonitorLike MonitorT>
bool BackupScheduler<MonitorT>::wait_until_idle(Millis timeout) {
    using SteadyClock = std::chrono::steady_clock;
    const auto deadline = SteadyClock::now() + timeout;
    const Millis step{std::max<uint32_t>(1, std::min<uint32_t>(config_.scheduler.timer_resolution_ms, 50))};

    while (true) {
        bool idle = false;
        if (running_.load()) {
            idle = run_on_scheduler([&] {
                return coordinator_.active_count() == 0 && mailbox_.pending() == 0;
            });
        } else {
            poll();
            idle = coordinator_.active_count() == 0 && mailbox_.pending() == 0
                   && events_.pending() == 0;
        }
        if (idle) return true;
        if (SteadyClock::now() >= deadline) return false;

        if (running_.load()) {
            std::this_thread::sleep_for(step);
        } else {
            mailbox_.wait_until(std::stop_token{}, std::min(deadline, SteadyClock::now() + step));
        }
    }
}

// ── Internals ────────────────────────────────

template <ResourceMonitorLike MonitorT>
template <typename F>
auto BackupScheduler<MonitorT>::run_on_scheduler(F&& func) -> std::invoke_result_t<F&> {
    using R = std::invoke_result_t<F&>;

    std::future<R> result;
    {
        std::lock_guard lock(loop_mutex_);
        if (running_.load() && std::this_thread::get_id() != loop_thread_id_) {
            auto task = std::make_shared<std::packaged_task<R()>>(
                [&func]() -> R { return func(); });
            result = task->get_future();
            mailbox_.post([task] { (*task)(); });
        }
    }
    if (!result.valid()) return func();
    return result.get();
}

template <ResourceMonitorLike MonitorT>
void BackupScheduler<MonitorT>::run_loop(std::stop_token stop) {
    using SteadyClock = std::chrono::steady_clock;
    const Millis tick_interval{config_.scheduler.tick_interval_ms};
    const Millis resolution{config_.scheduler.timer_resolution_ms};

    auto next_tick = SteadyClock::now() + Millis{config_.scheduler.warmup_delay_ms};

    while (!stop.stop_requested()) {
        mailbox_.wait_until(stop, std::min(next_tick, SteadyClock::now() + resolution));
        if (stop.stop_requested()) break;

        poll();

        if (SteadyClock::now() >= next_tick) {
            check_schedules();
            events_.dispatch();
            next_tick = SteadyClock::now() + tick_interval;
        }
    }
}

template <ResourceMonitorLike MonitorT>
Result<ActiveExecutionInfo> BackupScheduler<MonitorT>::launch(const ScheduleName& name,
                                                              std::optional<BackupType> type_override,
                                                              bool manual) {
    return coordinator_.start(name, type_override, manual, clock_->now(),
        [this](const ActiveExecutionInfo& execution, std::stop_token stop) {
            // The future is not needed: the outcome travels back through the mailbox.
            (void)worker_pool_.submit([this, id = execution.id, type = execution.type, stop] {
                auto outcome = run_backup(type, stop);
                mailbox_.post([this, id, outcome] {
                    coordinator_.complete(id, outcome, clock_->now());
                });
            });
        });
}

template <ResourceMonitorLike MonitorT>
Result<BackupResult> BackupScheduler<MonitorT>::run_backup(BackupType type, std::stop_token stop) {
    try {
        return type == BackupType::Full
            ? backup_unit_->create_full_backup(stop)
            : backup_unit_->create_incremental_backup(stop);
    } catch (const std::exception& e) {
        return Error{ErrorCode::ExecutionError, e.what()};
    }
}

template <ResourceMonitorLike MonitorT>
void BackupScheduler<MonitorT>::forward_unit_event(const BackupUnitEvent& event) {
    EventKind kind = EventKind::BackupStarted;
    switch (event.kind) {
        case BackupUnitEvent::Kind::Started:   kind = EventKind::BackupStarted; break;
        case BackupUnitEvent::Kind::Completed: kind = EventKind::BackupCompleted; break;
        case BackupUnitEvent::Kind::Error:     kind = EventKind::BackupError; break;
    }
    events_.publish(SchedulerEvent{.kind = kind, .at = clock_->now(), .unit_event = event});
}

}  // namespace backup_scheduler
