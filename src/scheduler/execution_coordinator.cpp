/**
 * @file execution_coordinator.cpp
 * @brief ExecutionCoordinator implementation.
 * @author Dimitris Kafetzis
 */

#include "scheduler/execution_coordinator.hpp"
#include "schedule/frequency.hpp"

#include <exception>
#include <format>

namespace backup_scheduler {

RetryPolicy RetryPolicy::from_config(const SchedulerConfig& config) {
    return RetryPolicy{
        .retry_delay = Millis{config.retry_delay_ms},
        .skip_delay = Millis{config.admission_retry_delay_ms},
        .error_backoff = Millis{config.error_backoff_ms}
    };
}

ExecutionCoordinator::ExecutionCoordinator(ScheduleStore& store, EventBus& events,
                                           Logger& logger, RetryPolicy policy)
    : store_(store), events_(events), logger_(logger), policy_(policy) {}

// ── Start ────────────────────────────────────

Result<ActiveExecutionInfo> ExecutionCoordinator::start(const ScheduleName& name,
                                                        std::optional<BackupType> type_override,
                                                        bool manual,
                                                        Timestamp now,
                                                        const Launcher& launch) {
    auto* schedule = store_.find(name);
    if (!schedule) {
        return Error{ErrorCode::ScheduleNotFound, "Schedule not found: " + name};
    }

    auto next = compute_next_run(schedule->frequency, now);
    if (!next) return next.error();

    ActiveExecutionInfo info{
        .id = std::format("scheduled-{}-{}", name, ++sequence_),
        .schedule_name = name,
        .type = type_override.value_or(schedule->type),
        .started_at = now,
        .deadline = now + schedule->timeout,
        .manual = manual
    };

    auto it = active_.emplace(info.id, ActiveExecution{info, std::stop_source{}}).first;
    try {
        launch(info, it->second.stop.get_token());
    } catch (const std::exception& e) {
        active_.erase(it);
        return Error{ErrorCode::ExecutionError,
                     "Could not launch backup for '" + name + "': " + e.what()};
    }

    schedule->last_run = now;
    schedule->run_count++;
    schedule->next_run = *next;
    stats_.scheduled_backups++;

    logger_.info(std::format("Executing {} backup: {} ({}, {})",
                             manual ? "manual" : "scheduled", name,
                             to_string(info.type), info.id));

    events_.publish(SchedulerEvent{
        .kind = EventKind::ScheduledBackupStarted,
        .at = now,
        .schedule = *schedule,
        .execution = info
    });

    store_.persist();
    return info;
}

// ── Completion ───────────────────────────────

bool ExecutionCoordinator::complete(const ExecutionId& id, const Result<BackupResult>& outcome,
                                    Timestamp now) {
    auto it = active_.find(id);
    if (it == active_.end()) {
        logger_.debug("Ignoring completion of inactive execution " + id);
        return false;
    }
    auto info = it->second.info;
    active_.erase(it);

    if (outcome) {
        on_success(info, *outcome, now);
    } else {
        on_failure(info, outcome.error(), now);
    }

    store_.persist();
    return true;
}

void ExecutionCoordinator::on_success(const ActiveExecutionInfo& info, const BackupResult& result,
                                      Timestamp now) {
    if (!result.has_archive()) {
        logger_.info("Backup " + info.id + " for " + info.schedule_name
                     + " found nothing to back up");
        return;
    }

    auto execution_time = std::chrono::duration_cast<Millis>(now - info.started_at);
    stats_.completed_backups++;
    stats_.total_execution_time += execution_time;
    stats_.average_execution_time = stats_.total_execution_time
                                    / static_cast<int64_t>(stats_.completed_backups);

    std::optional<Schedule> snapshot;
    if (auto* schedule = store_.find(info.schedule_name)) {
        schedule->success_count++;
        snapshot = *schedule;
    }

    logger_.info(std::format("Scheduled backup completed: {} ({}ms)",
                             info.schedule_name, execution_time.count()));

    events_.publish(SchedulerEvent{
        .kind = EventKind::ScheduledBackupCompleted,
        .at = now,
        .schedule = std::move(snapshot),
        .execution = info,
        .result = result,
        .execution_time = execution_time
    });
}

void ExecutionCoordinator::on_failure(const ActiveExecutionInfo& info, const Error& error,
                                      Timestamp now) {
    stats_.failed_backups++;
    logger_.error("Scheduled backup failed: " + info.schedule_name + " - " + error.message);

    std::optional<Schedule> snapshot;
    if (auto* schedule = store_.find(info.schedule_name)) {
        schedule->failure_count++;
        if (schedule->retry_count > 0) {
            schedule->retry_count--;
            schedule->next_run = now + policy_.retry_delay;
            logger_.info(std::format("Will retry backup {} in {}s ({} retries left)",
                                     schedule->name,
                                     std::chrono::duration_cast<std::chrono::seconds>(
                                         policy_.retry_delay).count(),
                                     schedule->retry_count));
        }
        snapshot = *schedule;
    }

    events_.publish(SchedulerEvent{
        .kind = EventKind::ScheduledBackupFailed,
        .at = now,
        .schedule = std::move(snapshot),
        .execution = info,
        .error = error
    });
}

// ── Timeouts ─────────────────────────────────

size_t ExecutionCoordinator::expire_overdue(Timestamp now) {
    std::vector<ActiveExecutionInfo> expired;
    for (auto it = active_.begin(); it != active_.end();) {
        if (it->second.info.deadline <= now) {
            it->second.stop.request_stop();
            expired.push_back(it->second.info);
            it = active_.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& info : expired) {
        stats_.failed_backups++;
        logger_.warn("Backup timeout: " + info.schedule_name + " (" + info.id + ")");

        std::optional<Schedule> snapshot;
        if (auto* schedule = store_.find(info.schedule_name)) {
            schedule->failure_count++;
            snapshot = *schedule;
        }

        events_.publish(SchedulerEvent{
            .kind = EventKind::BackupTimeout,
            .at = now,
            .schedule = std::move(snapshot),
            .execution = info,
            .error = Error{ErrorCode::ExecutionTimeout,
                           std::format("Backup {} exceeded its timeout", info.id)}
        });
    }

    if (!expired.empty()) store_.persist();
    return expired.size();
}

// ── Skips & schedule errors ──────────────────

void ExecutionCoordinator::record_skip(const ScheduleName& name, Timestamp now) {
    stats_.skipped_backups++;
    if (auto* schedule = store_.find(name)) {
        schedule->next_run = now + policy_.skip_delay;
        store_.persist();
    }
}

void ExecutionCoordinator::record_schedule_error(const ScheduleName& name, const Error& error,
                                                 Timestamp now) {
    auto* schedule = store_.find(name);
    if (!schedule) return;

    schedule->failure_count++;
    auto retry_from = now + policy_.error_backoff;
    auto next = compute_next_run(schedule->frequency, retry_from);
    schedule->next_run = next ? *next : retry_from;

    logger_.error("Schedule error for " + name + ": " + error.message);

    events_.publish(SchedulerEvent{
        .kind = EventKind::ScheduleError,
        .at = now,
        .schedule = *schedule,
        .error = error
    });

    store_.persist();
}

// ── Queries ──────────────────────────────────

void ExecutionCoordinator::cancel_all() {
    for (auto& [id, execution] : active_) {
        execution.stop.request_stop();
    }
}

void ExecutionCoordinator::mark_schedule_check(Timestamp now) {
    stats_.last_schedule_check = now;
}

void ExecutionCoordinator::refresh_next_scheduled() {
    stats_.next_scheduled_backup = store_.earliest_next_run();
}

std::vector<ActiveExecutionInfo> ExecutionCoordinator::active() const {
    std::vector<ActiveExecutionInfo> out;
    out.reserve(active_.size());
    for (const auto& [id, execution] : active_) {
        out.push_back(execution.info);
    }
    return out;
}

std::optional<Timestamp> ExecutionCoordinator::next_deadline() const {
    std::optional<Timestamp> earliest;
    for (const auto& [id, execution] : active_) {
        if (!earliest || execution.info.deadline < *earliest) earliest = execution.info.deadline;
    }
    return earliest;
}

}  // namespace backup_scheduler
