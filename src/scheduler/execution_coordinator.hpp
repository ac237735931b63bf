/**
 * @file execution_coordinator.hpp
 * @brief In-flight execution tracking, retry and timeout policy.
 * @author Dimitris Kafetzis
 *
 * Execution state machine:
 *
 *   Due ──admit──▶ Running ──┬─ success ──▶ Completed
 *                            ├─ error ────▶ Failed   (retry if budget remains)
 *                            └─ deadline ─▶ TimedOut (stop requested, no retry)
 *
 * Lives on the scheduler thread. Backup work itself is handed to a
 * Launcher, which runs it elsewhere and later reports back via complete().
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "scheduler/events.hpp"
#include "schedule/schedule_store.hpp"

#include <functional>
#include <map>
#include <optional>
#include <stop_token>
#include <vector>

namespace backup_scheduler {

/**
 * @brief Process-lifetime counters, zero at startup.
 */
struct SchedulerStats {
    uint64_t scheduled_backups{0};
    uint64_t completed_backups{0};
    uint64_t failed_backups{0};
    uint64_t skipped_backups{0};
    Millis total_execution_time{0};
    Millis average_execution_time{0};
    std::optional<Timestamp> last_schedule_check;
    std::optional<Timestamp> next_scheduled_backup;
};

/**
 * @brief Delays applied after an unsuccessful attempt.
 */
struct RetryPolicy {
    Millis retry_delay{5 * 60 * 1000};      ///< After a failure with budget left
    Millis skip_delay{5 * 60 * 1000};       ///< After admission is denied
    Millis error_backoff{10 * 60 * 1000};   ///< After a schedule error

    static RetryPolicy from_config(const SchedulerConfig& config);
};

class ExecutionCoordinator {
public:
    /// Starts the backup for @p execution off-thread. May throw if the
    /// executor refuses work.
    using Launcher = std::function<void(const ActiveExecutionInfo& execution, std::stop_token stop)>;

    ExecutionCoordinator(ScheduleStore& store, EventBus& events, Logger& logger, RetryPolicy policy);

    /**
     * @brief Record the attempt on the schedule and launch it.
     *
     * Sets lastRun, bumps runCount, moves nextRun to the following cycle,
     * registers the execution with its deadline and persists.
     *
     * @param type_override Run this type instead of the schedule's own.
     * @param manual        True for trigger_backup(); only affects reporting.
     */
    Result<ActiveExecutionInfo> start(const ScheduleName& name,
                                      std::optional<BackupType> type_override,
                                      bool manual,
                                      Timestamp now,
                                      const Launcher& launch);

    /**
     * @brief Apply a backup outcome. Unknown ids (already timed out) are ignored.
     * @return false if @p id was not active.
     */
    bool complete(const ExecutionId& id, const Result<BackupResult>& outcome, Timestamp now);

    /**
     * @brief Time out every execution whose deadline is at or before @p now.
     * @return Number of executions expired.
     */
    size_t expire_overdue(Timestamp now);

    /// Admission denied: count a skip and re-check after the skip delay.
    void record_skip(const ScheduleName& name, Timestamp now);

    /// Starting the schedule failed outright: back off and report.
    void record_schedule_error(const ScheduleName& name, const Error& error, Timestamp now);

    /// Request stop on every active execution without removing it.
    void cancel_all();

    void mark_schedule_check(Timestamp now);
    void refresh_next_scheduled();

    [[nodiscard]] size_t active_count() const noexcept { return active_.size(); }
    [[nodiscard]] std::vector<ActiveExecutionInfo> active() const;
    [[nodiscard]] std::optional<Timestamp> next_deadline() const;
    [[nodiscard]] const SchedulerStats& stats() const noexcept { return stats_; }

private:
    struct ActiveExecution {
        ActiveExecutionInfo info;
        std::stop_source stop;
    };

    void on_success(const ActiveExecutionInfo& info, const BackupResult& result, Timestamp now);
    void on_failure(const ActiveExecutionInfo& info, const Error& error, Timestamp now);

    ScheduleStore& store_;
    EventBus& events_;
    Logger& logger_;
    RetryPolicy policy_;

    std::map<ExecutionId, ActiveExecution> active_;
    uint64_t sequence_{0};
    SchedulerStats stats_;
};

}  // namespace backup_scheduler
