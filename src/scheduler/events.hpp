/**
 * @file events.hpp
 * @brief Scheduler lifecycle events and the queue that delivers them.
 * @author Dimitris Kafetzis
 *
 * Events are immutable records. publish() may be called from any thread;
 * dispatch() runs on the scheduler thread and invokes subscribers in
 * publication order.
 */

#pragma once

#include "backup/backup_unit.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "schedule/schedule.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace backup_scheduler {

// ─────────────────────────────────────────────
// Event Kinds
// ─────────────────────────────────────────────

enum class EventKind : uint8_t {
    Initialized,
    Started,
    Stopped,
    ScheduleAdded,
    ScheduleRemoved,
    ScheduleUpdated,
    ScheduleToggled,
    ScheduledBackupStarted,
    ScheduledBackupCompleted,
    ScheduledBackupFailed,
    BackupTimeout,
    ScheduleError,
    BackupStarted,      ///< Forwarded from the backup unit
    BackupCompleted,    ///< Forwarded from the backup unit
    BackupError,        ///< Forwarded from the backup unit
    Shutdown
};

[[nodiscard]] constexpr std::string_view to_string(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::Initialized:              return "initialized";
        case EventKind::Started:                  return "started";
        case EventKind::Stopped:                  return "stopped";
        case EventKind::ScheduleAdded:            return "scheduleAdded";
        case EventKind::ScheduleRemoved:          return "scheduleRemoved";
        case EventKind::ScheduleUpdated:          return "scheduleUpdated";
        case EventKind::ScheduleToggled:          return "scheduleToggled";
        case EventKind::ScheduledBackupStarted:   return "scheduledBackupStarted";
        case EventKind::ScheduledBackupCompleted: return "scheduledBackupCompleted";
        case EventKind::ScheduledBackupFailed:    return "scheduledBackupFailed";
        case EventKind::BackupTimeout:            return "backupTimeout";
        case EventKind::ScheduleError:            return "scheduleError";
        case EventKind::BackupStarted:            return "backupStarted";
        case EventKind::BackupCompleted:          return "backupCompleted";
        case EventKind::BackupError:              return "backupError";
        case EventKind::Shutdown:                 return "shutdown";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Event Payloads
// ─────────────────────────────────────────────

/**
 * @brief Public view of one in-flight execution.
 */
struct ActiveExecutionInfo {
    ExecutionId id;
    ScheduleName schedule_name;
    BackupType type{BackupType::Incremental};
    Timestamp started_at{};
    Timestamp deadline{};
    bool manual{false};           ///< Started by trigger_backup()
};

/**
 * @brief One lifecycle notification. Only the fields relevant to
 *        @ref kind are set.
 */
struct SchedulerEvent {
    EventKind kind{EventKind::Initialized};
    Timestamp at{};
    std::optional<Schedule> schedule;              ///< Snapshot after the transition
    std::optional<ActiveExecutionInfo> execution;
    std::optional<BackupResult> result;
    std::optional<Millis> execution_time;
    std::optional<Error> error;
    std::optional<BackupUnitEvent> unit_event;
};

// ─────────────────────────────────────────────
// EventBus
// ─────────────────────────────────────────────

class EventBus {
public:
    using Listener = std::function<void(const SchedulerEvent&)>;
    using SubscriptionId = uint64_t;

    explicit EventBus(Logger& logger);

    SubscriptionId subscribe(Listener listener);
    bool unsubscribe(SubscriptionId id);

    /// Queue an event for the next dispatch(). Thread-safe.
    void publish(SchedulerEvent event);

    /**
     * @brief Deliver every queued event to every subscriber.
     *
     * A listener that throws is logged and does not stop delivery.
     * @return Number of events delivered.
     */
    size_t dispatch();

    [[nodiscard]] size_t pending() const;

private:
    struct Subscription {
        SubscriptionId id;
        Listener listener;
    };

    Logger& logger_;
    mutable std::mutex mutex_;
    std::deque<SchedulerEvent> queue_;
    std::vector<Subscription> subscribers_;
    SubscriptionId next_id_{1};
};

}  // namespace backup_scheduler
