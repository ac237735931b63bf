/**
 * @file status.cpp
 * @brief Status JSON rendering.
 * @author Dimitris Kafetzis
 */

#include "scheduler/status.hpp"
#include "schedule/schedule_json.hpp"

namespace backup_scheduler {

namespace {

Json::Value optional_ms(const std::optional<Timestamp>& ts) {
    if (!ts) return Json::Value{Json::nullValue};
    return Json::Value{static_cast<Json::Int64>(to_epoch_ms(*ts))};
}

}  // namespace

Json::Value to_json(const SchedulerStats& stats) {
    Json::Value out{Json::objectValue};
    out["scheduledBackups"] = static_cast<Json::UInt64>(stats.scheduled_backups);
    out["completedBackups"] = static_cast<Json::UInt64>(stats.completed_backups);
    out["failedBackups"] = static_cast<Json::UInt64>(stats.failed_backups);
    out["skippedBackups"] = static_cast<Json::UInt64>(stats.skipped_backups);
    out["totalExecutionTime"] = static_cast<Json::Int64>(stats.total_execution_time.count());
    out["averageExecutionTime"] = static_cast<Json::Int64>(stats.average_execution_time.count());
    out["lastScheduleCheck"] = optional_ms(stats.last_schedule_check);
    out["nextScheduledBackup"] = optional_ms(stats.next_scheduled_backup);
    return out;
}

Json::Value to_json(const ActiveExecutionInfo& execution) {
    Json::Value out{Json::objectValue};
    out["id"] = execution.id;
    out["scheduleName"] = execution.schedule_name;
    out["type"] = std::string{to_string(execution.type)};
    out["startTime"] = static_cast<Json::Int64>(to_epoch_ms(execution.started_at));
    out["deadline"] = static_cast<Json::Int64>(to_epoch_ms(execution.deadline));
    out["manual"] = execution.manual;
    return out;
}

Json::Value to_json(const SchedulerStatus& status) {
    Json::Value out{Json::objectValue};
    out["isRunning"] = status.running;
    out["activeBackups"] = static_cast<Json::UInt64>(status.active_backups);
    out["totalSchedules"] = static_cast<Json::UInt64>(status.total_schedules);
    out["enabledSchedules"] = static_cast<Json::UInt64>(status.enabled_schedules);
    out["stats"] = to_json(status.stats);

    Json::Value schedules{Json::arrayValue};
    for (const auto& schedule : status.schedules) {
        auto record = to_json(schedule);
        record["nextRunFormatted"] = schedule.next_run
            ? Json::Value{format_iso8601(*schedule.next_run)}
            : Json::Value{Json::nullValue};
        schedules.append(record);
    }
    out["schedules"] = schedules;

    Json::Value active{Json::arrayValue};
    for (const auto& execution : status.active_executions) {
        active.append(to_json(execution));
    }
    out["activeExecutions"] = active;

    Json::Value limits{Json::objectValue};
    limits["maxConcurrentBackups"] = status.resource_limits.max_concurrent_backups;
    limits["monitorResources"] = status.resource_limits.monitor_resources;
    limits["maxCpuUsage"] = status.resource_limits.max_cpu_usage;
    limits["maxMemoryUsage"] = status.resource_limits.max_memory_usage;
    limits["maxDiskUsage"] = status.resource_limits.max_disk_usage;
    out["resourceLimits"] = limits;
    return out;
}

}  // namespace backup_scheduler
