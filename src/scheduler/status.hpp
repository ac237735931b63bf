/**
 * @file status.hpp
 * @brief Aggregate scheduler status and its JSON rendering.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "scheduler/admission.hpp"
#include "scheduler/events.hpp"
#include "scheduler/execution_coordinator.hpp"
#include "schedule/schedule.hpp"

#include <json/json.h>

#include <vector>

namespace backup_scheduler {

struct SchedulerStatus {
    bool running{false};
    size_t active_backups{0};
    size_t total_schedules{0};
    size_t enabled_schedules{0};
    SchedulerStats stats;
    std::vector<Schedule> schedules;
    std::vector<ActiveExecutionInfo> active_executions;
    ResourceLimits resource_limits;
};

Json::Value to_json(const SchedulerStats& stats);
Json::Value to_json(const ActiveExecutionInfo& execution);

/**
 * @brief Render @p status; each schedule gains an ISO-8601 "nextRunFormatted".
 */
Json::Value to_json(const SchedulerStatus& status);

}  // namespace backup_scheduler
