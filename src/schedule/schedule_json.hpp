/**
 * @file schedule_json.hpp
 * @brief jsoncpp mapping for schedule records in the schedule file.
 * @author Dimitris Kafetzis
 *
 * Record layout (timestamps are epoch milliseconds or null):
 *   { "name", "enabled", "type", "frequency", "priority", "retryCount",
 *     "timeout", "conditions": { "minFreeSpace", "maxLoadAverage",
 *     "timeWindow": { "start", "end" } }, "targets", "lastRun", "nextRun",
 *     "runCount", "successCount", "failureCount", "createdAt", "updatedAt" }
 */

#pragma once

#include "core/result.hpp"
#include "schedule/schedule.hpp"

#include <json/json.h>

#include <string_view>

namespace backup_scheduler {

Json::Value to_json(const Schedule& schedule);

/**
 * @brief Decode one record. Missing fields take the schedule defaults;
 *        fields of the wrong JSON type are a PersistenceError.
 */
Result<Schedule> schedule_from_json(const ScheduleName& name, const Json::Value& record);

/**
 * @brief True for keys this version reads and writes itself.
 */
[[nodiscard]] bool is_known_schedule_key(std::string_view key) noexcept;

}  // namespace backup_scheduler
