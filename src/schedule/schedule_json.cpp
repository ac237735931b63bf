/**
 * @file schedule_json.cpp
 * @brief Schedule <-> Json::Value conversion.
 * @author Dimitris Kafetzis
 */

#include "schedule/schedule_json.hpp"

#include <array>

namespace backup_scheduler {

namespace {

constexpr std::array<std::string_view, 17> kKnownKeys{
    "name", "enabled", "type", "frequency", "priority", "retryCount", "timeout",
    "conditions", "targets", "lastRun", "nextRun", "runCount", "successCount",
    "failureCount", "createdAt", "updatedAt", "nextRunFormatted"
};

Json::Value optional_timestamp(const std::optional<Timestamp>& ts) {
    if (!ts) return Json::Value{Json::nullValue};
    return Json::Value{static_cast<Json::Int64>(to_epoch_ms(*ts))};
}

Error bad_field(const ScheduleName& name, std::string_view field, std::string_view expected) {
    return Error{ErrorCode::PersistenceError,
                 "Schedule '" + name + "': field '" + std::string{field}
                 + "' must be " + std::string{expected}};
}

/// Reads record[key] into out when present; returns false on a type mismatch.
bool read_int64(const Json::Value& record, const char* key, int64_t& out) {
    const auto& v = record[key];
    if (v.isNull()) return true;
    if (!v.isInt64()) return false;
    out = v.asInt64();
    return true;
}

bool read_uint64(const Json::Value& record, const char* key, uint64_t& out) {
    const auto& v = record[key];
    if (v.isNull()) return true;
    if (!v.isUInt64()) return false;
    out = v.asUInt64();
    return true;
}

bool read_timestamp(const Json::Value& record, const char* key, std::optional<Timestamp>& out) {
    const auto& v = record[key];
    if (v.isNull()) {
        out.reset();
        return true;
    }
    if (!v.isInt64()) return false;
    out = from_epoch_ms(v.asInt64());
    return true;
}

Result<ScheduleConditions> conditions_from_json(const ScheduleName& name, const Json::Value& node) {
    ScheduleConditions conditions;
    if (node.isNull()) return conditions;
    if (!node.isObject()) return bad_field(name, "conditions", "an object");

    if (const auto& v = node["minFreeSpace"]; !v.isNull()) {
        if (!v.isUInt64()) return bad_field(name, "conditions.minFreeSpace", "a non-negative integer");
        conditions.min_free_space_bytes = v.asUInt64();
    }
    if (const auto& v = node["maxLoadAverage"]; !v.isNull()) {
        if (!v.isNumeric()) return bad_field(name, "conditions.maxLoadAverage", "a number");
        conditions.max_load_average = v.asDouble();
    }
    if (const auto& v = node["timeWindow"]; !v.isNull()) {
        if (!v.isObject() || !v["start"].isInt() || !v["end"].isInt()) {
            return bad_field(name, "conditions.timeWindow", "an object with integer start and end");
        }
        conditions.time_window = TimeWindow{v["start"].asInt(), v["end"].asInt()};
    }
    return conditions;
}

}  // namespace

bool is_known_schedule_key(std::string_view key) noexcept {
    for (auto known : kKnownKeys) {
        if (known == key) return true;
    }
    return false;
}

Json::Value to_json(const Schedule& schedule) {
    Json::Value record{Json::objectValue};
    record["name"] = schedule.name;
    record["enabled"] = schedule.enabled;
    record["type"] = std::string{to_string(schedule.type)};
    record["frequency"] = schedule.frequency;
    record["priority"] = schedule.priority;
    record["retryCount"] = static_cast<Json::UInt>(schedule.retry_count);
    record["timeout"] = static_cast<Json::Int64>(schedule.timeout.count());

    Json::Value conditions{Json::objectValue};
    if (schedule.conditions.min_free_space_bytes) {
        conditions["minFreeSpace"] =
            static_cast<Json::UInt64>(*schedule.conditions.min_free_space_bytes);
    }
    if (schedule.conditions.max_load_average) {
        conditions["maxLoadAverage"] = *schedule.conditions.max_load_average;
    }
    if (schedule.conditions.time_window) {
        Json::Value window{Json::objectValue};
        window["start"] = schedule.conditions.time_window->start_hour;
        window["end"] = schedule.conditions.time_window->end_hour;
        conditions["timeWindow"] = window;
    }
    record["conditions"] = conditions;

    Json::Value targets{Json::arrayValue};
    for (const auto& target : schedule.targets) {
        targets.append(target);
    }
    record["targets"] = targets;

    record["lastRun"] = optional_timestamp(schedule.last_run);
    record["nextRun"] = optional_timestamp(schedule.next_run);
    record["runCount"] = static_cast<Json::UInt64>(schedule.run_count);
    record["successCount"] = static_cast<Json::UInt64>(schedule.success_count);
    record["failureCount"] = static_cast<Json::UInt64>(schedule.failure_count);
    record["createdAt"] = static_cast<Json::Int64>(to_epoch_ms(schedule.created_at));
    record["updatedAt"] = static_cast<Json::Int64>(to_epoch_ms(schedule.updated_at));
    return record;
}

Result<Schedule> schedule_from_json(const ScheduleName& name, const Json::Value& record) {
    if (!record.isObject()) {
        return Error{ErrorCode::PersistenceError, "Schedule '" + name + "' is not an object"};
    }

    Schedule schedule;
    schedule.name = name;

    if (const auto& v = record["enabled"]; !v.isNull()) {
        if (!v.isBool()) return bad_field(name, "enabled", "a boolean");
        schedule.enabled = v.asBool();
    }
    if (const auto& v = record["type"]; !v.isNull()) {
        auto type = v.isString() ? parse_backup_type(v.asString()) : std::nullopt;
        if (!type) return bad_field(name, "type", "\"full\" or \"incremental\"");
        schedule.type = *type;
    }

    const auto& frequency = record["frequency"];
    if (!frequency.isString()) return bad_field(name, "frequency", "a string");
    schedule.frequency = frequency.asString();

    if (const auto& v = record["priority"]; !v.isNull()) {
        if (!v.isInt()) return bad_field(name, "priority", "an integer");
        schedule.priority = v.asInt();
    }
    if (const auto& v = record["retryCount"]; !v.isNull()) {
        if (!v.isUInt()) return bad_field(name, "retryCount", "a non-negative integer");
        schedule.retry_count = v.asUInt();
    }

    int64_t timeout_ms = schedule.timeout.count();
    if (!read_int64(record, "timeout", timeout_ms)) {
        return bad_field(name, "timeout", "an integer number of milliseconds");
    }
    schedule.timeout = Millis{timeout_ms};

    auto conditions = conditions_from_json(name, record["conditions"]);
    if (!conditions) return conditions.error();
    schedule.conditions = *conditions;

    if (const auto& v = record["targets"]; !v.isNull()) {
        if (!v.isArray()) return bad_field(name, "targets", "an array of strings");
        schedule.targets.clear();
        for (const auto& target : v) {
            if (!target.isString()) return bad_field(name, "targets", "an array of strings");
            schedule.targets.push_back(target.asString());
        }
    }

    if (!read_timestamp(record, "lastRun", schedule.last_run)) {
        return bad_field(name, "lastRun", "an epoch-millisecond integer or null");
    }
    if (!read_timestamp(record, "nextRun", schedule.next_run)) {
        return bad_field(name, "nextRun", "an epoch-millisecond integer or null");
    }
    if (!read_uint64(record, "runCount", schedule.run_count)
        || !read_uint64(record, "successCount", schedule.success_count)
        || !read_uint64(record, "failureCount", schedule.failure_count)) {
        return Error{ErrorCode::PersistenceError,
                     "Schedule '" + name + "': counters must be non-negative integers"};
    }

    int64_t created_ms = 0;
    int64_t updated_ms = 0;
    if (!read_int64(record, "createdAt", created_ms) || !read_int64(record, "updatedAt", updated_ms)) {
        return Error{ErrorCode::PersistenceError,
                     "Schedule '" + name + "': createdAt/updatedAt must be epoch-millisecond integers"};
    }
    schedule.created_at = from_epoch_ms(created_ms);
    schedule.updated_at = from_epoch_ms(updated_ms);

    if (auto valid = validate_schedule(schedule); !valid) {
        return Error{ErrorCode::PersistenceError, valid.error().message};
    }
    return schedule;
}

}  // namespace backup_scheduler
