/**
 * @file schedule.cpp
 * @brief Schedule construction, partial updates, and bootstrap defaults.
 * @author Dimitris Kafetzis
 */

#include "schedule/schedule.hpp"
#include "schedule/frequency.hpp"

namespace backup_scheduler {

namespace {

constexpr uint64_t kMiB = 1024ULL * 1024;
constexpr uint64_t kGiB = 1024 * kMiB;
constexpr Millis kMinute{60 * 1000};

Result<void> validate(const ScheduleName& name, int priority, Millis timeout,
                      const ScheduleConditions& conditions) {
    if (name.empty()) {
        return Error{ErrorCode::InvalidArgument, "Schedule name must not be empty"};
    }
    if (priority < 0) {
        return Error{ErrorCode::InvalidArgument,
                     "Schedule '" + name + "': priority must be non-negative"};
    }
    if (timeout.count() <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     "Schedule '" + name + "': timeout must be positive"};
    }
    if (const auto& window = conditions.time_window) {
        if (window->start_hour < 0 || window->end_hour > 23
            || window->start_hour > window->end_hour) {
            return Error{ErrorCode::InvalidArgument,
                         "Schedule '" + name + "': time window must satisfy 0 <= start <= end <= 23"};
        }
    }
    if (conditions.max_load_average && *conditions.max_load_average <= 0.0) {
        return Error{ErrorCode::InvalidArgument,
                     "Schedule '" + name + "': maxLoadAverage must be positive"};
    }
    return {};
}

}  // namespace

Result<void> validate_schedule(const Schedule& schedule) {
    return validate(schedule.name, schedule.priority, schedule.timeout, schedule.conditions);
}

Result<Schedule> make_schedule(const ScheduleName& name, const ScheduleSpec& spec, Timestamp now) {
    auto next = compute_next_run(spec.frequency, now);
    if (!next) return next.error();

    Schedule schedule;
    schedule.name = name;
    schedule.frequency = spec.frequency;
    schedule.enabled = spec.enabled.value_or(true);
    schedule.type = spec.type.value_or(BackupType::Incremental);
    schedule.priority = spec.priority.value_or(5);
    schedule.retry_count = spec.retry_count.value_or(1);
    schedule.timeout = spec.timeout.value_or(10 * kMinute);
    schedule.conditions = spec.conditions.value_or(ScheduleConditions{});
    schedule.targets = spec.targets.value_or(std::vector<std::string>{"all"});
    schedule.next_run = *next;
    schedule.created_at = now;
    schedule.updated_at = now;

    auto valid = validate(name, schedule.priority, schedule.timeout, schedule.conditions);
    if (!valid) return valid.error();
    return schedule;
}

Result<Schedule> apply_update(Schedule schedule, const ScheduleUpdate& update, Timestamp now) {
    if (update.frequency) {
        auto next = compute_next_run(*update.frequency, now);
        if (!next) return next.error();
        schedule.frequency = *update.frequency;
        schedule.next_run = *next;
    }
    if (update.enabled) schedule.enabled = *update.enabled;
    if (update.type) schedule.type = *update.type;
    if (update.priority) schedule.priority = *update.priority;
    if (update.retry_count) schedule.retry_count = *update.retry_count;
    if (update.timeout) schedule.timeout = *update.timeout;
    if (update.conditions) schedule.conditions = *update.conditions;
    if (update.targets) schedule.targets = *update.targets;
    schedule.updated_at = now;

    auto valid = validate(schedule.name, schedule.priority, schedule.timeout, schedule.conditions);
    if (!valid) return valid.error();
    return schedule;
}

ScheduleSpec spec_from_strategy(const StrategyConfig& strategy) {
    return ScheduleSpec{
        .frequency = strategy.frequency,
        .type = strategy.type,
        .priority = strategy.priority,
        .retry_count = strategy.retry_count,
        .timeout = Millis{strategy.timeout_ms}
    };
}

std::vector<std::pair<ScheduleName, ScheduleSpec>> bootstrap_schedules() {
    return {
        {"critical-backup", ScheduleSpec{
            .frequency = "0 */6 * * *",
            .type = BackupType::Full,
            .priority = 1,
            .retry_count = 3,
            .timeout = 30 * kMinute,
            .conditions = ScheduleConditions{
                .min_free_space_bytes = 1 * kGiB,
                .time_window = TimeWindow{0, 23}}}},
        {"incremental-backup", ScheduleSpec{
            .frequency = "0 */2 * * *",
            .type = BackupType::Incremental,
            .priority = 2,
            .retry_count = 2,
            .timeout = 15 * kMinute,
            .conditions = ScheduleConditions{
                .min_free_space_bytes = 512 * kMiB}}},
        {"daily-full-backup", ScheduleSpec{
            .frequency = "0 2 * * *",
            .type = BackupType::Full,
            .priority = 1,
            .retry_count = 2,
            .timeout = 60 * kMinute,
            .conditions = ScheduleConditions{
                .min_free_space_bytes = 2 * kGiB,
                .time_window = TimeWindow{1, 5}}}},
    };
}

}  // namespace backup_scheduler
