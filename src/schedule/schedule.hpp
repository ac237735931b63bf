/**
 * @file schedule.hpp
 * @brief Schedule records and the specs used to create and update them.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace backup_scheduler {

// ─────────────────────────────────────────────
// Conditions
// ─────────────────────────────────────────────

/**
 * @brief Inclusive local-hour range [start_hour, end_hour].
 */
struct TimeWindow {
    int start_hour{0};
    int end_hour{23};

    [[nodiscard]] constexpr bool contains(int hour) const noexcept {
        return hour >= start_hour && hour <= end_hour;
    }

    bool operator==(const TimeWindow&) const = default;
};

/**
 * @brief Optional per-schedule gating rules evaluated at admission.
 */
struct ScheduleConditions {
    std::optional<uint64_t> min_free_space_bytes;
    std::optional<double> max_load_average;
    std::optional<TimeWindow> time_window;

    [[nodiscard]] bool empty() const noexcept {
        return !min_free_space_bytes && !max_load_average && !time_window;
    }

    bool operator==(const ScheduleConditions&) const = default;
};

// ─────────────────────────────────────────────
// Schedule
// ─────────────────────────────────────────────

/**
 * @brief One named backup policy, owned by the ScheduleStore.
 */
struct Schedule {
    ScheduleName name;
    bool enabled{true};
    BackupType type{BackupType::Incremental};
    std::string frequency;
    int priority{5};                           ///< Lower value runs first
    uint32_t retry_count{1};                   ///< Remaining retry budget
    Millis timeout{10 * 60 * 1000};
    ScheduleConditions conditions;
    std::vector<std::string> targets{"all"};

    std::optional<Timestamp> last_run;
    std::optional<Timestamp> next_run;

    uint64_t run_count{0};
    uint64_t success_count{0};
    uint64_t failure_count{0};

    Timestamp created_at{};
    Timestamp updated_at{};

    [[nodiscard]] bool is_due(Timestamp now) const noexcept {
        return enabled && next_run.has_value() && *next_run <= now;
    }

    bool operator==(const Schedule&) const = default;
};

/**
 * @brief Fields accepted when creating a schedule; unset fields take defaults.
 */
struct ScheduleSpec {
    std::string frequency;
    std::optional<bool> enabled;
    std::optional<BackupType> type;
    std::optional<int> priority;
    std::optional<uint32_t> retry_count;
    std::optional<Millis> timeout;
    std::optional<ScheduleConditions> conditions;
    std::optional<std::vector<std::string>> targets;
};

/**
 * @brief Partial update; only set fields are applied.
 */
struct ScheduleUpdate {
    std::optional<std::string> frequency;
    std::optional<bool> enabled;
    std::optional<BackupType> type;
    std::optional<int> priority;
    std::optional<uint32_t> retry_count;
    std::optional<Millis> timeout;
    std::optional<ScheduleConditions> conditions;
    std::optional<std::vector<std::string>> targets;
};

/**
 * @brief Field checks shared by creation, updates and decoding.
 *
 * Rejects an empty name, a negative priority, a non-positive timeout, a time
 * window outside 0..23 or with start after end, and a non-positive load ceiling.
 */
Result<void> validate_schedule(const Schedule& schedule);

/**
 * @brief Build a new schedule with its first next_run computed from @p now.
 */
Result<Schedule> make_schedule(const ScheduleName& name, const ScheduleSpec& spec, Timestamp now);

/**
 * @brief Apply @p update to a copy of @p schedule.
 *
 * next_run is recomputed only when the frequency is part of the update.
 * On error the original schedule is left untouched by the caller.
 */
Result<Schedule> apply_update(Schedule schedule, const ScheduleUpdate& update, Timestamp now);

/**
 * @brief Instantiate a configured strategy preset.
 */
ScheduleSpec spec_from_strategy(const StrategyConfig& strategy);

/**
 * @brief The three schedules created when no usable schedule file exists.
 */
std::vector<std::pair<ScheduleName, ScheduleSpec>> bootstrap_schedules();

}  // namespace backup_scheduler
