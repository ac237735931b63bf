/**
 * @file schedule_store.hpp
 * @brief Durable name -> Schedule mapping backed by a JSON file.
 * @author Dimitris Kafetzis
 *
 * The store is owned by the scheduler thread and is not internally
 * synchronized. put() and remove() only touch memory; callers persist
 * once a mutation is complete.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "schedule/schedule.hpp"

#include <json/json.h>

#include <filesystem>
#include <map>
#include <optional>
#include <vector>

namespace backup_scheduler {

class ScheduleStore {
public:
    enum class LoadOutcome : uint8_t {
        Loaded,        ///< Records read from the schedule file
        Bootstrapped   ///< File missing or unparsable; defaults created and saved
    };

    ScheduleStore(std::filesystem::path path, Logger& logger);

    // Non-copyable
    ScheduleStore(const ScheduleStore&) = delete;
    ScheduleStore& operator=(const ScheduleStore&) = delete;

    /**
     * @brief Replace the in-memory contents with the file's records.
     *
     * A record that cannot be decoded is logged and kept verbatim so the
     * next save() does not drop it.
     */
    LoadOutcome load(Timestamp now);

    /**
     * @brief Write the full snapshot (temp file + rename).
     */
    Result<void> save();

    /**
     * @brief save(), logging a failure at warn instead of returning it.
     * @return false if the snapshot could not be written.
     */
    bool persist();

    [[nodiscard]] std::optional<Schedule> get(const ScheduleName& name) const;
    [[nodiscard]] const Schedule* find(const ScheduleName& name) const;
    [[nodiscard]] Schedule* find(const ScheduleName& name);
    [[nodiscard]] bool contains(const ScheduleName& name) const;

    void put(Schedule schedule);
    bool remove(const ScheduleName& name);

    [[nodiscard]] std::vector<Schedule> all() const;
    [[nodiscard]] size_t size() const noexcept { return schedules_.size(); }
    [[nodiscard]] size_t enabled_count() const;

    /**
     * @brief Names of due schedules, ascending by priority.
     *
     * Ties keep name order.
     */
    [[nodiscard]] std::vector<ScheduleName> due(Timestamp now) const;

    /// Minimum next_run over enabled schedules.
    [[nodiscard]] std::optional<Timestamp> earliest_next_run() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    void bootstrap(Timestamp now);

    std::filesystem::path path_;
    Logger& logger_;
    std::map<ScheduleName, Schedule> schedules_;
    std::map<ScheduleName, Json::Value> unknown_fields_;   ///< Per-record keys we do not model
    std::map<ScheduleName, Json::Value> undecodable_;      ///< Raw records that failed to decode
};

}  // namespace backup_scheduler
