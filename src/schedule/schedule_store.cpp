/**
 * @file schedule_store.cpp
 * @brief ScheduleStore implementation using jsoncpp.
 * @author Dimitris Kafetzis
 */

#include "schedule/schedule_store.hpp"
#include "schedule/schedule_json.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace backup_scheduler {

ScheduleStore::ScheduleStore(std::filesystem::path path, Logger& logger)
    : path_(std::move(path)), logger_(logger) {}

ScheduleStore::LoadOutcome ScheduleStore::load(Timestamp now) {
    schedules_.clear();
    unknown_fields_.clear();
    undecodable_.clear();

    std::ifstream in(path_);
    if (!in) {
        logger_.info("No schedule file at " + path_.string() + ", creating default schedules");
        bootstrap(now);
        return LoadOutcome::Bootstrapped;
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors) || !root.isObject()) {
        logger_.warn("Schedule file " + path_.string() + " is unreadable ("
                     + (errors.empty() ? std::string{"root is not an object"} : errors)
                     + "), falling back to default schedules");
        bootstrap(now);
        return LoadOutcome::Bootstrapped;
    }

    for (const auto& name : root.getMemberNames()) {
        const auto& record = root[name];
        auto schedule = schedule_from_json(name, record);
        if (!schedule) {
            logger_.warn("Skipping schedule record: " + schedule.error().message);
            undecodable_[name] = record;
            continue;
        }

        Json::Value extra{Json::objectValue};
        for (const auto& key : record.getMemberNames()) {
            if (!is_known_schedule_key(key)) extra[key] = record[key];
        }
        if (!extra.empty()) unknown_fields_[name] = std::move(extra);

        schedules_.emplace(name, std::move(*schedule));
    }

    logger_.info("Loaded " + std::to_string(schedules_.size()) + " schedules from "
                 + path_.string());
    return LoadOutcome::Loaded;
}

void ScheduleStore::bootstrap(Timestamp now) {
    for (const auto& [name, spec] : bootstrap_schedules()) {
        auto schedule = make_schedule(name, spec, now);
        if (!schedule) {
            logger_.error("Default schedule '" + name + "' is invalid: "
                          + schedule.error().message);
            continue;
        }
        schedules_.emplace(name, std::move(*schedule));
    }
    persist();
}

bool ScheduleStore::persist() {
    auto saved = save();
    if (!saved) {
        logger_.warn("Failed to save schedules: " + saved.error().message);
        return false;
    }
    return true;
}

Result<void> ScheduleStore::save() {
    Json::Value root{Json::objectValue};
    for (const auto& [name, schedule] : schedules_) {
        auto record = to_json(schedule);
        if (auto it = unknown_fields_.find(name); it != unknown_fields_.end()) {
            for (const auto& key : it->second.getMemberNames()) {
                if (!record.isMember(key)) record[key] = it->second[key];
            }
        }
        root[name] = std::move(record);
    }
    for (const auto& [name, raw] : undecodable_) {
        if (!root.isMember(name)) root[name] = raw;
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";

    auto tmp_path = path_;
    tmp_path += ".tmp";

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::PersistenceError, "Cannot open " + tmp_path.string()};
        }
        out << Json::writeString(writer, root) << '\n';
        out.flush();
        if (!out) {
            return Error{ErrorCode::PersistenceError, "Write failed: " + tmp_path.string()};
        }
    }

    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        auto message = "Rename to " + path_.string() + " failed: " + ec.message();
        std::filesystem::remove(tmp_path, ec);
        return Error{ErrorCode::PersistenceError, message};
    }

    logger_.debug("Saved " + std::to_string(schedules_.size()) + " schedules");
    return {};
}

std::optional<Schedule> ScheduleStore::get(const ScheduleName& name) const {
    if (auto* schedule = find(name)) return *schedule;
    return std::nullopt;
}

const Schedule* ScheduleStore::find(const ScheduleName& name) const {
    auto it = schedules_.find(name);
    return it == schedules_.end() ? nullptr : &it->second;
}

Schedule* ScheduleStore::find(const ScheduleName& name) {
    auto it = schedules_.find(name);
    return it == schedules_.end() ? nullptr : &it->second;
}

bool ScheduleStore::contains(const ScheduleName& name) const {
    return schedules_.contains(name);
}

void ScheduleStore::put(Schedule schedule) {
    auto name = schedule.name;
    undecodable_.erase(name);
    schedules_.insert_or_assign(std::move(name), std::move(schedule));
}

bool ScheduleStore::remove(const ScheduleName& name) {
    unknown_fields_.erase(name);
    undecodable_.erase(name);
    return schedules_.erase(name) > 0;
}

std::vector<Schedule> ScheduleStore::all() const {
    std::vector<Schedule> out;
    out.reserve(schedules_.size());
    for (const auto& [name, schedule] : schedules_) {
        out.push_back(schedule);
    }
    return out;
}

size_t ScheduleStore::enabled_count() const {
    return static_cast<size_t>(std::count_if(schedules_.begin(), schedules_.end(),
        [](const auto& entry) { return entry.second.enabled; }));
}

std::vector<ScheduleName> ScheduleStore::due(Timestamp now) const {
    std::vector<const Schedule*> due_schedules;
    for (const auto& [name, schedule] : schedules_) {
        if (schedule.is_due(now)) due_schedules.push_back(&schedule);
    }

    std::stable_sort(due_schedules.begin(), due_schedules.end(),
        [](const Schedule* a, const Schedule* b) { return a->priority < b->priority; });

    std::vector<ScheduleName> names;
    names.reserve(due_schedules.size());
    for (const auto* schedule : due_schedules) {
        names.push_back(schedule->name);
    }
    return names;
}

std::optional<Timestamp> ScheduleStore::earliest_next_run() const {
    std::optional<Timestamp> earliest;
    for (const auto& [name, schedule] : schedules_) {
        if (!schedule.enabled || !schedule.next_run) continue;
        if (!earliest || *schedule.next_run < *earliest) earliest = schedule.next_run;
    }
    return earliest;
}

}  // namespace backup_scheduler
