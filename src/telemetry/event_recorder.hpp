/**
 * @file event_recorder.hpp
 * @brief Structured scheduler-event telemetry as NDJSON.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "scheduler/events.hpp"

#include <json/json.h>

#include <memory>
#include <mutex>
#include <optional>

namespace backup_scheduler {

/**
 * @brief Subscribes to an EventBus and writes one NDJSON record per event.
 *
 * Record shape: {"event":"<kind>","ts":"<ISO-8601>", ...payload}
 */
class EventRecorder {
public:
    explicit EventRecorder(std::unique_ptr<ILogSink> sink);
    ~EventRecorder();

    EventRecorder(const EventRecorder&) = delete;
    EventRecorder& operator=(const EventRecorder&) = delete;

    /// Start recording @p bus's events. The bus must outlive the recorder
    /// or detach() must be called first.
    void attach(EventBus& bus);
    void detach();

    void record(const SchedulerEvent& event);
    void flush();

    [[nodiscard]] uint64_t recorded_count() const;

    /// The record written for @p event, without the trailing newline.
    [[nodiscard]] static Json::Value to_record(const SchedulerEvent& event);

private:
    void emit(std::string_view json_line);

    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex write_mutex_;
    uint64_t recorded_{0};

    EventBus* bus_{nullptr};
    std::optional<EventBus::SubscriptionId> subscription_;
};

}  // namespace backup_scheduler
