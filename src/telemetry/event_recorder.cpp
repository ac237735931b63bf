/**
 * @file event_recorder.cpp
 * @brief EventRecorder implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/event_recorder.hpp"
#include "schedule/schedule_json.hpp"
#include "scheduler/status.hpp"

namespace backup_scheduler {

EventRecorder::EventRecorder(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

EventRecorder::~EventRecorder() {
    detach();
    flush();
}

void EventRecorder::attach(EventBus& bus) {
    detach();
    bus_ = &bus;
    subscription_ = bus.subscribe([this](const SchedulerEvent& event) { record(event); });
}

void EventRecorder::detach() {
    if (bus_ && subscription_) {
        bus_->unsubscribe(*subscription_);
    }
    bus_ = nullptr;
    subscription_.reset();
}

Json::Value EventRecorder::to_record(const SchedulerEvent& event) {
    Json::Value record{Json::objectValue};
    record["event"] = std::string{to_string(event.kind)};
    record["ts"] = format_iso8601(event.at);

    if (event.schedule) {
        record["schedule"] = event.schedule->name;
        record["runCount"] = static_cast<Json::UInt64>(event.schedule->run_count);
        record["retryCount"] = static_cast<Json::UInt>(event.schedule->retry_count);
        if (event.schedule->next_run) {
            record["nextRun"] = format_iso8601(*event.schedule->next_run);
        }
    }
    if (event.execution) {
        record["execution"] = to_json(*event.execution);
    }
    if (event.result) {
        Json::Value result{Json::objectValue};
        result["backupId"] = event.result->backup_id;
        result["type"] = std::string{to_string(event.result->type)};
        result["sizeBytes"] = static_cast<Json::UInt64>(event.result->size_bytes);
        result["fileCount"] = static_cast<Json::UInt64>(event.result->file_count);
        result["archive"] = event.result->archive_path
            ? Json::Value{*event.result->archive_path}
            : Json::Value{Json::nullValue};
        record["result"] = result;
    }
    if (event.execution_time) {
        record["executionTimeMs"] = static_cast<Json::Int64>(event.execution_time->count());
    }
    if (event.error) {
        Json::Value error{Json::objectValue};
        error["code"] = std::string{to_string(event.error->code)};
        error["message"] = event.error->message;
        record["error"] = error;
    }
    if (event.unit_event) {
        Json::Value unit{Json::objectValue};
        unit["kind"] = std::string{to_string(event.unit_event->kind)};
        unit["backupId"] = event.unit_event->backup_id;
        unit["type"] = std::string{to_string(event.unit_event->type)};
        if (!event.unit_event->message.empty()) unit["message"] = event.unit_event->message;
        record["unit"] = unit;
    }
    return record;
}

void EventRecorder::record(const SchedulerEvent& event) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    emit(Json::writeString(writer, to_record(event)));
}

void EventRecorder::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
    ++recorded_;
}

void EventRecorder::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

uint64_t EventRecorder::recorded_count() const {
    std::lock_guard lock(write_mutex_);
    return recorded_;
}

}  // namespace backup_scheduler
