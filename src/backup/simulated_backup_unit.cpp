/**
 * @file simulated_backup_unit.cpp
 * @brief SimulatedBackupUnit implementation.
 * @author Dimitris Kafetzis
 */

#include "backup/simulated_backup_unit.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <thread>

namespace backup_scheduler {

namespace {

constexpr Millis kSlice{10};

/// Sleep up to @p duration; returns false if stopped early.
bool sleep_cancellable(Millis duration, std::stop_token stop) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!stop.stop_requested()) {
        auto remaining = deadline - std::chrono::steady_clock::now();
        if (remaining <= std::chrono::steady_clock::duration::zero()) return true;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(remaining, kSlice));
    }
    return false;
}

}  // namespace

SimulatedBackupUnit::SimulatedBackupUnit(BackupUnitConfig config)
    : config_(config) {}

Result<BackupResult> SimulatedBackupUnit::create_full_backup(std::stop_token stop) {
    return run(BackupType::Full, Millis{config_.full_duration_ms}, stop);
}

Result<BackupResult> SimulatedBackupUnit::create_incremental_backup(std::stop_token stop) {
    return run(BackupType::Incremental, Millis{config_.incremental_duration_ms}, stop);
}

void SimulatedBackupUnit::set_event_listener(EventListener listener) {
    std::lock_guard lock(listener_mutex_);
    listener_ = std::move(listener);
}

void SimulatedBackupUnit::shutdown() {
    shut_down_.store(true);
}

Result<BackupResult> SimulatedBackupUnit::run(BackupType type, Millis duration,
                                              std::stop_token stop) {
    if (shut_down_.load()) {
        return Error{ErrorCode::ExecutionError, "Backup unit is shut down"};
    }

    auto seq = sequence_.fetch_add(1) + 1;
    auto started_at = std::chrono::time_point_cast<Millis>(std::chrono::system_clock::now());
    auto backup_id = std::format("{}-{}-{}", to_string(type), to_epoch_ms(started_at), seq);

    notify(BackupUnitEvent{.kind = BackupUnitEvent::Kind::Started,
                           .backup_id = backup_id,
                           .type = type});

    auto begin = std::chrono::steady_clock::now();
    if (!sleep_cancellable(duration, stop)) {
        notify(BackupUnitEvent{.kind = BackupUnitEvent::Kind::Error,
                               .backup_id = backup_id,
                               .type = type,
                               .message = "Cancelled via stop token"});
        return Error{ErrorCode::ExecutionError, "Cancelled via stop token"};
    }
    auto elapsed = std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - begin);

    const uint64_t files = type == BackupType::Full ? 1000 : 50;
    BackupResult result{
        .backup_id = backup_id,
        .type = type,
        .started_at = started_at,
        .duration = elapsed,
        .size_bytes = files * 64 * 1024,
        .file_count = files,
        .archive_path = "simulated://" + backup_id + ".tar.gz"
    };

    created_.fetch_add(1);
    notify(BackupUnitEvent{.kind = BackupUnitEvent::Kind::Completed,
                           .backup_id = backup_id,
                           .type = type});
    return result;
}

void SimulatedBackupUnit::notify(const BackupUnitEvent& event) {
    EventListener listener;
    {
        std::lock_guard lock(listener_mutex_);
        listener = listener_;
    }
    if (listener) listener(event);
}

}  // namespace backup_scheduler
