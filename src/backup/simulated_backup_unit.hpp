/**
 * @file simulated_backup_unit.hpp
 * @brief Synthetic backup unit used by the daemon.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "backup/backup_unit.hpp"
#include "core/config.hpp"

#include <atomic>
#include <mutex>

namespace backup_scheduler {

/**
 * @brief Sleeps for a configured duration per backup type and reports a
 *        fabricated archive.
 *
 * Honours the stop_token in 10 ms slices.
 */
class SimulatedBackupUnit : public IBackupUnit {
public:
    explicit SimulatedBackupUnit(BackupUnitConfig config);

    Result<BackupResult> create_full_backup(std::stop_token stop) override;
    Result<BackupResult> create_incremental_backup(std::stop_token stop) override;
    void set_event_listener(EventListener listener) override;
    void shutdown() override;
    [[nodiscard]] std::string_view name() const noexcept override { return "simulated"; }

    [[nodiscard]] uint64_t backups_created() const noexcept { return created_.load(); }

private:
    Result<BackupResult> run(BackupType type, Millis duration, std::stop_token stop);
    void notify(const BackupUnitEvent& event);

    BackupUnitConfig config_;
    std::mutex listener_mutex_;
    EventListener listener_;
    std::atomic<uint64_t> sequence_{0};
    std::atomic<uint64_t> created_{0};
    std::atomic<bool> shut_down_{false};
};

}  // namespace backup_scheduler
