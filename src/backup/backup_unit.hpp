/**
 * @file backup_unit.hpp
 * @brief Contract for the component that performs backup I/O.
 * @author Dimitris Kafetzis
 *
 * The scheduler only decides when to back up. IBackupUnit is the seam to
 * whatever actually copies, compresses and verifies data. Calls arrive on
 * worker threads and must honour the stop_token, which is requested when
 * an execution times out or the scheduler shuts down.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <functional>
#include <optional>
#include <stop_token>
#include <string>

namespace backup_scheduler {

/**
 * @brief Outcome of one backup operation.
 *
 * archive_path is empty when there was nothing to back up.
 */
struct BackupResult {
    std::string backup_id;
    BackupType type{BackupType::Incremental};
    Timestamp started_at{};
    Millis duration{0};
    uint64_t size_bytes{0};
    uint64_t file_count{0};
    std::optional<std::string> archive_path;

    [[nodiscard]] bool has_archive() const noexcept { return archive_path.has_value(); }
};

/**
 * @brief Lifecycle notification raised by the unit itself.
 */
struct BackupUnitEvent {
    enum class Kind : uint8_t { Started, Completed, Error };

    Kind kind{Kind::Started};
    std::string backup_id;
    BackupType type{BackupType::Incremental};
    std::string message;
};

[[nodiscard]] constexpr std::string_view to_string(BackupUnitEvent::Kind kind) noexcept {
    switch (kind) {
        case BackupUnitEvent::Kind::Started:   return "started";
        case BackupUnitEvent::Kind::Completed: return "completed";
        case BackupUnitEvent::Kind::Error:     return "error";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// IBackupUnit (virtual, runtime-configurable)
// ─────────────────────────────────────────────

class IBackupUnit {
public:
    using EventListener = std::function<void(const BackupUnitEvent&)>;

    virtual ~IBackupUnit() = default;

    virtual Result<BackupResult> create_full_backup(std::stop_token stop) = 0;
    virtual Result<BackupResult> create_incremental_backup(std::stop_token stop) = 0;

    /// Listener may be invoked from any thread.
    virtual void set_event_listener(EventListener listener) = 0;

    /// Called once, after the scheduler has drained its executions.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace backup_scheduler
