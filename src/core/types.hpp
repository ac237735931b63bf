/**
 * @file types.hpp
 * @brief Fundamental types used throughout the backup scheduler.
 * @author Dimitris Kafetzis
 *
 * Defines time aliases, BackupType, ResourceSnapshot, and other shared
 * vocabulary types. All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace backup_scheduler {

// ─────────────────────────────────────────────
// Identity & Time Types
// ─────────────────────────────────────────────

using ScheduleName = std::string;
using ExecutionId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Millis = std::chrono::milliseconds;

/// Milliseconds since the Unix epoch, the unit used by the schedule file.
[[nodiscard]] constexpr int64_t to_epoch_ms(Timestamp ts) noexcept {
    return std::chrono::duration_cast<Millis>(ts.time_since_epoch()).count();
}

[[nodiscard]] constexpr Timestamp from_epoch_ms(int64_t ms) noexcept {
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(Millis{ms})};
}

/**
 * @brief Format a timestamp as ISO 8601 UTC with millisecond precision.
 */
std::string format_iso8601(Timestamp ts);

// ─────────────────────────────────────────────
// Backup Type
// ─────────────────────────────────────────────

enum class BackupType : uint8_t {
    Full,
    Incremental
};

[[nodiscard]] constexpr std::string_view to_string(BackupType type) noexcept {
    switch (type) {
        case BackupType::Full:        return "full";
        case BackupType::Incremental: return "incremental";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<BackupType> parse_backup_type(std::string_view text) noexcept {
    if (text == "full") return BackupType::Full;
    if (text == "incremental") return BackupType::Incremental;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Resource Snapshot
// ─────────────────────────────────────────────

/**
 * @brief A point-in-time snapshot of the host's resources.
 *
 * Read from Linux pseudo-filesystems (/proc) and statvfs() by the
 * LinuxMonitor. Immutable once constructed.
 */
struct ResourceSnapshot {
    Timestamp timestamp;

    float cpu_usage_percent{0.0f};                    ///< Aggregate CPU [0.0, 100.0]

    uint64_t memory_available_bytes{0};
    uint64_t memory_total_bytes{0};

    uint64_t disk_free_bytes{0};                      ///< Free bytes on the backup volume
    uint64_t disk_total_bytes{0};

    double load_average_1m{0.0};

    [[nodiscard]] constexpr float memory_usage_percent() const noexcept {
        if (memory_total_bytes == 0) return 0.0f;
        return 100.0f * static_cast<float>(memory_total_bytes - memory_available_bytes)
               / static_cast<float>(memory_total_bytes);
    }

    [[nodiscard]] constexpr float disk_usage_percent() const noexcept {
        if (disk_total_bytes == 0) return 0.0f;
        return 100.0f * static_cast<float>(disk_total_bytes - disk_free_bytes)
               / static_cast<float>(disk_total_bytes);
    }
};

}  // namespace backup_scheduler
