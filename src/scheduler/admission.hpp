/**
 * @file admission.hpp
 * @brief Admission control for due schedules.
 * @author Dimitris Kafetzis
 *
 * Check order:
 *   1. Concurrency limit (no sampling needed)
 *   2. System ceilings on CPU, memory and disk usage, if monitoring is on
 *   3. Per-schedule conditions: free space, load average, time window
 *
 * The monitor is read on every call; decisions are never cached.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "schedule/schedule.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace backup_scheduler {

/**
 * @brief System-wide limits, also reported in the status view.
 */
struct ResourceLimits {
    uint32_t max_concurrent_backups{2};
    bool monitor_resources{true};
    float max_cpu_usage{80.0f};
    float max_memory_usage{80.0f};
    float max_disk_usage{90.0f};

    static ResourceLimits from_config(const Config& config);
};

enum class AdmissionVerdict : uint8_t {
    Admitted,
    ConcurrencyLimit,
    CpuCeiling,
    MemoryCeiling,
    DiskCeiling,
    InsufficientFreeSpace,
    LoadAverageTooHigh,
    OutsideTimeWindow,
    ResourcesUnavailable
};

[[nodiscard]] constexpr std::string_view to_string(AdmissionVerdict verdict) noexcept {
    switch (verdict) {
        case AdmissionVerdict::Admitted:              return "admitted";
        case AdmissionVerdict::ConcurrencyLimit:      return "concurrency_limit";
        case AdmissionVerdict::CpuCeiling:            return "cpu_ceiling";
        case AdmissionVerdict::MemoryCeiling:         return "memory_ceiling";
        case AdmissionVerdict::DiskCeiling:           return "disk_ceiling";
        case AdmissionVerdict::InsufficientFreeSpace: return "insufficient_free_space";
        case AdmissionVerdict::LoadAverageTooHigh:    return "load_average_too_high";
        case AdmissionVerdict::OutsideTimeWindow:     return "outside_time_window";
        case AdmissionVerdict::ResourcesUnavailable:  return "resources_unavailable";
    }
    return "unknown";
}

struct AdmissionDecision {
    AdmissionVerdict verdict{AdmissionVerdict::Admitted};
    std::string detail;

    [[nodiscard]] bool admitted() const noexcept { return verdict == AdmissionVerdict::Admitted; }
};

class AdmissionController {
public:
    explicit AdmissionController(ResourceLimits limits);

    template <ResourceMonitorLike MonitorT>
    AdmissionDecision can_run(const Schedule& schedule, size_t active_count,
                              MonitorT& monitor, Timestamp now) const;

    /// Ceiling checks against a sample.
    [[nodiscard]] AdmissionDecision check_system(const ResourceSnapshot& snapshot) const;

    /// Per-schedule conditions. @p snapshot may be null only when no
    /// resource-based condition is set.
    [[nodiscard]] static AdmissionDecision check_conditions(const ScheduleConditions& conditions,
                                                            const ResourceSnapshot* snapshot,
                                                            Timestamp now);

    [[nodiscard]] const ResourceLimits& limits() const noexcept { return limits_; }

private:
    ResourceLimits limits_;
};

// ── Template implementations ─────────────────

template <ResourceMonitorLike MonitorT>
AdmissionDecision AdmissionController::can_run(const Schedule& schedule, size_t active_count,
                                               MonitorT& monitor, Timestamp now) const {
    if (active_count >= limits_.max_concurrent_backups) {
        return {AdmissionVerdict::ConcurrencyLimit,
                std::to_string(active_count) + " of " + std::to_string(limits_.max_concurrent_backups)
                + " backup slots in use"};
    }

    const auto& conditions = schedule.conditions;
    const bool needs_sample = limits_.monitor_resources
                              || conditions.min_free_space_bytes.has_value()
                              || conditions.max_load_average.has_value();

    std::optional<ResourceSnapshot> snapshot;
    if (needs_sample) {
        auto sample = monitor.read();
        if (!sample) {
            return {AdmissionVerdict::ResourcesUnavailable, sample.error().message};
        }
        snapshot = *sample;
    }

    if (limits_.monitor_resources) {
        auto system = check_system(*snapshot);
        if (!system.admitted()) return system;
    }

    return check_conditions(conditions, snapshot ? &*snapshot : nullptr, now);
}

}  // namespace backup_scheduler
