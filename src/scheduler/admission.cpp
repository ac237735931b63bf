/**
 * @file admission.cpp
 * @brief AdmissionController ceiling and condition checks.
 * @author Dimitris Kafetzis
 */

#include "scheduler/admission.hpp"

#include <ctime>
#include <format>

namespace backup_scheduler {

namespace {

int local_hour(Timestamp now) {
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&t, &local);
    return local.tm_hour;
}

}  // namespace

ResourceLimits ResourceLimits::from_config(const Config& config) {
    return ResourceLimits{
        .max_concurrent_backups = config.scheduler.max_concurrent_backups,
        .monitor_resources = config.resources.monitor_resources,
        .max_cpu_usage = config.resources.max_cpu_usage,
        .max_memory_usage = config.resources.max_memory_usage,
        .max_disk_usage = config.resources.max_disk_usage
    };
}

AdmissionController::AdmissionController(ResourceLimits limits)
    : limits_(limits) {}

AdmissionDecision AdmissionController::check_system(const ResourceSnapshot& snapshot) const {
    if (snapshot.cpu_usage_percent > limits_.max_cpu_usage) {
        return {AdmissionVerdict::CpuCeiling,
                std::format("CPU {:.1f}% > {:.1f}%", snapshot.cpu_usage_percent, limits_.max_cpu_usage)};
    }
    if (auto mem = snapshot.memory_usage_percent(); mem > limits_.max_memory_usage) {
        return {AdmissionVerdict::MemoryCeiling,
                std::format("memory {:.1f}% > {:.1f}%", mem, limits_.max_memory_usage)};
    }
    if (auto disk = snapshot.disk_usage_percent(); disk > limits_.max_disk_usage) {
        return {AdmissionVerdict::DiskCeiling,
                std::format("disk {:.1f}% > {:.1f}%", disk, limits_.max_disk_usage)};
    }
    return {};
}

AdmissionDecision AdmissionController::check_conditions(const ScheduleConditions& conditions,
                                                        const ResourceSnapshot* snapshot,
                                                        Timestamp now) {
    if (conditions.min_free_space_bytes && snapshot
        && snapshot->disk_free_bytes < *conditions.min_free_space_bytes) {
        return {AdmissionVerdict::InsufficientFreeSpace,
                std::format("{} bytes free < {} required",
                            snapshot->disk_free_bytes, *conditions.min_free_space_bytes)};
    }
    if (conditions.max_load_average && snapshot
        && snapshot->load_average_1m > *conditions.max_load_average) {
        return {AdmissionVerdict::LoadAverageTooHigh,
                std::format("load {:.2f} > {:.2f}",
                            snapshot->load_average_1m, *conditions.max_load_average)};
    }
    if (const auto& window = conditions.time_window) {
        auto hour = local_hour(now);
        if (!window->contains(hour)) {
            return {AdmissionVerdict::OutsideTimeWindow,
                    std::format("hour {} outside [{}, {}]", hour, window->start_hour, window->end_hour)};
        }
    }
    return {};
}

}  // namespace backup_scheduler
