/**
 * @file test_admission.cpp
 * @brief Unit tests for AdmissionController.
 */

#include "resource_monitor/monitor.hpp"
#include "scheduler/admission.hpp"

#include <gtest/gtest.h>
#include <ctime>

using namespace backup_scheduler;

namespace {

constexpr uint64_t kGiB = 1024ULL * 1024 * 1024;

Timestamp local_hour(int hour) {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 5;
    tm.tm_mday = 15;
    tm.tm_hour = hour;
    tm.tm_min = 30;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

Schedule plain_schedule(ScheduleConditions conditions = {}) {
    Schedule schedule;
    schedule.name = "docs";
    schedule.frequency = "0 1 * * *";
    schedule.conditions = conditions;
    return schedule;
}

ResourceLimits limits(uint32_t max_concurrent = 2, bool monitor = true) {
    return ResourceLimits{
        .max_concurrent_backups = max_concurrent,
        .monitor_resources = monitor,
        .max_cpu_usage = 80.0f,
        .max_memory_usage = 80.0f,
        .max_disk_usage = 90.0f
    };
}

}  // namespace

// ─── Concurrency ─────────────────────────────

TEST(AdmissionTest, AdmitsIdleHost) {
    AdmissionController admission(limits());
    MockMonitor monitor;
    auto decision = admission.can_run(plain_schedule(), 0, monitor, local_hour(3));
    EXPECT_TRUE(decision.admitted()) << decision.detail;
}

TEST(AdmissionTest, ConcurrencyLimitDeniesWithoutSampling) {
    AdmissionController admission(limits(1));
    MockMonitor monitor;

    auto decision = admission.can_run(plain_schedule(), 1, monitor, local_hour(3));
    EXPECT_EQ(decision.verdict, AdmissionVerdict::ConcurrencyLimit);
    EXPECT_EQ(monitor.read_count(), 0u);
}

// ─── System ceilings ─────────────────────────

TEST(AdmissionTest, CpuAboveCeilingDenied) {
    AdmissionController admission(limits());
    MockMonitor monitor;
    monitor.set_cpu(80.5f);

    auto decision = admission.can_run(plain_schedule(), 0, monitor, local_hour(3));
    EXPECT_EQ(decision.verdict, AdmissionVerdict::CpuCeiling);
}

TEST(AdmissionTest, CpuAtCeilingAdmitted) {
    AdmissionController admission(limits());
    MockMonitor monitor;
    monitor.set_cpu(80.0f);

    EXPECT_TRUE(admission.can_run(plain_schedule(), 0, monitor, local_hour(3)).admitted());
}

TEST(AdmissionTest, MemoryAboveCeilingDenied) {
    AdmissionController admission(limits());
    MockMonitor monitor;
    monitor.set_memory(1 * kGiB, 10 * kGiB);  // 90% used

    auto decision = admission.can_run(plain_schedule(), 0, monitor, local_hour(3));
    EXPECT_EQ(decision.verdict, AdmissionVerdict::MemoryCeiling);
}

TEST(AdmissionTest, DiskAboveCeilingDenied) {
    AdmissionController admission(limits());
    MockMonitor monitor;
    monitor.set_disk(5 * kGiB, 100 * kGiB);  // 95% used

    auto decision = admission.can_run(plain_schedule(), 0, monitor, local_hour(3));
    EXPECT_EQ(decision.verdict, AdmissionVerdict::DiskCeiling);
}

TEST(AdmissionTest, CeilingsIgnoredWhenMonitoringOff) {
    AdmissionController admission(limits(2, false));
    MockMonitor monitor;
    monitor.set_cpu(99.0f);

    EXPECT_TRUE(admission.can_run(plain_schedule(), 0, monitor, local_hour(3)).admitted());
    EXPECT_EQ(monitor.read_count(), 0u);
}

TEST(AdmissionTest, UnavailableSampleDenies) {
    AdmissionController admission(limits());
    MockMonitor monitor;
    monitor.set_unavailable(true);

    auto decision = admission.can_run(plain_schedule(), 0, monitor, local_hour(3));
    EXPECT_EQ(decision.verdict, AdmissionVerdict::ResourcesUnavailable);
}

TEST(AdmissionTest, EverySampleIsFresh) {
    AdmissionController admission(limits());
    MockMonitor monitor;

    EXPECT_TRUE(admission.can_run(plain_schedule(), 0, monitor, local_hour(3)).admitted());
    monitor.set_cpu(95.0f);
    EXPECT_FALSE(admission.can_run(plain_schedule(), 0, monitor, local_hour(3)).admitted());
    EXPECT_EQ(monitor.read_count(), 2u);
}

// ─── Per-schedule conditions ─────────────────

TEST(AdmissionTest, InsufficientFreeSpaceDenied) {
    AdmissionController admission(limits(2, false));
    MockMonitor monitor;
    monitor.set_disk(1 * kGiB, 10 * kGiB);

    auto decision = admission.can_run(
        plain_schedule(ScheduleConditions{.min_free_space_bytes = 2 * kGiB}),
        0, monitor, local_hour(3));
    EXPECT_EQ(decision.verdict, AdmissionVerdict::InsufficientFreeSpace);
    // Sampled for the condition even with monitoring off
    EXPECT_EQ(monitor.read_count(), 1u);
}

TEST(AdmissionTest, LoadAverageTooHighDenied) {
    AdmissionController admission(limits());
    MockMonitor monitor;
    monitor.set_load_average(4.0);

    auto decision = admission.can_run(
        plain_schedule(ScheduleConditions{.max_load_average = 2.0}),
        0, monitor, local_hour(3));
    EXPECT_EQ(decision.verdict, AdmissionVerdict::LoadAverageTooHigh);
}

TEST(AdmissionTest, TimeWindowIsInclusive) {
    auto conditions = ScheduleConditions{.time_window = TimeWindow{1, 5}};
    EXPECT_TRUE(AdmissionController::check_conditions(conditions, nullptr, local_hour(1)).admitted());
    EXPECT_TRUE(AdmissionController::check_conditions(conditions, nullptr, local_hour(5)).admitted());

    auto before = AdmissionController::check_conditions(conditions, nullptr, local_hour(0));
    EXPECT_EQ(before.verdict, AdmissionVerdict::OutsideTimeWindow);
    auto after = AdmissionController::check_conditions(conditions, nullptr, local_hour(6));
    EXPECT_EQ(after.verdict, AdmissionVerdict::OutsideTimeWindow);
}

TEST(AdmissionTest, TimeWindowNeedsNoSample) {
    AdmissionController admission(limits(2, false));
    MockMonitor monitor;
    monitor.set_unavailable(true);

    auto schedule = plain_schedule(ScheduleConditions{.time_window = TimeWindow{0, 23}});
    EXPECT_TRUE(admission.can_run(schedule, 0, monitor, local_hour(12)).admitted());
    EXPECT_EQ(monitor.read_count(), 0u);
}

TEST(AdmissionTest, LimitsFromConfig) {
    Config config;
    config.scheduler.max_concurrent_backups = 7;
    config.resources.monitor_resources = false;
    config.resources.max_cpu_usage = 55.0f;

    auto derived = ResourceLimits::from_config(config);
    EXPECT_EQ(derived.max_concurrent_backups, 7u);
    EXPECT_FALSE(derived.monitor_resources);
    EXPECT_FLOAT_EQ(derived.max_cpu_usage, 55.0f);
}

TEST(AdmissionVerdictTest, ToString) {
    EXPECT_EQ(to_string(AdmissionVerdict::Admitted), "admitted");
    EXPECT_EQ(to_string(AdmissionVerdict::OutsideTimeWindow), "outside_time_window");
}
