/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

#include "core/result.hpp"
#include "core/types.hpp"

namespace backup_scheduler {

struct SchedulerConfig {
    bool enable_scheduling = true;              ///< Start the tick loop on initialize()
    uint32_t max_concurrent_backups = 2;
    uint32_t tick_interval_ms = 60000;
    uint32_t warmup_delay_ms = 5000;            ///< First tick after start()
    uint32_t timer_resolution_ms = 500;         ///< Timeout check granularity
    uint32_t admission_retry_delay_ms = 300000; ///< Re-check delay for denied schedules
    uint32_t retry_delay_ms = 300000;           ///< Delay before retrying a failed backup
    uint32_t error_backoff_ms = 600000;
    uint32_t shutdown_timeout_ms = 60000;
    uint32_t shutdown_poll_interval_ms = 1000;
    uint32_t worker_threads = 0;                ///< 0 = 2 × max_concurrent_backups
    std::filesystem::path schedule_file = "backup-schedule.json";
};

struct ResourceConfig {
    bool monitor_resources = true;
    float max_cpu_usage = 80.0f;
    float max_memory_usage = 80.0f;
    float max_disk_usage = 90.0f;
    uint32_t sampling_interval_ms = 1000;
    std::filesystem::path disk_path = "/";
    bool mock = false;
};

/**
 * @brief Named preset later instantiated into a schedule.
 */
struct StrategyConfig {
    BackupType type = BackupType::Incremental;
    std::string frequency;
    int priority = 5;
    uint32_t retry_count = 1;
    uint32_t timeout_ms = 600000;
};

struct BackupUnitConfig {
    uint32_t full_duration_ms = 2000;
    uint32_t incremental_duration_ms = 500;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief The built-in critical/important/regular strategy table.
 */
std::map<std::string, StrategyConfig> default_strategies();

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    SchedulerConfig scheduler;
    ResourceConfig resources;
    std::map<std::string, StrategyConfig> strategies = default_strategies();
    BackupUnitConfig backup;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace backup_scheduler
