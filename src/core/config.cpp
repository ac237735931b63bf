/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <format>
#include <limits>
#include <utility>

namespace backup_scheduler {

namespace {

constexpr uint32_t kMinute = 60 * 1000;
constexpr int64_t kMaxDurationMs = int64_t{7} * 24 * 60 * kMinute;
constexpr int64_t kMaxConcurrentBackups = 256;
constexpr int64_t kMaxWorkerThreads = 1024;
constexpr int64_t kMaxRetryCount = 100;

/**
 * @brief Read an unsigned integer key, rejecting values outside [min, max].
 *
 * A missing key keeps the current value of @p out.
 */
template <typename NodeView>
Result<void> read_bounded(NodeView node, std::string_view key, uint32_t& out,
                          int64_t min_value, int64_t max_value) {
    const auto value = node.value_or(static_cast<int64_t>(out));
    if (value < min_value || value > max_value) {
        return Error{ErrorCode::ConfigError,
                     std::format("{} must be between {} and {} (got {})",
                                 key, min_value, max_value, value)};
    }
    out = static_cast<uint32_t>(value);
    return {};
}

template <typename NodeView>
Result<void> read_percent(NodeView node, std::string_view key, float& out) {
    const auto value = node.value_or(static_cast<double>(out));
    if (!(value > 0.0 && value <= 100.0)) {
        return Error{ErrorCode::ConfigError,
                     std::format("{} must be in (0, 100] (got {})", key, value)};
    }
    out = static_cast<float>(value);
    return {};
}

Result<StrategyConfig> parse_strategy(const std::string& name, const toml::table& tbl) {
    StrategyConfig strategy;

    auto type_text = tbl["type"].value_or(std::string{"incremental"});
    auto type = parse_backup_type(type_text);
    if (!type) {
        return Error{ErrorCode::ConfigError,
                     "Strategy '" + name + "': unknown backup type '" + type_text + "'"};
    }
    strategy.type = *type;

    auto frequency = tbl["frequency"].value<std::string>();
    if (!frequency) {
        return Error{ErrorCode::ConfigError, "Strategy '" + name + "': missing frequency"};
    }
    strategy.frequency = *frequency;

    const auto prefix = "strategies." + name + ".";
    uint32_t priority = 5;
    if (auto r = read_bounded(tbl["priority"], prefix + "priority", priority,
                              0, std::numeric_limits<int>::max()); !r) {
        return r.error();
    }
    strategy.priority = static_cast<int>(priority);
    strategy.retry_count = 1;
    if (auto r = read_bounded(tbl["retry_count"], prefix + "retry_count", strategy.retry_count,
                              0, kMaxRetryCount); !r) {
        return r.error();
    }
    strategy.timeout_ms = 10 * kMinute;
    if (auto r = read_bounded(tbl["timeout_ms"], prefix + "timeout_ms", strategy.timeout_ms,
                              1, kMaxDurationMs); !r) {
        return r.error();
    }
    return strategy;
}

}  // namespace

std::map<std::string, StrategyConfig> default_strategies() {
    return {
        {"critical", StrategyConfig{
            .type = BackupType::Full,
            .frequency = "0 */6 * * *",
            .priority = 1,
            .retry_count = 3,
            .timeout_ms = 30 * kMinute}},
        {"important", StrategyConfig{
            .type = BackupType::Incremental,
            .frequency = "0 */2 * * *",
            .priority = 2,
            .retry_count = 2,
            .timeout_ms = 15 * kMinute}},
        {"regular", StrategyConfig{
            .type = BackupType::Incremental,
            .frequency = "0 */4 * * *",
            .priority = 3,
            .retry_count = 1,
            .timeout_ms = 10 * kMinute}},
    };
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigError, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [scheduler]
        if (auto scheduler = tbl["scheduler"]; scheduler.is_table()) {
            auto& sc = config.scheduler;
            sc.enable_scheduling = scheduler["enable_scheduling"].value_or(true);
            sc.schedule_file = scheduler["schedule_file"].value_or(
                std::string{"backup-schedule.json"});

            struct Field {
                std::string_view key;
                uint32_t* target;
                int64_t min_value;
                int64_t max_value;
            };
            const Field fields[] = {
                {"max_concurrent_backups", &sc.max_concurrent_backups, 1, kMaxConcurrentBackups},
                {"tick_interval_ms", &sc.tick_interval_ms, 1, kMaxDurationMs},
                {"warmup_delay_ms", &sc.warmup_delay_ms, 0, kMaxDurationMs},
                {"timer_resolution_ms", &sc.timer_resolution_ms, 1, kMaxDurationMs},
                {"admission_retry_delay_ms", &sc.admission_retry_delay_ms, 0, kMaxDurationMs},
                {"retry_delay_ms", &sc.retry_delay_ms, 0, kMaxDurationMs},
                {"error_backoff_ms", &sc.error_backoff_ms, 0, kMaxDurationMs},
                {"shutdown_timeout_ms", &sc.shutdown_timeout_ms, 0, kMaxDurationMs},
                {"shutdown_poll_interval_ms", &sc.shutdown_poll_interval_ms, 1, kMaxDurationMs},
                {"worker_threads", &sc.worker_threads, 0, kMaxWorkerThreads},
            };
            for (const auto& field : fields) {
                auto read = read_bounded(scheduler[field.key], "scheduler." + std::string{field.key},
                                         *field.target, field.min_value, field.max_value);
                if (!read) return read.error();
            }
        }

        // [resources]
        if (auto resources = tbl["resources"]; resources.is_table()) {
            auto& rc = config.resources;
            rc.monitor_resources = resources["monitor_resources"].value_or(true);
            for (auto [key, target] : {std::pair{"max_cpu_usage", &rc.max_cpu_usage},
                                       std::pair{"max_memory_usage", &rc.max_memory_usage},
                                       std::pair{"max_disk_usage", &rc.max_disk_usage}}) {
                auto read = read_percent(resources[key], std::string{"resources."} + key, *target);
                if (!read) return read.error();
            }
            if (auto read = read_bounded(resources["sampling_interval_ms"],
                                         "resources.sampling_interval_ms",
                                         rc.sampling_interval_ms, 1, kMaxDurationMs); !read) {
                return read.error();
            }
            rc.disk_path = resources["disk_path"].value_or(std::string{"/"});
            rc.mock = resources["mock"].value_or(false);
        }

        // [strategies.<name>] replaces the built-in table when present
        if (auto strategies = tbl["strategies"].as_table()) {
            std::map<std::string, StrategyConfig> parsed;
            for (const auto& [key, node] : *strategies) {
                std::string name{key.str()};
                auto* entry = node.as_table();
                if (!entry) {
                    return Error{ErrorCode::ConfigError,
                                 "Strategy '" + name + "' must be a table"};
                }
                auto strategy = parse_strategy(name, *entry);
                if (!strategy) return strategy.error();
                parsed.emplace(name, *strategy);
            }
            config.strategies = std::move(parsed);
        }

        // [backup]
        if (auto backup = tbl["backup"]; backup.is_table()) {
            auto& bc = config.backup;
            if (auto read = read_bounded(backup["full_duration_ms"], "backup.full_duration_ms",
                                         bc.full_duration_ms, 0, kMaxDurationMs); !read) {
                return read.error();
            }
            if (auto read = read_bounded(backup["incremental_duration_ms"],
                                         "backup.incremental_duration_ms",
                                         bc.incremental_duration_ms, 0, kMaxDurationMs); !read) {
                return read.error();
            }
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            auto& tc = config.telemetry;
            tc.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            if (auto read = read_bounded(telemetry["max_file_size_mb"], "telemetry.max_file_size_mb",
                                         tc.max_file_size_mb, 1, 4096); !read) {
                return read.error();
            }
            if (auto read = read_bounded(telemetry["rotate_count"], "telemetry.rotate_count",
                                         tc.rotate_count, 1, 1000); !read) {
                return read.error();
            }
            tc.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace backup_scheduler
