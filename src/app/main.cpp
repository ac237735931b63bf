/**
 * @file main.cpp
 * @brief Backup scheduler daemon entry point.
 * @author Dimitris Kafetzis
 *
 * Wires all modules into a running scheduler:
 *   Config → Logger → Monitor → ScheduleStore → BackupScheduler → Telemetry
 */

#include "backup/simulated_backup_unit.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "resource_monitor/monitor.hpp"
#include "scheduler/backup_scheduler.hpp"
#include "scheduler/status.hpp"
#include "telemetry/event_recorder.hpp"
#include "telemetry/json_sink.hpp"

#include <json/json.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace backup_scheduler;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

constexpr auto kStatusLogInterval = std::chrono::minutes(5);

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║          BackupScheduler v1.0.0           ║
  ║   Priority- and Resource-Aware Backup     ║
  ║   Scheduling Daemon                       ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path schedule_file;
    std::string log_dir;
    bool status_only = false;
    std::optional<std::string> trigger;
};

void print_usage() {
    std::cout << "Usage: backup_scheduler [OPTIONS]\n"
              << "  --config <path>          Configuration file (default: config/default.toml)\n"
              << "  --schedule-file <path>   Persisted schedule file\n"
              << "  --log-dir <path>         Log output directory\n"
              << "  --status                 Print scheduler status as JSON, then exit\n"
              << "  --trigger <name>         Run one backup for a schedule, then exit\n"
              << "  --help, -h               Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--schedule-file" && i + 1 < argc) {
            args.schedule_file = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--status") {
            args.status_only = true;
        } else if (arg == "--trigger" && i + 1 < argc) {
            args.trigger = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            std::exit(2);
        }
    }
    return args;
}

void print_status(const SchedulerStatus& status) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    std::cout << Json::writeString(writer, to_json(status)) << std::endl;
}

template <typename MonitorT>
int run(Config config, const CLIArgs& args) {
    const bool one_shot = args.status_only || args.trigger.has_value();
    if (one_shot) config.scheduler.enable_scheduling = false;

    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "backup_scheduler",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }

    auto backup_unit = std::make_shared<SimulatedBackupUnit>(config.backup);
    const auto telemetry = config.telemetry;
    const auto shutdown_timeout = Millis{config.scheduler.shutdown_timeout_ms};

    BackupScheduler<MonitorT> scheduler({
        .config = std::move(config),
        .log_sink = std::move(log_sink),
        .log_level = level,
        .backup_unit = backup_unit
    });
    auto& logger = scheduler.logger();

    std::unique_ptr<ILogSink> event_sink;
    if (!telemetry.log_dir.empty()) {
        event_sink = std::make_unique<JsonFileSink>(telemetry.log_dir, "events",
                                                    telemetry.max_file_size_mb,
                                                    telemetry.rotate_count);
    } else {
        event_sink = std::make_unique<NullSink>();
    }
    EventRecorder recorder(std::move(event_sink));
    recorder.attach(scheduler.events());

    if (auto init = scheduler.initialize(); !init) {
        logger.error("Initialization failed: " + init.error().message);
        std::cerr << "Initialization failed: " << init.error().message << std::endl;
        return 1;
    }

    // ── One-shot modes ───────────────────────
    if (args.status_only) {
        scheduler.poll();
        print_status(scheduler.status());
        scheduler.shutdown();
        return 0;
    }

    if (args.trigger) {
        auto started = scheduler.trigger_backup(*args.trigger);
        if (!started) {
            std::cerr << "Trigger failed: " << started.error().message << std::endl;
            scheduler.shutdown();
            return 1;
        }
        if (!scheduler.wait_until_idle(shutdown_timeout)) {
            logger.warn("Triggered backup " + *started + " still running at exit");
        }
        print_status(scheduler.status());
        scheduler.shutdown();
        return 0;
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    auto next_status_log = std::chrono::steady_clock::now() + kStatusLogInterval;
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (std::chrono::steady_clock::now() >= next_status_log) {
            auto status = scheduler.status();
            auto next = status.stats.next_scheduled_backup;
            logger.info("Status: " + std::to_string(status.active_backups) + " active, "
                        + std::to_string(status.enabled_schedules) + " enabled schedules, next backup "
                        + (next ? format_iso8601(*next) : std::string{"none"}));
            next_status_log += kStatusLogInterval;
        }
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    scheduler.shutdown();
    recorder.detach();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args.status_only && !args.trigger) print_banner();

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.schedule_file.empty()) config.scheduler.schedule_file = args.schedule_file;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    if (config.resources.mock) {
        return run<MockMonitor>(std::move(config), args);
    }
    return run<LinuxMonitor>(std::move(config), args);
}
