/**
 * @file test_scheduler_end_to_end.cpp
 * @brief Integration tests exercising the full scheduling pipeline.
 * @author Dimitris Kafetzis
 */

#include "backup/backup_unit.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "resource_monitor/monitor.hpp"
#include "scheduler/backup_scheduler.hpp"
#include "scheduler/status.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <json/json.h>

#include <algorithm>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <thread>

using namespace backup_scheduler;

namespace {

constexpr Millis kMinute{60 * 1000};
constexpr Millis kWait{5000};

Timestamp local_time(int day, int hour, int minute, int second = 0) {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 5;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

// ═══════════════════════════════════════════════
// Scripted backup unit
// ═══════════════════════════════════════════════

/**
 * @brief Backup unit whose outcomes and timing are driven by the test.
 *
 * Outcomes are consumed in push order; once the script is empty every
 * call succeeds with an archive. While held, calls block until release()
 * or until their stop_token fires.
 */
class ScriptedBackupUnit : public IBackupUnit {
public:
    void push_outcome(Result<BackupResult> outcome) {
        std::lock_guard lock(mutex_);
        script_.push_back(std::move(outcome));
    }

    void hold() {
        std::lock_guard lock(mutex_);
        held_ = true;
    }

    void release() {
        {
            std::lock_guard lock(mutex_);
            held_ = false;
        }
        cv_.notify_all();
    }

    size_t calls(BackupType type) const {
        std::lock_guard lock(mutex_);
        return type == BackupType::Full ? full_calls_ : incremental_calls_;
    }

    bool wait_for_cancellations(size_t count, Millis timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return cancellations_ >= count; });
    }

    bool was_shut_down() const {
        std::lock_guard lock(mutex_);
        return shut_down_;
    }

    Result<BackupResult> create_full_backup(std::stop_token stop) override {
        return run(BackupType::Full, stop);
    }

    Result<BackupResult> create_incremental_backup(std::stop_token stop) override {
        return run(BackupType::Incremental, stop);
    }

    void set_event_listener(EventListener listener) override {
        std::lock_guard lock(mutex_);
        listener_ = std::move(listener);
    }

    void shutdown() override {
        std::lock_guard lock(mutex_);
        shut_down_ = true;
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "scripted"; }

private:
    Result<BackupResult> run(BackupType type, std::stop_token stop) {
        EventListener listener;
        std::string id;
        {
            std::unique_lock lock(mutex_);
            (type == BackupType::Full ? full_calls_ : incremental_calls_)++;
            id = "scripted-" + std::to_string(full_calls_ + incremental_calls_);
            listener = listener_;

            if (held_) {
                cv_.wait(lock, stop, [this] { return !held_; });
                if (held_) {
                    ++cancellations_;
                    cv_.notify_all();
                    return Error{ErrorCode::ExecutionError, "Cancelled via stop token"};
                }
            }
        }

        if (listener) {
            listener(BackupUnitEvent{.kind = BackupUnitEvent::Kind::Started,
                                     .backup_id = id, .type = type});
        }

        std::optional<Result<BackupResult>> scripted;
        {
            std::lock_guard lock(mutex_);
            if (!script_.empty()) {
                scripted = std::move(script_.front());
                script_.pop_front();
            }
        }
        if (scripted) return std::move(*scripted);

        if (listener) {
            listener(BackupUnitEvent{.kind = BackupUnitEvent::Kind::Completed,
                                     .backup_id = id, .type = type});
        }
        return BackupResult{.backup_id = id, .type = type, .size_bytes = 4096,
                            .file_count = 2, .archive_path = "/backups/" + id + ".tar.gz"};
    }

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Result<BackupResult>> script_;
    EventListener listener_;
    bool held_{false};
    bool shut_down_{false};
    size_t full_calls_{0};
    size_t incremental_calls_{0};
    size_t cancellations_{0};
};

Json::Value read_json(const std::filesystem::path& path) {
    std::ifstream in(path);
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    EXPECT_TRUE(Json::parseFromStream(builder, in, &root, &errors)) << errors;
    return root;
}

}  // namespace

// ═══════════════════════════════════════════════
// Fixture
// ═══════════════════════════════════════════════

class SchedulerIntegrationTest : public ::testing::Test {
protected:
    using Scheduler = BackupScheduler<MockMonitor>;

    std::filesystem::path temp_dir_;
    std::filesystem::path schedule_file_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<ScriptedBackupUnit> unit_;
    Config config_;

    std::mutex events_mutex_;
    std::vector<SchedulerEvent> events_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "bs_test_integration";
        std::filesystem::remove_all(temp_dir_);
        std::filesystem::create_directories(temp_dir_);
        schedule_file_ = temp_dir_ / "backup-schedule.json";

        // Start from an empty schedule file rather than the bootstrap defaults
        std::ofstream empty(schedule_file_);
        empty << "{}";

        clock_ = std::make_shared<ManualClock>(local_time(15, 1, 0));
        unit_ = std::make_shared<ScriptedBackupUnit>();

        config_.scheduler.enable_scheduling = false;
        config_.scheduler.schedule_file = schedule_file_;
        config_.scheduler.timer_resolution_ms = 10;
        config_.scheduler.shutdown_poll_interval_ms = 10;
        config_.resources.monitor_resources = false;
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::unique_ptr<Scheduler> make_scheduler() {
        auto scheduler = std::make_unique<Scheduler>(Scheduler::Options{
            .config = config_,
            .log_sink = std::make_unique<NullSink>(),
            .log_level = LogLevel::Debug,
            .backup_unit = unit_,
            .clock = clock_
        });
        scheduler->events().subscribe([this](const SchedulerEvent& event) {
            std::lock_guard lock(events_mutex_);
            events_.push_back(event);
        });
        auto init = scheduler->initialize();
        EXPECT_TRUE(init.has_value()) << init.error().message;
        return scheduler;
    }

    std::vector<EventKind> kinds() {
        std::lock_guard lock(events_mutex_);
        std::vector<EventKind> out;
        for (const auto& event : events_) out.push_back(event.kind);
        return out;
    }

    bool saw(EventKind kind) {
        auto all = kinds();
        return std::find(all.begin(), all.end(), kind) != all.end();
    }

    static ScheduleSpec nightly_full() {
        return ScheduleSpec{.frequency = "0 2 * * *", .type = BackupType::Full};
    }
};

// ═══════════════════════════════════════════════
// Scheduled execution
// ═══════════════════════════════════════════════

TEST_F(SchedulerIntegrationTest, NightlyBackupRunsAtTwoAndRollsToNextDay) {
    auto scheduler = make_scheduler();
    auto added = scheduler->add_schedule("nightly", nightly_full());
    ASSERT_TRUE(added.has_value()) << added.error().message;
    EXPECT_EQ(added->next_run, local_time(15, 2, 0));

    // Not due yet
    scheduler->check_schedules();
    EXPECT_TRUE(scheduler->wait_until_idle(kWait));
    EXPECT_EQ(unit_->calls(BackupType::Full), 0u);

    clock_->set(local_time(15, 2, 0));
    scheduler->check_schedules();
    ASSERT_TRUE(scheduler->wait_until_idle(kWait));

    auto schedule = scheduler->get_schedule("nightly");
    ASSERT_TRUE(schedule.has_value());
    EXPECT_EQ(schedule->run_count, 1u);
    EXPECT_EQ(schedule->success_count, 1u);
    EXPECT_EQ(schedule->last_run, local_time(15, 2, 0));
    EXPECT_EQ(schedule->next_run, local_time(16, 2, 0));
    EXPECT_EQ(unit_->calls(BackupType::Full), 1u);

    auto status = scheduler->status();
    EXPECT_EQ(status.stats.scheduled_backups, 1u);
    EXPECT_EQ(status.stats.completed_backups, 1u);
    EXPECT_EQ(status.stats.next_scheduled_backup, local_time(16, 2, 0));
    EXPECT_EQ(status.active_backups, 0u);

    EXPECT_TRUE(saw(EventKind::ScheduledBackupStarted));
    EXPECT_TRUE(saw(EventKind::BackupStarted));
    EXPECT_TRUE(saw(EventKind::BackupCompleted));
    EXPECT_TRUE(saw(EventKind::ScheduledBackupCompleted));

    // Persisted with the updated counters
    auto root = read_json(schedule_file_);
    EXPECT_EQ(root["nightly"]["runCount"].asUInt64(), 1u);
    EXPECT_EQ(root["nightly"]["nextRun"].asInt64(), to_epoch_ms(local_time(16, 2, 0)));
}

TEST_F(SchedulerIntegrationTest, BrokenScheduleDoesNotStopTheTick) {
    const auto now = local_time(15, 1, 0);
    const auto overdue = to_epoch_ms(now - kMinute);
    {
        // "corrupt" decodes but its frequency cannot be evaluated; it sorts first.
        std::ofstream out(schedule_file_);
        out << R"({
            "corrupt": { "frequency": "every night", "type": "full", "priority": 1,
                         "nextRun": )" << overdue << R"( },
            "nightly": { "frequency": "0 2 * * *", "type": "incremental", "priority": 5,
                         "nextRun": )" << overdue << R"( }
        })";
    }

    auto scheduler = make_scheduler();
    ASSERT_TRUE(scheduler->get_schedule("corrupt").has_value());

    scheduler->check_schedules();
    ASSERT_TRUE(scheduler->wait_until_idle(kWait));

    EXPECT_TRUE(saw(EventKind::ScheduleError));
    {
        std::lock_guard lock(events_mutex_);
        auto error = std::find_if(events_.begin(), events_.end(), [](const SchedulerEvent& event) {
            return event.kind == EventKind::ScheduleError;
        });
        ASSERT_NE(error, events_.end());
        ASSERT_TRUE(error->schedule.has_value());
        EXPECT_EQ(error->schedule->name, "corrupt");
        ASSERT_TRUE(error->error.has_value());
        EXPECT_EQ(error->error->code, ErrorCode::InvalidFrequencyFormat);
    }

    auto corrupt = scheduler->get_schedule("corrupt");
    ASSERT_TRUE(corrupt.has_value());
    EXPECT_EQ(corrupt->failure_count, 1u);
    EXPECT_EQ(corrupt->run_count, 0u);
    EXPECT_EQ(corrupt->next_run, now + Millis{config_.scheduler.error_backoff_ms});

    // The next due schedule still ran in the same tick
    auto nightly = scheduler->get_schedule("nightly");
    ASSERT_TRUE(nightly.has_value());
    EXPECT_EQ(nightly->run_count, 1u);
    EXPECT_EQ(nightly->success_count, 1u);
    EXPECT_EQ(unit_->calls(BackupType::Incremental), 1u);
    EXPECT_EQ(unit_->calls(BackupType::Full), 0u);

    auto root = read_json(schedule_file_);
    EXPECT_EQ(root["corrupt"]["failureCount"].asUInt64(), 1u);
    EXPECT_EQ(root["corrupt"]["frequency"].asString(), "every night");
}

TEST_F(SchedulerIntegrationTest, ConcurrencyLimitDefersLowerPriority) {
    config_.scheduler.max_concurrent_backups = 1;
    auto scheduler = make_scheduler();

    ASSERT_TRUE(scheduler->add_schedule("bulk", ScheduleSpec{.frequency = "0 2 * * *",
                                                             .priority = 5}).has_value());
    ASSERT_TRUE(scheduler->add_schedule("urgent", ScheduleSpec{.frequency = "0 2 * * *",
                                                               .priority = 1}).has_value());

    unit_->hold();
    const auto two_am = local_time(15, 2, 0);
    clock_->set(two_am);
    scheduler->check_schedules();

    auto status = scheduler->status();
    ASSERT_EQ(status.active_executions.size(), 1u);
    EXPECT_EQ(status.active_executions[0].schedule_name, "urgent");
    EXPECT_EQ(status.stats.skipped_backups, 1u);

    auto bulk = scheduler->get_schedule("bulk");
    EXPECT_EQ(bulk->run_count, 0u);
    EXPECT_EQ(bulk->next_run, two_am + 5 * kMinute);

    unit_->release();
    ASSERT_TRUE(scheduler->wait_until_idle(kWait));

    // The deferred schedule runs once a slot is free
    clock_->set(two_am + 5 * kMinute);
    scheduler->check_schedules();
    ASSERT_TRUE(scheduler->wait_until_idle(kWait));
    EXPECT_EQ(scheduler->get_schedule("bulk")->success_count, 1u);
    EXPECT_EQ(scheduler->get_schedule("urgent")->success_count, 1u);
}

TEST_F(SchedulerIntegrationTest, ResourceCeilingSkipsBackup) {
    config_.resources.monitor_resources = true;
    auto scheduler = make_scheduler();
    ASSERT_TRUE(scheduler->add_schedule("nightly", nightly_full()).has_value());

    scheduler->monitor().set_cpu(95.0f);
    clock_->set(local_time(15, 2, 0));
    scheduler->check_schedules();
    ASSERT_TRUE(scheduler->wait_until_idle(kWait));

    EXPECT_EQ(unit_->calls(BackupType::Full), 0u);
    EXPECT_EQ(scheduler->status().stats.skipped_backups, 1u);
    EXPECT_EQ(scheduler->get_schedule("nightly")->next_run, local_time(15, 2, 5));
}

TEST_F(SchedulerIntegrationTest, RetriesUntilBudgetExhausted) {
    auto scheduler = make_scheduler();
    auto spec = nightly_full();
    spec.retry_count = 1;
    ASSERT_TRUE(scheduler->add_schedule("nightly", spec).has_value());

    unit_->push_outcome(Error{ErrorCode::ExecutionError, "target unreachable"});
    unit_->push_outcome(Error{ErrorCode::ExecutionError, "target unreachable"});

    clock_->set(local_time(15, 2, 0));
    scheduler->check_schedules();
    ASSERT_TRUE(scheduler->wait_until_idle(kWait));

    auto first = scheduler->get_schedule("nightly");
    EXPECT_EQ(first->failure_count, 1u);
    EXPECT_EQ(first->retry_count, 0u);
    EXPECT_EQ(first->next_run, local_time(15, 2, 5));

    clock_->set(local_time(15, 2, 5));
    scheduler->check_schedules();
    ASSERT_TRUE(scheduler->wait_until_idle(kWait));

    auto second = scheduler->get_schedule("nightly");
    EXPECT_EQ(second->failure_count, 2u);
    EXPECT_EQ(second->retry_count, 0u);
    EXPECT_EQ(second->run_count, 2u);
    EXPECT_EQ(second->next_run, local_time(16, 2, 0));
    EXPECT_EQ(scheduler->status().stats.failed_backups, 2u);
    EXPECT_TRUE(saw(EventKind::ScheduledBackupFailed));
}

TEST_F(SchedulerIntegrationTest, TimeoutStopsBackup) {
    auto scheduler = make_scheduler();
    auto spec = nightly_full();
    spec.timeout = Millis{1000};
    spec.retry_count = 2;
    ASSERT_TRUE(scheduler->add_schedule("nightly", spec).has_value());

    unit_->hold();
    clock_->set(local_time(15, 2, 0));
    scheduler->check_schedules();
    EXPECT_EQ(scheduler->status().active_backups, 1u);

    clock_->advance(Millis{999});
    scheduler->poll();
    EXPECT_EQ(scheduler->status().active_backups, 1u);

    clock_->advance(Millis{1});
    scheduler->poll();
    EXPECT_EQ(scheduler->status().active_backups, 0u);
    EXPECT_TRUE(unit_->wait_for_cancellations(1, kWait));
    ASSERT_TRUE(scheduler->wait_until_idle(kWait));

    auto schedule = scheduler->get_schedule("nightly");
    EXPECT_EQ(schedule->failure_count, 1u);
    EXPECT_EQ(schedule->success_count, 0u);
    EXPECT_EQ(schedule->retry_count, 2u);
    EXPECT_EQ(scheduler->status().stats.failed_backups, 1u);
    EXPECT_TRUE(saw(EventKind::BackupTimeout));
    EXPECT_FALSE(saw(EventKind::ScheduledBackupFailed));
}

// ═══════════════════════════════════════════════
// Manual triggers
// ═══════════════════════════════════════════════

TEST_F(SchedulerIntegrationTest, TriggerBypassesAdmissionAndDueTime) {
    config_.resources.monitor_resources = true;
    config_.scheduler.max_concurrent_backups = 1;
    auto scheduler = make_scheduler();
    ASSERT_TRUE(scheduler->add_schedule("nightly", nightly_full()).has_value());
    scheduler->monitor().set_cpu(99.0f);

    auto id = scheduler->trigger_backup("nightly", BackupType::Incremental);
    ASSERT_TRUE(id.has_value()) << id.error().message;
    EXPECT_EQ(*id, "scheduled-nightly-1");
    ASSERT_TRUE(scheduler->wait_until_idle(kWait));

    EXPECT_EQ(unit_->calls(BackupType::Incremental), 1u);
    EXPECT_EQ(unit_->calls(BackupType::Full), 0u);

    auto schedule = scheduler->get_schedule("nightly");
    EXPECT_EQ(schedule->type, BackupType::Full);
    EXPECT_EQ(schedule->run_count, 1u);
    EXPECT_EQ(schedule->success_count, 1u);
    EXPECT_EQ(schedule->last_run, local_time(15, 1, 0));
}

TEST_F(SchedulerIntegrationTest, TriggerUnknownSchedule) {
    auto scheduler = make_scheduler();
    auto id = scheduler->trigger_backup("ghost");
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, ErrorCode::ScheduleNotFound);
}

// ═══════════════════════════════════════════════
// Schedule management
// ═══════════════════════════════════════════════

TEST_F(SchedulerIntegrationTest, ManagementOperationsEmitEvents) {
    auto scheduler = make_scheduler();
    ASSERT_TRUE(scheduler->add_schedule("docs", nightly_full()).has_value());

    auto duplicate = scheduler->add_schedule("docs", nightly_full());
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error().code, ErrorCode::ScheduleExists);

    auto updated = scheduler->update_schedule("docs", ScheduleUpdate{.frequency = "30 */3 * * *"});
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->next_run, local_time(15, 3, 30));

    auto rejected = scheduler->update_schedule("docs", ScheduleUpdate{.frequency = "nope"});
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(scheduler->get_schedule("docs")->frequency, "30 */3 * * *");

    auto toggled = scheduler->toggle_schedule("docs");
    ASSERT_TRUE(toggled.has_value());
    EXPECT_FALSE(toggled->enabled);
    EXPECT_EQ(scheduler->status().enabled_schedules, 0u);
    EXPECT_FALSE(scheduler->status().stats.next_scheduled_backup.has_value());

    auto forced = scheduler->toggle_schedule("docs", true);
    ASSERT_TRUE(forced.has_value());
    EXPECT_TRUE(forced->enabled);

    ASSERT_TRUE(scheduler->remove_schedule("docs").has_value());
    auto missing = scheduler->remove_schedule("docs");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::ScheduleNotFound);
    EXPECT_FALSE(scheduler->get_schedule("docs").has_value());

    scheduler->poll();
    EXPECT_EQ(kinds(), (std::vector<EventKind>{
        EventKind::Initialized,
        EventKind::ScheduleAdded,
        EventKind::ScheduleUpdated,
        EventKind::ScheduleToggled,
        EventKind::ScheduleToggled,
        EventKind::ScheduleRemoved}));
}

TEST_F(SchedulerIntegrationTest, DisabledScheduleIsNeverDue) {
    auto scheduler = make_scheduler();
    auto spec = nightly_full();
    spec.enabled = false;
    ASSERT_TRUE(scheduler->add_schedule("nightly", spec).has_value());

    clock_->set(local_time(15, 3, 0));
    scheduler->check_schedules();
    ASSERT_TRUE(scheduler->wait_until_idle(kWait));
    EXPECT_EQ(unit_->calls(BackupType::Full), 0u);
}

TEST_F(SchedulerIntegrationTest, AddFromStrategy) {
    auto scheduler = make_scheduler();
    auto added = scheduler->add_schedule_from_strategy("db", "critical");
    ASSERT_TRUE(added.has_value());
    EXPECT_EQ(added->frequency, "0 */6 * * *");
    EXPECT_EQ(added->type, BackupType::Full);
    EXPECT_EQ(added->priority, 1);
    EXPECT_EQ(added->retry_count, 3u);
    EXPECT_EQ(added->next_run, local_time(15, 6, 0));

    auto unknown = scheduler->add_schedule_from_strategy("db2", "platinum");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ErrorCode::InvalidArgument);
}

// ═══════════════════════════════════════════════
// Persistence & lifecycle
// ═══════════════════════════════════════════════

TEST_F(SchedulerIntegrationTest, BootstrapsDefaultsWithoutScheduleFile) {
    std::filesystem::remove(schedule_file_);
    auto scheduler = make_scheduler();

    auto schedules = scheduler->all_schedules();
    ASSERT_EQ(schedules.size(), 3u);
    EXPECT_TRUE(std::filesystem::exists(schedule_file_));
    EXPECT_EQ(read_json(schedule_file_).size(), 3u);
}

TEST_F(SchedulerIntegrationTest, StatePersistsAcrossRestart) {
    {
        auto scheduler = make_scheduler();
        ASSERT_TRUE(scheduler->add_schedule("nightly", nightly_full()).has_value());
        ASSERT_TRUE(scheduler->trigger_backup("nightly").has_value());
        ASSERT_TRUE(scheduler->wait_until_idle(kWait));
        scheduler->shutdown();
        EXPECT_TRUE(unit_->was_shut_down());
    }
    EXPECT_TRUE(saw(EventKind::Shutdown));

    auto restarted = make_scheduler();
    auto schedule = restarted->get_schedule("nightly");
    ASSERT_TRUE(schedule.has_value());
    EXPECT_EQ(schedule->run_count, 1u);
    EXPECT_EQ(schedule->success_count, 1u);
    EXPECT_EQ(schedule->type, BackupType::Full);

    // Process counters start over
    EXPECT_EQ(restarted->status().stats.completed_backups, 0u);
}

TEST_F(SchedulerIntegrationTest, ShutdownWaitsForActiveBackups) {
    config_.scheduler.shutdown_timeout_ms = 5000;
    auto scheduler = make_scheduler();
    ASSERT_TRUE(scheduler->add_schedule("nightly", nightly_full()).has_value());

    unit_->hold();
    ASSERT_TRUE(scheduler->trigger_backup("nightly").has_value());

    std::jthread releaser([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        unit_->release();
    });
    scheduler->shutdown();

    EXPECT_EQ(scheduler->status().active_backups, 0u);
    EXPECT_EQ(read_json(schedule_file_)["nightly"]["successCount"].asUInt64(), 1u);
}

TEST_F(SchedulerIntegrationTest, ShutdownCancelsBackupsPastTimeout) {
    config_.scheduler.shutdown_timeout_ms = 50;
    auto scheduler = make_scheduler();
    ASSERT_TRUE(scheduler->add_schedule("nightly", nightly_full()).has_value());

    unit_->hold();
    ASSERT_TRUE(scheduler->trigger_backup("nightly").has_value());
    scheduler->shutdown();

    EXPECT_TRUE(unit_->wait_for_cancellations(1, kWait));
    EXPECT_TRUE(saw(EventKind::Shutdown));
}

TEST_F(SchedulerIntegrationTest, StatusJson) {
    config_.scheduler.max_concurrent_backups = 3;
    auto scheduler = make_scheduler();
    ASSERT_TRUE(scheduler->add_schedule("nightly", nightly_full()).has_value());

    auto json = to_json(scheduler->status());
    EXPECT_FALSE(json["isRunning"].asBool());
    EXPECT_EQ(json["totalSchedules"].asUInt64(), 1u);
    EXPECT_EQ(json["enabledSchedules"].asUInt64(), 1u);
    EXPECT_EQ(json["activeBackups"].asUInt64(), 0u);
    EXPECT_EQ(json["resourceLimits"]["maxConcurrentBackups"].asUInt(), 3u);
    ASSERT_EQ(json["schedules"].size(), 1u);
    EXPECT_EQ(json["schedules"][0]["name"].asString(), "nightly");
    EXPECT_EQ(json["schedules"][0]["nextRunFormatted"].asString(),
              format_iso8601(local_time(15, 2, 0)));
    EXPECT_EQ(json["stats"]["scheduledBackups"].asUInt64(), 0u);
}

TEST_F(SchedulerIntegrationTest, StartRequiresInitialize) {
    Scheduler scheduler(Scheduler::Options{
        .config = config_,
        .log_sink = std::make_unique<NullSink>(),
        .backup_unit = unit_,
        .clock = clock_
    });
    auto started = scheduler.start();
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, ErrorCode::NotRunning);
}

TEST_F(SchedulerIntegrationTest, InitializeWithoutBackupUnitFails) {
    Scheduler scheduler(Scheduler::Options{.config = config_, .log_sink = std::make_unique<NullSink>()});
    auto init = scheduler.initialize();
    ASSERT_FALSE(init.has_value());
    EXPECT_EQ(init.error().code, ErrorCode::InvalidArgument);
}

// ═══════════════════════════════════════════════
// Tick loop on its own thread
// ═══════════════════════════════════════════════

TEST_F(SchedulerIntegrationTest, TickLoopLaunchesDueSchedule) {
    config_.scheduler.enable_scheduling = true;
    config_.scheduler.warmup_delay_ms = 0;
    config_.scheduler.tick_interval_ms = 20;
    clock_->set(local_time(15, 1, 59, 59));

    auto scheduler = make_scheduler();
    ASSERT_TRUE(scheduler->is_running());

    // Called from the test thread while the loop owns the state
    ASSERT_TRUE(scheduler->add_schedule("nightly", nightly_full()).has_value());
    clock_->advance(Millis{1000});

    auto deadline = std::chrono::steady_clock::now() + kWait;
    std::optional<Schedule> schedule;
    while (std::chrono::steady_clock::now() < deadline) {
        schedule = scheduler->get_schedule("nightly");
        if (schedule && schedule->success_count == 1) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(schedule.has_value());
    EXPECT_EQ(schedule->success_count, 1u);
    EXPECT_EQ(schedule->next_run, local_time(16, 2, 0));

    scheduler->stop();
    EXPECT_FALSE(scheduler->is_running());
    auto restarted = scheduler->start();
    EXPECT_TRUE(restarted.has_value());
    scheduler->shutdown();

    EXPECT_TRUE(saw(EventKind::Started));
    EXPECT_TRUE(saw(EventKind::Stopped));
    EXPECT_TRUE(saw(EventKind::ScheduledBackupCompleted));
}
