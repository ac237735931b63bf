/**
 * @file monitor.hpp
 * @brief Resource monitor implementations used by admission control.
 * @author Dimitris Kafetzis
 *
 * Provides LinuxMonitor (reads from /proc and statvfs) and MockMonitor
 * (testing). Both satisfy the ResourceMonitorLike concept.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace backup_scheduler {

// ─────────────────────────────────────────────
// LinuxMonitor
// ─────────────────────────────────────────────

/**
 * @brief Reads system resources from Linux pseudo-filesystems.
 *
 * Satisfies ResourceMonitorLike. Runs a dedicated sampling thread
 * (std::jthread) and stores the latest snapshot atomically.
 *
 * Data sources:
 *   /proc/stat: CPU utilization (aggregate, delta between samples)
 *   /proc/meminfo: Memory total and available
 *   /proc/loadavg: 1-minute load average
 *   statvfs(path): Free and total bytes of the backup volume
 */
class LinuxMonitor {
public:
    explicit LinuxMonitor(std::filesystem::path disk_path = "/",
                          uint32_t sampling_interval_ms = 1000);
    ~LinuxMonitor();

    // Non-copyable
    LinuxMonitor(const LinuxMonitor&) = delete;
    LinuxMonitor& operator=(const LinuxMonitor&) = delete;

    // ResourceMonitorLike interface
    Result<ResourceSnapshot> read();
    float cpu_usage();
    uint64_t disk_free();
    double load_average();
    void start();
    void stop();

    struct CpuTimesInternal {
        uint64_t user{0}, nice{0}, system{0}, idle{0};
        uint64_t iowait{0}, irq{0}, softirq{0}, steal{0};
    };

private:
    void sampling_loop(std::stop_token stop);
    ResourceSnapshot sample_once();

    std::filesystem::path disk_path_;
    uint32_t interval_ms_;
    std::jthread sampling_thread_;
    std::atomic<std::shared_ptr<ResourceSnapshot>> latest_;
    std::atomic<std::shared_ptr<const std::string>> disk_error_;  ///< Set while statvfs fails

    CpuTimesInternal prev_cpu_times_{};
};

// ─────────────────────────────────────────────
// MockMonitor
// ─────────────────────────────────────────────

/**
 * @brief Mock resource monitor for testing.
 *
 * Returns predetermined resource sequences or a static snapshot.
 * Satisfies ResourceMonitorLike.
 */
class MockMonitor {
public:
    explicit MockMonitor(std::filesystem::path disk_path = "/",
                         uint32_t sampling_interval_ms = 0);

    // ResourceMonitorLike interface
    Result<ResourceSnapshot> read();
    float cpu_usage();
    uint64_t disk_free();
    double load_average();
    void start();
    void stop();

    // Test helpers: configure what snapshots are returned
    void push_snapshot(ResourceSnapshot snapshot);
    void set_static_snapshot(ResourceSnapshot snapshot);
    void set_cpu(float percent);
    void set_memory(uint64_t available, uint64_t total);
    void set_disk(uint64_t free, uint64_t total);
    void set_load_average(double load);
    void set_unavailable(bool unavailable);

    /// Number of read() calls so far.
    [[nodiscard]] size_t read_count() const noexcept { return reads_; }

private:
    const ResourceSnapshot& current() const;

    std::vector<ResourceSnapshot> sequence_;
    size_t index_{0};
    size_t reads_{0};
    ResourceSnapshot static_snapshot_;
    bool use_static_{true};
    bool unavailable_{false};
};

// Verify concept satisfaction at compile time
static_assert(ResourceMonitorLike<LinuxMonitor>);
static_assert(ResourceMonitorLike<MockMonitor>);

}  // namespace backup_scheduler
