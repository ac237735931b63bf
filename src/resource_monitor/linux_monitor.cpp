/**
 * @file linux_monitor.cpp
 * @brief LinuxMonitor: reads CPU, memory, load, and disk metrics from
 *        Linux pseudo-filesystems and statvfs().
 * @author Dimitris Kafetzis
 *
 * Sampling is performed by a dedicated std::jthread at a configurable
 * interval. The latest snapshot is published atomically so admission
 * checks never block on /proc I/O.
 */

#include "resource_monitor/monitor.hpp"

#include <sys/statvfs.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace backup_scheduler {

using CpuTimes = LinuxMonitor::CpuTimesInternal;

// ─────────────────────────────────────────────
// Internal helpers for /proc parsing
// ─────────────────────────────────────────────
namespace {

std::string read_file_line(const std::string& path) {
    std::ifstream ifs(path);
    std::string line;
    if (ifs.is_open()) {
        std::getline(ifs, line);
    }
    return line;
}

std::vector<std::string> read_file_lines(const std::string& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

/**
 * @brief Parse the aggregate CPU line from /proc/stat.
 * Format: "cpu user nice system idle iowait irq softirq steal ..."
 */
CpuTimes parse_cpu_line(const std::string& line) {
    CpuTimes times;
    std::istringstream iss(line);
    std::string label;
    iss >> label >> times.user >> times.nice >> times.system >> times.idle
        >> times.iowait >> times.irq >> times.softirq >> times.steal;
    return times;
}

CpuTimes read_cpu_times() {
    auto line = read_file_line("/proc/stat");
    if (!line.starts_with("cpu")) return {};
    return parse_cpu_line(line);
}

float compute_cpu_percent(const CpuTimes& prev, const CpuTimes& curr) {
    auto prev_total = prev.user + prev.nice + prev.system + prev.idle
                    + prev.iowait + prev.irq + prev.softirq + prev.steal;
    auto curr_total = curr.user + curr.nice + curr.system + curr.idle
                    + curr.iowait + curr.irq + curr.softirq + curr.steal;
    auto prev_active = prev.user + prev.nice + prev.system
                     + prev.irq + prev.softirq + prev.steal;
    auto curr_active = curr.user + curr.nice + curr.system
                     + curr.irq + curr.softirq + curr.steal;

    if (curr_total <= prev_total) return 0.0f;
    uint64_t total_delta = curr_total - prev_total;
    uint64_t active_delta = curr_active >= prev_active ? curr_active - prev_active : 0;
    return 100.0f * static_cast<float>(active_delta) / static_cast<float>(total_delta);
}

struct MemInfo {
    uint64_t total_kb{0};
    uint64_t available_kb{0};
};

MemInfo parse_meminfo() {
    MemInfo info;
    auto lines = read_file_lines("/proc/meminfo");
    for (const auto& line : lines) {
        if (line.starts_with("MemTotal:")) {
            std::istringstream iss(line.substr(9));
            iss >> info.total_kb;
        } else if (line.starts_with("MemAvailable:")) {
            std::istringstream iss(line.substr(13));
            iss >> info.available_kb;
        }
    }
    return info;
}

double read_load_average() {
    std::istringstream iss(read_file_line("/proc/loadavg"));
    double one_minute = 0.0;
    iss >> one_minute;
    return iss.fail() ? 0.0 : one_minute;
}

struct DiskInfo {
    uint64_t free_bytes{0};
    uint64_t total_bytes{0};
};

Result<DiskInfo> read_disk(const std::filesystem::path& path) {
    struct statvfs vfs{};
    if (::statvfs(path.c_str(), &vfs) != 0) {
        return Error{ErrorCode::Unavailable,
                     "statvfs(" + path.string() + ") failed: " + std::strerror(errno)};
    }
    return DiskInfo{
        .free_bytes = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize,
        .total_bytes = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize
    };
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// LinuxMonitor implementation
// ─────────────────────────────────────────────

LinuxMonitor::LinuxMonitor(std::filesystem::path disk_path, uint32_t sampling_interval_ms)
    : disk_path_(std::move(disk_path)), interval_ms_(sampling_interval_ms) {}

LinuxMonitor::~LinuxMonitor() {
    stop();
}

void LinuxMonitor::start() {
    if (sampling_thread_.joinable()) return;

    prev_cpu_times_ = read_cpu_times();

    // Publish an initial snapshot so the first admission check has data
    latest_.store(std::make_shared<ResourceSnapshot>(sample_once()));

    sampling_thread_ = std::jthread([this](std::stop_token stop) {
        sampling_loop(stop);
    });
}

void LinuxMonitor::stop() {
    if (sampling_thread_.joinable()) {
        sampling_thread_.request_stop();
        sampling_thread_.join();
    }
}

Result<ResourceSnapshot> LinuxMonitor::read() {
    auto snapshot = latest_.load();
    if (!snapshot) {
        return Error{ErrorCode::Unavailable, "No snapshot available yet"};
    }
    if (auto disk_error = disk_error_.load()) {
        return Error{ErrorCode::Unavailable, *disk_error};
    }
    return *snapshot;
}

float LinuxMonitor::cpu_usage() {
    auto snapshot = latest_.load();
    return snapshot ? snapshot->cpu_usage_percent : 0.0f;
}

uint64_t LinuxMonitor::disk_free() {
    auto snapshot = latest_.load();
    return snapshot ? snapshot->disk_free_bytes : 0;
}

double LinuxMonitor::load_average() {
    auto snapshot = latest_.load();
    return snapshot ? snapshot->load_average_1m : 0.0;
}

void LinuxMonitor::sampling_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        // Sleep in short slices so stop() does not wait a full interval
        auto wake = std::chrono::steady_clock::now() + std::chrono::milliseconds(interval_ms_);
        while (!stop.stop_requested() && std::chrono::steady_clock::now() < wake) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (stop.stop_requested()) break;

        latest_.store(std::make_shared<ResourceSnapshot>(sample_once()));
    }
}

ResourceSnapshot LinuxMonitor::sample_once() {
    ResourceSnapshot snap;
    snap.timestamp = std::chrono::system_clock::now();

    // CPU Usage
    auto curr = read_cpu_times();
    snap.cpu_usage_percent = compute_cpu_percent(prev_cpu_times_, curr);
    prev_cpu_times_ = curr;

    // Memory
    auto mem = parse_meminfo();
    snap.memory_total_bytes = mem.total_kb * 1024;
    snap.memory_available_bytes = mem.available_kb * 1024;

    // Disk
    if (auto disk = read_disk(disk_path_)) {
        snap.disk_free_bytes = disk->free_bytes;
        snap.disk_total_bytes = disk->total_bytes;
        disk_error_.store(nullptr);
    } else {
        disk_error_.store(std::make_shared<const std::string>(disk.error().message));
    }

    // Load
    snap.load_average_1m = read_load_average();

    return snap;
}

}  // namespace backup_scheduler
