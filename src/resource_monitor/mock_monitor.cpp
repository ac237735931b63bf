/**
 * @file mock_monitor.cpp
 * @brief MockMonitor implementation: configurable resource snapshots for testing.
 * @author Dimitris Kafetzis
 */

#include "resource_monitor/monitor.hpp"

namespace backup_scheduler {

MockMonitor::MockMonitor(std::filesystem::path /*disk_path*/, uint32_t /*sampling_interval_ms*/) {
    // An idle host with plenty of room on the backup volume
    static_snapshot_.cpu_usage_percent = 20.0f;
    static_snapshot_.memory_total_bytes = 8ULL * 1024 * 1024 * 1024;      // 8 GB
    static_snapshot_.memory_available_bytes = 6ULL * 1024 * 1024 * 1024;  // 6 GB
    static_snapshot_.disk_total_bytes = 500ULL * 1024 * 1024 * 1024;      // 500 GB
    static_snapshot_.disk_free_bytes = 250ULL * 1024 * 1024 * 1024;       // 250 GB
    static_snapshot_.load_average_1m = 0.5;
}

Result<ResourceSnapshot> MockMonitor::read() {
    ++reads_;
    if (unavailable_) {
        return Error{ErrorCode::Unavailable, "No snapshot available yet"};
    }
    if (use_static_) {
        static_snapshot_.timestamp = std::chrono::system_clock::now();
        return static_snapshot_;
    }
    if (index_ >= sequence_.size()) {
        return Error{ErrorCode::Unavailable, "Mock sequence exhausted"};
    }
    auto snap = sequence_[index_++];
    snap.timestamp = std::chrono::system_clock::now();
    return snap;
}

const ResourceSnapshot& MockMonitor::current() const {
    if (use_static_ || index_ == 0 || index_ > sequence_.size()) {
        return static_snapshot_;
    }
    return sequence_[index_ - 1];
}

float MockMonitor::cpu_usage() { return current().cpu_usage_percent; }
uint64_t MockMonitor::disk_free() { return current().disk_free_bytes; }
double MockMonitor::load_average() { return current().load_average_1m; }

void MockMonitor::start() { /* no-op for mock */ }
void MockMonitor::stop()  { /* no-op for mock */ }

void MockMonitor::push_snapshot(ResourceSnapshot snapshot) {
    use_static_ = false;
    sequence_.push_back(std::move(snapshot));
}

void MockMonitor::set_static_snapshot(ResourceSnapshot snapshot) {
    use_static_ = true;
    static_snapshot_ = std::move(snapshot);
}

void MockMonitor::set_cpu(float percent) {
    static_snapshot_.cpu_usage_percent = percent;
}

void MockMonitor::set_memory(uint64_t available, uint64_t total) {
    static_snapshot_.memory_available_bytes = available;
    static_snapshot_.memory_total_bytes = total;
}

void MockMonitor::set_disk(uint64_t free, uint64_t total) {
    static_snapshot_.disk_free_bytes = free;
    static_snapshot_.disk_total_bytes = total;
}

void MockMonitor::set_load_average(double load) {
    static_snapshot_.load_average_1m = load;
}

void MockMonitor::set_unavailable(bool unavailable) {
    unavailable_ = unavailable;
}

}  // namespace backup_scheduler
