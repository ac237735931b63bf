/**
 * @file clock.cpp
 * @brief SystemClock, ManualClock, and timestamp formatting.
 * @author Dimitris Kafetzis
 */

#include "core/clock.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace backup_scheduler {

std::string format_iso8601(Timestamp ts) {
    auto time_t_value = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<Millis>(ts.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += Millis{1000};
        --time_t_value;
    }

    std::tm utc{};
    gmtime_r(&time_t_value, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

// ── SystemClock ──────────────────────────────

Timestamp SystemClock::now() const {
    return std::chrono::time_point_cast<Millis>(std::chrono::system_clock::now());
}

// ── ManualClock ──────────────────────────────

ManualClock::ManualClock(Timestamp start)
    : now_(std::chrono::time_point_cast<Millis>(start)) {}

Timestamp ManualClock::now() const {
    std::lock_guard lock(mutex_);
    return now_;
}

void ManualClock::set(Timestamp ts) {
    std::lock_guard lock(mutex_);
    now_ = std::chrono::time_point_cast<Millis>(ts);
}

void ManualClock::advance(Millis delta) {
    std::lock_guard lock(mutex_);
    now_ += delta;
}

}  // namespace backup_scheduler
