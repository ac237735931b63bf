/**
 * @file frequency.cpp
 * @brief Frequency parsing and next-run computation in local time.
 * @author Dimitris Kafetzis
 *
 * Step form: candidates are the hours 0, N, 2N, ... below 24 at the fixed
 * minute, today then tomorrow; the first one strictly after the reference
 * instant wins. Fixed form: today at H:M, else tomorrow at H:M.
 */

#include "schedule/frequency.hpp"

#include <charconv>
#include <ctime>
#include <sstream>
#include <vector>

namespace backup_scheduler {

namespace {

constexpr int kHoursPerDay = 24;

std::vector<std::string> split_fields(std::string_view expression) {
    std::vector<std::string> fields;
    std::istringstream iss{std::string{expression}};
    std::string field;
    while (iss >> field) {
        fields.push_back(std::move(field));
    }
    return fields;
}

std::optional<int> parse_int(std::string_view text, int min, int max) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    if (value < min || value > max) return std::nullopt;
    return value;
}

Error invalid(std::string_view expression, std::string_view reason) {
    return Error{ErrorCode::InvalidFrequencyFormat,
                 "Invalid cron format: '" + std::string{expression} + "' (" + std::string{reason} + ")"};
}

std::tm to_local(Timestamp ts) {
    auto t = std::chrono::system_clock::to_time_t(ts);
    std::tm local{};
    localtime_r(&t, &local);
    return local;
}

/// Build the instant for @p base's calendar day shifted by @p day_offset, at hour:minute.
Timestamp at_local(const std::tm& base, int day_offset, int hour, int minute) {
    std::tm candidate = base;
    candidate.tm_mday += day_offset;
    candidate.tm_hour = hour;
    candidate.tm_min = minute;
    candidate.tm_sec = 0;
    candidate.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&candidate));
}

}  // namespace

Result<Frequency> parse_frequency(std::string_view expression) {
    auto fields = split_fields(expression);
    if (fields.size() != 5) {
        return invalid(expression, "expected 5 fields, got " + std::to_string(fields.size()));
    }

    Frequency freq;

    auto minute = parse_int(fields[0], 0, 59);
    if (!minute) return invalid(expression, "minute must be 0-59");
    freq.minute = *minute;

    const auto& hour = fields[1];
    if (hour.starts_with("*/")) {
        auto step = parse_int(std::string_view{hour}.substr(2), 1, kHoursPerDay - 1);
        if (!step) return invalid(expression, "hour step must be 1-23");
        freq.hour_step = *step;
    } else {
        auto fixed = parse_int(hour, 0, kHoursPerDay - 1);
        if (!fixed) return invalid(expression, "hour must be 0-23 or */N");
        freq.hour = *fixed;
    }

    freq.day = fields[2];
    freq.month = fields[3];
    freq.day_of_week = fields[4];
    return freq;
}

Timestamp next_run_after(const Frequency& frequency, Timestamp from) {
    auto local = to_local(from);

    if (frequency.is_step()) {
        const int step = *frequency.hour_step;
        for (int day_offset = 0; day_offset <= 1; ++day_offset) {
            for (int hour = 0; hour < kHoursPerDay; hour += step) {
                auto candidate = at_local(local, day_offset, hour, frequency.minute);
                if (candidate > from) return candidate;
            }
        }
        // Only reachable across a DST jump; two days out is always later.
        return at_local(local, 2, 0, frequency.minute);
    }

    auto today = at_local(local, 0, frequency.hour, frequency.minute);
    if (today > from) return today;
    return at_local(local, 1, frequency.hour, frequency.minute);
}

Result<Timestamp> compute_next_run(std::string_view expression, Timestamp from) {
    auto freq = parse_frequency(expression);
    if (!freq) return freq.error();
    return next_run_after(*freq, from);
}

}  // namespace backup_scheduler
