/**
 * @file frequency.hpp
 * @brief Restricted cron-subset parser and next-run computation.
 * @author Dimitris Kafetzis
 */

// Expression format: "minute hour day month dayOfWeek".
//
// Supported hour forms:
//   */N  every N hours at the fixed minute
//   H    daily at H:minute
//
// The day, month and day-of-week fields must be present but are not
// evaluated; every schedule is either periodic within a day or daily.
// All wall-clock arithmetic uses the process's local time zone.

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace backup_scheduler {

struct Frequency {
    int minute{0};                    ///< [0, 59]
    std::optional<int> hour_step;     // set for the */N form
    int hour{0};                      ///< [0, 23], used when hour_step is empty
    std::string day;
    std::string month;
    std::string day_of_week;

    [[nodiscard]] bool is_step() const noexcept { return hour_step.has_value(); }
};

/**
 * @brief Parse a frequency expression.
 * @return InvalidFrequencyFormat unless there are exactly five fields with
 *         a supported minute and hour form.
 */
Result<Frequency> parse_frequency(std::string_view expression);

/**
 * @brief Next run instant strictly after @p from.
 */
Timestamp next_run_after(const Frequency& frequency, Timestamp from);

/**
 * @brief Parse then compute; the Time Evaluator entry point.
 */
Result<Timestamp> compute_next_run(std::string_view expression, Timestamp from);

}  // namespace backup_scheduler
