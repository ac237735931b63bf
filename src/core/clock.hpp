/**
 * @file clock.hpp
 * @brief Injectable wall clock for scheduling decisions.
 * @author Dimitris Kafetzis
 *
 * The scheduler never calls system_clock::now() directly; it asks an IClock.
 * Tests substitute ManualClock to drive due times and timeouts.
 */

#pragma once

#include "core/types.hpp"

#include <mutex>

namespace backup_scheduler {

class IClock {
public:
    virtual ~IClock() = default;

    /// Current wall-clock instant, truncated to millisecond precision.
    [[nodiscard]] virtual Timestamp now() const = 0;
};

/**
 * @brief Real wall clock.
 */
class SystemClock : public IClock {
public:
    [[nodiscard]] Timestamp now() const override;
};

/**
 * @brief Manually advanced clock for deterministic tests.
 *
 * Thread-safe: worker threads may read it while the test advances it.
 */
class ManualClock : public IClock {
public:
    explicit ManualClock(Timestamp start);

    [[nodiscard]] Timestamp now() const override;

    void set(Timestamp ts);
    void advance(Millis delta);

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

}  // namespace backup_scheduler
