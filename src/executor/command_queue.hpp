/**
 * @file command_queue.hpp
 * @brief Multi-producer mailbox drained by the scheduler thread.
 * @author Dimitris Kafetzis
 *
 * Worker threads and API callers never touch scheduler state directly;
 * they post a command here and the scheduler thread runs it.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <vector>

namespace backup_scheduler {

class CommandQueue {
public:
    using Command = std::function<void()>;
    using Deadline = std::chrono::steady_clock::time_point;

    void post(Command command);

    /// Remove and return every pending command, in post order.
    [[nodiscard]] std::vector<Command> drain();

    /**
     * @brief Block until a command is pending, @p deadline passes, or
     *        @p stop is requested.
     * @return true if at least one command is pending.
     */
    bool wait_until(std::stop_token stop, Deadline deadline);

    [[nodiscard]] size_t pending() const;

private:
    std::deque<Command> commands_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
};

}  // namespace backup_scheduler
