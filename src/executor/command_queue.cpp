/**
 * @file command_queue.cpp
 * @brief CommandQueue implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/command_queue.hpp"

namespace backup_scheduler {

void CommandQueue::post(Command command) {
    {
        std::lock_guard lock(mutex_);
        commands_.push_back(std::move(command));
    }
    cv_.notify_all();
}

std::vector<CommandQueue::Command> CommandQueue::drain() {
    std::lock_guard lock(mutex_);
    std::vector<Command> out;
    out.reserve(commands_.size());
    for (auto& command : commands_) {
        out.push_back(std::move(command));
    }
    commands_.clear();
    return out;
}

bool CommandQueue::wait_until(std::stop_token stop, Deadline deadline) {
    std::unique_lock lock(mutex_);
    return cv_.wait_until(lock, stop, deadline, [this] { return !commands_.empty(); });
}

size_t CommandQueue::pending() const {
    std::lock_guard lock(mutex_);
    return commands_.size();
}

}  // namespace backup_scheduler
