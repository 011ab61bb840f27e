/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobctl/channel.hpp"
#include "jobctl/logger.hpp"

namespace jobctl {

bool CommandChannel::send(Command command) noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            commands_.push_back(std::move(command));
        }
        available_.notify_one();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue command: " + std::string(e.what()));
        return false;
    }
}

std::optional<Command> CommandChannel::receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait(lock, [this] { return !commands_.empty() || closed_; });
    if (commands_.empty()) {
        return std::nullopt;
    }
    Command command = std::move(commands_.front());
    commands_.pop_front();
    return command;
}

std::optional<Command> CommandChannel::tryReceive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (commands_.empty()) {
        return std::nullopt;
    }
    Command command = std::move(commands_.front());
    commands_.pop_front();
    return command;
}

std::optional<Command> CommandChannel::receiveFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait_for(lock, timeout, [this] { return !commands_.empty() || closed_; });
    if (commands_.empty()) {
        return std::nullopt;
    }
    Command command = std::move(commands_.front());
    commands_.pop_front();
    return command;
}

void CommandChannel::close() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    available_.notify_all();
}

bool CommandChannel::isClosed() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t CommandChannel::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_.size();
}

}
