/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "jobctl/command.hpp"

namespace jobctl {

// Unbounded multi-producer queue feeding the controller. send() never
// blocks; after close() sends fail but queued commands can still be drained.
class CommandChannel {
public:
    CommandChannel() = default;

    CommandChannel(const CommandChannel&) = delete;
    CommandChannel& operator=(const CommandChannel&) = delete;
    CommandChannel(CommandChannel&&) = delete;
    CommandChannel& operator=(CommandChannel&&) = delete;

    // On failure the command is destroyed, which drops any reply slot it carries.
    [[nodiscard]] bool send(Command command) noexcept;

    // Blocks until a command arrives; nullopt once closed and drained.
    [[nodiscard]] std::optional<Command> receive();
    [[nodiscard]] std::optional<Command> tryReceive();
    [[nodiscard]] std::optional<Command> receiveFor(std::chrono::milliseconds timeout);

    void close() noexcept;
    [[nodiscard]] bool isClosed() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<Command> commands_;
    bool closed_ = false;
};

}
