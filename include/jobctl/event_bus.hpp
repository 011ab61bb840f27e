/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "jobctl/types.hpp"

namespace jobctl {

enum class EventKind : uint8_t { Started, Progress, Completed, Failed, Cancelled };

struct JobEvent {
    EventKind kind = EventKind::Started;
    JobId id;
    std::string jobKind;
    std::string message;
    std::size_t done = 0;
    std::size_t total = 0;
};

[[nodiscard]] const char* toString(EventKind kind) noexcept;

class EventBus;

// A subscriber's view of the bus. Receives events published after it was
// created; detaches when destroyed.
class Subscription {
public:
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&&) = delete;
    Subscription& operator=(Subscription&&) = delete;

    [[nodiscard]] std::optional<JobEvent> tryRecv();
    [[nodiscard]] std::optional<JobEvent> recv(std::chrono::milliseconds timeout);

    // Events dropped because this subscriber fell behind.
    [[nodiscard]] std::uint64_t lagged() const noexcept;
    [[nodiscard]] std::size_t pending() const noexcept;

private:
    friend class EventBus;

    struct Buffer {
        explicit Buffer(std::size_t cap) : capacity(cap) {}

        const std::size_t capacity;
        mutable std::mutex mutex;
        std::condition_variable ready;
        std::deque<JobEvent> events;
        std::uint64_t dropped = 0;
    };

    Subscription(std::weak_ptr<EventBus> bus, std::shared_ptr<Buffer> buffer);

    std::weak_ptr<EventBus> bus_;
    std::shared_ptr<Buffer> buffer_;
};

// Fan-out broadcast of job lifecycle transitions. publish() never blocks on
// subscribers: a full buffer loses its oldest event.
class EventBus : public std::enable_shared_from_this<EventBus> {
public:
    [[nodiscard]] static std::shared_ptr<EventBus> create(std::size_t capacity);

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    void publish(const JobEvent& event) noexcept;
    [[nodiscard]] std::unique_ptr<Subscription> subscribe();

    [[nodiscard]] std::size_t subscriberCount() const noexcept;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    explicit EventBus(std::size_t capacity) noexcept;

    friend class Subscription;
    void detach(const Subscription::Buffer* buffer) noexcept;

    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<Subscription::Buffer>> subscribers_;
};

}
