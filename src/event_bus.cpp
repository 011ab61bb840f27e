/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobctl/event_bus.hpp"
#include "jobctl/logger.hpp"
#include <algorithm>

namespace jobctl {

const char* toString(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::Started: return "started";
        case EventKind::Progress: return "progress";
        case EventKind::Completed: return "completed";
        case EventKind::Failed: return "failed";
        case EventKind::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

Subscription::Subscription(std::weak_ptr<EventBus> bus, std::shared_ptr<Buffer> buffer)
    : bus_(std::move(bus)), buffer_(std::move(buffer)) {
}

Subscription::~Subscription() {
    if (auto bus = bus_.lock()) {
        bus->detach(buffer_.get());
    }
}

std::optional<JobEvent> Subscription::tryRecv() {
    std::lock_guard<std::mutex> lock(buffer_->mutex);
    if (buffer_->events.empty()) {
        return std::nullopt;
    }
    JobEvent event = std::move(buffer_->events.front());
    buffer_->events.pop_front();
    return event;
}

std::optional<JobEvent> Subscription::recv(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(buffer_->mutex);
    if (!buffer_->ready.wait_for(lock, timeout, [this] { return !buffer_->events.empty(); })) {
        return std::nullopt;
    }
    JobEvent event = std::move(buffer_->events.front());
    buffer_->events.pop_front();
    return event;
}

std::uint64_t Subscription::lagged() const noexcept {
    std::lock_guard<std::mutex> lock(buffer_->mutex);
    return buffer_->dropped;
}

std::size_t Subscription::pending() const noexcept {
    std::lock_guard<std::mutex> lock(buffer_->mutex);
    return buffer_->events.size();
}

std::shared_ptr<EventBus> EventBus::create(std::size_t capacity) {
    return std::shared_ptr<EventBus>(new EventBus(capacity == 0 ? 1 : capacity));
}

EventBus::EventBus(std::size_t capacity) noexcept : capacity_(capacity) {
}

void EventBus::publish(const JobEvent& event) noexcept {
    try {
        std::vector<std::shared_ptr<Subscription::Buffer>> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            targets.reserve(subscribers_.size());
            for (const auto& weak : subscribers_) {
                if (auto buffer = weak.lock()) {
                    targets.push_back(std::move(buffer));
                }
            }
        }

        for (auto& buffer : targets) {
            {
                std::lock_guard<std::mutex> lock(buffer->mutex);
                if (buffer->events.size() >= buffer->capacity) {
                    buffer->events.pop_front();
                    ++buffer->dropped;
                }
                buffer->events.push_back(event);
            }
            buffer->ready.notify_one();
        }

        LOG_TRACE(std::string("Event ") + toString(event.kind) + " for job " + event.id +
                  " delivered to " + std::to_string(targets.size()) + " subscriber(s)");
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to publish event for job " + event.id + ": " + std::string(e.what()));
    }
}

std::unique_ptr<Subscription> EventBus::subscribe() {
    auto buffer = std::make_shared<Subscription::Buffer>(capacity_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers_.push_back(buffer);
    }
    return std::unique_ptr<Subscription>(new Subscription(weak_from_this(), std::move(buffer)));
}

std::size_t EventBus::subscriberCount() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(subscribers_.begin(), subscribers_.end(),
        [](const auto& weak) { return !weak.expired(); }));
}

void EventBus::detach(const Subscription::Buffer* buffer) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
        [buffer](const auto& weak) {
            auto locked = weak.lock();
            return !locked || locked.get() == buffer;
        }), subscribers_.end());
}

}
