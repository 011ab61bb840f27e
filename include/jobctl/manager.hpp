/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "jobctl/command.hpp"
#include "jobctl/config.hpp"
#include "jobctl/event_bus.hpp"
#include "jobctl/executor.hpp"
#include "jobctl/pool.hpp"
#include "jobctl/types.hpp"

namespace jobctl {

class CommandChannel;
class JobRepository;

// Owns the pending queue and the running table. Not thread-safe: every
// call must come from the single thread that owns the manager (the
// controller loop). Workers report back by sending CompleteJob into the
// command channel, never by calling in here.
class Manager {
public:
    Manager(const Config& config, std::shared_ptr<CommandChannel> commands,
            std::shared_ptr<EventBus> events = nullptr,
            std::shared_ptr<JobRepository> repository = nullptr);
    ~Manager();

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;
    Manager(Manager&&) = delete;
    Manager& operator=(Manager&&) = delete;

    [[nodiscard]] JobResult enqueue(std::unique_ptr<Executor> executor);
    void complete(const JobId& id, const JobOutcome& outcome);
    [[nodiscard]] JobResult cancel(const JobId& id);
    [[nodiscard]] JobResult pause(const JobId& id);
    [[nodiscard]] JobResult resume(const JobId& id);
    void shutdown() noexcept;

    [[nodiscard]] ManagerSnapshot snapshot() const;
    [[nodiscard]] std::optional<Status> status(const JobId& id) const;
    [[nodiscard]] bool isPaused(const JobId& id) const;

    [[nodiscard]] std::size_t runningCount() const noexcept { return running_.size(); }
    [[nodiscard]] std::size_t queuedCount() const noexcept { return queue_.size(); }
    [[nodiscard]] std::size_t maxConcurrency() const noexcept { return config_.maxConcurrency; }
    [[nodiscard]] bool isShutdown() const noexcept { return shutdown_; }

private:
    struct RunningJob {
        std::string kind;
        Status status = Status::Running;
        std::shared_ptr<JobSignal> signal;
    };

    // kind() is read once at admission so promotion never calls into the executor.
    struct QueuedJob {
        std::unique_ptr<Executor> executor;
        std::string kind;
    };

    void dispatch(QueuedJob job);
    void fillToCapacity();
    [[nodiscard]] bool isQueued(const JobId& id) const;

    void record(const JobId& id, Status status, const std::string& message) noexcept;
    void publish(EventKind kind, const JobId& id, const std::string& jobKind,
                 const std::string& message) noexcept;

    Config config_;
    std::shared_ptr<CommandChannel> commands_;
    std::shared_ptr<EventBus> events_;
    std::shared_ptr<JobRepository> repository_;

    Pool pool_;
    std::deque<QueuedJob> queue_;
    std::unordered_map<JobId, RunningJob> running_;
    bool shutdown_ = false;
};

}
