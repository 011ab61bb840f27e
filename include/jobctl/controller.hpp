/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <future>
#include <memory>
#include <thread>

#include "jobctl/command.hpp"
#include "jobctl/config.hpp"
#include "jobctl/types.hpp"

namespace jobctl {

class CommandChannel;
class EventBus;
class JobRepository;
class Manager;

// Serializes every command into the job manager on one dedicated thread.
// Any thread may push commands; only the loop thread touches the manager.
class Controller final {
public:
    explicit Controller(const Config& config, std::shared_ptr<JobRepository> repository = nullptr);
    ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;
    Controller(Controller&&) = delete;
    Controller& operator=(Controller&&) = delete;

    [[nodiscard]] bool start();

    // Never blocks. False once the controller has shut down; the command
    // (and any reply slot in it) is dropped in that case.
    [[nodiscard]] bool push(Command command) noexcept;

    // Fire-and-forget: the outcome only shows up in logs, events and records.
    bool enqueue(std::unique_ptr<Executor> executor) noexcept;
    bool pause(const JobId& id) noexcept;
    bool resume(const JobId& id) noexcept;

    // The future always resolves: with the manager's answer, or with
    // std::future_error(broken_promise) if the controller is gone.
    [[nodiscard]] std::future<JobResult> cancel(const JobId& id);
    [[nodiscard]] std::future<void> shutdown();
    [[nodiscard]] std::future<ManagerSnapshot> inspect();

    // Waits for the command loop to exit (after a Shutdown command).
    void join();

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::shared_ptr<EventBus> events() const noexcept { return events_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    void watch();

    void handle(EnqueueJob& command);
    void handle(CompleteJob& command);
    void handle(CancelJob& command);
    void handle(PauseJob& command);
    void handle(ResumeJob& command);
    void handle(Shutdown& command);
    void handle(InspectJobs& command);

    Config config_;
    std::shared_ptr<CommandChannel> commands_;
    std::shared_ptr<EventBus> events_;
    std::unique_ptr<Manager> manager_;

    std::atomic<bool> running_{false};
    std::thread loopThread_;
};

}
