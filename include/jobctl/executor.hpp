/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "jobctl/types.hpp"

namespace jobctl {

class EventBus;

struct RunResult {
    bool ok = false;
    bool cancelled = false;  // stopped early after observing a cancel request
    std::string output;
    std::string error;

    static RunResult success(std::string output = "") { return {true, false, std::move(output), ""}; }
    static RunResult failure(std::string error) { return {false, false, "", std::move(error)}; }
    static RunResult stopped() { return {false, true, "", "cancelled"}; }
};

// Cancel/pause flags shared between the manager's running entry and the
// worker executing the job, plus the completion latch shutdown waits on.
class JobSignal {
public:
    JobSignal() = default;

    JobSignal(const JobSignal&) = delete;
    JobSignal& operator=(const JobSignal&) = delete;

    void requestCancel() noexcept;
    [[nodiscard]] bool cancelRequested() const noexcept { return cancel_.load(std::memory_order_acquire); }

    void pause() noexcept;
    void resume() noexcept;
    [[nodiscard]] bool paused() const noexcept;

    // Blocks while paused. Returns false once cancellation was requested.
    [[nodiscard]] bool checkpoint() noexcept;

    void finish(JobOutcome outcome) noexcept;
    [[nodiscard]] bool finished() const noexcept;
    [[nodiscard]] bool waitFinished(std::chrono::steady_clock::time_point deadline) const noexcept;
    [[nodiscard]] std::optional<JobOutcome> outcome() const;

private:
    std::atomic<bool> cancel_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;
    bool paused_ = false;
    bool finished_ = false;
    JobOutcome outcome_;
};

// What a running executor sees of the outside world.
class JobContext {
public:
    JobContext(JobId id, std::string kind, std::shared_ptr<JobSignal> signal,
               std::shared_ptr<EventBus> events) noexcept;

    [[nodiscard]] const JobId& id() const noexcept { return id_; }
    [[nodiscard]] bool cancelled() const noexcept { return signal_->cancelRequested(); }
    [[nodiscard]] bool checkpoint() noexcept { return signal_->checkpoint(); }

    void progress(std::size_t done, std::size_t total, const std::string& message = "") noexcept;

private:
    JobId id_;
    std::string kind_;
    std::shared_ptr<JobSignal> signal_;
    std::shared_ptr<EventBus> events_;
};

// A unit of work. Implementations must poll JobContext::checkpoint() (or
// cancelled()) at bounded intervals; cancellation is never forced.
class Executor {
public:
    virtual ~Executor() = default;

    [[nodiscard]] virtual const JobId& id() const noexcept = 0;
    [[nodiscard]] virtual std::string kind() const = 0;
    [[nodiscard]] virtual RunResult run(JobContext& context) = 0;
};

// Runs an executor to completion and folds its result into a terminal
// outcome. Exceptions escaping run() become Failed.
[[nodiscard]] JobOutcome execute(Executor& executor, JobContext& context) noexcept;

}
