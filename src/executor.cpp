/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobctl/executor.hpp"
#include "jobctl/event_bus.hpp"
#include "jobctl/logger.hpp"
#include <chrono>

namespace jobctl {

void JobSignal::requestCancel() noexcept {
    cancel_.store(true, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(mutex_);
    }
    // Wake a worker parked in checkpoint()
    changed_.notify_all();
}

void JobSignal::pause() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = true;
}

void JobSignal::resume() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = false;
    }
    changed_.notify_all();
}

bool JobSignal::paused() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

bool JobSignal::checkpoint() noexcept {
    std::unique_lock<std::mutex> lock(mutex_);
    changed_.wait(lock, [this] { return !paused_ || cancelRequested(); });
    return !cancelRequested();
}

void JobSignal::finish(JobOutcome outcome) noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) {
            return;
        }
        outcome_ = std::move(outcome);
        finished_ = true;
    }
    changed_.notify_all();
}

bool JobSignal::finished() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

bool JobSignal::waitFinished(std::chrono::steady_clock::time_point deadline) const noexcept {
    std::unique_lock<std::mutex> lock(mutex_);
    return changed_.wait_until(lock, deadline, [this] { return finished_; });
}

std::optional<JobOutcome> JobSignal::outcome() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!finished_) {
        return std::nullopt;
    }
    return outcome_;
}

JobContext::JobContext(JobId id, std::string kind, std::shared_ptr<JobSignal> signal,
                       std::shared_ptr<EventBus> events) noexcept
    : id_(std::move(id)), kind_(std::move(kind)), signal_(std::move(signal)), events_(std::move(events)) {
}

void JobContext::progress(std::size_t done, std::size_t total, const std::string& message) noexcept {
    if (!events_) {
        return;
    }
    try {
        JobEvent event;
        event.kind = EventKind::Progress;
        event.id = id_;
        event.jobKind = kind_;
        event.message = message;
        event.done = done;
        event.total = total;
        events_->publish(event);
    } catch (const std::exception& e) {
        LOG_WARN("Dropped progress report for job " + id_ + ": " + e.what());
    }
}

JobOutcome execute(Executor& executor, JobContext& context) noexcept {
    const JobId& jobId = context.id();
    auto startTime = std::chrono::steady_clock::now();

    try {
        RunResult result = executor.run(context);
        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();

        if (result.cancelled) {
            LOG_INFO("Job cancelled: " + jobId + " after " + std::to_string(elapsed) + "s");
            return {Status::Cancelled, result.error.empty() ? "cancelled" : result.error};
        }
        if (result.ok) {
            LOG_INFO("Job completed: " + jobId + " in " + std::to_string(elapsed) + "s");
            return {Status::Completed, result.output};
        }
        LOG_WARN("Job failed: " + jobId + " - " + result.error);
        return {Status::Failed, result.error};

    } catch (const std::exception& e) {
        LOG_ERROR("Exception running job " + jobId + ": " + std::string(e.what()));
        return {Status::Failed, std::string(toString(JobError::ExecutionFailure)) + ": " + e.what()};
    } catch (...) {
        LOG_ERROR("Unknown exception running job: " + jobId);
        return {Status::Failed, std::string(toString(JobError::ExecutionFailure)) + ": unknown error"};
    }
}

}
