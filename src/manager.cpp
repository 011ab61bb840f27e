/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobctl/manager.hpp"
#include "jobctl/channel.hpp"
#include "jobctl/logger.hpp"
#include "jobctl/repository.hpp"
#include <algorithm>
#include <chrono>

namespace jobctl {

namespace {
EventKind terminalEvent(Status status) noexcept {
    switch (status) {
        case Status::Completed: return EventKind::Completed;
        case Status::Cancelled: return EventKind::Cancelled;
        default: return EventKind::Failed;
    }
}
}

Manager::Manager(const Config& config, std::shared_ptr<CommandChannel> commands,
                 std::shared_ptr<EventBus> events, std::shared_ptr<JobRepository> repository)
    : config_(config),
      commands_(std::move(commands)),
      events_(std::move(events)),
      repository_(std::move(repository)),
      pool_(static_cast<int>(std::clamp<std::size_t>(config.maxConcurrency, 1, Config::kMaxConcurrency))) {
    // The running table must never outgrow the workers that serve it
    const auto workers = static_cast<std::size_t>(pool_.workerCount());
    if (config_.maxConcurrency != workers) {
        LOG_WARN("maxConcurrency of " + std::to_string(config_.maxConcurrency) + " clamped to " +
                 std::to_string(workers));
        config_.maxConcurrency = workers;
    }
    if (config_.shutdownGrace.count() < 0) {
        LOG_WARN("Negative shutdown grace raised to 0ms");
        config_.shutdownGrace = std::chrono::milliseconds(0);
    } else if (config_.shutdownGrace > Config::kMaxShutdownGrace) {
        LOG_WARN("Shutdown grace capped at " + std::to_string(Config::kMaxShutdownGrace.count()) + "ms");
        config_.shutdownGrace = Config::kMaxShutdownGrace;
    }
    if (!pool_.start()) {
        LOG_ERROR("Job manager has no worker pool; admitted jobs will fail");
    }
    LOG_DEBUG("Manager created - concurrency: " + std::to_string(config_.maxConcurrency) +
              ", shutdown grace: " + std::to_string(config_.shutdownGrace.count()) + "ms");
}

Manager::~Manager() {
    shutdown();
}

JobResult Manager::enqueue(std::unique_ptr<Executor> executor) {
    if (!executor) {
        return JobResult::failure(JobError::InvalidState, "No executor provided");
    }

    const JobId id = executor->id();
    if (shutdown_) {
        return JobResult::failure(JobError::InvalidState, "Manager is shut down, rejecting job " + id);
    }
    if (id.empty()) {
        return JobResult::failure(JobError::InvalidState, "Job id must not be empty");
    }
    if (running_.count(id) > 0 || isQueued(id)) {
        return JobResult::failure(JobError::DuplicateId, "Job already exists: " + id);
    }

    std::string kind;
    try {
        kind = executor->kind();
    } catch (const std::exception& e) {
        return JobResult::failure(JobError::InvalidState, "Cannot read kind of job " + id + ": " + e.what());
    }

    if (repository_) {
        JobRecord recordEntry;
        recordEntry.id = id;
        recordEntry.kind = kind;
        recordEntry.status = Status::Queued;
        recordEntry.timestamp = std::chrono::system_clock::now();
        try {
            if (!repository_->create(recordEntry)) {
                LOG_WARN("Failed to persist new job: " + id);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Repository error creating job " + id + ": " + std::string(e.what()));
        }
    }

    if (running_.size() < config_.maxConcurrency) {
        dispatch(QueuedJob{std::move(executor), std::move(kind)});
    } else {
        queue_.push_back(QueuedJob{std::move(executor), std::move(kind)});
        LOG_DEBUG("Job queued: " + id + " (position " + std::to_string(queue_.size()) + ")");
    }
    return JobResult::success();
}

void Manager::complete(const JobId& id, const JobOutcome& outcome) {
    auto it = running_.find(id);
    if (it == running_.end()) {
        if (shutdown_) {
            LOG_DEBUG("Late completion after shutdown ignored: " + id);
        } else {
            LOG_WARN("Completion reported for job that is not running: " + id);
        }
        return;
    }

    const std::string kind = it->second.kind;
    running_.erase(it);

    Status finalStatus = isTerminal(outcome.status) ? outcome.status : Status::Failed;
    record(id, finalStatus, outcome.message);
    publish(terminalEvent(finalStatus), id, kind, outcome.message);
    LOG_INFO("Job " + id + " finished: " + toString(finalStatus));

    fillToCapacity();
}

JobResult Manager::cancel(const JobId& id) {
    auto queued = std::find_if(queue_.begin(), queue_.end(),
        [&id](const QueuedJob& job) { return job.executor->id() == id; });
    if (queued != queue_.end()) {
        const std::string kind = queued->kind;
        queue_.erase(queued);
        record(id, Status::Cancelled, "cancelled before start");
        publish(EventKind::Cancelled, id, kind, "cancelled before start");
        LOG_INFO("Removed queued job: " + id);
        return JobResult::success();
    }

    auto it = running_.find(id);
    if (it == running_.end()) {
        return JobResult::failure(JobError::NotFound, "No queued or running job: " + id);
    }

    RunningJob& job = it->second;
    if (job.status == Status::Cancelling) {
        return JobResult::success();
    }

    job.signal->requestCancel();
    job.status = Status::Cancelling;
    record(id, Status::Cancelling, "cancellation requested");
    LOG_INFO("Cancellation requested for job: " + id);
    return JobResult::success();
}

JobResult Manager::pause(const JobId& id) {
    auto it = running_.find(id);
    if (it == running_.end()) {
        if (isQueued(id)) {
            return JobResult::failure(JobError::InvalidState, "Cannot pause queued job: " + id);
        }
        return JobResult::failure(JobError::NotFound, "No running job: " + id);
    }

    RunningJob& job = it->second;
    if (job.status == Status::Cancelling) {
        return JobResult::failure(JobError::InvalidState, "Job is being cancelled: " + id);
    }
    if (job.signal->paused()) {
        return JobResult::failure(JobError::InvalidState, "Job already paused: " + id);
    }

    job.signal->pause();
    LOG_INFO("Pause requested for job: " + id);
    return JobResult::success();
}

JobResult Manager::resume(const JobId& id) {
    auto it = running_.find(id);
    if (it == running_.end()) {
        if (isQueued(id)) {
            return JobResult::failure(JobError::InvalidState, "Cannot resume queued job: " + id);
        }
        return JobResult::failure(JobError::NotFound, "No running job: " + id);
    }

    RunningJob& job = it->second;
    if (job.status == Status::Cancelling) {
        return JobResult::failure(JobError::InvalidState, "Job is being cancelled: " + id);
    }
    if (!job.signal->paused()) {
        return JobResult::failure(JobError::InvalidState, "Job is not paused: " + id);
    }

    job.signal->resume();
    LOG_INFO("Resume requested for job: " + id);
    return JobResult::success();
}

void Manager::shutdown() noexcept {
    if (shutdown_) {
        return;
    }
    shutdown_ = true;

    const auto deadline = std::chrono::steady_clock::now() + config_.shutdownGrace;
    LOG_INFO("Shutting down job manager: " + std::to_string(running_.size()) + " running, " +
             std::to_string(queue_.size()) + " queued");

    for (auto& [id, job] : running_) {
        job.signal->requestCancel();
        job.status = Status::Cancelling;
    }

    for (const auto& job : queue_) {
        record(job.executor->id(), Status::Cancelled, "discarded at shutdown");
        publish(EventKind::Cancelled, job.executor->id(), job.kind, "discarded at shutdown");
    }
    queue_.clear();

    std::size_t abandoned = 0;
    for (auto& [id, job] : running_) {
        if (job.signal->waitFinished(deadline)) {
            JobOutcome outcome = job.signal->outcome().value_or(JobOutcome{Status::Cancelled, "cancelled"});
            record(id, outcome.status, outcome.message);
            publish(terminalEvent(outcome.status), id, job.kind, outcome.message);
        } else {
            ++abandoned;
            LOG_WARN("Job did not stop within shutdown grace period, abandoning: " + id);
            record(id, Status::Cancelled, "abandoned at shutdown");
            publish(EventKind::Cancelled, id, job.kind, "abandoned at shutdown");
        }
    }
    running_.clear();

    std::size_t detached = pool_.stop(deadline);
    if (abandoned > 0 || detached > 0) {
        LOG_WARN("Job manager shut down with " + std::to_string(abandoned) + " abandoned job(s)");
    } else {
        LOG_INFO("Job manager shut down cleanly");
    }
}

ManagerSnapshot Manager::snapshot() const {
    ManagerSnapshot snap;
    snap.running.reserve(running_.size());
    for (const auto& [id, job] : running_) {
        snap.running.push_back({id, job.kind, job.status, job.signal->paused()});
    }
    std::sort(snap.running.begin(), snap.running.end(),
        [](const RunningEntry& a, const RunningEntry& b) { return a.id < b.id; });

    snap.queued.reserve(queue_.size());
    for (const auto& job : queue_) {
        snap.queued.push_back(job.executor->id());
    }
    return snap;
}

std::optional<Status> Manager::status(const JobId& id) const {
    auto it = running_.find(id);
    if (it != running_.end()) {
        return it->second.status;
    }
    if (isQueued(id)) {
        return Status::Queued;
    }
    return std::nullopt;
}

bool Manager::isPaused(const JobId& id) const {
    auto it = running_.find(id);
    return it != running_.end() && it->second.signal->paused();
}

void Manager::dispatch(QueuedJob job) {
    const JobId id = job.executor->id();
    const std::string kind = std::move(job.kind);
    auto signal = std::make_shared<JobSignal>();

    running_.emplace(id, RunningJob{kind, Status::Running, signal});
    record(id, Status::Running, "");
    publish(EventKind::Started, id, kind, "");

    std::shared_ptr<Executor> owned(std::move(job.executor));
    auto commands = commands_;
    auto events = events_;
    bool submitted = pool_.submit([owned, kind, signal, commands, events](int workerId) {
        LOG_INFO(workerThreadName(workerId) + " running job: " + owned->id());
        JobContext context(owned->id(), kind, signal, events);
        JobOutcome outcome = execute(*owned, context);
        signal->finish(outcome);

        if (!commands || !commands->send(CompleteJob{owned->id(), std::move(outcome)})) {
            LOG_WARN("Completion of job " + owned->id() + " could not be reported, controller is gone");
        }
    });

    if (!submitted) {
        running_.erase(id);
        LOG_ERROR("Failed to dispatch job: " + id);
        record(id, Status::Failed, "worker pool unavailable");
        publish(EventKind::Failed, id, kind, "worker pool unavailable");
        return;
    }
    LOG_DEBUG("Job dispatched: " + id + " (" + std::to_string(running_.size()) + "/" +
              std::to_string(config_.maxConcurrency) + " running)");
}

void Manager::fillToCapacity() {
    while (!shutdown_ && running_.size() < config_.maxConcurrency && !queue_.empty()) {
        QueuedJob next = std::move(queue_.front());
        queue_.pop_front();
        LOG_DEBUG("Promoting queued job: " + next.executor->id());
        dispatch(std::move(next));
    }
}

bool Manager::isQueued(const JobId& id) const {
    return std::any_of(queue_.begin(), queue_.end(),
        [&id](const QueuedJob& job) { return job.executor->id() == id; });
}

void Manager::record(const JobId& id, Status status, const std::string& message) noexcept {
    if (!repository_) {
        return;
    }
    try {
        if (!repository_->updateStatus(id, status, message)) {
            LOG_DEBUG("Repository did not record " + std::string(toString(status)) + " for job " + id);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Repository error updating job " + id + ": " + std::string(e.what()));
    }
}

void Manager::publish(EventKind kind, const JobId& id, const std::string& jobKind,
                      const std::string& message) noexcept {
    if (!events_) {
        return;
    }
    try {
        JobEvent event;
        event.kind = kind;
        event.id = id;
        event.jobKind = jobKind;
        event.message = message;
        events_->publish(event);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to publish event for job " + id + ": " + std::string(e.what()));
    }
}

}
