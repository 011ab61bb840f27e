/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <variant>
#include <vector>

#include "jobctl/executor.hpp"
#include "jobctl/reply.hpp"
#include "jobctl/types.hpp"

namespace jobctl {

struct RunningEntry {
    JobId id;
    std::string kind;
    Status status = Status::Running;
    bool paused = false;
};

// Point-in-time view of the manager tables.
struct ManagerSnapshot {
    std::vector<RunningEntry> running;
    std::vector<JobId> queued;  // FIFO order
};

// Add a job to the queue to be run.
struct EnqueueJob {
    std::unique_ptr<Executor> executor;
};

// A worker finished a job, successfully or not.
struct CompleteJob {
    JobId id;
    JobOutcome outcome;
};

struct CancelJob {
    JobId id;
    ReplySlot<JobResult> reply;
};

struct PauseJob {
    JobId id;
};

struct ResumeJob {
    JobId id;
};

// Cancels all running jobs, clears the queue and acknowledges once drained.
struct Shutdown {
    ReplySlot<void> reply;
};

struct InspectJobs {
    ReplySlot<ManagerSnapshot> reply;
};

using Command = std::variant<EnqueueJob, CompleteJob, CancelJob, PauseJob, ResumeJob, Shutdown, InspectJobs>;

}
