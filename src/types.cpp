/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobctl/types.hpp"

namespace jobctl {

const char* toString(Status status) noexcept {
    switch (status) {
        case Status::Queued: return "queued";
        case Status::Running: return "running";
        case Status::Cancelling: return "cancelling";
        case Status::Completed: return "completed";
        case Status::Failed: return "failed";
        case Status::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

const char* toString(JobError error) noexcept {
    switch (error) {
        case JobError::None: return "none";
        case JobError::NotFound: return "not found";
        case JobError::InvalidState: return "invalid state";
        case JobError::DuplicateId: return "duplicate id";
        case JobError::ReplyDeliveryFailure: return "reply delivery failure";
        case JobError::ExecutionFailure: return "execution failure";
        default: return "unknown";
    }
}

bool isTerminal(Status status) noexcept {
    return status == Status::Completed || status == Status::Failed || status == Status::Cancelled;
}

}
