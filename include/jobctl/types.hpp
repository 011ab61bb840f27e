#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace jobctl {

// Job lifecycle states. Pause is a flag on a Running job, not a status.
enum class Status : std::uint8_t { Queued, Running, Cancelling, Completed, Failed, Cancelled };

enum class JobError : std::uint8_t {
    None = 0,
    NotFound,
    InvalidState,
    DuplicateId,
    ReplyDeliveryFailure,
    ExecutionFailure
};

// Caller-supplied job identifier.
using JobId = std::string;

struct JobResult {
    bool ok = false;
    JobError error = JobError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }

    static JobResult success() { return {true, JobError::None, ""}; }
    static JobResult failure(JobError error, std::string message) {
        return {false, error, std::move(message)};
    }
};

// Terminal report carried back from a worker.
struct JobOutcome {
    Status status = Status::Completed;
    std::string message;
};

[[nodiscard]] const char* toString(Status status) noexcept;
[[nodiscard]] const char* toString(JobError error) noexcept;
[[nodiscard]] bool isTerminal(Status status) noexcept;

} // namespace jobctl
