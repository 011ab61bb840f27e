/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <functional>
#include <string>

#include "jobctl/executor.hpp"

namespace jobctl {

class FunctionExecutor final : public Executor {
public:
    using Function = std::function<RunResult(JobContext&)>;

    FunctionExecutor(JobId id, std::string kind, Function func);

    [[nodiscard]] const JobId& id() const noexcept override { return id_; }
    [[nodiscard]] std::string kind() const override { return kind_; }
    [[nodiscard]] RunResult run(JobContext& context) override;

private:
    JobId id_;
    std::string kind_;
    Function func_;
};

// Performs a fixed number of timed steps, checking in between each one.
// Optionally fails at a given step, which is handy for exercising the
// failure path from the daemon.
class StepExecutor final : public Executor {
public:
    static constexpr std::size_t kNoFailure = static_cast<std::size_t>(-1);

    StepExecutor(JobId id, std::size_t steps, std::chrono::milliseconds interval,
                 std::size_t failAt = kNoFailure);

    [[nodiscard]] const JobId& id() const noexcept override { return id_; }
    [[nodiscard]] std::string kind() const override { return "step"; }
    [[nodiscard]] RunResult run(JobContext& context) override;

private:
    JobId id_;
    std::size_t steps_;
    std::chrono::milliseconds interval_;
    std::size_t failAt_;
};

}
