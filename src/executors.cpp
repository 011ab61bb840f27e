/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobctl/executors.hpp"
#include "jobctl/logger.hpp"
#include <algorithm>
#include <thread>

namespace jobctl {

FunctionExecutor::FunctionExecutor(JobId id, std::string kind, Function func)
    : id_(std::move(id)), kind_(std::move(kind)), func_(std::move(func)) {
}

RunResult FunctionExecutor::run(JobContext& context) {
    if (!func_) {
        return RunResult::failure("no function to run");
    }
    return func_(context);
}

StepExecutor::StepExecutor(JobId id, std::size_t steps, std::chrono::milliseconds interval, std::size_t failAt)
    : id_(std::move(id)), steps_(steps), interval_(interval), failAt_(failAt) {
}

RunResult StepExecutor::run(JobContext& context) {
    // Sleep in short slices so a cancel is noticed well before the step ends
    const auto slice = std::chrono::milliseconds(10);

    for (std::size_t step = 0; step < steps_; ++step) {
        if (!context.checkpoint()) {
            return RunResult::stopped();
        }
        if (step == failAt_) {
            return RunResult::failure("step " + std::to_string(step + 1) + " failed");
        }

        auto stepEnd = std::chrono::steady_clock::now() + interval_;
        while (std::chrono::steady_clock::now() < stepEnd) {
            if (context.cancelled()) {
                return RunResult::stopped();
            }
            std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(slice, interval_));
        }

        context.progress(step + 1, steps_, "step " + std::to_string(step + 1) + "/" + std::to_string(steps_));
        LOG_TRACE("Job " + id_ + " finished step " + std::to_string(step + 1));
    }

    if (!context.checkpoint()) {
        return RunResult::stopped();
    }
    return RunResult::success(std::to_string(steps_) + " steps");
}

}
