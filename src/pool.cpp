/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobctl/pool.hpp"
#include "jobctl/logger.hpp"

namespace jobctl {

Pool::Pool(int workers) noexcept : workers_(workers < 1 ? 1 : workers) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start() {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    state_ = std::make_shared<State>();
    state_->exited.assign(static_cast<std::size_t>(workers_), false);
    running_.store(true);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, state_, i);
        }

        LOG_INFO("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

std::size_t Pool::stop(std::chrono::steady_clock::time_point deadline) noexcept {
    if (!running_.exchange(false)) {
        return 0;
    }

    LOG_DEBUG("Stopping pool...");

    std::vector<bool> exited;
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->shutdown = true;
        state_->taskAvailable.notify_all();

        auto allExited = [this] {
            std::size_t count = 0;
            for (bool done : state_->exited) {
                if (done) ++count;
            }
            return count == workerThreads_.size();
        };
        if (deadline == std::chrono::steady_clock::time_point::max()) {
            state_->workerExited.wait(lock, allExited);
        } else {
            state_->workerExited.wait_until(lock, deadline, allExited);
        }
        exited = state_->exited;
    }

    std::size_t abandoned = 0;
    for (std::size_t i = 0; i < workerThreads_.size(); ++i) {
        auto& thread = workerThreads_[i];
        if (!thread.joinable()) {
            continue;
        }
        if (i < exited.size() && exited[i]) {
            thread.join();
        } else {
            thread.detach();
            ++abandoned;
        }
    }
    workerThreads_.clear();

    if (abandoned > 0) {
        LOG_WARN("Pool stopped, abandoned " + std::to_string(abandoned) + " busy worker(s)");
    } else {
        LOG_INFO("Pool stopped");
    }
    return abandoned;
}

bool Pool::submit(Task task) noexcept {
    if (!running_.load()) {
        LOG_DEBUG("Cannot submit task to stopped pool");
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->shutdown) {
                return false;
            }
            state_->tasks.push(std::move(task));
        }
        state_->taskAvailable.notify_one();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue task: " + std::string(e.what()));
        return false;
    }
}

std::size_t Pool::queueSize() const noexcept {
    if (!state_) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->tasks.size();
}

std::size_t Pool::busyCount() const noexcept {
    if (!state_) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->busy;
}

void Pool::workerLoop(std::shared_ptr<State> state, int workerId) {
    setThreadName(workerThreadName(workerId));
    LOG_DEBUG(workerThreadName(workerId) + " thread started");

    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->taskAvailable.wait(lock, [&state] {
                return !state->tasks.empty() || state->shutdown;
            });

            // Tasks submitted before shutdown still run so their jobs can report back
            if (state->tasks.empty()) {
                break;
            }

            task = std::move(state->tasks.front());
            state->tasks.pop();
            ++state->busy;
        }

        try {
            task(workerId);
        } catch (const std::exception& e) {
            LOG_ERROR(workerThreadName(workerId) + " task error: " + std::string(e.what()));
        } catch (...) {
            LOG_ERROR(workerThreadName(workerId) + " unknown task error");
        }

        {
            std::lock_guard<std::mutex> lock(state->mutex);
            --state->busy;
        }
    }

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->exited[static_cast<std::size_t>(workerId)] = true;
    }
    state->workerExited.notify_all();
    LOG_DEBUG(workerThreadName(workerId) + " stopped");
}

}
