/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace jobctl {

using Task = std::function<void(int workerId)>;

class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start();

    // Stops accepting tasks and lets the workers drain what was already
    // submitted. Workers still busy at the deadline are detached; the count
    // of such workers is returned.
    std::size_t stop(std::chrono::steady_clock::time_point deadline) noexcept;
    void stop() noexcept { (void)stop(std::chrono::steady_clock::time_point::max()); }

    [[nodiscard]] bool submit(Task task) noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] std::size_t busyCount() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    // Shared with the worker threads so that detached workers stay valid
    // after the pool is gone.
    struct State {
        std::mutex mutex;
        std::condition_variable taskAvailable;
        std::condition_variable workerExited;
        std::queue<Task> tasks;
        std::vector<bool> exited;
        std::size_t busy = 0;
        bool shutdown = false;
    };

    static void workerLoop(std::shared_ptr<State> state, int workerId);

    int workers_;
    std::atomic<bool> running_{false};
    std::shared_ptr<State> state_;
    std::vector<std::thread> workerThreads_;
};

}
