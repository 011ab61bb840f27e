/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace jobctl {

struct Config {
    // Largest accepted values; the manager clamps anything beyond them.
    static constexpr std::size_t kMaxConcurrency = 256;
    static constexpr std::chrono::milliseconds kMaxShutdownGrace{24 * 60 * 60 * 1000};

    // Upper bound on concurrently running jobs.
    std::size_t maxConcurrency = 4;
    // How long shutdown waits for running jobs before abandoning them.
    std::chrono::milliseconds shutdownGrace{5000};
    // Per-subscriber event buffer; older events are dropped past this.
    std::size_t eventCapacity = 256;
    // Root of the job record store. Empty disables persistence in the daemon.
    std::filesystem::path workspace;

    // Reads JOBCTL_MAX_JOBS, JOBCTL_SHUTDOWN_GRACE_MS, JOBCTL_EVENT_CAPACITY
    // and JOBCTL_WORKSPACE; malformed values keep the defaults. A grace of 0
    // is honoured (abandon at once); larger graces are capped.
    [[nodiscard]] static Config fromEnv();

    // Empty when the configuration is usable, otherwise the reason it is not.
    [[nodiscard]] std::string validate() const;
};

}
