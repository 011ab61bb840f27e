/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobctl/config.hpp"
#include "jobctl/logger.hpp"
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace jobctl {

namespace {
std::size_t env_size(const char* name, std::size_t defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring malformed ") + name + "=" + val);
        return defv;
    }
}

std::chrono::milliseconds env_millis(const char* name, std::chrono::milliseconds defv,
                                     std::chrono::milliseconds maxv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        long long parsed = std::stoll(val);
        if (parsed < 0) {
            LOG_WARN(std::string("Ignoring negative ") + name + "=" + val);
            return defv;
        }
        if (parsed > maxv.count()) {
            LOG_WARN(std::string(name) + "=" + val + " capped at " + std::to_string(maxv.count()) + "ms");
            return maxv;
        }
        return std::chrono::milliseconds(parsed);
    } catch (const std::out_of_range&) {
        LOG_WARN(std::string(name) + "=" + val + " capped at " + std::to_string(maxv.count()) + "ms");
        return maxv;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring malformed ") + name + "=" + val);
        return defv;
    }
}
}

Config Config::fromEnv() {
    Config config;
    config.maxConcurrency = env_size("JOBCTL_MAX_JOBS", config.maxConcurrency);
    config.shutdownGrace = env_millis("JOBCTL_SHUTDOWN_GRACE_MS", config.shutdownGrace, kMaxShutdownGrace);
    config.eventCapacity = env_size("JOBCTL_EVENT_CAPACITY", config.eventCapacity);
    if (const char* ws = std::getenv("JOBCTL_WORKSPACE"); ws && *ws) {
        config.workspace = ws;
    }
    return config;
}

std::string Config::validate() const {
    if (maxConcurrency == 0) {
        return "maxConcurrency must be at least 1";
    }
    if (maxConcurrency > kMaxConcurrency) {
        return "maxConcurrency must be at most " + std::to_string(kMaxConcurrency);
    }
    if (eventCapacity == 0) {
        return "eventCapacity must be at least 1";
    }
    if (shutdownGrace.count() < 0) {
        return "shutdownGrace must not be negative";
    }
    if (shutdownGrace > kMaxShutdownGrace) {
        return "shutdownGrace must be at most " + std::to_string(kMaxShutdownGrace.count()) + "ms";
    }
    return "";
}

}
