/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace jobctl {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

// Receives every line that passes the level filter. Used by tests and embedders.
using LogSink = std::function<void(LogLevel, const std::string&)>;

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    // Replaces stderr output; pass an empty sink to restore it.
    static void setSink(LogSink sink) noexcept;

    [[nodiscard]] static std::optional<LogLevel> parseLevel(const std::string& name) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for better logging context
void setThreadName(const std::string& name);
std::string workerThreadName(int worker_id);

}

// Convenience macros for common usage
#define LOG_ERROR(msg) ::jobctl::Logger::error(msg)
#define LOG_WARN(msg)  ::jobctl::Logger::warn(msg)
#define LOG_INFO(msg)  ::jobctl::Logger::info(msg)
#define LOG_DEBUG(msg) ::jobctl::Logger::debug(msg)
#define LOG_TRACE(msg) ::jobctl::Logger::trace(msg)
