/*
 * jobctl - Job control daemon (jobctld)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobctl/config.hpp"
#include "jobctl/controller.hpp"
#include "jobctl/event_bus.hpp"
#include "jobctl/executors.hpp"
#include "jobctl/logger.hpp"
#include "jobctl/repository.hpp"
#include <chrono>
#include <csignal>
#include <ctime>
#include <future>
#include <iostream>
#include <memory>
#include <poll.h>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace jobctl;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &local);
    return buf;
}

const char* eventColor(EventKind kind) {
    switch (kind) {
        case EventKind::Started: return "\033[33m";
        case EventKind::Progress: return "\033[90m";
        case EventKind::Completed: return "\033[32m";
        case EventKind::Failed: return "\033[31m";
        case EventKind::Cancelled: return "\033[35m";
        default: return "\033[0m";
    }
}

void printEvent(const JobEvent& event) {
    std::cout << "    \033[90m" << timestamp() << "\033[0m  " << event.id << "  "
              << eventColor(event.kind) << toString(event.kind) << "\033[0m";
    if (!event.message.empty()) {
        std::cout << "  " << event.message;
    }
    std::cout << "\n" << std::flush;
}

void printUsage(const char* progName) {
    std::cout << "jobctl Job Control Daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options] [workspace]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace          Directory for job records (optional)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -j, --jobs <n>     Maximum concurrently running jobs\n";
    std::cout << "  -g, --grace <ms>   Shutdown grace period in milliseconds\n";
    std::cout << "  -h, --help         Show this help message\n";
    std::cout << "  -v, --version      Show version\n\n";
    std::cout << "Commands (stdin, one per line):\n";
    std::cout << "  run <id> <steps> [interval_ms]   enqueue a step job\n";
    std::cout << "  fail <id>                        enqueue a job that fails\n";
    std::cout << "  cancel <id>                      cancel a queued or running job\n";
    std::cout << "  pause <id> | resume <id>         pause or resume a running job\n";
    std::cout << "  status                           show running and queued jobs\n";
    std::cout << "  quit                             shut down\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  JOBCTL_LOG_LEVEL           Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  JOBCTL_MAX_JOBS            Default for --jobs\n";
    std::cout << "  JOBCTL_SHUTDOWN_GRACE_MS   Default for --grace\n";
    std::cout << "  JOBCTL_EVENT_CAPACITY      Event buffer per subscriber\n";
    std::cout << "  JOBCTL_WORKSPACE           Default workspace\n";
}

void printStatus(Controller& controller) {
    auto future = controller.inspect();
    if (future.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
        std::cout << "  status unavailable\n";
        return;
    }
    try {
        ManagerSnapshot snap = future.get();
        std::cout << "\n  \033[1mRUNNING\033[0m  " << snap.running.size() << "/" << controller.config().maxConcurrency << "\n";
        for (const auto& entry : snap.running) {
            std::cout << "    \033[36m" << entry.id << "\033[0m  \033[90m" << entry.kind << "\033[0m  "
                      << toString(entry.status) << (entry.paused ? " (paused)" : "") << "\n";
        }
        std::cout << "  \033[1mQUEUED\033[0m   " << snap.queued.size() << "\n";
        for (const auto& id : snap.queued) {
            std::cout << "    " << id << "\n";
        }
        std::cout << "\n" << std::flush;
    } catch (const std::future_error&) {
        std::cout << "  controller stopped\n";
    }
}

// Returns false when the daemon should stop.
bool handleLine(Controller& controller, const std::string& line) {
    std::istringstream in(line);
    std::string verb;
    in >> verb;
    if (verb.empty()) {
        return true;
    }

    if (verb == "quit" || verb == "exit") {
        return false;
    }
    if (verb == "status") {
        printStatus(controller);
        return true;
    }

    std::string id;
    in >> id;
    if (id.empty()) {
        std::cerr << "Error: " << verb << " requires a job id\n";
        return true;
    }

    if (verb == "run") {
        std::size_t steps = 5;
        long intervalMs = 500;
        in >> steps >> intervalMs;
        if (intervalMs < 0) intervalMs = 0;
        controller.enqueue(std::make_unique<StepExecutor>(id, steps, std::chrono::milliseconds(intervalMs)));
    } else if (verb == "fail") {
        controller.enqueue(std::make_unique<StepExecutor>(id, 3, std::chrono::milliseconds(200), 1));
    } else if (verb == "cancel") {
        auto future = controller.cancel(id);
        if (future.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
            std::cerr << "Error: cancel timed out\n";
            return true;
        }
        try {
            JobResult result = future.get();
            if (result) {
                std::cout << "  cancel requested: " << id << "\n";
            } else {
                std::cout << "  cancel failed: " << result.message << "\n";
            }
        } catch (const std::future_error&) {
            std::cout << "  controller stopped\n";
        }
    } else if (verb == "pause") {
        controller.pause(id);
    } else if (verb == "resume") {
        controller.resume(id);
    } else {
        std::cerr << "Error: unknown command '" << verb << "'\n";
    }
    return true;
}

int main(int argc, char* argv[]) {
    Config config = Config::fromEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
        if ((arg == "-j" || arg == "--jobs") && i + 1 < argc) {
            try {
                config.maxConcurrency = static_cast<std::size_t>(std::stoul(argv[++i]));
            } catch (...) {
                std::cerr << "Error: Invalid job count\n";
                return 1;
            }
        } else if ((arg == "-g" || arg == "--grace") && i + 1 < argc) {
            try {
                config.shutdownGrace = std::chrono::milliseconds(std::stol(argv[++i]));
            } catch (...) {
                std::cerr << "Error: Invalid grace period\n";
                return 1;
            }
        } else if (!arg.empty() && arg[0] != '-') {
            config.workspace = arg;
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            return 1;
        }
    }

    if (auto problem = config.validate(); !problem.empty()) {
        std::cerr << "Error: " << problem << "\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    setThreadName("Main");

    try {
        std::shared_ptr<FileJobRepository> repository;
        if (!config.workspace.empty()) {
            repository = std::make_shared<FileJobRepository>(config.workspace);
            if (!repository->isValid()) {
                std::cerr << "Error: Cannot use workspace " << config.workspace << "\n";
                return 1;
            }
            (void)repository->recoverOrphaned();
        }

        Controller controller(config, repository);
        auto events = controller.events()->subscribe();
        if (!controller.start()) {
            std::cerr << "  \033[31mFailed to start\033[0m\n";
            return 1;
        }

        std::cout << "\n";
        std::cout << "  \033[1mjobctl\033[0m " << VERSION << "\n";
        std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n\n";
        std::cout << "  \033[1mRUNNING\033[0m\n\n";
        std::cout << "    Jobs       " << config.maxConcurrency << "\n";
        std::cout << "    Grace      " << config.shutdownGrace.count() << "ms\n";
        std::cout << "    Workspace  " << (config.workspace.empty() ? "(none)" : config.workspace.string()) << "\n\n";
        std::cout << "  Type 'run <id> <steps>' to start a job, 'quit' to stop.\n\n" << std::flush;

        std::string pending;
        bool keepGoing = true;
        while (keepGoing && !g_shutdown_requested && controller.isRunning()) {
            while (auto event = events->tryRecv()) {
                printEvent(*event);
            }

            pollfd pfd{STDIN_FILENO, POLLIN, 0};
            int ready = ::poll(&pfd, 1, 100);
            if (ready <= 0) {
                continue;
            }

            char buf[1024];
            ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
            if (n <= 0) {
                break;  // stdin closed
            }
            pending.append(buf, static_cast<std::size_t>(n));

            std::size_t pos;
            while (keepGoing && (pos = pending.find('\n')) != std::string::npos) {
                std::string line = pending.substr(0, pos);
                pending.erase(0, pos + 1);
                keepGoing = handleLine(controller, line);
            }
        }

        if (g_shutdown_requested) {
            std::cout << "\nShutdown requested, stopping jobs..." << std::endl;
        }
        LOG_DEBUG("Shutting down controller");

        auto done = controller.shutdown();
        try {
            done.get();
        } catch (const std::future_error& e) {
            LOG_WARN("Shutdown not acknowledged: " + std::string(e.what()));
        }
        controller.join();

        while (auto event = events->tryRecv()) {
            printEvent(*event);
        }
        if (events->lagged() > 0) {
            std::cout << "  \033[90m(" << events->lagged() << " events dropped)\033[0m\n";
        }

    } catch (const std::exception& e) {
        LOG_ERROR("Daemon error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("jobctld stopped");
    return 0;
}
