/*
 * jobctl - Job history viewer (jobs)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobctl/logger.hpp"
#include "jobctl/repository.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

using namespace jobctl;

void printUsage(const char* progName) {
    std::cout << "jobctl Job History Tool\n\n";
    std::cout << "Usage: " << progName << " <workspace> [job_id] [-n <count>] [-w]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Directory holding job records\n";
    std::cout << "  job_id        Specific job to show (optional)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -n <count>    Number of recent jobs to list (default 10)\n";
    std::cout << "  -w, --wait    Wait until the job reaches a final status\n\n";
    std::cout << "Exit status for a single job: 0 completed, 1 failed or cancelled, 2 not finished\n";
}

std::string formatTime(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

int main(int argc, char* argv[]) {
    // Silence logs for CLI tool usage
    Logger::setLevel(LogLevel::WARN);

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string workspace = argv[1];
    if (workspace == "-h" || workspace == "--help") {
        printUsage(argv[0]);
        return 0;
    }

    JobId jobId;
    std::size_t count = 10;
    bool wait = false;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-w" || arg == "--wait") {
            wait = true;
        } else if (arg == "-n" && i + 1 < argc) {
            try {
                count = static_cast<std::size_t>(std::stoul(argv[++i]));
            } catch (...) {
                std::cerr << "Error: Invalid count\n";
                return 1;
            }
        } else {
            jobId = arg;
        }
    }

    try {
        FileJobRepository repository(workspace, false);
        if (!repository.isValid()) {
            std::cerr << "Not a job workspace: " << workspace << std::endl;
            return 1;
        }

        if (jobId.empty()) {
            auto records = repository.list(count);
            if (records.empty()) {
                std::cerr << "No jobs found" << std::endl;
                return 1;
            }
            for (const auto& record : records) {
                std::cout << formatTime(record.timestamp) << "  "
                          << std::left << std::setw(11) << toString(record.status) << "  "
                          << std::setw(10) << record.kind << "  " << record.id << "\n";
            }
            return 0;
        }

        if (wait) {
            while (true) {
                auto status = repository.status(jobId);
                if (!status || isTerminal(*status)) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }

        auto record = repository.get(jobId);
        if (!record) {
            std::cerr << "Job not found: " << jobId << std::endl;
            return 1;
        }

        std::cout << record->id << "  " << toString(record->status) << "  " << record->kind << "\n";
        if (!record->message.empty()) {
            std::cout << record->message << "\n";
        }

        if (record->status == Status::Completed) return 0;
        if (isTerminal(record->status)) return 1;
        return 2;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
