/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobctl/repository.hpp"
#include "jobctl/logger.hpp"
#include <algorithm>
#include <array>
#include <fstream>
#include <iterator>

namespace jobctl {

namespace {
constexpr std::array<Status, 6> kAllStatuses = {
    Status::Queued, Status::Running, Status::Cancelling,
    Status::Completed, Status::Failed, Status::Cancelled
};

std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "";
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

std::chrono::system_clock::time_point toSystemTime(std::filesystem::file_time_type timestamp) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        timestamp - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
}
}

FileJobRepository::FileJobRepository(const std::filesystem::path& workspace, bool createIfMissing)
    : workspace_(workspace) {
    valid_ = createWorkspace(createIfMissing);
    if (!valid_) {
        LOG_ERROR("Failed to initialize job workspace: " + workspace_.string());
    }
}

bool FileJobRepository::createWorkspace(bool createIfMissing) noexcept {
    try {
        if (!createIfMissing) {
            for (Status status : kAllStatuses) {
                if (!std::filesystem::is_directory(statusDir(status))) {
                    return false;
                }
            }
            return true;
        }

        std::filesystem::create_directories(workspace_ / ".writing");
        for (Status status : kAllStatuses) {
            std::filesystem::create_directories(statusDir(status));
        }
        LOG_DEBUG("Job workspace ready: " + workspace_.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create job workspace: " + std::string(e.what()));
        return false;
    }
}

std::filesystem::path FileJobRepository::statusDir(Status status) const {
    return workspace_ / toString(status);
}

bool FileJobRepository::create(const JobRecord& record) {
    if (!valid_ || !isValidId(record.id)) {
        LOG_ERROR("Refusing to record job with invalid id: '" + record.id + "'");
        return false;
    }

    try {
        // Drop history left by an earlier job with the same id
        for (Status status : kAllStatuses) {
            std::error_code ec;
            std::filesystem::remove_all(statusDir(status) / record.id, ec);
        }

        auto staging = workspace_ / ".writing" / record.id;
        std::filesystem::remove_all(staging);
        std::filesystem::create_directories(staging);

        if (!writeFile(staging / "kind.txt", record.kind) ||
            !writeFile(staging / "message.txt", record.message)) {
            LOG_ERROR("Failed to write record files for job: " + record.id);
            std::error_code ec;
            std::filesystem::remove_all(staging, ec);
            return false;
        }

        std::filesystem::rename(staging, statusDir(record.status) / record.id);
        LOG_TRACE("Recorded job " + record.id + " as " + toString(record.status));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record job " + record.id + ": " + std::string(e.what()));
        return false;
    }
}

bool FileJobRepository::updateStatus(const JobId& id, Status status, const std::string& message) {
    if (!valid_ || !isValidId(id)) {
        return false;
    }

    try {
        for (Status current : kAllStatuses) {
            auto from = statusDir(current) / id;
            if (!std::filesystem::is_directory(from)) {
                continue;
            }

            if (!writeFile(from / "message.txt", message)) {
                LOG_WARN("Failed to write status message for job: " + id);
            }
            if (current != status) {
                std::filesystem::rename(from, statusDir(status) / id);
            }
            LOG_TRACE("Job " + id + " moved " + toString(current) + " -> " + toString(status));
            return true;
        }

        LOG_DEBUG("No record to update for job: " + id);
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to update job " + id + ": " + std::string(e.what()));
        return false;
    }
}

std::optional<JobRecord> FileJobRepository::readRecord(const std::filesystem::path& dir, Status status) const {
    JobRecord record;
    record.id = dir.filename().string();
    record.status = status;
    record.kind = readFile(dir / "kind.txt");
    record.message = readFile(dir / "message.txt");
    record.timestamp = toSystemTime(std::filesystem::last_write_time(dir));
    return record;
}

std::optional<JobRecord> FileJobRepository::get(const JobId& id) const {
    if (!isValidId(id)) {
        return std::nullopt;
    }
    try {
        for (Status status : kAllStatuses) {
            auto dir = statusDir(status) / id;
            if (std::filesystem::is_directory(dir)) {
                return readRecord(dir, status);
            }
        }
        return std::nullopt;
    } catch (const std::exception& e) {
        LOG_ERROR("Error retrieving job " + id + ": " + e.what());
        return std::nullopt;
    }
}

std::vector<JobRecord> FileJobRepository::list(std::size_t max) const {
    std::vector<JobRecord> records;
    try {
        for (Status status : kAllStatuses) {
            auto dir = statusDir(status);
            if (!std::filesystem::exists(dir)) {
                continue;
            }
            for (const auto& entry : std::filesystem::directory_iterator(dir)) {
                if (!entry.is_directory()) {
                    continue;
                }
                if (auto record = readRecord(entry.path(), status)) {
                    records.push_back(std::move(*record));
                }
            }
        }

        std::sort(records.begin(), records.end(), [](const JobRecord& a, const JobRecord& b) {
            return a.timestamp > b.timestamp;
        });

        if (records.size() > max) {
            records.resize(max);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error listing jobs: " + std::string(e.what()));
    }
    return records;
}

std::optional<Status> FileJobRepository::status(const JobId& id) const noexcept {
    if (!isValidId(id)) {
        return std::nullopt;
    }
    try {
        for (Status status : kAllStatuses) {
            if (std::filesystem::exists(statusDir(status) / id)) {
                return status;
            }
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("Status lookup failed for job " + id + ": " + e.what());
    }
    return std::nullopt;
}

std::size_t FileJobRepository::recoverOrphaned() noexcept {
    std::size_t recovered = 0;
    try {
        for (Status status : {Status::Queued, Status::Running, Status::Cancelling}) {
            auto dir = statusDir(status);
            if (!std::filesystem::exists(dir)) {
                continue;
            }

            std::vector<JobId> orphans;
            for (const auto& entry : std::filesystem::directory_iterator(dir)) {
                if (entry.is_directory()) {
                    orphans.push_back(entry.path().filename().string());
                }
            }

            for (const auto& id : orphans) {
                LOG_WARN("Recovering orphaned job: " + id + " (was " + toString(status) + ")");
                if (updateStatus(id, Status::Failed, "interrupted: process exited while job was " +
                                                     std::string(toString(status)))) {
                    ++recovered;
                }
            }
        }

        if (recovered > 0) {
            LOG_INFO("Recovered " + std::to_string(recovered) + " orphaned job(s)");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error recovering orphaned jobs: " + std::string(e.what()));
    }
    return recovered;
}

bool FileJobRepository::writeFile(const std::filesystem::path& path, const std::string& content) noexcept {
    try {
        auto tmp = path;
        tmp += ".tmp";
        {
            std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
            if (!file) return false;
            file << content;
            file.flush();
            if (!file.good()) return false;
        }
        std::filesystem::rename(tmp, path);
        return true;
    } catch (const std::exception& e) {
        LOG_WARN("Failed to write " + path.string() + ": " + e.what());
        return false;
    }
}

bool FileJobRepository::isValidId(const JobId& id) noexcept {
    if (id.empty() || id == "." || id == "..") {
        return false;
    }
    return id.find('/') == std::string::npos && id.find('\0') == std::string::npos;
}

}
