/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "jobctl/types.hpp"

namespace jobctl {

struct JobRecord {
    JobId id;
    std::string kind;
    Status status = Status::Queued;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
};

// Durable job history. The manager calls it only from the controller
// thread; implementations need not be thread-safe against themselves.
class JobRepository {
public:
    virtual ~JobRepository() = default;

    // Replaces any earlier record with the same id.
    [[nodiscard]] virtual bool create(const JobRecord& record) = 0;
    [[nodiscard]] virtual bool updateStatus(const JobId& id, Status status, const std::string& message) = 0;
    [[nodiscard]] virtual std::optional<JobRecord> get(const JobId& id) const = 0;
    // Newest first.
    [[nodiscard]] virtual std::vector<JobRecord> list(std::size_t max = 10) const = 0;
};

// Stores each job as a directory under <workspace>/<status>/<id>, moved
// between status directories with rename().
class FileJobRepository final : public JobRepository {
public:
    explicit FileJobRepository(const std::filesystem::path& workspace, bool createIfMissing = true);

    FileJobRepository(const FileJobRepository&) = delete;
    FileJobRepository& operator=(const FileJobRepository&) = delete;

    [[nodiscard]] bool create(const JobRecord& record) override;
    [[nodiscard]] bool updateStatus(const JobId& id, Status status, const std::string& message) override;
    [[nodiscard]] std::optional<JobRecord> get(const JobId& id) const override;
    [[nodiscard]] std::vector<JobRecord> list(std::size_t max = 10) const override;

    [[nodiscard]] std::optional<Status> status(const JobId& id) const noexcept;

    // Marks records a previous process left active as failed. Returns how many moved.
    std::size_t recoverOrphaned() noexcept;

    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }
    [[nodiscard]] bool isValid() const noexcept { return valid_; }

private:
    std::filesystem::path workspace_;
    bool valid_ = false;

    [[nodiscard]] bool createWorkspace(bool createIfMissing) noexcept;
    [[nodiscard]] std::filesystem::path statusDir(Status status) const;
    [[nodiscard]] std::optional<JobRecord> readRecord(const std::filesystem::path& dir, Status status) const;
    [[nodiscard]] static bool writeFile(const std::filesystem::path& path, const std::string& content) noexcept;
    [[nodiscard]] static bool isValidId(const JobId& id) noexcept;
};

}
