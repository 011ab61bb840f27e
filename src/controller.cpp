/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobctl/controller.hpp"
#include "jobctl/channel.hpp"
#include "jobctl/event_bus.hpp"
#include "jobctl/logger.hpp"
#include "jobctl/manager.hpp"
#include "jobctl/repository.hpp"

namespace jobctl {

Controller::Controller(const Config& config, std::shared_ptr<JobRepository> repository)
    : config_(config),
      commands_(std::make_shared<CommandChannel>()),
      events_(EventBus::create(config.eventCapacity)) {
    manager_ = std::make_unique<Manager>(config_, commands_, events_, std::move(repository));
}

Controller::~Controller() {
    if (loopThread_.joinable()) {
        if (!commands_->isClosed()) {
            auto done = shutdown();
            (void)done;
        }
        loopThread_.join();
    }
}

bool Controller::start() {
    if (running_.load() || loopThread_.joinable()) {
        LOG_WARN("Controller already started");
        return false;
    }

    try {
        running_.store(true);
        loopThread_ = std::thread(&Controller::watch, this);
        LOG_DEBUG("Controller started");
        return true;
    } catch (const std::exception& e) {
        running_.store(false);
        LOG_ERROR("Failed to start controller: " + std::string(e.what()));
        return false;
    }
}

bool Controller::push(Command command) noexcept {
    return commands_->send(std::move(command));
}

bool Controller::enqueue(std::unique_ptr<Executor> executor) noexcept {
    return push(EnqueueJob{std::move(executor)});
}

bool Controller::pause(const JobId& id) noexcept {
    try {
        return push(PauseJob{id});
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to send pause for job " + id + ": " + e.what());
        return false;
    }
}

bool Controller::resume(const JobId& id) noexcept {
    try {
        return push(ResumeJob{id});
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to send resume for job " + id + ": " + e.what());
        return false;
    }
}

std::future<JobResult> Controller::cancel(const JobId& id) {
    CancelJob command{id, {}};
    auto future = command.reply.future();
    if (!push(std::move(command))) {
        LOG_DEBUG("Cancel for job " + id + " dropped, controller closed");
    }
    return future;
}

std::future<void> Controller::shutdown() {
    Shutdown command;
    auto future = command.reply.future();
    if (!push(std::move(command))) {
        LOG_DEBUG("Shutdown dropped, controller already closed");
    }
    return future;
}

std::future<ManagerSnapshot> Controller::inspect() {
    InspectJobs command;
    auto future = command.reply.future();
    if (!push(std::move(command))) {
        LOG_DEBUG("Inspect dropped, controller closed");
    }
    return future;
}

void Controller::join() {
    if (loopThread_.joinable()) {
        loopThread_.join();
    }
}

void Controller::watch() {
    setThreadName("Controller");
    LOG_DEBUG("Controller loop started");

    while (auto command = commands_->receive()) {
        try {
            std::visit([this](auto& cmd) { handle(cmd); }, *command);
        } catch (const std::exception& e) {
            LOG_ERROR("Controller failed to handle command: " + std::string(e.what()));
        }
    }

    running_.store(false);
    LOG_DEBUG("Controller loop stopped");
}

void Controller::handle(EnqueueJob& command) {
    if (!command.executor) {
        LOG_ERROR("Failed to enqueue job: no executor");
        return;
    }
    const JobId id = command.executor->id();
    LOG_TRACE("Received enqueue for job: " + id);

    JobResult result = manager_->enqueue(std::move(command.executor));
    if (result) {
        LOG_INFO("Successfully enqueued job: " + id);
    } else {
        LOG_ERROR("Failed to enqueue job " + id + ": " + toString(result.error) + " - " + result.message);
    }
}

void Controller::handle(CompleteJob& command) {
    manager_->complete(command.id, command.outcome);
}

void Controller::handle(CancelJob& command) {
    JobResult result = manager_->cancel(command.id);
    if (!command.reply.send(std::move(result))) {
        LOG_ERROR("Error while sending cancel confirmation for job " + command.id + ": " +
                  toString(JobError::ReplyDeliveryFailure));
    } else {
        LOG_TRACE("Cancel confirmation sent for job: " + command.id);
    }
}

void Controller::handle(PauseJob& command) {
    JobResult result = manager_->pause(command.id);
    if (result) {
        LOG_INFO("Successfully issued pause request: " + command.id);
    } else {
        LOG_ERROR("Failed to pause job " + command.id + ": " + toString(result.error) + " - " + result.message);
    }
}

void Controller::handle(ResumeJob& command) {
    JobResult result = manager_->resume(command.id);
    if (result) {
        LOG_INFO("Successfully issued resume request: " + command.id);
    } else {
        LOG_ERROR("Failed to resume job " + command.id + ": " + toString(result.error) + " - " + result.message);
    }
}

void Controller::handle(Shutdown& command) {
    manager_->shutdown();
    // Later commands are still drained, but nothing new gets in
    commands_->close();

    if (!command.reply.send()) {
        LOG_ERROR("Error while sending shutdown confirmation: " +
                  std::string(toString(JobError::ReplyDeliveryFailure)));
    } else {
        LOG_TRACE("Shutdown confirmation sent");
    }
}

void Controller::handle(InspectJobs& command) {
    if (!command.reply.send(manager_->snapshot())) {
        LOG_ERROR("Error while sending job snapshot: " +
                  std::string(toString(JobError::ReplyDeliveryFailure)));
    }
}

}
