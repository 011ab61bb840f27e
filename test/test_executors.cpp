#include "test_executors.hpp"

#include <stdexcept>
#include <thread>

#include "jobctl/channel.hpp"
#include "jobctl/executors.hpp"
#include "jobctl/manager.hpp"

namespace jobctl::test {

void Gate::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = true;
}

bool Gate::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

std::unique_ptr<Executor> gatedJob(const JobId& id, std::shared_ptr<Gate> gate, std::shared_ptr<Probe> probe) {
    if (!probe) {
        probe = std::make_shared<Probe>();
    }
    return std::make_unique<FunctionExecutor>(id, "gated", [gate, probe](JobContext& context) {
        ++probe->runs;
        int now = ++probe->concurrent;
        int seen = probe->maxConcurrent.load();
        while (now > seen && !probe->maxConcurrent.compare_exchange_weak(seen, now)) {
        }

        while (true) {
            if (!context.checkpoint()) {
                --probe->concurrent;
                return RunResult::stopped();
            }
            if (gate->isOpen()) {
                break;
            }
            std::this_thread::sleep_for(1ms);
        }
        --probe->concurrent;
        return RunResult::success("done");
    });
}

std::unique_ptr<Executor> stubbornJob(const JobId& id, std::shared_ptr<Gate> gate) {
    return std::make_unique<FunctionExecutor>(id, "stubborn", [gate](JobContext&) {
        while (!gate->isOpen()) {
            std::this_thread::sleep_for(1ms);
        }
        return RunResult::success("finally");
    });
}

std::unique_ptr<Executor> failingJob(const JobId& id, const std::string& error) {
    return std::make_unique<FunctionExecutor>(id, "failing", [error](JobContext&) {
        return RunResult::failure(error);
    });
}

std::unique_ptr<Executor> throwingJob(const JobId& id) {
    return std::make_unique<FunctionExecutor>(id, "throwing", [](JobContext&) -> RunResult {
        throw std::runtime_error("boom");
    });
}

std::optional<CompleteJob> nextCompletion(CommandChannel& channel, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        auto command = channel.receiveFor(10ms);
        if (!command) {
            continue;
        }
        if (auto* complete = std::get_if<CompleteJob>(&*command)) {
            return std::move(*complete);
        }
    }
    return std::nullopt;
}

bool completeNext(CommandChannel& channel, Manager& manager, std::chrono::milliseconds timeout) {
    auto completion = nextCompletion(channel, timeout);
    if (!completion) {
        return false;
    }
    manager.complete(completion->id, completion->outcome);
    return true;
}

bool waitUntil(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(2ms);
    }
    return condition();
}

LogCapture::LogCapture() : lines_(std::make_shared<Lines>()) {
    auto lines = lines_;
    Logger::setSink([lines](LogLevel, const std::string& message) {
        std::lock_guard<std::mutex> lock(lines->mutex);
        lines->lines.push_back(message);
    });
}

LogCapture::~LogCapture() {
    Logger::setSink(nullptr);
}

bool LogCapture::contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(lines_->mutex);
    for (const auto& line : lines_->lines) {
        if (line.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> LogCapture::lines() const {
    std::lock_guard<std::mutex> lock(lines_->mutex);
    return lines_->lines;
}

}
