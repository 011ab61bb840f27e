/*
 * jobctl - Asynchronous Job Control Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <future>
#include <utility>

namespace jobctl {

// Single-use delivery of one value back to the sender of a command.
// A slot destroyed without being fulfilled breaks its future, so a waiter
// always wakes up: either with the value or with std::future_error.
template <typename T>
class ReplySlot {
public:
    ReplySlot() = default;

    ReplySlot(const ReplySlot&) = delete;
    ReplySlot& operator=(const ReplySlot&) = delete;
    ReplySlot(ReplySlot&&) noexcept = default;
    ReplySlot& operator=(ReplySlot&&) noexcept = default;

    [[nodiscard]] std::future<T> future() { return promise_.get_future(); }

    // False when the slot was already used.
    [[nodiscard]] bool send(T value) noexcept {
        if (used_) {
            return false;
        }
        try {
            promise_.set_value(std::move(value));
            used_ = true;
            return true;
        } catch (const std::future_error&) {
            return false;
        }
    }

    [[nodiscard]] bool used() const noexcept { return used_; }

private:
    std::promise<T> promise_;
    bool used_ = false;
};

template <>
class ReplySlot<void> {
public:
    ReplySlot() = default;

    ReplySlot(const ReplySlot&) = delete;
    ReplySlot& operator=(const ReplySlot&) = delete;
    ReplySlot(ReplySlot&&) noexcept = default;
    ReplySlot& operator=(ReplySlot&&) noexcept = default;

    [[nodiscard]] std::future<void> future() { return promise_.get_future(); }

    [[nodiscard]] bool send() noexcept {
        if (used_) {
            return false;
        }
        try {
            promise_.set_value();
            used_ = true;
            return true;
        } catch (const std::future_error&) {
            return false;
        }
    }

    [[nodiscard]] bool used() const noexcept { return used_; }

private:
    std::promise<void> promise_;
    bool used_ = false;
};

}
