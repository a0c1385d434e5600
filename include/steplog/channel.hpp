/*
 * steplog - Step Log Streaming
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace steplog {

// Wakes one waiter blocked on several channels. A notify() that arrives
// before wait() is not lost.
class Notifier {
public:
    void notify() noexcept {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_ = true;
        }
        cv_.notify_all();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return pending_; });
        pending_ = false;
    }

    template <typename Clock, typename Duration>
    bool waitUntil(const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool fired = cv_.wait_until(lock, deadline, [this] { return pending_; });
        pending_ = false;
        return fired;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool pending_ = false;
};

enum class RecvStatus : std::uint8_t { Value, Empty, Closed };

// Bounded FIFO shared between one producer and one consumer. Either side
// may close it: the producer when it has nothing more to send, the
// consumer when it stops reading. send() fails once closed; receivers
// still drain what was queued before the close.
template <typename T>
class Channel {
public:
    explicit Channel(std::size_t capacity = 1) noexcept
        : capacity_(capacity == 0 ? 1 : capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
    Channel(Channel&&) = delete;
    Channel& operator=(Channel&&) = delete;

    bool send(T value) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            notFull_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(value));
            notifyAttachedLocked();
        }
        notEmpty_.notify_one();
        return true;
    }

    [[nodiscard]] std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return popLocked(lock);
    }

    [[nodiscard]] RecvStatus tryReceive(std::optional<T>& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        return statusLocked(lock, out);
    }

    template <typename Rep, typename Period>
    [[nodiscard]] RecvStatus receiveFor(std::optional<T>& out, const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        return statusLocked(lock, out);
    }

    void close() noexcept {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            notifyAttachedLocked();
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    [[nodiscard]] bool closed() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    void attach(const std::shared_ptr<Notifier>& notifier) {
        bool ready = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            notifiers_.push_back(notifier);
            ready = closed_ || !items_.empty();
        }
        if (ready) {
            notifier->notify();
        }
    }

    void detach(const std::shared_ptr<Notifier>& notifier) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        notifiers_.erase(std::remove(notifiers_.begin(), notifiers_.end(), notifier), notifiers_.end());
    }

private:
    void notifyAttachedLocked() noexcept {
        for (auto& n : notifiers_) {
            n->notify();
        }
    }

    std::optional<T> popLocked(std::unique_lock<std::mutex>& lock) {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> value(std::move(items_.front()));
        items_.pop_front();
        lock.unlock();
        notFull_.notify_one();
        return value;
    }

    RecvStatus statusLocked(std::unique_lock<std::mutex>& lock, std::optional<T>& out) {
        if (!items_.empty()) {
            out = popLocked(lock);
            return RecvStatus::Value;
        }
        out.reset();
        return closed_ ? RecvStatus::Closed : RecvStatus::Empty;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<T> items_;
    bool closed_ = false;
    std::vector<std::shared_ptr<Notifier>> notifiers_;
};

// Services two channels until both are closed. Each value is handed to its
// handler as it arrives; a channel closing calls its handler once with an
// empty optional. A handler returning false stops the select early, which
// is reported by returning false.
template <typename A, typename B, typename OnA, typename OnB>
bool selectUntilClosed(Channel<A>& a, Channel<B>& b, OnA&& onA, OnB&& onB) {
    auto notifier = std::make_shared<Notifier>();
    a.attach(notifier);
    b.attach(notifier);

    bool aOpen = true;
    bool bOpen = true;
    bool completed = true;

    while (completed && (aOpen || bOpen)) {
        bool progressed = false;

        if (aOpen) {
            std::optional<A> value;
            RecvStatus status = a.tryReceive(value);
            if (status != RecvStatus::Empty) {
                progressed = true;
                aOpen = status == RecvStatus::Value;
                completed = onA(std::move(value));
            }
        }

        if (completed && bOpen) {
            std::optional<B> value;
            RecvStatus status = b.tryReceive(value);
            if (status != RecvStatus::Empty) {
                progressed = true;
                bOpen = status == RecvStatus::Value;
                completed = onB(std::move(value));
            }
        }

        if (completed && !progressed) {
            notifier->wait();
        }
    }

    a.detach(notifier);
    b.detach(notifier);
    return completed;
}

}
