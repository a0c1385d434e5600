/*
 * steplog - Step Log Streaming
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "steplog/channel.hpp"
#include "steplog/types.hpp"

namespace steplog {

struct RunResult {
    bool ok = false;
    Run run;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

struct PodResult {
    bool ok = false;
    PodSnapshot pod;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Stream of run snapshots for one run. stop() closes events().
class RunWatch {
public:
    virtual ~RunWatch() = default;

    [[nodiscard]] virtual Channel<Run>& events() noexcept = 0;
    virtual void stop() noexcept = 0;
};

struct WatchResult {
    bool ok = false;
    std::unique_ptr<RunWatch> watch;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

class RunClient {
public:
    virtual ~RunClient() = default;

    [[nodiscard]] virtual RunResult get(const std::string& ns, const std::string& name) = 0;
    [[nodiscard]] virtual WatchResult watch(const std::string& ns, const std::string& name) = 0;
};

// Output and error channels of one container's log stream. When a
// producer thread is attached, the consumer joins it after draining or
// after closing both channels. Destroying a feed closes and joins it.
struct LogFeed {
    std::shared_ptr<Channel<std::string>> lines;
    std::shared_ptr<Channel<std::string>> errors;
    std::thread producer;

    LogFeed() = default;
    ~LogFeed() {
        close();
        join();
    }

    LogFeed(const LogFeed&) = delete;
    LogFeed& operator=(const LogFeed&) = delete;

    LogFeed(LogFeed&& other) noexcept
        : lines(std::move(other.lines)), errors(std::move(other.errors)), producer(std::move(other.producer)) {
    }

    LogFeed& operator=(LogFeed&& other) noexcept {
        if (this != &other) {
            close();
            join();
            lines = std::move(other.lines);
            errors = std::move(other.errors);
            producer = std::move(other.producer);
        }
        return *this;
    }

    void close() noexcept {
        if (lines) lines->close();
        if (errors) errors->close();
    }

    void join() noexcept {
        if (producer.joinable()) {
            producer.join();
        }
    }
};

struct FeedResult {
    bool ok = false;
    LogFeed feed;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// ok is false once the container terminated unsuccessfully.
struct StatusResult {
    bool ok = false;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

class ContainerHandle {
public:
    virtual ~ContainerHandle() = default;

    [[nodiscard]] virtual FeedResult readLogs(bool follow) = 0;
    [[nodiscard]] virtual StatusResult status() = 0;
};

class PodHandle {
public:
    virtual ~PodHandle() = default;

    // Blocks until the pod can be scheduled or fails to
    [[nodiscard]] virtual PodResult wait() = 0;
    [[nodiscard]] virtual PodResult get() = 0;
    [[nodiscard]] virtual std::unique_ptr<ContainerHandle> container(const std::string& name) = 0;
};

class PodClient {
public:
    virtual ~PodClient() = default;

    [[nodiscard]] virtual std::shared_ptr<PodHandle> open(const std::string& podName, const std::string& ns) = 0;
};

}
