/*
 * steplog - Step Log Streaming
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

#include "steplog/channel.hpp"
#include "steplog/client.hpp"
#include "steplog/steps.hpp"
#include "steplog/types.hpp"

namespace steplog {

struct ReadOptions {
    std::string ns = "default";
    std::string run;
    std::string task;       // overrides the name derived from the run
    int number = 0;         // ordinal used for the "Task N" fallback name
    bool follow = false;
    bool allSteps = false;
    std::vector<std::string> steps;
    std::chrono::milliseconds podWaitTimeout{std::chrono::seconds(10)};
    std::size_t bufferSize = 16;
    std::ostream* errStream = nullptr;  // also receives startup failures
};

// Output of one read. A background worker walks the steps in order and
// writes to logs() and errors(); both are closed when it finishes. The
// consumer drains both channels together, or calls cancel() to stop early.
class LogStream final {
public:
    explicit LogStream(std::size_t capacity);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;
    LogStream(LogStream&&) = delete;
    LogStream& operator=(LogStream&&) = delete;

    [[nodiscard]] Channel<LogRecord>& logs() noexcept { return *logs_; }
    [[nodiscard]] Channel<ErrorRecord>& errors() noexcept { return *errors_; }

    void cancel() noexcept;
    void wait() noexcept;
    [[nodiscard]] bool cancelled() const noexcept;

private:
    friend class LogReader;

    void start(std::vector<Step> steps, std::shared_ptr<PodHandle> pod, std::string task, bool follow);
    void streamSteps(const std::vector<Step>& steps, PodHandle& pod, const std::string& task, bool follow);
    [[nodiscard]] bool drainStep(LogFeed& feed, const std::string& task, const std::string& step);

    [[nodiscard]] bool track(const LogFeed& feed);
    void untrack() noexcept;

    std::unique_ptr<Channel<LogRecord>> logs_;
    std::unique_ptr<Channel<ErrorRecord>> errors_;

    mutable std::mutex mutex_;
    bool cancelled_ = false;
    std::shared_ptr<Channel<std::string>> currentLines_;
    std::shared_ptr<Channel<std::string>> currentErrors_;

    std::thread worker_;
};

struct ReadResult {
    bool ok = false;
    std::unique_ptr<LogStream> stream;
    std::string error;
    bool reported = false;  // error was already written to errStream
    explicit operator bool() const noexcept { return ok; }
};

class LogReader {
public:
    LogReader(RunClient& runs, PodClient& pods, ReadOptions options);

    LogReader(const LogReader&) = delete;
    LogReader& operator=(const LogReader&) = delete;

    // Fails immediately when the run cannot be read or its pod is not
    // usable; everything after that arrives through the stream.
    [[nodiscard]] ReadResult read();

    [[nodiscard]] const std::string& task() const noexcept { return task_; }
    [[nodiscard]] const ReadOptions& options() const noexcept { return options_; }

private:
    void formTaskName(const Run& run);
    [[nodiscard]] ReadResult readLiveLogs();
    [[nodiscard]] ReadResult readAvailableLogs(const Run& run);
    [[nodiscard]] ReadResult readStepsLogs(const PodSnapshot& snapshot, std::shared_ptr<PodHandle> pod);
    [[nodiscard]] std::string podFailure(const std::string& reason, const std::string& runName) const;

    RunClient& runs_;
    PodClient& pods_;
    ReadOptions options_;
    std::string task_;
};

}
