/*
 * steplog - Step Log Streaming
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "steplog/reader.hpp"
#include "steplog/logger.hpp"
#include "steplog/waiter.hpp"
#include <cctype>
#include <utility>

namespace steplog {

namespace {
constexpr const char* kNotFoundPrefix = "Unable to get Taskrun";

std::string trimCopy(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
    return value.substr(begin, end - begin);
}

// Feeds missing a channel behave as if it were already closed.
void normalizeFeed(LogFeed& feed) {
    if (!feed.lines) {
        feed.lines = std::make_shared<Channel<std::string>>();
        feed.lines->close();
    }
    if (!feed.errors) {
        feed.errors = std::make_shared<Channel<std::string>>();
        feed.errors->close();
    }
}
}

LogStream::LogStream(std::size_t capacity)
    : logs_(std::make_unique<Channel<LogRecord>>(capacity)),
      errors_(std::make_unique<Channel<ErrorRecord>>(capacity)) {
}

LogStream::~LogStream() {
    cancel();
    wait();
}

void LogStream::cancel() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_ && !logs_->closed()) {
        LOG_DEBUG("Log stream cancelled");
    }
    cancelled_ = true;
    // Outputs first, so the worker's next send fails instead of slipping
    // a sentinel through for the step being interrupted.
    logs_->close();
    errors_->close();
    if (currentLines_) currentLines_->close();
    if (currentErrors_) currentErrors_->close();
}

void LogStream::wait() noexcept {
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

bool LogStream::cancelled() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

void LogStream::start(std::vector<Step> steps, std::shared_ptr<PodHandle> pod, std::string task, bool follow) {
    worker_ = std::thread([this, steps = std::move(steps), pod = std::move(pod),
                           task = std::move(task), follow]() {
        setThreadName("stream");
        try {
            streamSteps(steps, *pod, task, follow);
        } catch (const std::exception& e) {
            LOG_ERROR("Log stream worker error: " + std::string(e.what()));
            (void)errors_->send({"", e.what()});
        }
        logs_->close();
        errors_->close();
        LOG_DEBUG("Log stream finished");
        clearThreadName();
    });
}

void LogStream::streamSteps(const std::vector<Step>& steps, PodHandle& pod, const std::string& task, bool follow) {
    for (const auto& step : steps) {
        if (cancelled()) {
            return;
        }
        if (!follow && !step.hasStarted()) {
            LOG_DEBUG("Skipping step " + step.name + ": not started");
            continue;
        }

        auto container = pod.container(step.container);
        FeedResult opened;
        if (container) {
            opened = container->readLogs(follow);
        } else {
            opened.error = "no container " + step.container + " in pod";
        }

        if (!opened) {
            LOG_WARN("Cannot read logs of step " + step.name + ": " + opened.error);
            if (!errors_->send({step.name, "error in getting logs for step " + step.name + ": " + opened.error})) {
                return;
            }
            continue;
        }

        LogFeed feed = std::move(opened.feed);
        normalizeFeed(feed);
        if (!track(feed)) {
            feed.close();
            feed.join();
            return;
        }

        LOG_DEBUG("Reading logs of step " + step.name);
        bool drained = drainStep(feed, task, step.name);
        untrack();
        if (!drained) {
            feed.close();
        }
        feed.join();
        if (!drained) {
            return;
        }

        StatusResult status = container->status();
        if (!status) {
            LOG_WARN("Step " + step.name + " failed, not reading further steps: " + status.error);
            (void)errors_->send({step.name, status.error});
            return;
        }
        LOG_DEBUG("Step " + step.name + " done");
    }
}

bool LogStream::drainStep(LogFeed& feed, const std::string& task, const std::string& step) {
    return selectUntilClosed(*feed.lines, *feed.errors,
        [&](std::optional<std::string> line) {
            if (!line) {
                return logs_->send({task, step, kEofSentinel});
            }
            return logs_->send({task, step, std::move(*line)});
        },
        [&](std::optional<std::string> error) {
            if (!error) {
                return true;
            }
            return errors_->send({step, "failed to get logs for " + step + ": " + *error});
        });
}

bool LogStream::track(const LogFeed& feed) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
        return false;
    }
    currentLines_ = feed.lines;
    currentErrors_ = feed.errors;
    return true;
}

void LogStream::untrack() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLines_.reset();
    currentErrors_.reset();
}

LogReader::LogReader(RunClient& runs, PodClient& pods, ReadOptions options)
    : runs_(runs), pods_(pods), options_(std::move(options)) {
}

ReadResult LogReader::read() {
    RunResult fetched = runs_.get(options_.ns, options_.run);
    if (!fetched) {
        return {false, nullptr, std::string(kNotFoundPrefix) + ": " + fetched.error};
    }

    formTaskName(fetched.run);
    LOG_DEBUG("Reading logs of taskrun " + options_.run + " as task " + task_);

    if (options_.follow) {
        return readLiveLogs();
    }
    return readAvailableLogs(fetched.run);
}

void LogReader::formTaskName(const Run& run) {
    if (!options_.task.empty()) {
        task_ = options_.task;
        return;
    }

    auto label = run.labels.find(kPipelineTaskLabel);
    if (label != run.labels.end()) {
        task_ = label->second;
        return;
    }

    if (!run.taskRef.empty()) {
        task_ = run.taskRef;
        return;
    }

    task_ = "Task " + std::to_string(options_.number);
}

ReadResult LogReader::readLiveLogs() {
    PodWaiter waiter(runs_, options_.ns, options_.run, task_);
    WaitResult waited = waiter.waitUntilPodNameAvailable(options_.podWaitTimeout);
    if (!waited) {
        return {false, nullptr, waited.error};
    }

    auto pod = pods_.open(waited.run.podName, options_.ns);
    if (!pod) {
        return {false, nullptr, podFailure("pod " + waited.run.podName + " not found", waited.run.name)};
    }

    PodResult scheduled = pod->wait();
    if (!scheduled) {
        return {false, nullptr, podFailure(scheduled.error, waited.run.name)};
    }

    return readStepsLogs(scheduled.pod, std::move(pod));
}

ReadResult LogReader::readAvailableLogs(const Run& run) {
    if (!run.hasStarted()) {
        return {false, nullptr, "task " + task_ + " has not started yet"};
    }

    if (auto failure = runFailure(run, task_)) {
        if (options_.errStream) {
            *options_.errStream << *failure << "\n";
        }
        return {false, nullptr, *failure, options_.errStream != nullptr};
    }

    if (run.podName.empty()) {
        return {false, nullptr, "pod for taskrun " + run.name + " not available yet"};
    }

    auto pod = pods_.open(run.podName, options_.ns);
    if (!pod) {
        return {false, nullptr, podFailure("pod " + run.podName + " not found", run.name)};
    }

    PodResult fetched = pod->get();
    if (!fetched) {
        return {false, nullptr, podFailure(fetched.error, run.name)};
    }

    return readStepsLogs(fetched.pod, std::move(pod));
}

ReadResult LogReader::readStepsLogs(const PodSnapshot& snapshot, std::shared_ptr<PodHandle> pod) {
    std::vector<Step> steps = filterSteps(snapshot, options_.allSteps, options_.steps);
    LOG_DEBUG("Resolved " + std::to_string(steps.size()) + " step(s) in pod " + snapshot.name);

    auto stream = std::make_unique<LogStream>(options_.bufferSize);
    try {
        stream->start(std::move(steps), std::move(pod), task_, options_.follow);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start log stream: " + std::string(e.what()));
        return {false, nullptr, "failed to start log stream: " + std::string(e.what())};
    }
    return {true, std::move(stream), ""};
}

std::string LogReader::podFailure(const std::string& reason, const std::string& runName) const {
    return "task " + task_ + " failed: " + trimCopy(reason) + ". Run kubectl describe taskrun " +
           runName + " -n " + options_.ns + " for more details.";
}

}
