/*
 * steplog - Step Log Streaming
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "steplog/waiter.hpp"
#include "steplog/logger.hpp"
#include <utility>

namespace steplog {

std::optional<std::string> runFailure(const Run& run, const std::string& task) {
    if (!run.conditions.empty() && run.conditions.front().status == ConditionStatus::False) {
        return "task " + task + " has failed: " + run.conditions.front().message;
    }
    return std::nullopt;
}

PodWaiter::PodWaiter(RunClient& runs, std::string ns, std::string run, std::string task)
    : runs_(runs), ns_(std::move(ns)), run_(std::move(run)), task_(std::move(task)) {
}

WaitResult PodWaiter::waitUntilPodNameAvailable(std::chrono::milliseconds timeout) {
    RunResult current = runs_.get(ns_, run_);
    if (!current) {
        return {false, {}, current.error};
    }

    if (!current.run.podName.empty()) {
        return {true, std::move(current.run), ""};
    }

    WatchResult watched = runs_.watch(ns_, run_);
    if (!watched) {
        LOG_ERROR("Failed to watch taskrun " + run_ + ": " + watched.error);
        return {false, {}, watched.error};
    }

    LOG_DEBUG("Waiting up to " + std::to_string(timeout.count()) + "ms for pod of taskrun " + run_);

    Run lastKnown = std::move(current.run);
    bool sawEvent = false;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    for (;;) {
        auto remaining = deadline - std::chrono::steady_clock::now();
        if (remaining <= std::chrono::steady_clock::duration::zero()) {
            watched.watch->stop();
            return giveUp(lastKnown);
        }

        std::optional<Run> event;
        RecvStatus status = watched.watch->events().receiveFor(event, remaining);

        if (status == RecvStatus::Value) {
            if (!event->podName.empty()) {
                watched.watch->stop();
                LOG_DEBUG("Pod " + event->podName + " assigned to taskrun " + run_);
                return {true, std::move(*event), ""};
            }
            if (!sawEvent) {
                LOG_DEBUG("Taskrun " + run_ + " updated without a pod yet");
                sawEvent = true;
            }
            lastKnown = std::move(*event);
            continue;
        }

        watched.watch->stop();
        if (status == RecvStatus::Closed) {
            LOG_WARN("Watch on taskrun " + run_ + " ended before a pod was assigned");
        }
        return giveUp(lastKnown);
    }
}

WaitResult PodWaiter::giveUp(const Run& lastKnown) const {
    if (auto failure = runFailure(lastKnown, task_)) {
        return {false, {}, *failure};
    }
    return {false, {}, "task " + task_ + " create has not started yet or pod for task not yet available"};
}

}
