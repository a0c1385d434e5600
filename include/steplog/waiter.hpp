/*
 * steplog - Step Log Streaming
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <optional>
#include <string>

#include "steplog/client.hpp"
#include "steplog/types.hpp"

namespace steplog {

struct WaitResult {
    bool ok = false;
    Run run;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Message for a run whose first condition is False, nothing otherwise.
[[nodiscard]] std::optional<std::string> runFailure(const Run& run, const std::string& task);

class PodWaiter {
public:
    PodWaiter(RunClient& runs, std::string ns, std::string run, std::string task);

    PodWaiter(const PodWaiter&) = delete;
    PodWaiter& operator=(const PodWaiter&) = delete;

    // Returns the run once its pod name is set. A run that already has one
    // is returned without opening a watch.
    [[nodiscard]] WaitResult waitUntilPodNameAvailable(std::chrono::milliseconds timeout);

private:
    [[nodiscard]] WaitResult giveUp(const Run& lastKnown) const;

    RunClient& runs_;
    std::string ns_;
    std::string run_;
    std::string task_;
};

}
