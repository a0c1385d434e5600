/*
 * steplog - Step Log Streaming
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "steplog/types.hpp"
#include <algorithm>
#include <cctype>

namespace steplog {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

const char* toString(ContainerState state) noexcept {
    switch (state) {
        case ContainerState::Waiting: return "waiting";
        case ContainerState::Running: return "running";
        case ContainerState::Terminated: return "terminated";
        default: return "unknown";
    }
}

const char* toString(PodPhase phase) noexcept {
    switch (phase) {
        case PodPhase::Pending: return "Pending";
        case PodPhase::Running: return "Running";
        case PodPhase::Succeeded: return "Succeeded";
        case PodPhase::Failed: return "Failed";
        default: return "Unknown";
    }
}

const char* toString(ConditionStatus status) noexcept {
    switch (status) {
        case ConditionStatus::True: return "True";
        case ConditionStatus::False: return "False";
        default: return "Unknown";
    }
}

std::optional<ContainerState> parseContainerState(const std::string& value) {
    std::string s = toLowerCopy(value);
    if (s == "waiting") return ContainerState::Waiting;
    if (s == "running") return ContainerState::Running;
    if (s == "terminated") return ContainerState::Terminated;
    if (s.empty() || s == "unknown") return ContainerState::Unknown;
    return std::nullopt;
}

std::optional<PodPhase> parsePodPhase(const std::string& value) {
    std::string s = toLowerCopy(value);
    if (s == "pending") return PodPhase::Pending;
    if (s == "running") return PodPhase::Running;
    if (s == "succeeded") return PodPhase::Succeeded;
    if (s == "failed") return PodPhase::Failed;
    if (s == "unknown") return PodPhase::Unknown;
    return std::nullopt;
}

std::optional<ConditionStatus> parseConditionStatus(const std::string& value) {
    std::string s = toLowerCopy(value);
    if (s == "true") return ConditionStatus::True;
    if (s == "false") return ConditionStatus::False;
    if (s == "unknown") return ConditionStatus::Unknown;
    return std::nullopt;
}

}
