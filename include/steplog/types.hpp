/*
 * steplog - Step Log Streaming
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace steplog {

// Container name prefix stripped to get the step name.
inline constexpr const char* kStepPrefix = "step-";

// Marks the end of one step's log stream.
inline constexpr const char* kEofSentinel = "EOFLOG";

inline constexpr const char* kPipelineTaskLabel = "tekton.dev/pipelineTask";

enum class ConditionStatus : std::uint8_t { Unknown, True, False };

struct Condition {
    std::string type;
    ConditionStatus status = ConditionStatus::Unknown;
    std::string reason;
    std::string message;
};

struct Run {
    std::string ns;
    std::string name;
    std::unordered_map<std::string, std::string> labels;
    std::string taskRef;
    std::vector<Condition> conditions;
    std::string podName;
    std::optional<std::chrono::system_clock::time_point> startTime;

    [[nodiscard]] bool hasStarted() const noexcept { return startTime.has_value(); }
};

// Unknown is what a container with no reported status gets.
enum class ContainerState : std::uint8_t { Unknown, Waiting, Running, Terminated };

enum class PodPhase : std::uint8_t { Pending, Running, Succeeded, Failed, Unknown };

struct ContainerStatus {
    std::string name;
    ContainerState state = ContainerState::Unknown;
};

struct PodSnapshot {
    std::string ns;
    std::string name;
    PodPhase phase = PodPhase::Unknown;
    std::string message;
    std::vector<std::string> initContainers;
    std::vector<std::string> containers;
    std::vector<ContainerStatus> initContainerStatuses;
    std::vector<ContainerStatus> containerStatuses;
};

struct LogRecord {
    std::string task;
    std::string step;
    std::string log;

    [[nodiscard]] bool isEof() const noexcept { return log == kEofSentinel; }
};

struct ErrorRecord {
    std::string step;
    std::string message;
};

[[nodiscard]] const char* toString(ContainerState state) noexcept;
[[nodiscard]] const char* toString(PodPhase phase) noexcept;
[[nodiscard]] const char* toString(ConditionStatus status) noexcept;

[[nodiscard]] std::optional<ContainerState> parseContainerState(const std::string& value);
[[nodiscard]] std::optional<PodPhase> parsePodPhase(const std::string& value);
[[nodiscard]] std::optional<ConditionStatus> parseConditionStatus(const std::string& value);

} // namespace steplog
