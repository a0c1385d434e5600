/*
 * steplog - Step Log Streaming
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "steplog/steps.hpp"
#include <unordered_map>
#include <unordered_set>

namespace steplog {

namespace {
std::vector<Step> buildSteps(const std::vector<std::string>& containers,
                             const std::vector<ContainerStatus>& statuses) {
    std::unordered_map<std::string, ContainerState> state;
    for (const auto& status : statuses) {
        state[status.name] = status.state;
    }

    std::vector<Step> steps;
    steps.reserve(containers.size());
    for (const auto& container : containers) {
        auto it = state.find(container);
        steps.push_back({stepNameFor(container), container,
                         it != state.end() ? it->second : ContainerState::Unknown});
    }
    return steps;
}
}

std::string stepNameFor(const std::string& container) {
    const std::string prefix(kStepPrefix);
    if (container.compare(0, prefix.size(), prefix) == 0) {
        return container.substr(prefix.size());
    }
    return container;
}

std::vector<Step> podSteps(const PodSnapshot& pod) {
    return buildSteps(pod.containers, pod.containerStatuses);
}

std::vector<Step> initSteps(const PodSnapshot& pod) {
    return buildSteps(pod.initContainers, pod.initContainerStatuses);
}

std::vector<Step> filterSteps(const PodSnapshot& pod, bool allSteps,
                              const std::vector<std::string>& wanted) {
    std::vector<Step> steps;
    if (allSteps) {
        steps = initSteps(pod);
    }

    std::vector<Step> regular = podSteps(pod);
    if (wanted.empty()) {
        steps.insert(steps.end(), regular.begin(), regular.end());
        return steps;
    }

    std::unordered_set<std::string> keep(wanted.begin(), wanted.end());
    for (auto& step : regular) {
        if (keep.count(step.name) > 0) {
            steps.push_back(std::move(step));
        }
    }
    return steps;
}

}
