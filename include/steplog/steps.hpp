/*
 * steplog - Step Log Streaming
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <vector>

#include "steplog/types.hpp"

namespace steplog {

struct Step {
    std::string name;
    std::string container;
    ContainerState state = ContainerState::Unknown;

    [[nodiscard]] bool hasStarted() const noexcept { return state != ContainerState::Waiting; }
};

[[nodiscard]] std::string stepNameFor(const std::string& container);

// Steps of the pod's regular containers in declaration order.
[[nodiscard]] std::vector<Step> podSteps(const PodSnapshot& pod);
[[nodiscard]] std::vector<Step> initSteps(const PodSnapshot& pod);

// Init steps come first when allSteps is set and are never filtered by
// wanted. An empty wanted list keeps every regular step; otherwise only
// regular steps named in wanted are kept, in pod order. Unknown names in
// wanted are ignored.
[[nodiscard]] std::vector<Step> filterSteps(const PodSnapshot& pod, bool allSteps,
                                            const std::vector<std::string>& wanted);

}
