/*
 * steplog - Step Log Streaming
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "steplog/steps.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace steplog;

namespace {

PodSnapshot buildTestPod() {
    PodSnapshot pod;
    pod.name = "build-pod";
    pod.initContainers = {"step-init-git", "place-tools"};
    pod.containers = {"step-build", "step-test", "step-publish"};
    pod.initContainerStatuses = {{"step-init-git", ContainerState::Terminated}};
    pod.containerStatuses = {
        {"step-build", ContainerState::Terminated},
        {"step-test", ContainerState::Waiting},
        {"step-publish", ContainerState::Running},
    };
    return pod;
}

std::vector<std::string> names(const std::vector<Step>& steps) {
    std::vector<std::string> out;
    for (const auto& s : steps) out.push_back(s.name);
    return out;
}

}

TEST(StepsTest, StripsStepPrefixOnly) {
    EXPECT_EQ(stepNameFor("step-build"), "build");
    EXPECT_EQ(stepNameFor("place-tools"), "place-tools");
    EXPECT_EQ(stepNameFor("step-"), "");
    EXPECT_EQ(stepNameFor("ste"), "ste");
}

TEST(StepsTest, EmptySelectionKeepsDeclarationOrder) {
    auto steps = filterSteps(buildTestPod(), false, {});
    EXPECT_EQ(names(steps), (std::vector<std::string>{"build", "test", "publish"}));
    EXPECT_EQ(steps[0].container, "step-build");
}

TEST(StepsTest, AllStepsPrependsInitSteps) {
    auto steps = filterSteps(buildTestPod(), true, {});
    EXPECT_EQ(names(steps), (std::vector<std::string>{"init-git", "place-tools", "build", "test", "publish"}));
}

TEST(StepsTest, WantedIsIntersectedInPodOrder) {
    auto steps = filterSteps(buildTestPod(), false, {"publish", "build"});
    EXPECT_EQ(names(steps), (std::vector<std::string>{"build", "publish"}));
}

TEST(StepsTest, UnknownWantedNamesAreDropped) {
    auto steps = filterSteps(buildTestPod(), false, {"deploy", "test"});
    EXPECT_EQ(names(steps), (std::vector<std::string>{"test"}));

    EXPECT_TRUE(filterSteps(buildTestPod(), false, {"deploy"}).empty());
}

TEST(StepsTest, InitStepsAreNotSubjectToWanted) {
    PodSnapshot pod;
    pod.initContainers = {"step-init-git"};
    pod.containers = {"step-build", "step-test"};

    auto steps = filterSteps(pod, true, {"test"});
    EXPECT_EQ(names(steps), (std::vector<std::string>{"init-git", "test"}));
}

TEST(StepsTest, StateComesFromMatchingStatus) {
    auto steps = filterSteps(buildTestPod(), true, {});
    ASSERT_EQ(steps.size(), 5u);
    EXPECT_EQ(steps[0].state, ContainerState::Terminated);
    EXPECT_EQ(steps[1].state, ContainerState::Unknown);
    EXPECT_TRUE(steps[1].hasStarted());
    EXPECT_TRUE(steps[2].hasStarted());
    EXPECT_FALSE(steps[3].hasStarted());
    EXPECT_TRUE(steps[4].hasStarted());
}
