/*
 * steplog - Step Log Streaming
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "steplog/store.hpp"
#include "steplog/reader.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace steplog;
using namespace steplog::fakes;

namespace {

class LocalStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = std::filesystem::temp_directory_path() /
               ("steplog_store_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root);
        options.pollInterval = std::chrono::milliseconds(10);
        options.podWaitTimeout = std::chrono::milliseconds(200);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    void write(const std::filesystem::path& path, const std::string& content) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file << content;
    }

    void writeRun(const std::string& content) {
        write(root / "default" / "taskruns" / "build-run" / "taskrun.conf", content);
    }

    std::filesystem::path podDir() const {
        return root / "default" / "pods" / "build-pod";
    }

    std::filesystem::path root;
    StoreOptions options;
};

std::vector<std::string> drain(LogFeed& feed) {
    std::vector<std::string> lines;
    while (auto line = feed.lines->receive()) {
        lines.push_back(*line);
    }
    feed.join();
    return lines;
}

}

TEST(RunConfigTest, ParsesAllKeys) {
    std::istringstream in(
        "# build run\n"
        "taskRef = build-task\n"
        "podName=build-pod\n"
        "startTime=1700000000\n"
        "label.tekton.dev/pipelineTask=compile\n"
        "condition=Succeeded False BuildFailed step build exited with 2\n"
        "\n");
    RunResult result = parseRunConfig(in, "ci", "build-run");

    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.run.ns, "ci");
    EXPECT_EQ(result.run.taskRef, "build-task");
    EXPECT_EQ(result.run.podName, "build-pod");
    EXPECT_TRUE(result.run.hasStarted());
    EXPECT_EQ(result.run.labels.at(kPipelineTaskLabel), "compile");
    ASSERT_EQ(result.run.conditions.size(), 1u);
    EXPECT_EQ(result.run.conditions[0].status, ConditionStatus::False);
    EXPECT_EQ(result.run.conditions[0].reason, "BuildFailed");
    EXPECT_EQ(result.run.conditions[0].message, "step build exited with 2");
}

TEST(RunConfigTest, RejectsMalformedLines) {
    std::istringstream missingEquals("taskRef build-task\n");
    RunResult a = parseRunConfig(missingEquals, "default", "r");
    EXPECT_FALSE(a);
    EXPECT_EQ(a.error, "line 1: expected key=value");

    std::istringstream badTime("startTime=yesterday\n");
    EXPECT_FALSE(parseRunConfig(badTime, "default", "r"));

    std::istringstream badCondition("condition=Succeeded Maybe\n");
    EXPECT_FALSE(parseRunConfig(badCondition, "default", "r"));
}

TEST(PodConfigTest, ParsesContainersInOrder) {
    std::istringstream in(
        "phase=Running\n"
        "initContainer=step-init-git:terminated\n"
        "container=step-build:terminated\n"
        "container=step-test:waiting\n"
        "container=step-publish\n");
    PodResult result = parsePodConfig(in, "default", "build-pod");

    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.pod.phase, PodPhase::Running);
    EXPECT_EQ(result.pod.initContainers, (std::vector<std::string>{"step-init-git"}));
    EXPECT_EQ(result.pod.containers, (std::vector<std::string>{"step-build", "step-test", "step-publish"}));
    ASSERT_EQ(result.pod.containerStatuses.size(), 2u);
    EXPECT_EQ(result.pod.containerStatuses[1].state, ContainerState::Waiting);
}

TEST_F(LocalStoreTest, GetReportsMissingRun) {
    LocalStore store(root, options);
    RunResult result = store.get("default", "nope");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error, "taskruns \"nope\" not found");
}

TEST_F(LocalStoreTest, GetReadsRun) {
    writeRun("taskRef=build-task\npodName=build-pod\nstartTime=1700000000\n");
    LocalStore store(root, options);
    RunResult result = store.get("default", "build-run");
    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.run.podName, "build-pod");
}

TEST_F(LocalStoreTest, WatchPublishesChangedRun) {
    writeRun("startTime=1700000000\n");
    LocalStore store(root, options);
    WatchResult watched = store.watch("default", "build-run");
    ASSERT_TRUE(watched) << watched.error;

    writeRun("startTime=1700000000\npodName=build-pod\n");

    // A reader may catch the file half written, so skip to the update
    // that carries the pod name.
    std::string podName;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (podName.empty() && std::chrono::steady_clock::now() < deadline) {
        std::optional<steplog::Run> event;
        if (watched.watch->events().receiveFor(event, std::chrono::milliseconds(100)) == RecvStatus::Value) {
            podName = event->podName;
        }
    }
    EXPECT_EQ(podName, "build-pod");

    watched.watch->stop();
    EXPECT_TRUE(watched.watch->events().closed());
}

TEST_F(LocalStoreTest, WatchPublishesPodAssignedBeforeItOpened) {
    writeRun("startTime=1700000000\n");
    LocalStore store(root, options);
    RunResult fetched = store.get("default", "build-run");
    ASSERT_TRUE(fetched) << fetched.error;
    EXPECT_TRUE(fetched.run.podName.empty());

    writeRun("startTime=1700000000\npodName=build-pod\n");
    WatchResult watched = store.watch("default", "build-run");
    ASSERT_TRUE(watched) << watched.error;

    std::optional<steplog::Run> event;
    ASSERT_EQ(watched.watch->events().receiveFor(event, std::chrono::milliseconds(500)), RecvStatus::Value);
    EXPECT_EQ(event->podName, "build-pod");
    watched.watch->stop();
}

TEST_F(LocalStoreTest, PodWaitReturnsFailedPod) {
    write(podDir() / "pod.conf", "phase=Failed\nmessage=OOMKilled\ncontainer=step-build:terminated\n");
    LocalStore store(root, options);
    PodResult result = store.open("build-pod", "default")->wait();
    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.pod.phase, PodPhase::Failed);
    EXPECT_EQ(result.pod.message, "OOMKilled");
}

TEST_F(LocalStoreTest, PodWaitReportsPendingMessage) {
    write(podDir() / "pod.conf", "phase=Pending\nmessage=ImagePullBackOff\n");
    LocalStore store(root, options);
    PodResult result = store.open("build-pod", "default")->wait();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error, "ImagePullBackOff");
}

TEST_F(LocalStoreTest, PodWaitTimesOutWhilePending) {
    write(podDir() / "pod.conf", "phase=Pending\n");
    LocalStore store(root, options);
    PodResult result = store.open("build-pod", "default")->wait();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error, "pod build-pod was not scheduled in time");
}

TEST_F(LocalStoreTest, OneShotLogsAndStatus) {
    write(podDir() / "pod.conf", "phase=Failed\ncontainer=step-build:terminated\n");
    write(podDir() / "step-build.log", "compiling\nerror: boom\npartial");
    write(podDir() / "step-build.exit", "2 undefined symbol\n");

    LocalStore store(root, options);
    auto pod = store.open("build-pod", "default");
    ASSERT_TRUE(pod->get());

    auto container = pod->container("step-build");
    FeedResult opened = container->readLogs(false);
    ASSERT_TRUE(opened) << opened.error;
    EXPECT_EQ(drain(opened.feed), (std::vector<std::string>{"compiling", "error: boom", "partial"}));

    StatusResult status = container->status();
    ASSERT_FALSE(status);
    EXPECT_EQ(status.error, "container step-build has failed: undefined symbol");
}

TEST_F(LocalStoreTest, MissingLogFileFailsToOpen) {
    LocalStore store(root, options);
    auto container = store.open("build-pod", "default")->container("step-build");
    FeedResult opened = container->readLogs(false);
    ASSERT_FALSE(opened);
    EXPECT_EQ(opened.error, "no log file for container step-build");
    EXPECT_TRUE(container->status());
}

TEST_F(LocalStoreTest, FollowTailsUntilExitFileAppears) {
    write(podDir() / "step-test.log", "one\n");
    LocalStore store(root, options);
    auto container = store.open("build-pod", "default")->container("step-test");
    FeedResult opened = container->readLogs(true);
    ASSERT_TRUE(opened) << opened.error;

    std::thread writer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        {
            std::ofstream log(podDir() / "step-test.log", std::ios::binary | std::ios::app);
            log << "two\n";
        }
        write(podDir() / "step-test.exit", "0\n");
    });

    auto lines = drain(opened.feed);
    writer.join();

    EXPECT_EQ(lines, (std::vector<std::string>{"one", "two"}));
    EXPECT_TRUE(container->status());
}

TEST_F(LocalStoreTest, ReaderStreamsStepsFromFiles) {
    writeRun("taskRef=build-task\npodName=build-pod\nstartTime=1700000000\n");
    write(podDir() / "pod.conf",
          "phase=Running\ncontainer=step-build:terminated\ncontainer=step-test:waiting\n");
    write(podDir() / "step-build.log", "ok\n");
    write(podDir() / "step-build.exit", "0\n");

    LocalStore store(root, options);
    ReadOptions readOptions;
    readOptions.run = "build-run";
    LogReader reader(store, store, readOptions);

    ReadResult result = reader.read();
    ASSERT_TRUE(result) << result.error;
    Collected got = collect(*result.stream);

    ASSERT_EQ(got.logs.size(), 2u);
    EXPECT_EQ(got.logs[0].log, "ok");
    EXPECT_TRUE(got.logs[1].isEof());
    EXPECT_TRUE(got.errors.empty());
}
