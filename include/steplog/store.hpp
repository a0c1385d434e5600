/*
 * steplog - Step Log Streaming
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>

#include "steplog/client.hpp"
#include "steplog/types.hpp"

namespace steplog {

struct StoreOptions {
    std::chrono::milliseconds pollInterval{200};
    std::chrono::milliseconds podWaitTimeout{std::chrono::minutes(5)};
};

// Run and pod records kept as plain files under a root directory:
//
//   <root>/<ns>/taskruns/<run>/taskrun.conf
//   <root>/<ns>/pods/<pod>/pod.conf
//   <root>/<ns>/pods/<pod>/<container>.log
//   <root>/<ns>/pods/<pod>/<container>.exit
//
// Anything that updates those files (a runner, a test, a person with an
// editor) is what the watch and the log tailers observe.
class LocalStore final : public RunClient, public PodClient {
public:
    explicit LocalStore(const std::filesystem::path& root, StoreOptions options = {});

    LocalStore(const LocalStore&) = delete;
    LocalStore& operator=(const LocalStore&) = delete;

    [[nodiscard]] RunResult get(const std::string& ns, const std::string& name) override;
    [[nodiscard]] WatchResult watch(const std::string& ns, const std::string& name) override;
    [[nodiscard]] std::shared_ptr<PodHandle> open(const std::string& podName, const std::string& ns) override;

    [[nodiscard]] std::filesystem::path runFile(const std::string& ns, const std::string& name) const;
    [[nodiscard]] std::filesystem::path podDir(const std::string& ns, const std::string& pod) const;
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    // STEPLOG_POLL_MS overrides the poll interval
    [[nodiscard]] static StoreOptions optionsFromEnv();

private:
    std::filesystem::path root_;
    StoreOptions options_;
};

[[nodiscard]] RunResult parseRunConfig(std::istream& in, const std::string& ns, const std::string& name);
[[nodiscard]] PodResult parsePodConfig(std::istream& in, const std::string& ns, const std::string& name);

}
