/*
 * steplog - Step Log Streaming
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "steplog/store.hpp"
#include "steplog/logger.hpp"
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>
#include <thread>
#include <utility>

namespace steplog {

namespace {
constexpr const char* kRunFileName = "taskrun.conf";
constexpr const char* kPodFileName = "pod.conf";
constexpr std::size_t kReadChunk = 4096;

std::string trim(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
    return value.substr(begin, end - begin);
}

// Splits "key=value" lines, skipping blanks and # comments.
template <typename Fn>
bool forEachEntry(std::istream& in, std::string& error, Fn&& fn) {
    std::string line;
    int number = 0;
    while (std::getline(in, line)) {
        ++number;
        std::string entry = trim(line);
        if (entry.empty() || entry[0] == '#') {
            continue;
        }
        auto eq = entry.find('=');
        if (eq == std::string::npos) {
            error = "line " + std::to_string(number) + ": expected key=value";
            return false;
        }
        if (!fn(trim(entry.substr(0, eq)), trim(entry.substr(eq + 1)), error)) {
            error = "line " + std::to_string(number) + ": " + error;
            return false;
        }
    }
    return true;
}

std::optional<Condition> parseCondition(const std::string& value) {
    std::istringstream fields(value);
    std::string type;
    std::string status;
    std::string reason;
    if (!(fields >> type >> status)) {
        return std::nullopt;
    }
    auto parsed = parseConditionStatus(status);
    if (!parsed) {
        return std::nullopt;
    }
    fields >> reason;
    std::string message;
    std::getline(fields, message);
    return Condition{type, *parsed, reason, trim(message)};
}

std::optional<ContainerStatus> parseContainer(const std::string& value) {
    auto colon = value.rfind(':');
    std::string name = trim(value.substr(0, colon));
    std::string state = colon == std::string::npos ? "" : trim(value.substr(colon + 1));
    auto parsed = parseContainerState(state);
    if (name.empty() || !parsed) {
        return std::nullopt;
    }
    return ContainerStatus{name, *parsed};
}

bool readFile(const std::filesystem::path& path, std::string& content) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

class FileRunWatch final : public RunWatch {
public:
    // The first poll always publishes the current snapshot, so a change
    // made between the caller's get() and this watch is not lost.
    FileRunWatch(std::filesystem::path path, std::string ns, std::string name,
                 std::chrono::milliseconds pollInterval)
        : path_(std::move(path)), ns_(std::move(ns)), name_(std::move(name)),
          pollInterval_(pollInterval),
          events_(std::make_shared<Channel<Run>>(16)) {
        thread_ = std::thread(&FileRunWatch::pollLoop, this);
    }

    ~FileRunWatch() override {
        stop();
    }

    Channel<Run>& events() noexcept override { return *events_; }

    void stop() noexcept override {
        stopped_.store(true);
        events_->close();
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
            thread_.join();
        }
    }

private:
    void pollLoop() {
        setThreadName("watch-" + name_);
        LOG_DEBUG("Watching " + path_.string());

        while (!stopped_.load()) {
            std::string content;
            if (readFile(path_, content) && (!published_ || content != last_)) {
                last_ = content;
                published_ = true;
                std::istringstream in(content);
                RunResult parsed = parseRunConfig(in, ns_, name_);
                if (!parsed) {
                    LOG_WARN("Ignoring unreadable update of taskrun " + name_ + ": " + parsed.error);
                } else if (!events_->send(std::move(parsed.run))) {
                    break;
                }
            }

            auto wakeAt = std::chrono::steady_clock::now() + pollInterval_;
            while (std::chrono::steady_clock::now() < wakeAt && !stopped_.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }

        LOG_DEBUG("Watch on taskrun " + name_ + " stopped");
        clearThreadName();
    }

    std::filesystem::path path_;
    std::string ns_;
    std::string name_;
    std::string last_;
    bool published_ = false;
    std::chrono::milliseconds pollInterval_;
    std::shared_ptr<Channel<Run>> events_;
    std::atomic<bool> stopped_{false};
    std::thread thread_;
};

// Sends complete lines from a log file. In follow mode it keeps polling
// until the container's exit file shows up and the log is fully read.
void tailLog(const std::filesystem::path& logPath, const std::filesystem::path& exitPath, bool follow,
             std::chrono::milliseconds pollInterval, Channel<std::string>& lines, Channel<std::string>& errors) {
    std::ifstream file;
    std::string pending;
    char chunk[kReadChunk];

    for (;;) {
        if (lines.closed()) {
            break;
        }

        if (!file.is_open()) {
            file.open(logPath, std::ios::binary);
            if (!file.is_open()) {
                std::error_code ec;
                if (!follow || std::filesystem::exists(exitPath, ec)) {
                    break;
                }
                std::this_thread::sleep_for(pollInterval);
                continue;
            }
        }

        // The exit file is checked before reading so that every byte
        // written before it appeared is still picked up below.
        std::error_code ec;
        bool finished = !follow || std::filesystem::exists(exitPath, ec);

        bool cancelled = false;
        while (!cancelled) {
            file.read(chunk, sizeof(chunk));
            std::streamsize got = file.gcount();
            if (got <= 0) {
                break;
            }
            pending.append(chunk, static_cast<std::size_t>(got));
            std::size_t start = 0;
            for (auto nl = pending.find('\n'); nl != std::string::npos; nl = pending.find('\n', start)) {
                if (!lines.send(pending.substr(start, nl - start))) {
                    cancelled = true;
                    break;
                }
                start = nl + 1;
            }
            pending.erase(0, start);
        }
        if (cancelled) {
            break;
        }

        if (file.bad()) {
            (void)errors.send("read error on " + logPath.filename().string());
            break;
        }
        file.clear();

        if (finished) {
            if (!pending.empty()) {
                (void)lines.send(pending);
            }
            break;
        }
        std::this_thread::sleep_for(pollInterval);
    }

    lines.close();
    errors.close();
}

class FileContainerHandle final : public ContainerHandle {
public:
    FileContainerHandle(std::filesystem::path dir, std::string name, std::chrono::milliseconds pollInterval)
        : dir_(std::move(dir)), name_(std::move(name)), pollInterval_(pollInterval) {
    }

    FeedResult readLogs(bool follow) override {
        auto logPath = dir_ / (name_ + ".log");
        auto exitPath = dir_ / (name_ + ".exit");

        std::error_code ec;
        if (!follow && !std::filesystem::exists(logPath, ec)) {
            return {false, {}, "no log file for container " + name_};
        }

        FeedResult result;
        result.ok = true;
        result.feed.lines = std::make_shared<Channel<std::string>>(64);
        result.feed.errors = std::make_shared<Channel<std::string>>(4);

        auto lines = result.feed.lines;
        auto errors = result.feed.errors;
        auto interval = pollInterval_;
        std::string thread = "tail-" + name_;
        try {
            result.feed.producer = std::thread([=]() {
                setThreadName(thread);
                tailLog(logPath, exitPath, follow, interval, *lines, *errors);
                clearThreadName();
            });
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to start log tailer for " + name_ + ": " + e.what());
            return {false, {}, std::string("cannot start log reader: ") + e.what()};
        }
        return result;
    }

    StatusResult status() override {
        auto exitPath = dir_ / (name_ + ".exit");
        std::error_code ec;
        if (!std::filesystem::exists(exitPath, ec)) {
            return {true, ""};
        }

        std::string content;
        if (!readFile(exitPath, content)) {
            return {false, "cannot read exit status of container " + name_};
        }

        std::istringstream in(content);
        int code = 0;
        if (!(in >> code)) {
            return {false, "cannot read exit status of container " + name_};
        }
        if (code == 0) {
            return {true, ""};
        }

        std::string message;
        std::getline(in, message);
        message = trim(message);
        if (message.empty()) {
            message = "exit code " + std::to_string(code);
        }
        return {false, "container " + name_ + " has failed: " + message};
    }

private:
    std::filesystem::path dir_;
    std::string name_;
    std::chrono::milliseconds pollInterval_;
};

class FilePodHandle final : public PodHandle {
public:
    FilePodHandle(std::filesystem::path dir, std::string ns, std::string name, StoreOptions options)
        : dir_(std::move(dir)), ns_(std::move(ns)), name_(std::move(name)), options_(options) {
    }

    PodResult wait() override {
        const auto deadline = std::chrono::steady_clock::now() + options_.podWaitTimeout;
        bool announced = false;

        for (;;) {
            PodResult current = load();
            if (current) {
                // Failed pods are returned too; their logs are still readable
                if (current.pod.phase != PodPhase::Pending) {
                    return current;
                }
                if (!current.pod.message.empty()) {
                    return {false, {}, current.pod.message};
                }
            }

            if (std::chrono::steady_clock::now() >= deadline) {
                return {false, {}, "pod " + name_ + " was not scheduled in time"};
            }
            if (!announced) {
                LOG_DEBUG("Waiting for pod " + name_ + " to be scheduled");
                announced = true;
            }
            std::this_thread::sleep_for(options_.pollInterval);
        }
    }

    PodResult get() override {
        return load();
    }

    std::unique_ptr<ContainerHandle> container(const std::string& name) override {
        return std::make_unique<FileContainerHandle>(dir_, name, options_.pollInterval);
    }

private:
    PodResult load() const {
        std::ifstream file(dir_ / kPodFileName);
        if (!file) {
            return {false, {}, "pods \"" + name_ + "\" not found"};
        }
        return parsePodConfig(file, ns_, name_);
    }

    std::filesystem::path dir_;
    std::string ns_;
    std::string name_;
    StoreOptions options_;
};
}

RunResult parseRunConfig(std::istream& in, const std::string& ns, const std::string& name) {
    RunResult result;
    result.run.ns = ns;
    result.run.name = name;

    auto& run = result.run;
    bool ok = forEachEntry(in, result.error,
        [&run](const std::string& key, const std::string& value, std::string& error) {
            if (key == "taskRef") {
                run.taskRef = value;
            } else if (key == "podName") {
                run.podName = value;
            } else if (key == "startTime") {
                char* end = nullptr;
                long long seconds = std::strtoll(value.c_str(), &end, 10);
                if (value.empty() || end == nullptr || *end != '\0') {
                    error = "invalid startTime '" + value + "'";
                    return false;
                }
                run.startTime = std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
            } else if (key.rfind("label.", 0) == 0) {
                run.labels[key.substr(6)] = value;
            } else if (key == "condition") {
                auto condition = parseCondition(value);
                if (!condition) {
                    error = "invalid condition '" + value + "'";
                    return false;
                }
                run.conditions.push_back(std::move(*condition));
            } else {
                LOG_TRACE("Ignoring taskrun key " + key);
            }
            return true;
        });

    result.ok = ok;
    return result;
}

PodResult parsePodConfig(std::istream& in, const std::string& ns, const std::string& name) {
    PodResult result;
    result.pod.ns = ns;
    result.pod.name = name;

    auto& pod = result.pod;
    bool ok = forEachEntry(in, result.error,
        [&pod](const std::string& key, const std::string& value, std::string& error) {
            if (key == "phase") {
                auto phase = parsePodPhase(value);
                if (!phase) {
                    error = "invalid phase '" + value + "'";
                    return false;
                }
                pod.phase = *phase;
            } else if (key == "message") {
                pod.message = value;
            } else if (key == "initContainer" || key == "container") {
                auto container = parseContainer(value);
                if (!container) {
                    error = "invalid container '" + value + "'";
                    return false;
                }
                bool init = key == "initContainer";
                (init ? pod.initContainers : pod.containers).push_back(container->name);
                if (container->state != ContainerState::Unknown) {
                    (init ? pod.initContainerStatuses : pod.containerStatuses).push_back(std::move(*container));
                }
            } else {
                LOG_TRACE("Ignoring pod key " + key);
            }
            return true;
        });

    result.ok = ok;
    return result;
}

LocalStore::LocalStore(const std::filesystem::path& root, StoreOptions options)
    : root_(root), options_(options) {
    LOG_DEBUG("Local store at " + root_.string());
}

std::filesystem::path LocalStore::runFile(const std::string& ns, const std::string& name) const {
    return root_ / ns / "taskruns" / name / kRunFileName;
}

std::filesystem::path LocalStore::podDir(const std::string& ns, const std::string& pod) const {
    return root_ / ns / "pods" / pod;
}

RunResult LocalStore::get(const std::string& ns, const std::string& name) {
    try {
        std::ifstream file(runFile(ns, name));
        if (!file) {
            return {false, {}, "taskruns \"" + name + "\" not found"};
        }
        RunResult result = parseRunConfig(file, ns, name);
        if (!result) {
            LOG_WARN("Malformed taskrun " + name + ": " + result.error);
            result.error = "taskrun " + name + " is malformed: " + result.error;
        }
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Error reading taskrun " + name + ": " + e.what());
        return {false, {}, e.what()};
    }
}

WatchResult LocalStore::watch(const std::string& ns, const std::string& name) {
    auto path = runFile(ns, name);
    try {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return {false, nullptr, "taskruns \"" + name + "\" not found"};
        }
        return {true, std::make_unique<FileRunWatch>(path, ns, name, options_.pollInterval), ""};
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to watch taskrun " + name + ": " + e.what());
        return {false, nullptr, e.what()};
    }
}

std::shared_ptr<PodHandle> LocalStore::open(const std::string& podName, const std::string& ns) {
    return std::make_shared<FilePodHandle>(podDir(ns, podName), ns, podName, options_);
}

StoreOptions LocalStore::optionsFromEnv() {
    StoreOptions options;
    const char* val = std::getenv("STEPLOG_POLL_MS");
    if (val && *val) {
        char* end = nullptr;
        long parsed = std::strtol(val, &end, 10);
        if (end && *end == '\0' && parsed > 0) {
            options.pollInterval = std::chrono::milliseconds(parsed);
        } else {
            LOG_WARN("Ignoring invalid STEPLOG_POLL_MS=" + std::string(val));
        }
    }
    return options;
}

}
