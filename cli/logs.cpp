/*
 * steplog - Step log reader (steplog-logs)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "steplog/logger.hpp"
#include "steplog/printer.hpp"
#include "steplog/reader.hpp"
#include "steplog/store.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace steplog;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag
static volatile sig_atomic_t g_interrupted = 0;

void signalHandler(int signal) {
    (void)signal;
    g_interrupted = 1;
}

void printUsage(const char* progName) {
    std::cout << "steplog Step Log Reader v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <store> <taskrun> [options]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  store         Directory holding taskrun and pod records\n";
    std::cout << "  taskrun       Name of the taskrun to read logs from\n\n";
    std::cout << "Options:\n";
    std::cout << "  -n, --namespace <ns>   Namespace of the taskrun (default: $STEPLOG_NAMESPACE or default)\n";
    std::cout << "  -f, --follow           Stream logs as they are produced\n";
    std::cout << "  -a, --all              Include init steps\n";
    std::cout << "  -s, --step <name>      Only show this step (repeatable)\n";
    std::cout << "  -t, --timeout <sec>    Seconds to wait for the pod when following (default: 10)\n";
    std::cout << "      --task <name>      Task name shown in the prefix\n";
    std::cout << "      --no-color         Disable colors\n";
    std::cout << "      --no-prefix        Do not prefix lines with task and step\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "  -v, --version          Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  STEPLOG_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  STEPLOG_NAMESPACE    Default namespace\n";
    std::cout << "  STEPLOG_POLL_MS      Poll interval of the store in milliseconds (default: 200)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./store build-run-x7k2\n";
    std::cout << "  " << progName << " ./store build-run-x7k2 -f -s test\n";
    std::cout << "  STEPLOG_LOG_LEVEL=DEBUG " << progName << " ./store build-run-x7k2 -a\n";
}

bool needsValue(int i, int argc, const std::string& arg) {
    if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " requires a value\n";
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    // Log lines would interleave with step output; STEPLOG_LOG_LEVEL overrides
    if (!std::getenv("STEPLOG_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    std::filesystem::path storeRoot = argv[1];
    ReadOptions options;
    options.run = argv[2];
    options.errStream = &std::cerr;
    if (const char* ns = std::getenv("STEPLOG_NAMESPACE")) {
        if (*ns) options.ns = ns;
    }

    PrintOptions printOptions;
    printOptions.color = isatty(fileno(stdout)) != 0;

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-n" || arg == "--namespace") {
            if (!needsValue(i, argc, arg)) return 1;
            options.ns = argv[++i];
        } else if (arg == "-f" || arg == "--follow") {
            options.follow = true;
        } else if (arg == "-a" || arg == "--all") {
            options.allSteps = true;
        } else if (arg == "-s" || arg == "--step") {
            if (!needsValue(i, argc, arg)) return 1;
            options.steps.emplace_back(argv[++i]);
        } else if (arg == "-t" || arg == "--timeout") {
            if (!needsValue(i, argc, arg)) return 1;
            std::string value = argv[++i];
            char* end = nullptr;
            long seconds = std::strtol(value.c_str(), &end, 10);
            if (value.empty() || *end != '\0' || seconds <= 0) {
                std::cerr << "Error: invalid timeout: " << value << "\n";
                return 1;
            }
            options.podWaitTimeout = std::chrono::seconds(seconds);
        } else if (arg == "--task") {
            if (!needsValue(i, argc, arg)) return 1;
            options.task = argv[++i];
        } else if (arg == "--no-color") {
            printOptions.color = false;
        } else if (arg == "--no-prefix") {
            printOptions.prefix = false;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return 1;
        }
    }

    if (!std::filesystem::is_directory(storeRoot)) {
        std::cerr << "Error: store not found: " << storeRoot.string() << "\n";
        return 1;
    }

    setThreadName("Main");

    try {
        LocalStore store(storeRoot, LocalStore::optionsFromEnv());
        LogReader reader(store, store, options);

        ReadResult result = reader.read();
        if (!result) {
            if (!result.reported) {
                std::cerr << result.error << "\n";
            }
            return 1;
        }

        // From here on an interrupt cancels the stream
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::atomic<bool> done{false};
        std::thread interruptWatcher([&]() {
            while (!done.load()) {
                if (g_interrupted) {
                    LOG_INFO("Interrupted, stopping log stream");
                    result.stream->cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        LogPrinter printer(std::cout, std::cerr, printOptions);
        std::size_t errors = printer.print(*result.stream);
        result.stream->wait();

        done.store(true);
        interruptWatcher.join();

        return exitStatus(errors, g_interrupted != 0);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
