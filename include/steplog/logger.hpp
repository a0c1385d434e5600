/*
 * steplog - Step Log Streaming
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace steplog {

enum class LogLevel : std::uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    // Re-reads STEPLOG_LOG_LEVEL, dropping any level set by setLevel()
    static void initFromEnv() noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Names the calling thread in log lines
void setThreadName(const std::string& name);
void clearThreadName();

}

#define LOG_ERROR(msg) ::steplog::Logger::error(msg)
#define LOG_WARN(msg)  ::steplog::Logger::warn(msg)
#define LOG_INFO(msg)  ::steplog::Logger::info(msg)
#define LOG_DEBUG(msg) ::steplog::Logger::debug(msg)
#define LOG_TRACE(msg) ::steplog::Logger::trace(msg)
