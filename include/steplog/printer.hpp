/*
 * steplog - Step Log Streaming
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <ostream>

#include "steplog/reader.hpp"
#include "steplog/types.hpp"

namespace steplog {

struct PrintOptions {
    bool color = true;
    bool prefix = true;
};

// 128 + SIGINT
inline constexpr int kExitInterrupted = 130;

// Process exit status after printing a stream: 0 when clean, 1 when any
// error record was seen, kExitInterrupted when the stream was interrupted.
[[nodiscard]] int exitStatus(std::size_t errors, bool interrupted) noexcept;

class LogPrinter {
public:
    LogPrinter(std::ostream& out, std::ostream& err, PrintOptions options = {}) noexcept;

    // Drains both channels of the stream. Returns the number of error
    // records printed.
    std::size_t print(LogStream& stream);

    void printLog(const LogRecord& record);
    void printError(const ErrorRecord& record);

private:
    std::ostream& out_;
    std::ostream& err_;
    PrintOptions options_;
};

}
