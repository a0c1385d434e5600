/*
 * steplog - Step Log Streaming
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "steplog/printer.hpp"
#include "steplog/channel.hpp"

namespace steplog {

namespace {
constexpr const char* kDim = "\033[90m";
constexpr const char* kGreen = "\033[32m";
constexpr const char* kRed = "\033[31m";
constexpr const char* kReset = "\033[0m";
}

LogPrinter::LogPrinter(std::ostream& out, std::ostream& err, PrintOptions options) noexcept
    : out_(out), err_(err), options_(options) {
}

std::size_t LogPrinter::print(LogStream& stream) {
    std::size_t errors = 0;
    selectUntilClosed(stream.logs(), stream.errors(),
        [this](std::optional<LogRecord> record) {
            if (record) {
                printLog(*record);
            }
            return true;
        },
        [this, &errors](std::optional<ErrorRecord> record) {
            if (record) {
                printError(*record);
                ++errors;
            }
            return true;
        });
    out_.flush();
    return errors;
}

void LogPrinter::printLog(const LogRecord& record) {
    if (record.isEof()) {
        out_ << "\n";
        return;
    }

    if (options_.prefix) {
        if (options_.color) {
            out_ << kGreen << "[" << record.task << " : " << record.step << "]" << kReset << " ";
        } else {
            out_ << "[" << record.task << " : " << record.step << "] ";
        }
    }
    out_ << record.log << "\n";
}

int exitStatus(std::size_t errors, bool interrupted) noexcept {
    if (interrupted) {
        return kExitInterrupted;
    }
    return errors == 0 ? 0 : 1;
}

void LogPrinter::printError(const ErrorRecord& record) {
    if (options_.color) {
        err_ << kRed << record.message << kReset;
        if (!record.step.empty()) {
            err_ << " " << kDim << "(" << record.step << ")" << kReset;
        }
        err_ << "\n";
    } else {
        err_ << record.message;
        if (!record.step.empty()) {
            err_ << " (" << record.step << ")";
        }
        err_ << "\n";
    }
    err_.flush();
}

}
