// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <utility>

namespace printdesk {

/**
 * @brief Error types for spooler operations
 */
enum class SpoolerErrorKind {
    NONE,              // No error
    TIMEOUT,           // Command did not finish within its timeout
    COMMAND_NOT_FOUND, // Spooler binary missing from PATH
    REJECTED,          // Spooler ran and reported failure
    SYSTEM_ERROR       // fork/pipe/wait failure
};

/**
 * @brief Outcome of a spooler command
 *
 * On success `value` carries the payload (the job id for submit, the
 * confirmation text for cancel). On failure `message` carries the spooler's
 * own error text or a description of the local failure.
 */
struct SpoolerResult {
    SpoolerErrorKind kind = SpoolerErrorKind::NONE;
    std::string value;
    std::string message;

    bool success() const {
        return kind == SpoolerErrorKind::NONE;
    }

    std::string get_kind_string() const {
        switch (kind) {
        case SpoolerErrorKind::NONE:
            return "NONE";
        case SpoolerErrorKind::TIMEOUT:
            return "TIMEOUT";
        case SpoolerErrorKind::COMMAND_NOT_FOUND:
            return "COMMAND_NOT_FOUND";
        case SpoolerErrorKind::REJECTED:
            return "REJECTED";
        case SpoolerErrorKind::SYSTEM_ERROR:
            return "SYSTEM_ERROR";
        }
        return "UNKNOWN";
    }

    static SpoolerResult ok(std::string value) {
        SpoolerResult r;
        r.value = std::move(value);
        return r;
    }

    static SpoolerResult failure(SpoolerErrorKind kind, std::string message) {
        SpoolerResult r;
        r.kind = kind;
        r.message = std::move(message);
        return r;
    }
};

} // namespace printdesk
