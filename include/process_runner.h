// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file process_runner.h
 * @brief Run an external command with a hard timeout
 *
 * Commands are started with fork/execvp (no shell, so arguments such as
 * uploaded file paths are never interpreted). stdout and stderr are captured
 * through pipes. A child that outlives its timeout gets SIGTERM, then
 * SIGKILL, and is always reaped before returning. A child whose status can
 * no longer be collected (ECHILD) is reported as launched with exit_code -1
 * and a non-empty error, never as a success.
 */

#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace printdesk {

struct ProcessResult {
    bool launched = false;  ///< Child was forked and exec succeeded
    bool not_found = false; ///< execvp failed with ENOENT
    bool timed_out = false; ///< Killed after exceeding the timeout
    int exit_code = -1;     ///< Exit status, -1 if killed or never ran
    std::string out;        ///< Captured stdout
    std::string err;        ///< Captured stderr
    std::string error;      ///< Local failure description (fork, pipe, exec, lost child)

    bool success() const {
        return launched && !timed_out && exit_code == 0;
    }
};

/// Injectable command runner (tests replace it to capture argv)
using ProcessRunner = std::function<ProcessResult(const std::vector<std::string>& argv,
                                                  std::chrono::milliseconds timeout)>;

/**
 * @brief Execute argv[0] (PATH lookup) with the given arguments
 *
 * Blocks the calling thread for at most `timeout` plus the kill grace period.
 *
 * @param argv Program and arguments; must not be empty
 * @param timeout Maximum run time
 * @return Captured output and exit information (never throws)
 */
ProcessResult run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

} // namespace printdesk
