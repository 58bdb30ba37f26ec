// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "process_runner.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <csignal>

using namespace printdesk;
using namespace std::chrono_literals;

TEST_CASE("ProcessRunner: captures stdout and exit code", "[process]") {
    auto r = run_process({"sh", "-c", "printf 'request id is Office-7'; exit 0"}, 2000ms);
    REQUIRE(r.launched);
    CHECK(r.exit_code == 0);
    CHECK(r.out == "request id is Office-7");
    CHECK(r.success());
}

TEST_CASE("ProcessRunner: captures stderr and non-zero exit", "[process]") {
    auto r = run_process({"sh", "-c", "echo nope >&2; exit 3"}, 2000ms);
    REQUIRE(r.launched);
    CHECK(r.exit_code == 3);
    CHECK(r.err == "nope\n");
    CHECK_FALSE(r.success());
}

TEST_CASE("ProcessRunner: arguments are not interpreted by a shell", "[process]") {
    auto r = run_process({"echo", "$(id); rm -rf /"}, 2000ms);
    REQUIRE(r.success());
    CHECK(r.out == "$(id); rm -rf /\n");
}

TEST_CASE("ProcessRunner: missing binary is reported as not found", "[process]") {
    auto r = run_process({"printdesk-no-such-command-xyz"}, 2000ms);
    CHECK_FALSE(r.launched);
    CHECK(r.not_found);
    CHECK_FALSE(r.error.empty());
}

TEST_CASE("ProcessRunner: slow command is killed at the timeout", "[process][slow]") {
    auto start = std::chrono::steady_clock::now();
    auto r = run_process({"sleep", "10"}, 200ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(r.launched);
    CHECK(r.timed_out);
    CHECK_FALSE(r.success());
    CHECK(elapsed < 3s);
}

TEST_CASE("ProcessRunner: empty argv fails without forking", "[process]") {
    auto r = run_process({}, 100ms);
    CHECK_FALSE(r.launched);
    CHECK(r.error == "empty command");
}

namespace {

/// Ignoring SIGCHLD makes the kernel reap children, so waitpid() reports ECHILD
struct IgnoreSigchld {
    struct sigaction saved {};
    IgnoreSigchld() {
        struct sigaction sa {};
        sa.sa_handler = SIG_IGN;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGCHLD, &sa, &saved);
    }
    ~IgnoreSigchld() {
        sigaction(SIGCHLD, &saved, nullptr);
    }
};

} // namespace

TEST_CASE("ProcessRunner: unreapable child is not reported as success", "[process]") {
    IgnoreSigchld guard;
    auto r = run_process({"sh", "-c", "exit 0"}, 2000ms);

    CHECK(r.launched);
    CHECK_FALSE(r.timed_out);
    CHECK(r.exit_code == -1);
    CHECK_FALSE(r.success());
    CHECK_FALSE(r.error.empty());
}
