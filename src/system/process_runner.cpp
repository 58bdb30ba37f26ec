// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "process_runner.h"

#include "spdlog/spdlog.h"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <string>
#include <thread>
#include <unistd.h>

namespace printdesk {

namespace {

constexpr auto KILL_GRACE = std::chrono::milliseconds(500);
constexpr auto WAIT_POLL_INTERVAL = std::chrono::milliseconds(10);

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

enum class ReapState { RUNNING, REAPED, LOST };

/// Non-blocking wait; LOST means the child can no longer be waited for (ECHILD)
ReapState try_reap(pid_t pid, int& status) {
    while (true) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            return ReapState::REAPED;
        }
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            return ReapState::LOST;
        }
        return ReapState::RUNNING;
    }
}

void terminate_child(pid_t pid, int& status) {
    kill(pid, SIGTERM);
    auto grace_end = std::chrono::steady_clock::now() + KILL_GRACE;
    while (std::chrono::steady_clock::now() < grace_end) {
        if (try_reap(pid, status) != ReapState::RUNNING) {
            return;
        }
        std::this_thread::sleep_for(WAIT_POLL_INTERVAL);
    }
    kill(pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv,
                          std::chrono::milliseconds timeout) {
    ProcessResult result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    // Build argv before fork: the child may only make async-signal-safe calls
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1}; // carries errno if execvp fails
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
        result.error = std::string("pipe() failed: ") + strerror(errno);
        spdlog::error("[Process] {}", result.error);
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    spdlog::trace("[Process] exec: {} ({} args, timeout {}ms)", argv[0], argv.size() - 1,
                  timeout.count());

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork() failed: ") + strerror(errno);
        spdlog::error("[Process] {}", result.error);
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        execvp(c_argv[0], c_argv.data());

        // exec failed: report errno to the parent
        int exec_errno = errno;
        ssize_t ignored = write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    // Parent
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // Blocks only until exec succeeds (CLOEXEC closes the pipe) or fails
    int exec_errno = 0;
    ssize_t n_exec;
    do {
        n_exec = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n_exec < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n_exec == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        result.not_found = (exec_errno == ENOENT);
        result.error = std::string("exec ") + argv[0] + " failed: " + strerror(exec_errno);
        spdlog::debug("[Process] {}", result.error);
        return result;
    }

    result.launched = true;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    std::array<pollfd, 2> fds{};
    fds[0] = {out_pipe[0], POLLIN, 0};
    fds[1] = {err_pipe[0], POLLIN, 0};
    std::array<std::string*, 2> sinks = {&result.out, &result.err};
    int open_fds = 2;
    std::array<char, 4096> buffer{};

    while (open_fds > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        int rc = poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.error = std::string("poll() failed: ") + strerror(errno);
            spdlog::error("[Process] {}", result.error);
            break;
        }
        if (rc == 0) {
            continue;
        }

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }

    int status = 0;
    ReapState state = ReapState::RUNNING;
    int wait_errno = 0;
    while (!result.timed_out) {
        state = try_reap(pid, status);
        if (state != ReapState::RUNNING) {
            wait_errno = errno;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(WAIT_POLL_INTERVAL);
    }

    if (result.timed_out) {
        spdlog::warn("[Process] {} timed out after {}ms, terminating", argv[0], timeout.count());
        terminate_child(pid, status);
    }

    close_fd(fds[0].fd);
    close_fd(fds[1].fd);

    if (state == ReapState::LOST) {
        // Exit status is unknown; exit_code stays -1 so success() is false
        result.error = std::string("lost track of ") + argv[0] + " (pid " + std::to_string(pid) +
                       "): " + strerror(wait_errno);
        spdlog::error("[Process] {}", result.error);
        return result;
    }

    if (!result.timed_out && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }

    spdlog::trace("[Process] {} exited with code {}", argv[0], result.exit_code);
    return result;
}

} // namespace printdesk
