// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace printdesk {

/// Runs a unit of work on a dedicated thread at a fixed interval.
///
/// The first run happens one interval after start(). stop() wakes the
/// thread immediately and joins it; a run already in progress finishes first.
/// Exceptions thrown by the work are logged and do not end the loop.
class PeriodicTask {
  public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> work);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /// Start the worker thread (no-op if already running)
    void start();

    /// Stop the worker thread (blocks until joined)
    void stop();

    bool is_running() const {
        return running_.load();
    }

    /// Number of completed runs, including failed ones
    unsigned run_count() const {
        return run_count_.load();
    }

  private:
    void loop();

    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> work_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
    std::atomic<unsigned> run_count_{0};
};

} // namespace printdesk
