// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "periodic_task.h"

#include "spdlog/spdlog.h"

#include <exception>
#include <utility>

namespace printdesk {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval,
                           std::function<void()> work)
    : name_(std::move(name)), interval_(interval), work_(std::move(work)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (running_.load())
        return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    running_.store(true);
    thread_ = std::thread(&PeriodicTask::loop, this);
    spdlog::debug("[{}] started (interval {} ms)", name_, interval_.count());
}

void PeriodicTask::stop() {
    if (!running_.load())
        return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false);
    spdlog::debug("[{}] stopped", name_);
}

void PeriodicTask::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        try {
            work_();
        } catch (const std::exception& e) {
            spdlog::error("[{}] run failed: {}", name_, e.what());
        }
        run_count_.fetch_add(1);
        lock.lock();
    }
}

} // namespace printdesk
