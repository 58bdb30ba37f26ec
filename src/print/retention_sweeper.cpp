// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "retention_sweeper.h"

#include "job_store.h"
#include "spdlog/spdlog.h"
#include "time_utils.h"

#include <exception>
#include <filesystem>
#include <sys/stat.h>
#include <utility>

namespace fs = std::filesystem;

namespace printdesk {

RetentionSweeper::RetentionSweeper(JobStore& store, std::string upload_dir, int retention_days)
    : store_(store), upload_dir_(std::move(upload_dir)), retention_days_(retention_days) {}

RetentionSweeper::~RetentionSweeper() {
    stop();
}

int RetentionSweeper::sweep_files() {
    return sweep_files(std::chrono::system_clock::now());
}

int RetentionSweeper::sweep_files(TimePoint now) {
    std::error_code ec;
    if (!fs::is_directory(upload_dir_, ec)) {
        spdlog::debug("[Sweeper] Upload directory {} does not exist", upload_dir_);
        return 0;
    }

    const std::time_t cutoff =
        std::chrono::system_clock::to_time_t(time_utils::days_before(now, retention_days_));

    fs::directory_iterator it(upload_dir_, ec);
    if (ec) {
        spdlog::error("[Sweeper] Cannot scan {}: {}", upload_dir_, ec.message());
        return 0;
    }

    int deleted = 0;
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }

        const std::string path = entry.path().string();
        struct stat st {};
        if (stat(path.c_str(), &st) != 0) {
            spdlog::warn("[Sweeper] Cannot stat {}", path);
            continue;
        }
        if (st.st_mtime >= cutoff) {
            continue;
        }

        if (fs::remove(entry.path(), entry_ec)) {
            ++deleted;
            spdlog::debug("[Sweeper] Deleted {}", path);
        } else if (entry_ec) {
            spdlog::warn("[Sweeper] Failed to delete {}: {}", path, entry_ec.message());
        }
    }
    return deleted;
}

int RetentionSweeper::sweep_records() {
    return sweep_records(std::chrono::system_clock::now());
}

int RetentionSweeper::sweep_records(TimePoint now) {
    try {
        return store_.delete_older_than(retention_days_, now);
    } catch (const std::exception& e) {
        spdlog::error("[Sweeper] Record cleanup failed: {}", e.what());
        return 0;
    }
}

SweepReport RetentionSweeper::sweep_once() {
    return sweep_once(std::chrono::system_clock::now());
}

SweepReport RetentionSweeper::sweep_once(TimePoint now) {
    SweepReport report;
    report.files_deleted = sweep_files(now);
    report.records_deleted = sweep_records(now);
    spdlog::info("[Sweeper] Cleaned up {} old file(s) and {} old record(s)", report.files_deleted,
                 report.records_deleted);
    return report;
}

void RetentionSweeper::start(std::chrono::milliseconds interval) {
    if (is_running())
        return;
    task_ = std::make_unique<PeriodicTask>("Sweeper", interval, [this] { sweep_once(); });
    task_->start();
}

void RetentionSweeper::stop() {
    if (task_) {
        task_->stop();
        task_.reset();
    }
}

} // namespace printdesk
