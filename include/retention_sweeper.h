// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file retention_sweeper.h
 * @brief Deletes uploaded files and job records past the retention window
 *
 * Files and records are swept independently: a file is judged by its mtime,
 * a record by its submitted_at. A record can therefore outlive its file (and
 * reprint reports "File no longer available").
 */

#pragma once

#include "periodic_task.h"

#include <chrono>
#include <memory>
#include <string>

namespace printdesk {

class JobStore;

struct SweepReport {
    int files_deleted = 0;
    int records_deleted = 0;
};

class RetentionSweeper {
  public:
    using TimePoint = std::chrono::system_clock::time_point;

    RetentionSweeper(JobStore& store, std::string upload_dir, int retention_days);
    ~RetentionSweeper();

    RetentionSweeper(const RetentionSweeper&) = delete;
    RetentionSweeper& operator=(const RetentionSweeper&) = delete;

    /**
     * @brief Delete regular files in the upload directory older than the window
     *
     * A file that cannot be inspected or removed is logged and skipped. A
     * missing directory counts as nothing to do.
     *
     * @return Number of files deleted
     */
    int sweep_files();
    int sweep_files(TimePoint now);

    /**
     * @brief Delete job records older than the window
     * @return Number of records deleted (0 if the store failed)
     */
    int sweep_records();
    int sweep_records(TimePoint now);

    /// Run both sweeps once, synchronously
    SweepReport sweep_once();
    SweepReport sweep_once(TimePoint now);

    /// Begin sweeping on a background thread every `interval`
    void start(std::chrono::milliseconds interval);

    /// Stop the background thread (no-op if not started)
    void stop();

    bool is_running() const {
        return task_ && task_->is_running();
    }

  private:
    JobStore& store_;
    std::string upload_dir_;
    int retention_days_;
    std::unique_ptr<PeriodicTask> task_;
};

} // namespace printdesk
