// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file job_store.h
 * @brief Durable SQLite record of every submitted print job
 *
 * One table, `print_jobs`, indexed on job_id and submitted_at. Timestamps are
 * stored as UTC "YYYY-MM-DD HH:MM:SS" text so range filters compare strings.
 *
 * Everything is whole-second: submitted_at is truncated on insert and the
 * `now - days` cutoff of recent_jobs() and delete_older_than() is truncated
 * the same way before comparing. A record submitted in the same second as
 * the cutoff therefore counts as "at the cutoff" even when it is a fraction
 * of a second older.
 *
 * Thread safety: a single connection serialized by an internal mutex. Every
 * public operation is atomic on its own; none spans multiple calls.
 */

#pragma once

#include "print_job_data.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct sqlite3;

namespace printdesk {

/**
 * @brief Raised for any SQLite failure (message carries sqlite3_errmsg)
 */
class JobStoreError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class JobStore {
  public:
    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * @brief Open (or create) the database and ensure the schema exists
     *
     * @param db_path SQLite file path, or ":memory:"
     * @throws JobStoreError if the database cannot be opened or initialized
     */
    explicit JobStore(const std::string& db_path);
    ~JobStore();

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    /**
     * @brief Persist a new job
     *
     * record_id and completed_at of the argument are ignored. A default
     * (epoch) submitted_at is replaced with the current time.
     *
     * @return Assigned record id
     */
    int64_t insert(const PrintJob& job);

    /**
     * @brief Move pending records with this job id to a terminal status
     *
     * COMPLETED stamps completed_at and leaves error_message alone. Any other
     * status writes status and error_message together (a missing message
     * stores NULL). Records that already left PENDING are not touched.
     *
     * @return Number of records updated
     * @throws std::invalid_argument if status is PENDING
     */
    int update_status(const std::string& job_id, JobStatus status,
                      const std::optional<std::string>& error_message = std::nullopt);
    int update_status(const std::string& job_id, JobStatus status,
                      const std::optional<std::string>& error_message, TimePoint now);

    /**
     * @brief Jobs submitted strictly after now - days, newest first
     */
    std::vector<PrintJob> recent_jobs(int days) const;
    std::vector<PrintJob> recent_jobs(int days, TimePoint now) const;

    /**
     * @brief Look up a job by spooler id
     *
     * Spooler ids repeat across spooler restarts. The most recently submitted
     * record wins; equal submission times fall back to the highest record id.
     */
    std::optional<PrintJob> job_by_id(const std::string& job_id) const;

    std::optional<PrintJob> job_by_record_id(int64_t record_id) const;

    /// Records still PENDING, oldest first
    std::vector<PrintJob> pending_jobs() const;

    /**
     * @brief Delete records submitted strictly before now - days
     *
     * A record exactly at the cutoff survives (and is also outside
     * recent_jobs(days), which is strict in the other direction). The
     * cutoff is compared at whole-second granularity.
     *
     * @return Number of records deleted
     */
    int delete_older_than(int days);
    int delete_older_than(int days, TimePoint now);

    const std::string& path() const {
        return path_;
    }

  private:
    void init_schema();

    std::string path_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

} // namespace printdesk
