// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace printdesk {

/**
 * @brief Lifecycle state of a submitted print job
 *
 * Jobs start PENDING. Every other state is terminal: the store never moves a
 * record back to PENDING.
 */
enum class JobStatus { PENDING = 0, COMPLETED, CANCELLED, FAILED };

/**
 * @brief One persisted print job (row of the print_jobs table)
 *
 * A record may outlive its file: the retention sweeper deletes files and
 * records independently, so file_path can point at nothing.
 */
struct PrintJob {
    int64_t record_id = 0;             ///< Store-assigned primary key
    std::optional<std::string> job_id; ///< Spooler-assigned id (not unique across restarts)
    std::string stored_filename;       ///< Timestamped on-disk name
    std::string original_filename;     ///< Name as uploaded by the user
    std::string file_path;             ///< Absolute path of the retained file
    double file_size_mb = 0.0;         ///< Captured at submission
    int copies = 1;
    bool duplex = false;
    JobStatus status = JobStatus::PENDING;
    std::chrono::system_clock::time_point submitted_at{};
    std::optional<std::chrono::system_clock::time_point> completed_at;
    std::optional<std::string> error_message;
};

/**
 * @brief Job currently outstanding in the spooler queue
 *
 * Parsed from one `lpstat -o` line: `<printer>-<id> <user> <size> <date...>`.
 */
struct QueuedJob {
    std::string job_id;  ///< Numeric suffix of full_id ("42")
    std::string full_id; ///< Spooler token ("Office-42")
    std::string user;
    std::string size; ///< Size in bytes as printed by the spooler
    JobStatus status = JobStatus::PENDING;
};

/**
 * @brief Convert status to its persisted/JSON string
 */
[[nodiscard]] inline const char* to_string(JobStatus status) {
    switch (status) {
    case JobStatus::PENDING:
        return "pending";
    case JobStatus::COMPLETED:
        return "completed";
    case JobStatus::CANCELLED:
        return "cancelled";
    case JobStatus::FAILED:
        return "failed";
    }
    return "pending";
}

/**
 * @brief Parse a persisted status string
 * @return Matching status, or std::nullopt for anything unrecognized
 */
[[nodiscard]] inline std::optional<JobStatus> parse_job_status(const std::string& status) {
    if (status == "pending")
        return JobStatus::PENDING;
    if (status == "completed")
        return JobStatus::COMPLETED;
    if (status == "cancelled")
        return JobStatus::CANCELLED;
    if (status == "failed")
        return JobStatus::FAILED;
    return std::nullopt;
}

} // namespace printdesk
