// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file print_service.h
 * @brief Job orchestration: upload, queue, history, cancel, reprint, status
 *
 * PrintService ties the filename sanitizer, content validator, spooler and
 * job store together. It holds no per-request state, so one instance serves
 * every HTTP worker thread concurrently.
 *
 * Upload pipeline per file:
 * ```
 *   extension check -> write <upload>/<sanitized> -> validate content
 *     -> measure size -> spooler submit -> store insert
 * ```
 * A file that fails after the write is deleted again. Only a spooler
 * submission followed by a successful insert makes a job visible in history.
 *
 * Every public flow reports failures through its outcome struct and never
 * throws.
 */

#pragma once

#include "app_settings.h"
#include "print_job_data.h"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace printdesk {

class JobStore;
class SpoolerClient;

/**
 * @brief Failure classes of a service flow (each maps to one HTTP status)
 */
enum class PrintErrorKind {
    NONE,          // Success
    INVALID_INPUT, // Bad request parameters (400)
    UNAVAILABLE,   // Spooler not reachable (503)
    NOT_FOUND,     // Job record or file missing (404)
    REJECTED,      // Spooler refused the operation (400)
    INTERNAL       // Unexpected failure (500)
};

/// One uploaded file as received from the client
struct UploadFile {
    std::string filename;
    std::string content;
};

/// Per-file result of an upload batch
struct FileResult {
    std::string filename;
    bool success = false;
    std::optional<std::string> job_id;
    std::string message; ///< Set on success
    std::string error;   ///< Set on failure
};

struct UploadOutcome {
    bool success = false; ///< true if any file was submitted
    PrintErrorKind kind = PrintErrorKind::NONE;
    std::string error; ///< Batch-level failure (kind != NONE)
    std::vector<FileResult> results;
};

/// Result of cancel and reprint
struct PrintOutcome {
    bool success = false;
    PrintErrorKind kind = PrintErrorKind::NONE;
    std::optional<std::string> job_id;
    std::string message;
    std::string error;

    static PrintOutcome failure(PrintErrorKind kind, std::string error);
};

/// Live spooler entry enriched with the persisted record
struct QueueEntry {
    std::string job_id;
    std::string filename = "Unknown";
    int copies = 1;
    bool duplex = false;
    JobStatus status = JobStatus::PENDING;
    std::string size;
};

struct QueueOutcome {
    bool success = false;
    PrintErrorKind kind = PrintErrorKind::NONE;
    std::string error;
    std::vector<QueueEntry> queue;
};

struct HistoryOutcome {
    bool success = false;
    PrintErrorKind kind = PrintErrorKind::NONE;
    std::string error;
    std::vector<PrintJob> history;
};

struct ServiceStatus {
    bool success = false;
    std::string error;
    bool cups_available = false;
    bool upload_folder_ok = false;
    std::string hostname;
    std::string app_name;
};

class PrintService {
  public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr int MIN_COPIES = 1;
    static constexpr int MAX_COPIES = 10;

    /**
     * @param settings Upload folder, allowed extensions, retention, identity
     * @param spooler Spooler backend (must outlive the service)
     * @param store Job store (must outlive the service)
     * @param clock Time source for filenames and records
     */
    PrintService(PrintSettings settings, SpoolerClient& spooler, JobStore& store,
                 Clock clock = std::chrono::system_clock::now);

    /**
     * @brief Validate, store and submit a batch of files
     *
     * Batch-level checks, in order: copies in [1,10], at least one file with
     * a name, spooler available. Any batch-level failure means nothing is
     * written and nothing is submitted. After that each file succeeds or
     * fails on its own.
     */
    UploadOutcome upload(const std::vector<UploadFile>& files, int copies, bool duplex);

    /**
     * @brief Outstanding spooler jobs, enriched with records from the last day
     *
     * Entries without a matching record keep the "Unknown"/1/false defaults.
     */
    QueueOutcome queue();

    /// Records within the retention window, newest first
    HistoryOutcome history();

    /// Cancel in the spooler; the record becomes cancelled only on success
    PrintOutcome cancel(const std::string& job_id);

    /**
     * @brief Submit the retained file of an earlier job again
     *
     * Creates a new record with the same file and options. The original
     * record is never modified.
     */
    PrintOutcome reprint(const std::string& job_id);

    ServiceStatus status();

    /**
     * @brief Mark pending records completed once the spooler reports them so
     * @return Number of records updated
     */
    int sync_pending();

    /**
     * @brief Create the upload folder if needed and check it is writable
     */
    static bool ensure_upload_folder(const std::string& path);

    const PrintSettings& settings() const {
        return settings_;
    }

  private:
    FileResult process_file(const UploadFile& file, int copies, bool duplex);
    std::string allowed_types_text() const;

    PrintSettings settings_;
    SpoolerClient& spooler_;
    JobStore& store_;
    Clock clock_;
};

/// Round to two decimals (history sizes)
double round_mb(double value);

} // namespace printdesk
