// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "print_job_data.h"
#include "spooler_error.h"

#include <optional>
#include <string>
#include <vector>

namespace printdesk {

/**
 * @brief Abstract print spooler interface
 *
 * Provides the four operations the print service needs from the host
 * spooler. Concrete implementations:
 * - CupsSpoolerClient: invokes the CUPS command-line tools
 * - MockSpoolerClient (tests): scripted results, records every call
 *
 * Every call is synchronous and bounded by an implementation-defined
 * timeout. Nothing is retried.
 */
class SpoolerClient {
  public:
    virtual ~SpoolerClient() = default;

    /**
     * @brief Submit a file for printing
     *
     * @param file_path Absolute path of the file to print
     * @param copies Number of copies (1-10)
     * @param duplex true for two-sided (long edge), false for one-sided
     * @return Spooler job id in `value` on success, error text otherwise
     */
    virtual SpoolerResult submit(const std::string& file_path, int copies, bool duplex) = 0;

    /**
     * @brief List jobs still outstanding in the spooler
     *
     * Best-effort: any failure yields an empty list.
     */
    virtual std::vector<QueuedJob> list_queue() = 0;

    /**
     * @brief Cancel an outstanding job
     *
     * @param job_id Spooler job id (numeric suffix)
     * @return Confirmation in `value` on success, error text otherwise
     */
    virtual SpoolerResult cancel(const std::string& job_id) = 0;

    /**
     * @brief Probe whether the spooler is up and responsive
     */
    virtual bool is_available() = 0;

    /**
     * @brief Look up the current spooler state of one job
     *
     * @return PENDING if still queued, COMPLETED if the spooler lists it as
     *         completed, std::nullopt if unknown or the lookup failed
     */
    virtual std::optional<JobStatus> job_status(const std::string& job_id) = 0;
};

} // namespace printdesk
