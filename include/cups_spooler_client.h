// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "process_runner.h"
#include "spooler_client.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace printdesk {

/**
 * @brief CUPS spooler backend using the lp/lpstat/cancel command-line tools
 *
 * Architecture:
 * - All commands run via fork/execvp through a ProcessRunner (no shell)
 * - submit is bounded by SUBMIT_TIMEOUT, everything else by QUERY_TIMEOUT
 * - Output parsing lives in static helpers so it can be tested without CUPS
 *
 * Commands:
 *   submit       lp [-n <copies>] -o sides=<mode> <file>
 *   list_queue   lpstat -o
 *   cancel       cancel <job_id>
 *   is_available lpstat -r
 *   job_status   lpstat -o, then lpstat -W completed -o
 */
class CupsSpoolerClient : public SpoolerClient {
  public:
    static constexpr std::chrono::milliseconds SUBMIT_TIMEOUT{10000};
    static constexpr std::chrono::milliseconds QUERY_TIMEOUT{5000};

    explicit CupsSpoolerClient(ProcessRunner runner = run_process);
    ~CupsSpoolerClient() override = default;

    SpoolerResult submit(const std::string& file_path, int copies, bool duplex) override;
    std::vector<QueuedJob> list_queue() override;
    SpoolerResult cancel(const std::string& job_id) override;
    bool is_available() override;
    std::optional<JobStatus> job_status(const std::string& job_id) override;

    /**
     * @brief Build the lp argv for a submission
     *
     * The sides option is always present so the printer's own default never
     * applies.
     */
    static std::vector<std::string> build_submit_command(const std::string& file_path, int copies,
                                                         bool duplex);

    /**
     * @brief Extract the job id from lp's confirmation
     *
     * "request id is Office-42 (1 file(s))" -> "42"
     *
     * @return Numeric id, or std::nullopt if the pattern is absent
     */
    static std::optional<std::string> parse_request_id(const std::string& lp_output);

    /**
     * @brief Parse `lpstat -o` output
     *
     * Lines with fewer than 5 whitespace-separated fields are skipped.
     */
    static std::vector<QueuedJob> parse_queue_listing(const std::string& lpstat_output);

    /**
     * @brief Check whether a listing contains `-<job_id>` as a whole token suffix
     */
    static bool listing_mentions_job(const std::string& listing, const std::string& job_id);

  private:
    ProcessRunner runner_;
};

} // namespace printdesk
