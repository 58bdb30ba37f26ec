// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cups_spooler_client.h"

#include "spdlog/spdlog.h"

#include <cctype>
#include <regex>
#include <sstream>
#include <utility>

namespace printdesk {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // namespace

CupsSpoolerClient::CupsSpoolerClient(ProcessRunner runner) : runner_(std::move(runner)) {}

// ============================================================================
// Output Parsing
// ============================================================================

std::vector<std::string> CupsSpoolerClient::build_submit_command(const std::string& file_path,
                                                                 int copies, bool duplex) {
    std::vector<std::string> cmd = {"lp"};
    if (copies > 1) {
        cmd.push_back("-n");
        cmd.push_back(std::to_string(copies));
    }
    cmd.push_back("-o");
    cmd.push_back(duplex ? "sides=two-sided-long-edge" : "sides=one-sided");
    cmd.push_back(file_path);
    return cmd;
}

std::optional<std::string> CupsSpoolerClient::parse_request_id(const std::string& lp_output) {
    static const std::regex request_re(R"(request id is \S+-(\d+))");
    std::smatch match;
    if (std::regex_search(lp_output, match, request_re)) {
        return match[1].str();
    }
    return std::nullopt;
}

std::vector<QueuedJob> CupsSpoolerClient::parse_queue_listing(const std::string& lpstat_output) {
    static const std::regex suffix_re(R"(-(\d+)$)");

    std::vector<QueuedJob> jobs;
    std::istringstream lines(lpstat_output);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream fields(line);
        std::vector<std::string> parts;
        std::string field;
        while (fields >> field) {
            parts.push_back(field);
        }
        if (parts.size() < 5) {
            continue;
        }

        QueuedJob job;
        job.full_id = parts[0];
        std::smatch match;
        job.job_id = std::regex_search(parts[0], match, suffix_re) ? match[1].str() : parts[0];
        job.user = parts[1];
        job.size = parts[2];
        job.status = JobStatus::PENDING;
        jobs.push_back(std::move(job));
    }
    return jobs;
}

bool CupsSpoolerClient::listing_mentions_job(const std::string& listing,
                                             const std::string& job_id) {
    if (job_id.empty()) {
        return false;
    }
    const std::string needle = "-" + job_id;
    size_t pos = listing.find(needle);
    while (pos != std::string::npos) {
        size_t after = pos + needle.size();
        if (after == listing.size() || std::isspace(static_cast<unsigned char>(listing[after]))) {
            return true;
        }
        pos = listing.find(needle, pos + 1);
    }
    return false;
}

// ============================================================================
// Spooler Operations
// ============================================================================

SpoolerResult CupsSpoolerClient::submit(const std::string& file_path, int copies, bool duplex) {
    auto cmd = build_submit_command(file_path, copies, duplex);
    spdlog::debug("[Spooler] Submitting {} (copies={}, duplex={})", file_path, copies, duplex);

    ProcessResult proc = runner_(cmd, SUBMIT_TIMEOUT);

    if (proc.timed_out) {
        spdlog::warn("[Spooler] lp timed out for {}", file_path);
        return SpoolerResult::failure(SpoolerErrorKind::TIMEOUT, "Print command timed out");
    }
    if (proc.not_found) {
        spdlog::error("[Spooler] lp not found in PATH");
        return SpoolerResult::failure(SpoolerErrorKind::COMMAND_NOT_FOUND,
                                      "CUPS lp command not found. Is CUPS installed?");
    }
    if (!proc.launched) {
        return SpoolerResult::failure(SpoolerErrorKind::SYSTEM_ERROR,
                                      "Error submitting print job: " + proc.error);
    }

    if (proc.exit_code != 0) {
        std::string err = trim(proc.err);
        spdlog::warn("[Spooler] lp rejected {} (exit {}): {}", file_path, proc.exit_code, err);
        return SpoolerResult::failure(SpoolerErrorKind::REJECTED,
                                      err.empty() ? "Unknown error submitting print job" : err);
    }

    auto job_id = parse_request_id(proc.out);
    if (job_id) {
        spdlog::info("[Spooler] Submitted {} as job {}", file_path, *job_id);
        return SpoolerResult::ok(*job_id);
    }

    std::string raw = trim(proc.out);
    spdlog::warn("[Spooler] No request id in lp output, using raw output '{}'", raw);
    return SpoolerResult::ok(raw);
}

std::vector<QueuedJob> CupsSpoolerClient::list_queue() {
    ProcessResult proc = runner_({"lpstat", "-o"}, QUERY_TIMEOUT);
    if (!proc.success()) {
        spdlog::debug("[Spooler] lpstat -o failed (timed_out={}, exit={}): {}", proc.timed_out,
                      proc.exit_code, proc.error.empty() ? trim(proc.err) : proc.error);
        return {};
    }
    return parse_queue_listing(proc.out);
}

SpoolerResult CupsSpoolerClient::cancel(const std::string& job_id) {
    ProcessResult proc = runner_({"cancel", job_id}, QUERY_TIMEOUT);

    if (proc.timed_out) {
        return SpoolerResult::failure(SpoolerErrorKind::TIMEOUT, "Cancel command timed out");
    }
    if (proc.not_found) {
        return SpoolerResult::failure(SpoolerErrorKind::COMMAND_NOT_FOUND,
                                      "CUPS cancel command not found");
    }
    if (!proc.launched) {
        return SpoolerResult::failure(SpoolerErrorKind::SYSTEM_ERROR,
                                      "Error cancelling job: " + proc.error);
    }
    if (proc.exit_code != 0) {
        std::string err = trim(proc.err);
        spdlog::warn("[Spooler] cancel {} rejected: {}", job_id, err);
        return SpoolerResult::failure(SpoolerErrorKind::REJECTED,
                                      err.empty() ? "Failed to cancel job" : err);
    }

    spdlog::info("[Spooler] Cancelled job {}", job_id);
    return SpoolerResult::ok("Job " + job_id + " cancelled successfully");
}

bool CupsSpoolerClient::is_available() {
    ProcessResult proc = runner_({"lpstat", "-r"}, QUERY_TIMEOUT);
    bool available = proc.success();
    spdlog::trace("[Spooler] lpstat -r: available={}", available);
    return available;
}

std::optional<JobStatus> CupsSpoolerClient::job_status(const std::string& job_id) {
    for (const auto& job : list_queue()) {
        if (job.job_id == job_id) {
            return JobStatus::PENDING;
        }
    }

    ProcessResult proc = runner_({"lpstat", "-W", "completed", "-o"}, QUERY_TIMEOUT);
    if (proc.success() && listing_mentions_job(proc.out, job_id)) {
        return JobStatus::COMPLETED;
    }
    return std::nullopt;
}

} // namespace printdesk
