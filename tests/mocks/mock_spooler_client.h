// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef MOCK_SPOOLER_CLIENT_H
#define MOCK_SPOOLER_CLIENT_H

/**
 * @file mock_spooler_client.h
 * @brief Scripted spooler for PrintService tests
 *
 * Returns configured results and records every call:
 * - submit() hands out ids from next_job_id (incrementing) unless
 *   submit_result is set
 * - cancel() succeeds unless cancel_result is set
 * - statuses maps job id -> job_status() answer
 *
 * @example
 * MockSpoolerClient spooler;
 * spooler.next_job_id = 42;
 * service.upload(files, 2, true);
 * REQUIRE(spooler.submits[0].copies == 2);
 */

#include "spooler_client.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace printdesk;

class MockSpoolerClient : public SpoolerClient {
  public:
    struct SubmitCall {
        std::string file_path;
        int copies;
        bool duplex;
    };

    MockSpoolerClient() = default;
    ~MockSpoolerClient() override = default;

    MockSpoolerClient(const MockSpoolerClient&) = delete;
    MockSpoolerClient& operator=(const MockSpoolerClient&) = delete;

    SpoolerResult submit(const std::string& file_path, int copies, bool duplex) override {
        submits.push_back({file_path, copies, duplex});
        if (submit_result) {
            return *submit_result;
        }
        return SpoolerResult::ok(std::to_string(next_job_id++));
    }

    std::vector<QueuedJob> list_queue() override {
        ++list_calls;
        return queue;
    }

    SpoolerResult cancel(const std::string& job_id) override {
        cancels.push_back(job_id);
        if (cancel_result) {
            return *cancel_result;
        }
        return SpoolerResult::ok("Job " + job_id + " cancelled successfully");
    }

    bool is_available() override {
        ++availability_checks;
        return available;
    }

    std::optional<JobStatus> job_status(const std::string& job_id) override {
        status_queries.push_back(job_id);
        auto it = statuses.find(job_id);
        if (it == statuses.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // Configuration
    bool available = true;
    int next_job_id = 1;
    std::optional<SpoolerResult> submit_result;
    std::optional<SpoolerResult> cancel_result;
    std::vector<QueuedJob> queue;
    std::map<std::string, JobStatus> statuses;

    // Recorded calls
    std::vector<SubmitCall> submits;
    std::vector<std::string> cancels;
    std::vector<std::string> status_queries;
    int list_calls = 0;
    int availability_checks = 0;
};

#endif // MOCK_SPOOLER_CLIENT_H
