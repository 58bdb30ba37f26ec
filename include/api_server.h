// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file api_server.h
 * @brief JSON HTTP front-end for PrintService (libhv)
 *
 * Routes:
 *   POST /api/upload              multipart: files (repeatable), copies, duplex
 *   GET  /api/queue
 *   GET  /api/history
 *   POST /api/cancel/{job_id}
 *   POST /api/reprint/{job_id}
 *   GET  /api/status
 *
 * Handlers only translate between HTTP and PrintService outcomes; the
 * translation helpers are exposed so they can be tested without a socket.
 */

#pragma once

#include "app_settings.h"
#include "print_service.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "hv/HttpServer.h"
#include "hv/json.hpp"

namespace printdesk {

using json = nlohmann::json;

namespace api {

/// HTTP status for a failed flow (200 for NONE)
int http_status_for(PrintErrorKind kind);

/**
 * @brief Parse the `copies` form field
 * @return Integer value, or std::nullopt if the text is not an integer
 */
std::optional<int> parse_copies(const std::string& text);

/// `duplex` is true only for "true" in any letter case
bool parse_duplex(const std::string& text);

/// True if a Content-Length header value exceeds max_bytes
bool exceeds_limit(const std::string& content_length, int64_t max_bytes);

/// "File too large. Maximum size is <N> MB"
std::string too_large_message(int max_mb);

/// Fields of an /api/upload request body
struct UploadForm {
    std::vector<UploadFile> files; ///< every `files` part, in order
    std::optional<std::string> copies;
    std::optional<std::string> duplex;
};

UploadForm parse_upload_form(const std::string& content_type, const std::string& body);

/**
 * @brief Serialize a response body
 *
 * Invalid UTF-8 in any string (spooler stderr, exception text) is replaced
 * with U+FFFD instead of throwing.
 */
std::string dump_json(const json& body);

json error_json(const std::string& error);
json to_json(const UploadOutcome& outcome);
json to_json(const QueueOutcome& outcome);
json to_json(const HistoryOutcome& outcome);
json to_json(const PrintOutcome& outcome);
json to_json(const ServiceStatus& status);
json job_to_json(const PrintJob& job);

} // namespace api

class ApiServer {
  public:
    ApiServer(PrintService& service, HttpSettings settings);
    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    /**
     * @brief Bind and start serving on the worker thread pool (non-blocking)
     * @return true if the listener started
     */
    bool start();

    /// Stop accepting requests and join the workers
    void stop();

    bool is_running() const {
        return running_;
    }

    /**
     * @name Route handlers
     *
     * Registered on the router by the constructor. Each writes a JSON body
     * and returns the HTTP status; exceptions become a 500 reply.
     * @{
     */

    /// Header-stage check: 413 when Content-Length exceeds the limit, else continue
    int handle_headers(HttpRequest* req, HttpResponse* resp);
    int handle_upload(HttpRequest* req, HttpResponse* resp);
    int handle_queue(HttpRequest* req, HttpResponse* resp);
    int handle_history(HttpRequest* req, HttpResponse* resp);
    int handle_cancel(HttpRequest* req, HttpResponse* resp);
    int handle_reprint(HttpRequest* req, HttpResponse* resp);
    int handle_status(HttpRequest* req, HttpResponse* resp);
    /** @} */

  private:
    void register_routes();
    int reject_too_large(HttpResponse* resp);

    PrintService& service_;
    HttpSettings settings_;
    int64_t max_bytes_;
    std::unique_ptr<hv::HttpService> router_;
    std::unique_ptr<hv::HttpServer> server_;
    bool running_ = false;
};

} // namespace printdesk
