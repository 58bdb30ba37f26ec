// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <set>
#include <string>

namespace printdesk::filename {

/**
 * @brief Reduce a user-supplied filename to a safe, flat ASCII name
 *
 * - Non-ASCII bytes are dropped
 * - Path separators become word breaks, whitespace runs become '_'
 * - Only [A-Za-z0-9_.-] survives
 * - Leading/trailing '.' and '_' are stripped (no "..", no hidden files)
 * - Windows device names (CON, NUL, COM1...) get a '_' prefix
 *
 * Examples: "../../etc/passwd" -> "etc_passwd", "My Report.pdf" -> "My_Report.pdf"
 *
 * @return Safe name, possibly empty
 */
std::string secure_filename(const std::string& name);

/**
 * @brief Build the on-disk name for an upload
 *
 * Prefixes the secured name with a local "YYYYMMDD_HHMMSS_" timestamp.
 * Deterministic for identical input and time. Two uploads of the same name
 * within one second map to the same stored name.
 *
 * @param original_name Name supplied by the client
 * @param now Upload time
 * @return e.g. "20251112_103000_report.pdf"
 */
std::string sanitize(const std::string& original_name, std::chrono::system_clock::time_point now);

/**
 * @brief Lower-case extension after the last '.', empty if none
 */
std::string extension_of(const std::string& name);

/**
 * @brief Check whether a filename has an extension from the allowed set
 */
bool is_allowed(const std::string& name, const std::set<std::string>& allowed_extensions);

} // namespace printdesk::filename
