// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace printdesk::time_utils {

/**
 * @brief Format as "YYYY-MM-DD HH:MM:SS" in UTC
 *
 * This is the storage format of every timestamp column. It sorts
 * lexicographically in chronological order, so SQL range filters can compare
 * the text directly.
 */
std::string format_utc(std::chrono::system_clock::time_point tp);

/**
 * @brief Parse a format_utc() string
 * @return Parsed time, or std::nullopt for malformed input
 */
std::optional<std::chrono::system_clock::time_point> parse_utc(const std::string& text);

/**
 * @brief Format as "YYYYMMDD_HHMMSS" in local time (upload filename prefix)
 */
std::string format_local_compact(std::chrono::system_clock::time_point tp);

/// Shift a time point back by whole days
std::chrono::system_clock::time_point days_before(std::chrono::system_clock::time_point tp,
                                                  int days);

} // namespace printdesk::time_utils
