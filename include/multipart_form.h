// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace printdesk {

/// One part of a multipart/form-data body
struct FormPart {
    std::string name;         ///< form field name
    std::string filename;     ///< empty for plain fields; invalid UTF-8 replaced by U+FFFD
    bool has_filename = false; ///< true if a filename parameter was present (even "")
    std::string content_type;
    std::string content;
};

/**
 * @brief Minimal multipart/form-data parser
 *
 * Keeps every part in order, so repeated fields (several `files` parts) all
 * survive. Malformed input yields whatever parts were complete before the
 * damage; nothing throws.
 */
class MultipartForm {
  public:
    /**
     * @brief Extract the boundary parameter from a Content-Type header value
     * @return Boundary without quotes, or std::nullopt if not multipart/form-data
     */
    static std::optional<std::string> boundary_from_content_type(const std::string& content_type);

    /**
     * @brief Split a body into parts
     */
    static std::vector<FormPart> parse(const std::string& body, const std::string& boundary);

    /// Parse using the boundary from a Content-Type header (empty on failure)
    static std::vector<FormPart> parse_request(const std::string& content_type,
                                               const std::string& body);
};

} // namespace printdesk
