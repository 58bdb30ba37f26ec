// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <optional>
#include <string>

namespace printdesk {

/**
 * @brief Checks that an uploaded file's bytes match its claimed extension
 *
 * The actual media type is sniffed with libmagic (MAGIC_MIME_TYPE) and
 * compared against a fixed table:
 *
 *   pdf        -> application/pdf
 *   txt        -> text/plain
 *   jpg, jpeg  -> image/jpeg
 *   png        -> image/png
 *
 * Fail-closed: unknown extensions and any libmagic failure count as a mismatch.
 */
class ContentValidator {
  public:
    /**
     * @brief Expected media type for an extension
     *
     * @param extension Extension with or without leading dot, any case
     * @return Media type, or std::nullopt if the extension is not printable
     */
    static std::optional<std::string> expected_media_type(const std::string& extension);

    /**
     * @brief Sniff the media type of a file's contents
     * @return Media type string, empty on any failure
     */
    static std::string sniff_media_type(const std::string& file_path);

    /**
     * @brief Validate file content against the claimed extension
     * @return true only if the sniffed type equals the expected type
     */
    static bool validate(const std::string& file_path, const std::string& extension);
};

} // namespace printdesk
