// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace printdesk::utf8 {

/// U+FFFD REPLACEMENT CHARACTER, UTF-8 encoded
constexpr const char* REPLACEMENT = "\xEF\xBF\xBD";

/**
 * @brief Check that a byte string is well-formed UTF-8
 *
 * Overlong encodings, surrogates and code points above U+10FFFF are invalid.
 */
bool is_valid(const std::string& text);

/**
 * @brief Copy text, replacing each invalid byte sequence with U+FFFD
 *
 * Valid input is returned unchanged.
 * Example: "r\xE9sum\xE9.txt" (Latin-1) -> "r�sum�.txt"
 */
std::string repair(const std::string& text);

} // namespace printdesk::utf8
