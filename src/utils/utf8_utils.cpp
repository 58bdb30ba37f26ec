// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utf8_utils.h"

namespace printdesk::utf8 {

namespace {

/// Length of the valid sequence starting at pos, 0 if invalid
size_t sequence_length(const std::string& text, size_t pos) {
    const auto byte = [&text](size_t i) { return static_cast<unsigned char>(text[i]); };
    const unsigned char lead = byte(pos);

    if (lead < 0x80) {
        return 1;
    }

    size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) {
            lo = 0xA0; // overlong
        }
        if (lead == 0xED) {
            hi = 0x9F; // surrogates
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) {
            lo = 0x90; // overlong
        }
        if (lead == 0xF4) {
            hi = 0x8F; // above U+10FFFF
        }
    } else {
        return 0;
    }

    if (pos + len > text.size()) {
        return 0;
    }
    if (byte(pos + 1) < lo || byte(pos + 1) > hi) {
        return 0;
    }
    for (size_t i = 2; i < len; ++i) {
        if ((byte(pos + i) & 0xC0) != 0x80) {
            return 0;
        }
    }
    return len;
}

} // namespace

bool is_valid(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t len = sequence_length(text, pos);
        if (len == 0) {
            return false;
        }
        pos += len;
    }
    return true;
}

std::string repair(const std::string& text) {
    if (is_valid(text)) {
        return text;
    }

    std::string out;
    out.reserve(text.size() + 8);
    size_t pos = 0;
    while (pos < text.size()) {
        size_t len = sequence_length(text, pos);
        if (len == 0) {
            out += REPLACEMENT;
            ++pos;
        } else {
            out.append(text, pos, len);
            pos += len;
        }
    }
    return out;
}

} // namespace printdesk::utf8
