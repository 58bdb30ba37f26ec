// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "filename_sanitizer.h"

#include "time_utils.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>
#include <sstream>

namespace printdesk::filename {

namespace {

constexpr std::array<const char*, 22> WINDOWS_DEVICE_NAMES = {
    "CON",  "PRN",  "AUX",  "NUL",  "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7",
    "COM8", "COM9", "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"};

bool is_safe_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
}

bool is_windows_device(const std::string& name) {
    std::string stem = name.substr(0, name.find('.'));
    std::transform(stem.begin(), stem.end(), stem.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return std::find_if(WINDOWS_DEVICE_NAMES.begin(), WINDOWS_DEVICE_NAMES.end(),
                        [&stem](const char* dev) { return stem == dev; }) !=
           WINDOWS_DEVICE_NAMES.end();
}

} // namespace

std::string secure_filename(const std::string& name) {
    std::string ascii;
    ascii.reserve(name.size());
    for (char c : name) {
        if (static_cast<unsigned char>(c) >= 0x80) {
            continue;
        }
        ascii += (c == '/' || c == '\\') ? ' ' : c;
    }

    // Collapse whitespace runs into single underscores
    std::istringstream words(ascii);
    std::string word;
    std::string joined;
    while (words >> word) {
        if (!joined.empty()) {
            joined += '_';
        }
        joined += word;
    }

    std::string safe;
    safe.reserve(joined.size());
    std::copy_if(joined.begin(), joined.end(), std::back_inserter(safe), is_safe_char);

    auto begin = safe.find_first_not_of("._");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = safe.find_last_not_of("._");
    safe = safe.substr(begin, end - begin + 1);

    if (is_windows_device(safe)) {
        safe = "_" + safe;
    }
    return safe;
}

std::string sanitize(const std::string& original_name, std::chrono::system_clock::time_point now) {
    std::string safe = secure_filename(original_name);
    if (safe.empty()) {
        safe = "unnamed";
    }
    return time_utils::format_local_compact(now) + "_" + safe;
}

std::string extension_of(const std::string& name) {
    auto dot = name.rfind('.');
    if (dot == std::string::npos) {
        return "";
    }
    std::string ext = name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool is_allowed(const std::string& name, const std::set<std::string>& allowed_extensions) {
    if (name.find('.') == std::string::npos) {
        return false;
    }
    return allowed_extensions.count(extension_of(name)) > 0;
}

} // namespace printdesk::filename
