// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "content_validator.h"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <cctype>
#include <magic.h>

namespace printdesk {

std::optional<std::string> ContentValidator::expected_media_type(const std::string& extension) {
    std::string ext = extension;
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == "pdf")
        return std::string("application/pdf");
    if (ext == "txt")
        return std::string("text/plain");
    if (ext == "jpg" || ext == "jpeg")
        return std::string("image/jpeg");
    if (ext == "png")
        return std::string("image/png");
    return std::nullopt;
}

std::string ContentValidator::sniff_media_type(const std::string& file_path) {
    const magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!magic) {
        spdlog::error("[Validator] magic_open failed");
        return {};
    }
    if (magic_load(magic, nullptr) != 0) {
        spdlog::error("[Validator] magic_load failed: {}", magic_error(magic));
        magic_close(magic);
        return {};
    }
    const char* mime = magic_file(magic, file_path.c_str());
    std::string result = mime ? mime : "";
    if (!mime) {
        const char* err = magic_error(magic);
        spdlog::debug("[Validator] magic_file failed for {}: {}", file_path, err ? err : "unknown");
    }
    magic_close(magic);
    return result;
}

bool ContentValidator::validate(const std::string& file_path, const std::string& extension) {
    auto expected = expected_media_type(extension);
    if (!expected) {
        spdlog::debug("[Validator] No media type known for extension '{}'", extension);
        return false;
    }

    std::string actual = sniff_media_type(file_path);
    if (actual != *expected) {
        spdlog::info("[Validator] {} claims {} but contains {}", file_path, *expected,
                     actual.empty() ? "<unknown>" : actual);
        return false;
    }
    return true;
}

} // namespace printdesk
