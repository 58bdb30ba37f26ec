// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "multipart_form.h"

#include "spdlog/spdlog.h"
#include "utf8_utils.h"

#include <algorithm>
#include <cctype>

namespace printdesk {

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

/// Split `value; k1=v1; k2="v2"` and apply fn(key_lowercase, unquoted_value)
template <typename Fn> void for_each_param(const std::string& header_value, Fn fn) {
    size_t pos = header_value.find(';');
    while (pos != std::string::npos) {
        size_t next = std::string::npos;
        // Semicolons inside quotes belong to the value
        bool quoted = false;
        for (size_t i = pos + 1; i < header_value.size(); ++i) {
            if (header_value[i] == '"') {
                quoted = !quoted;
            } else if (header_value[i] == ';' && !quoted) {
                next = i;
                break;
            }
        }
        std::string param = header_value.substr(
            pos + 1, next == std::string::npos ? std::string::npos : next - pos - 1);
        auto eq = param.find('=');
        if (eq != std::string::npos) {
            fn(to_lower(trim(param.substr(0, eq))), unquote(trim(param.substr(eq + 1))));
        }
        pos = next;
    }
}

void parse_part_headers(const std::string& block, FormPart& part) {
    size_t start = 0;
    while (start < block.size()) {
        size_t end = block.find("\r\n", start);
        std::string line = block.substr(start, end == std::string::npos ? std::string::npos
                                                                         : end - start);
        start = (end == std::string::npos) ? block.size() : end + 2;

        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = to_lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));

        if (key == "content-disposition") {
            for_each_param(value, [&part](const std::string& k, const std::string& v) {
                if (k == "name") {
                    part.name = v;
                } else if (k == "filename") {
                    // Filenames reach JSON responses and the store; keep them valid UTF-8
                    part.filename = utf8::repair(v);
                    part.has_filename = true;
                }
            });
        } else if (key == "content-type") {
            part.content_type = value;
        }
    }
}

} // namespace

std::optional<std::string> MultipartForm::boundary_from_content_type(
    const std::string& content_type) {
    auto semi = content_type.find(';');
    std::string media = to_lower(trim(content_type.substr(0, semi)));
    if (media != "multipart/form-data") {
        return std::nullopt;
    }

    std::optional<std::string> boundary;
    for_each_param(content_type, [&boundary](const std::string& k, const std::string& v) {
        if (k == "boundary" && !v.empty()) {
            boundary = v;
        }
    });
    return boundary;
}

std::vector<FormPart> MultipartForm::parse(const std::string& body, const std::string& boundary) {
    std::vector<FormPart> parts;
    if (boundary.empty()) {
        return parts;
    }

    const std::string delimiter = "--" + boundary;
    const std::string separator = "\r\n" + delimiter;

    size_t pos = body.find(delimiter);
    if (pos == std::string::npos) {
        spdlog::debug("[Multipart] No opening boundary in {} byte body", body.size());
        return parts;
    }
    pos += delimiter.size();

    while (pos < body.size()) {
        // Closing delimiter
        if (body.compare(pos, 2, "--") == 0) {
            break;
        }
        if (body.compare(pos, 2, "\r\n") != 0) {
            spdlog::debug("[Multipart] Malformed boundary line at offset {}", pos);
            break;
        }
        pos += 2;

        size_t header_end = body.find("\r\n\r\n", pos);
        if (header_end == std::string::npos) {
            break;
        }

        FormPart part;
        parse_part_headers(body.substr(pos, header_end - pos), part);

        size_t content_start = header_end + 4;
        size_t content_end = body.find(separator, content_start);
        if (content_end == std::string::npos) {
            spdlog::debug("[Multipart] Unterminated part '{}'", part.name);
            break;
        }

        part.content = body.substr(content_start, content_end - content_start);
        parts.push_back(std::move(part));
        pos = content_end + separator.size();
    }

    return parts;
}

std::vector<FormPart> MultipartForm::parse_request(const std::string& content_type,
                                                   const std::string& body) {
    auto boundary = boundary_from_content_type(content_type);
    if (!boundary) {
        return {};
    }
    return parse(body, *boundary);
}

} // namespace printdesk
