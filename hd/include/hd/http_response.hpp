/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */

#pragma once
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace hd {

struct HttpResponse {
    int status_code = 0;
    std::string status_text;
    // Insertion order kept, duplicate names allowed.
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    HttpResponse& add_header(const std::string& name, const std::string& value);

    // First value for name (case-insensitive), empty if absent.
    std::string header(const std::string& name) const;
    // All values for name joined with ", ".
    std::string header_line(const std::string& name) const;
    std::size_t header_count(const std::string& name) const;
};

// Builds the response shell for a status code; the dispatcher adds headers and body.
using ResponseFactory = std::function<HttpResponse(int status_code)>;

// Default factory: status code plus the standard reason phrase.
HttpResponse make_response(int status_code);

const char* reason_phrase(int status_code);

} // namespace hd
