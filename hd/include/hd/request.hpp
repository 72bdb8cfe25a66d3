/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */

#pragma once
#include <string>
#include <utility>
#include <vector>

namespace hd {

// Outgoing request as supplied by the caller. Header names keep their
// original spelling; a name may carry several values.
struct Request {
    std::string method = "GET";
    std::string uri;
    std::vector<std::pair<std::string, std::vector<std::string>>> headers;
    std::string body;        // sent only for POST

    Request() = default;
    Request(std::string m, std::string u) : method(std::move(m)), uri(std::move(u)) {}

    // Appends a value under name (merged with an existing entry, case-insensitive).
    Request& add_header(const std::string& name, const std::string& value);

    // All values of name joined with ", "; empty if absent.
    std::string header_line(const std::string& name) const;
    bool has_header(const std::string& name) const;
};

} // namespace hd
