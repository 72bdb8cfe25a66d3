/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hd::internal {

// Response state accumulated by the transport callbacks of one connection.
struct CaptureState {
    std::vector<std::pair<std::string, std::string>> headers;  // lower-cased names
    bool is_binary = false;                                    // never reset once set
    std::optional<std::string> body;                           // created on first chunk
};

// True when a content type names a textual payload (text, html or json).
bool is_textual_content_type(const std::string& value);

// Header-line handler. Returns len (the line is always accepted).
std::size_t capture_header_line(CaptureState& st, const char* data, std::size_t len);

// Body-chunk handler. Returns len, or 0 to abort the transfer of a binary payload.
// Text past kMaxBodyBytes is accepted and dropped.
std::size_t capture_body_chunk(CaptureState& st, const char* data, std::size_t len);

} // namespace hd::internal
