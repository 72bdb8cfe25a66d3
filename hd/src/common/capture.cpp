/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */
#include "hd/internal/capture.hpp"
#include "hd/internal/utils.hpp"
#include "hd/settings.hpp"

#include <algorithm>
#include <cctype>

namespace hd::internal {

namespace {

inline bool is_token_char(char c) {
    const auto u = (unsigned char)c;
    return std::isalnum(u) || c == '_' || c == '-';
}

// Length of the header name if the line starts with "token:", else 0.
std::size_t header_name_len(const char* data, std::size_t len) {
    std::size_t i = 0;
    while (i < len && is_token_char(data[i])) ++i;
    if (i == 0 || i >= len || data[i] != ':') return 0;
    return i;
}

inline bool is_status_line(const char* data, std::size_t len) {
    return len >= 5 && data[0] == 'H' && data[1] == 'T' && data[2] == 'T' &&
           data[3] == 'P' && data[4] == '/';
}

} // namespace

bool is_textual_content_type(const std::string& value) {
    return icontains(value, "text") || icontains(value, "html") || icontains(value, "json");
}

std::size_t capture_header_line(CaptureState& st, const char* data, std::size_t len) {
    const std::size_t name_len = header_name_len(data, len);
    if (name_len > 0) {
        std::string name = lower_copy(std::string(data, name_len));
        std::string value = trim_copy(data + name_len + 1, len - name_len - 1);

        if (name == "content-type" && !is_textual_content_type(value)) {
            st.is_binary = true;
        }
        st.headers.emplace_back(std::move(name), std::move(value));
        return len;
    }

    if (st.headers.empty() || is_status_line(data, len)) {
        return len;
    }

    // Folded continuation of the previous header; the blank line that ends a
    // header block carries nothing to fold.
    const std::string rest = trim_copy(data, len);
    if (!rest.empty()) {
        std::string& last = st.headers.back().second;
        last += ' ';
        last += rest;
    }
    return len;
}

std::size_t capture_body_chunk(CaptureState& st, const char* data, std::size_t len) {
    if (st.is_binary) {
        return 0;
    }
    if (!st.body) {
        st.body.emplace();
    }
    // Bytes past the cap are consumed but not kept.
    if (st.body->size() < kMaxBodyBytes) {
        st.body->append(data, std::min(len, kMaxBodyBytes - st.body->size()));
    }
    return len;
}

} // namespace hd::internal
