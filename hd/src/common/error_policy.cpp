/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */
#include "hd/internal/error_policy.hpp"
#include "hd/transport_error.hpp"
#include "hd/log.hpp"

#include <curl/curl.h>

namespace hd::internal {

bool is_suppressed(int code, bool is_binary, const IgnoredErrors& ignored) {
    if (ignored.ignores(code)) return true;
    // The body handler aborted the transfer to skip a binary download.
    return is_binary && code == CURLE_WRITE_ERROR;
}

void classify_error(int code, const std::string& message, const Request& request,
                    bool is_binary, const IgnoredErrors& ignored) {
    if (is_suppressed(code, is_binary, ignored)) {
        hd::log_line("[CONN] suppressed error " + std::to_string(code) + " (" + message +
                     ") for " + request.uri);
        return;
    }
    throw TransportError(message, code, request);
}

} // namespace hd::internal
