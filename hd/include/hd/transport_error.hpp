/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */

#pragma once
#include <stdexcept>
#include <string>
#include "hd/request.hpp"

namespace hd {

// Raised when a transfer fails and the failure is not suppressed.
// code() is the libcurl CURLcode of the failure.
class TransportError : public std::runtime_error {
public:
    TransportError(const std::string& message, int code, Request request)
        : std::runtime_error(message), _code(code), _request(std::move(request)) {}

    int code() const { return _code; }
    const Request& request() const { return _request; }

private:
    int _code;
    Request _request;
};

} // namespace hd
