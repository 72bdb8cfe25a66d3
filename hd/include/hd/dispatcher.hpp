/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */
#pragma once
#include <memory>
#include <vector>
#include "hd/settings.hpp"
#include "hd/request.hpp"
#include "hd/http_response.hpp"
#include "hd/transport_error.hpp"

namespace hd {

// Fetches HTTP requests over libcurl. A single request runs synchronously;
// several share one multi handle and a cooperative poll loop.
// Responses come back in request order. Throws hd::TransportError for the
// first failure that the settings do not suppress.
class Dispatcher {
public:
    explicit Dispatcher(Settings settings = {}, ResponseFactory factory = make_response);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    std::vector<HttpResponse> fetch(const std::vector<Request>& requests) const;
    HttpResponse fetch(const Request& request) const;

    const Settings& settings() const;

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

// One-shot helper.
std::vector<HttpResponse> fetch(const Settings& settings,
                                const ResponseFactory& factory,
                                const std::vector<Request>& requests);

} // namespace hd
