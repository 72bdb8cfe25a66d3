/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */
#pragma once
#include <curl/curl.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "hd/http_response.hpp"
#include "hd/request.hpp"
#include "hd/settings.hpp"
#include "hd/internal/capture.hpp"
#include "hd/internal/connection_config.hpp"

namespace hd::internal {

struct EasyDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
using EasyPtr = std::unique_ptr<CURL, EasyDeleter>;

// One transfer attempt: owns the easy handle, its resolved options and the
// state captured by the header/body callbacks. Not copyable or movable, the
// transport holds pointers into it.
class Connection {
public:
    Connection(const Request& request, const Settings& settings);
    ~Connection() = default;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    CURL* handle() const { return _curl.get(); }
    bool is_open() const { return static_cast<bool>(_curl); }

    const Request& request() const { return _request; }
    const ConnectionConfig& config() const { return _config; }
    const CaptureState& capture() const { return _capture; }
    bool is_binary() const { return _capture.is_binary; }

    // Runs the transfer on the calling thread and records its result.
    void perform();

    // Completion result reported by the multiplexer.
    void set_result(CURLcode rc) { _result = rc; }
    std::optional<CURLcode> result() const { return _result; }

    // Live error state, for failures that never reached a completion event.
    void fail(int code, std::string message);
    std::optional<int> last_error() const { return _last_error; }

    // Classifies any failure, then assembles the response. The handle is
    // released before returning or throwing.
    HttpResponse finish(const ResponseFactory& factory);

private:
    std::string error_message(CURLcode rc) const;

    const Request& _request;
    const Settings& _settings;
    const ConnectionConfig _config;

    CaptureState _capture;
    std::vector<SlistPtr> _lists;
    EasyPtr _curl;
    char _errbuf[CURL_ERROR_SIZE] = {0};

    std::optional<CURLcode> _result;
    std::optional<int> _last_error;
    std::string _last_error_msg;
};

} // namespace hd::internal
