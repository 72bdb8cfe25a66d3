/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */
#include "hd/internal/connection.hpp"
#include "hd/internal/error_policy.hpp"
#include "hd/internal/utils.hpp"
#include "hd/transport_error.hpp"
#include "hd/log.hpp"

#include <algorithm>

namespace hd::internal {

namespace {

// Transport callbacks: plain function values forwarding into the capture
// state handed over as userdata.
const curl_write_callback kHeaderHandler = [](char* p, std::size_t size, std::size_t n, void* ud) -> std::size_t {
    return capture_header_line(*static_cast<CaptureState*>(ud), p, size * n);
};

const curl_write_callback kBodyHandler = [](char* p, std::size_t size, std::size_t n, void* ud) -> std::size_t {
    return capture_body_chunk(*static_cast<CaptureState*>(ud), p, size * n);
};

void log_setopt_failure(const Request& req, CURLoption opt, CURLcode rc) {
    hd::log_line("[CONN] option " + std::to_string(static_cast<int>(opt)) + " rejected for " +
                 req.uri + ": " + curl_easy_strerror(rc));
}

} // namespace

Connection::Connection(const Request& request, const Settings& settings)
    : _request(request),
      _settings(settings),
      _config(build_connection_config(request, settings)),
      _curl(curl_easy_init())
{
    if (!_curl) {
        throw TransportError("curl_easy_init failed", CURLE_FAILED_INIT, _request);
    }
    CURL* h = _curl.get();

    CURLcode rc = curl_easy_setopt(h, CURLOPT_URL, _request.uri.c_str());
    if (rc != CURLE_OK) {
        log_setopt_failure(_request, CURLOPT_URL, rc);
    }

    for (const auto& kv : _config) {
        rc = apply_option(h, kv.first, kv.second, _lists);
        if (rc != CURLE_OK) {
            log_setopt_failure(_request, kv.first, rc);
        }
    }

    // Capture hooks are part of the connection, not of the overridable options.
    const bool hooked =
        curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, kHeaderHandler) == CURLE_OK &&
        curl_easy_setopt(h, CURLOPT_HEADERDATA, &_capture) == CURLE_OK &&
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, kBodyHandler) == CURLE_OK &&
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &_capture) == CURLE_OK &&
        curl_easy_setopt(h, CURLOPT_ERRORBUFFER, _errbuf) == CURLE_OK;
    if (!hooked) {
        throw TransportError("cannot install transfer callbacks", CURLE_FAILED_INIT, _request);
    }

    rc = curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    if (rc != CURLE_OK) {
        log_setopt_failure(_request, CURLOPT_NOSIGNAL, rc);
    }
}

void Connection::perform() {
    _errbuf[0] = '\0';
    _result = curl_easy_perform(_curl.get());
}

void Connection::fail(int code, std::string message) {
    _last_error = code;
    _last_error_msg = std::move(message);
}

std::string Connection::error_message(CURLcode rc) const {
    if (_errbuf[0] != '\0') return std::string(_errbuf);
    return curl_easy_strerror(rc);
}

HttpResponse Connection::finish(const ResponseFactory& factory) {
    // Closed when this scope exits, on the error path as well.
    EasyPtr curl = std::move(_curl);

    long status = 0;
    char* effective = nullptr;
    double total_sec = 0.0;
    if (curl) {
        if (curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status) != CURLE_OK) status = 0;
        if (curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective) != CURLE_OK) effective = nullptr;
        if (curl_easy_getinfo(curl.get(), CURLINFO_TOTAL_TIME, &total_sec) != CURLE_OK) total_sec = 0.0;
    }
    const std::string url = effective ? effective : _request.uri;

    if (_result && *_result != CURLE_OK) {
        classify_error(*_result, error_message(*_result), _request,
                       _capture.is_binary, _settings.ignored_errors);
    } else if (_last_error && *_last_error != 0) {
        classify_error(*_last_error, _last_error_msg, _request,
                       _capture.is_binary, _settings.ignored_errors);
    }

    HttpResponse resp = factory(static_cast<int>(status));
    for (const auto& h : _capture.headers) {
        resp.add_header(h.first, h.second);
    }
    resp.add_header("Content-Location", url);
    resp.add_header("X-Request-Time", format_elapsed_ms(total_sec));

    if (_capture.body && !_capture.body->empty()) {
        const std::string& body = *_capture.body;
        resp.body.assign(body, 0, std::min(body.size(), kMaxBodyBytes));
    }

    hd::log_line("[CONN] " + upper_copy(_request.method) + " " + _request.uri + " -> " +
                 std::to_string(status) + " (" + format_elapsed_ms(total_sec) + ", " +
                 std::to_string(resp.body.size()) + " bytes" +
                 (_capture.is_binary ? ", binary skipped)" : ")"));
    return resp;
}

} // namespace hd::internal
