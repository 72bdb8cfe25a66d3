/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */
#include "hd/http_response.hpp"
#include "hd/internal/utils.hpp"

namespace hd {

HttpResponse& HttpResponse::add_header(const std::string& name, const std::string& value) {
    headers.emplace_back(name, value);
    return *this;
}

std::string HttpResponse::header(const std::string& name) const {
    for (const auto& kv : headers) {
        if (internal::iequals(kv.first, name)) return kv.second;
    }
    return {};
}

std::string HttpResponse::header_line(const std::string& name) const {
    std::string out;
    for (const auto& kv : headers) {
        if (!internal::iequals(kv.first, name)) continue;
        if (!out.empty()) out += ", ";
        out += kv.second;
    }
    return out;
}

std::size_t HttpResponse::header_count(const std::string& name) const {
    std::size_t n = 0;
    for (const auto& kv : headers) {
        if (internal::iequals(kv.first, name)) ++n;
    }
    return n;
}

const char* reason_phrase(int sc) {
    switch (sc) {
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 410: return "Gone";
        case 413: return "Payload Too Large";
        case 415: return "Unsupported Media Type";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "";
    }
}

HttpResponse make_response(int status_code) {
    HttpResponse r;
    r.status_code = status_code;
    r.status_text = reason_phrase(status_code);
    return r;
}

} // namespace hd
