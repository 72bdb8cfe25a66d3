/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */
#include "hd/dispatcher.hpp"
#include "hd/log.hpp"

#include "hd/internal/connection.hpp"
#include "hd/internal/multiplexer.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace {

// Process-wide libcurl initialization, done once before the first handle.
struct CurlGlobal {
    CurlGlobal() {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            hd::log_line(std::string("[DISPATCH] curl_global_init failed: ") + curl_easy_strerror(rc));
            throw std::runtime_error("curl_global_init failed");
        }
    }
    ~CurlGlobal() { curl_global_cleanup(); }
};

void ensure_curl_global() {
    static const CurlGlobal g;
    (void)g;
}

// Peer verification is off when the default is kept and it is insecure, or when
// an override sets it to 0. Removing the option falls back to libcurl's default (on).
bool peer_verification_off(const hd::OptionMap& overrides) {
    auto it = overrides.find(CURLOPT_SSL_VERIFYPEER);
    if (it == overrides.end()) return !hd::kDefaultTlsVerify;
    const long* v = std::get_if<long>(&it->second);
    return v && *v == 0;
}

} // namespace

namespace hd {

struct Dispatcher::Impl {
    Settings settings;
    ResponseFactory factory;

    Impl(Settings s, ResponseFactory f) : settings(std::move(s)), factory(std::move(f)) {
        ensure_curl_global();
        if (!settings.log_file.empty()) {
            hd::set_log_file(settings.log_file);
        }
        hd::set_log_echo(settings.log_echo);
        if (!factory) {
            factory = make_response;
        }
    }

    std::vector<HttpResponse> run(const std::vector<Request>& requests) const {
        std::vector<HttpResponse> out;
        if (requests.empty()) return out;

        if (peer_verification_off(settings.options)) {
            hd::log_line("[DISPATCH] TLS peer verification is disabled for this batch");
        }
        hd::log_line("[DISPATCH] fetching " + std::to_string(requests.size()) + " request(s)");

        std::vector<std::unique_ptr<internal::Connection>> conns;
        conns.reserve(requests.size());
        for (const auto& r : requests) {
            conns.push_back(std::make_unique<internal::Connection>(r, settings));
        }

        internal::drive(conns);

        // Submission order, whatever the completion order was.
        out.reserve(conns.size());
        for (auto& c : conns) {
            out.push_back(c->finish(factory));
        }
        return out;
    }
};

Dispatcher::Dispatcher(Settings settings, ResponseFactory factory)
    : _p(std::make_unique<Dispatcher::Impl>(std::move(settings), std::move(factory))) {}

Dispatcher::~Dispatcher() = default;

std::vector<HttpResponse> Dispatcher::fetch(const std::vector<Request>& requests) const {
    return _p->run(requests);
}

HttpResponse Dispatcher::fetch(const Request& request) const {
    std::vector<HttpResponse> out = _p->run(std::vector<Request>{request});
    return std::move(out.front());
}

const Settings& Dispatcher::settings() const {
    return _p->settings;
}

std::vector<HttpResponse> fetch(const Settings& settings,
                                const ResponseFactory& factory,
                                const std::vector<Request>& requests) {
    return Dispatcher(settings, factory).fetch(requests);
}

} // namespace hd
