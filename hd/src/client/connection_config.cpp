/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */
#include "hd/internal/connection_config.hpp"
#include "hd/internal/ca_bundle.hpp"
#include "hd/internal/utils.hpp"

#include <cstdlib>
#include <variant>

namespace hd::internal {

std::vector<std::string> request_header_lines(const Request& req) {
    std::vector<std::string> lines;
    lines.reserve(req.headers.size());
    for (const auto& kv : req.headers) {
        if (lower_copy(kv.first) == "user-agent") continue;
        std::string line = kv.first + ":";
        bool first = true;
        for (const auto& v : kv.second) {
            line += first ? " " : ", ";
            line += v;
            first = false;
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

std::string default_cookie_path() {
    const char* tmp = std::getenv("TMPDIR");
    std::string dir = (tmp && *tmp) ? tmp : "/tmp";
    if (dir.back() != '/') dir += '/';
    return dir + "hd-cookies.txt";
}

ConnectionConfig default_options(const Request& req, const Settings& settings) {
    ConnectionConfig o;
    const std::string method = upper_copy(req.method);

    o[CURLOPT_HTTPHEADER]     = request_header_lines(req);
    o[CURLOPT_POST]           = method == "POST" ? 1L : 0L;
    o[CURLOPT_MAXREDIRS]      = kDefaultMaxRedirs;
    o[CURLOPT_CONNECTTIMEOUT] = kDefaultConnectTimeoutSec;
    o[CURLOPT_TIMEOUT]        = kDefaultTimeoutSec;
    o[CURLOPT_SSL_VERIFYHOST] = kDefaultTlsVerify ? 2L : 0L;
    o[CURLOPT_SSL_VERIFYPEER] = kDefaultTlsVerify ? 1L : 0L;
    o[CURLOPT_ACCEPT_ENCODING] = std::string();   // every encoding the transport supports
    o[CURLOPT_AUTOREFERER]    = 1L;
    o[CURLOPT_FOLLOWLOCATION] = 1L;
    o[CURLOPT_IPRESOLVE]      = static_cast<long>(CURL_IPRESOLVE_V4);
    o[CURLOPT_USERAGENT]      = req.header_line("User-Agent");

    const std::string& ca = system_ca_bundle_path();
    if (!ca.empty()) {
        o[CURLOPT_CAINFO] = ca;
    }

    const std::string cookies = settings.cookies_path ? *settings.cookies_path : default_cookie_path();
    o[CURLOPT_COOKIEJAR]  = cookies;
    o[CURLOPT_COOKIEFILE] = cookies;

    // Options apply in key order: POSTFIELDSIZE (long) lands before COPYPOSTFIELDS,
    // so bodies with NUL bytes are copied whole.
    if (method == "POST") {
        o[CURLOPT_POSTFIELDSIZE]  = static_cast<long>(req.body.size());
        o[CURLOPT_COPYPOSTFIELDS] = req.body;
    } else if (method == "HEAD") {
        o[CURLOPT_NOBODY] = 1L;
    } else if (method != "GET") {
        o[CURLOPT_CUSTOMREQUEST] = method;
        if (!req.body.empty()) {
            o[CURLOPT_POSTFIELDSIZE]  = static_cast<long>(req.body.size());
            o[CURLOPT_COPYPOSTFIELDS] = req.body;
        }
    }
    return o;
}

ConnectionConfig merge_options(ConnectionConfig defaults, const OptionMap& overrides) {
    for (const auto& kv : overrides) {
        if (std::holds_alternative<Unset>(kv.second)) {
            defaults.erase(kv.first);
        } else {
            defaults[kv.first] = kv.second;
        }
    }
    return defaults;
}

ConnectionConfig build_connection_config(const Request& req, const Settings& settings) {
    return merge_options(default_options(req, settings), settings.options);
}

CURLcode apply_option(CURL* h, CURLoption opt, const OptionValue& value,
                      std::vector<SlistPtr>& lists) {
    if (std::holds_alternative<Unset>(value)) {
        return CURLE_OK;  // hd::unset: nothing to apply
    }

    const curl_easyoption* info = curl_easy_option_by_id(opt);
    if (!info) {
        return CURLE_UNKNOWN_OPTION;
    }

    if (const long* l = std::get_if<long>(&value)) {
        switch (info->type) {
        case CURLOT_LONG:
        case CURLOT_VALUES:
            return curl_easy_setopt(h, opt, *l);
        case CURLOT_OFF_T:
            return curl_easy_setopt(h, opt, static_cast<curl_off_t>(*l));
        default:
            return CURLE_BAD_FUNCTION_ARGUMENT;
        }
    }

    if (const std::string* s = std::get_if<std::string>(&value)) {
        // COPYPOSTFIELDS is declared as an object but copies a char buffer.
        if (info->type != CURLOT_STRING && opt != CURLOPT_COPYPOSTFIELDS) {
            return CURLE_BAD_FUNCTION_ARGUMENT;
        }
        return curl_easy_setopt(h, opt, s->c_str());
    }

    const StringList& items = std::get<StringList>(value);
    if (info->type != CURLOT_SLIST) {
        return CURLE_BAD_FUNCTION_ARGUMENT;
    }
    SlistPtr list;
    for (const auto& item : items) {
        curl_slist* next = curl_slist_append(list.get(), item.c_str());
        if (!next) return CURLE_OUT_OF_MEMORY;
        (void)list.release();
        list.reset(next);
    }
    const CURLcode rc = curl_easy_setopt(h, opt, list.get());
    if (rc == CURLE_OK && list) {
        lists.push_back(std::move(list));
    }
    return rc;
}

} // namespace hd::internal
