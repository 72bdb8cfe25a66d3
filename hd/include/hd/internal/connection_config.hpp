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
#include <string>
#include <vector>
#include "hd/request.hpp"
#include "hd/settings.hpp"

namespace hd::internal {

// Resolved option set of one connection.
using ConnectionConfig = OptionMap;

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

// "Name: v1, v2" lines for every request header except User-Agent.
std::vector<std::string> request_header_lines(const Request& req);

// <tmp>/hd-cookies.txt
std::string default_cookie_path();

// Fixed defaults for req (see settings.hpp for the constants).
ConnectionConfig default_options(const Request& req, const Settings& settings);

// Overrides replace defaults, hd::unset deletes them, unknown keys pass through.
ConnectionConfig merge_options(ConnectionConfig defaults, const OptionMap& overrides);

ConnectionConfig build_connection_config(const Request& req, const Settings& settings);

// Sets one option on h according to the type libcurl declares for it. A value
// of the wrong kind, or an option taking a pointer other than a string or a
// string list, yields CURLE_BAD_FUNCTION_ARGUMENT without touching h. String
// lists are converted to a curl_slist kept alive in lists.
CURLcode apply_option(CURL* h, CURLoption opt, const OptionValue& value,
                      std::vector<SlistPtr>& lists);

} // namespace hd::internal
