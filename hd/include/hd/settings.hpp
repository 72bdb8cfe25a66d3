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

#include <cstddef>
#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <string>
#include <variant>
#include <vector>

namespace hd {

// Override value that deletes a default option instead of replacing it.
struct Unset {
    bool operator==(const Unset&) const { return true; }
    bool operator!=(const Unset&) const { return false; }
};
inline constexpr Unset unset{};

using StringList  = std::vector<std::string>;
using OptionValue = std::variant<Unset, long, std::string, StringList>;
using OptionMap   = std::map<CURLoption, OptionValue>;

// Which transport error codes are turned into partial responses instead of errors.
class IgnoredErrors {
public:
    IgnoredErrors() = default;                       // nothing ignored
    IgnoredErrors(std::initializer_list<int> codes) : _codes(codes) {}
    explicit IgnoredErrors(std::set<int> codes) : _codes(std::move(codes)) {}

    static IgnoredErrors all() { IgnoredErrors e; e._all = true; return e; }

    bool ignores(int code) const { return _all || _codes.count(code) != 0; }
    bool ignores_all() const { return _all; }
    bool empty() const { return !_all && _codes.empty(); }
    const std::set<int>& codes() const { return _codes; }

private:
    bool _all = false;
    std::set<int> _codes;
};

// Defaults of the per-connection option set.
// TLS verification is off unless overridden (CURLOPT_SSL_VERIFYPEER/VERIFYHOST).
constexpr bool        kDefaultTlsVerify        = false;
constexpr long        kDefaultMaxRedirs        = 10;
constexpr long        kDefaultConnectTimeoutSec = 10;
constexpr long        kDefaultTimeoutSec       = 10;
constexpr std::size_t kMaxBodyBytes            = 5000000;

// Per-batch settings, shared read-only by every connection of a dispatch.
struct Settings {
    // Option overrides; hd::unset removes the default.
    OptionMap options;

    IgnoredErrors ignored_errors;

    // Shared cookie jar; defaults to <tmp>/hd-cookies.txt
    std::optional<std::string> cookies_path;

    // Logging
    std::string log_file;      // empty: no file sink
    bool log_echo = true;      // mirror log lines to stderr

    Settings& set(CURLoption opt, OptionValue value) {
        options[opt] = std::move(value);
        return *this;
    }
    Settings& remove(CURLoption opt) {
        options[opt] = unset;
        return *this;
    }
};

} // namespace hd
