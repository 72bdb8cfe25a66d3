/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */
#include "hd/request.hpp"
#include "hd/internal/utils.hpp"

namespace hd {

Request& Request::add_header(const std::string& name, const std::string& value) {
    for (auto& kv : headers) {
        if (internal::iequals(kv.first, name)) {
            kv.second.push_back(value);
            return *this;
        }
    }
    headers.emplace_back(name, std::vector<std::string>{value});
    return *this;
}

std::string Request::header_line(const std::string& name) const {
    std::string out;
    for (const auto& kv : headers) {
        if (!internal::iequals(kv.first, name)) continue;
        for (const auto& v : kv.second) {
            if (!out.empty()) out += ", ";
            out += v;
        }
    }
    return out;
}

bool Request::has_header(const std::string& name) const {
    for (const auto& kv : headers) {
        if (internal::iequals(kv.first, name)) return true;
    }
    return false;
}

} // namespace hd
