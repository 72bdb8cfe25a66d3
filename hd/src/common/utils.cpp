/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */
#include "hd/internal/utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>

namespace hd::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

std::string trim_copy(const char* p, std::size_t n) {
    std::string s(p, n);
    trim_inplace(s);
    return s;
}

std::string upper_copy(std::string s){
    for(char& c: s) c = (char)std::toupper((unsigned char)c);
    return s;
}
std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    }
    return true;
}

bool icontains(const std::string& haystack, const char* needle) {
    const std::size_t n = std::strlen(needle);
    if (n == 0) return true;
    auto it = std::search(haystack.begin(), haystack.end(), needle, needle + n,
                          [](char a, char b){
                              return std::tolower((unsigned char)a) == std::tolower((unsigned char)b);
                          });
    return it != haystack.end();
}

std::string format_elapsed_ms(double seconds) {
    if (seconds < 0.0) seconds = 0.0;
    char buf[64];
    const int n = std::snprintf(buf, sizeof(buf), "%.3f ms", seconds * 1000.0);
    if (n <= 0) return "0.000 ms";
    return std::string(buf, std::min<std::size_t>((std::size_t)n, sizeof(buf) - 1));
}

} // namespace hd::internal
