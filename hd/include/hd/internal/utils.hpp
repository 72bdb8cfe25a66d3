/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */
#pragma once
#include <string>
#include <cstddef>

namespace hd::internal {

void trim_inplace(std::string& s);
std::string trim_copy(const char* p, std::size_t n);
std::string upper_copy(std::string s);
std::string lower_copy(std::string s);
bool iequals(const std::string& a, const std::string& b);
// Case-insensitive substring search.
bool icontains(const std::string& haystack, const char* needle);

// "%.3f ms" of a duration given in seconds.
std::string format_elapsed_ms(double seconds);

} // namespace hd::internal
