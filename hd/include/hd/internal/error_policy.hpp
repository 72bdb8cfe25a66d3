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
#include "hd/request.hpp"
#include "hd/settings.hpp"

namespace hd::internal {

// A failure is suppressed when the settings ignore its code, or when it is the
// write abort that the body handler raises for binary payloads.
bool is_suppressed(int code, bool is_binary, const IgnoredErrors& ignored);

// Throws hd::TransportError unless the failure is suppressed.
void classify_error(int code, const std::string& message, const Request& request,
                    bool is_binary, const IgnoredErrors& ignored);

} // namespace hd::internal
