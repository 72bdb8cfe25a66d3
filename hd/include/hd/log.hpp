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

namespace hd {

// Thread-safe logging (to file + stderr).
// An empty path disables the file sink.
void set_log_file(const std::string& path);
void set_log_echo(bool on);
void log_line(const std::string& line);

} // namespace hd
