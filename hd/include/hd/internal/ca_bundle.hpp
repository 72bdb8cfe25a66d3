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

namespace hd::internal {

// Path of the system CA bundle, empty if none is readable.
// Honors SSL_CERT_FILE, then OpenSSL's compiled-in default, then well-known locations.
// The lookup runs once per process.
const std::string& system_ca_bundle_path();

} // namespace hd::internal
