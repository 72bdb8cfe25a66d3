/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */
#include "hd/internal/ca_bundle.hpp"
#include "hd/log.hpp"

#include <openssl/x509.h>

#include <cstdlib>
#include <unistd.h>

namespace hd::internal {

namespace {

bool readable(const char* path) {
    return path && *path && ::access(path, R_OK) == 0;
}

std::string lookup_ca_bundle() {
    // Environment override, under the variable name OpenSSL itself honors.
    const char* env_name = X509_get_default_cert_file_env();
    if (env_name) {
        const char* p = std::getenv(env_name);
        if (readable(p)) return p;
    }

    const char* compiled = X509_get_default_cert_file();
    if (readable(compiled)) return compiled;

    static const char* const kKnown[] = {
        "/etc/ssl/certs/ca-certificates.crt",                // Debian, Ubuntu, Gentoo
        "/etc/pki/tls/certs/ca-bundle.crt",                  // Fedora, RHEL 6
        "/etc/pki/ca-trust/extracted/pem/tls-ca-bundle.pem", // RHEL 7+
        "/etc/ssl/ca-bundle.pem",                            // openSUSE
        "/etc/ssl/cert.pem",                                 // Alpine, macOS
        "/usr/local/share/certs/ca-root-nss.crt",            // FreeBSD
        "/etc/pki/tls/cacert.pem",                           // OpenELEC
    };
    for (const char* p : kKnown) {
        if (readable(p)) return p;
    }
    return {};
}

} // namespace

const std::string& system_ca_bundle_path() {
    static const std::string path = [] {
        std::string p = lookup_ca_bundle();
        if (p.empty()) {
            hd::log_line("[CA] no system CA bundle found, using transport default");
        }
        return p;
    }();
    return path;
}

} // namespace hd::internal
