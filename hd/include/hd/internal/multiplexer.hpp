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
#include <memory>
#include <unordered_map>
#include <vector>
#include "hd/internal/connection.hpp"

namespace hd::internal {

// Shared multi handle driving several connections with one poll loop.
class Multiplexer {
public:
    Multiplexer();
    ~Multiplexer();

    Multiplexer(const Multiplexer&) = delete;
    Multiplexer& operator=(const Multiplexer&) = delete;

    bool ok() const { return _multi != nullptr; }

    // Registers c; returns false if the multi handle refused it.
    bool add(Connection& c);

    // Polls until every transfer completed or the multi interface failed.
    // Completion results are stored on the connections. Returns the last
    // aggregate status.
    CURLMcode run();

    // Unregisters every handle (idempotent).
    void detach_all();

    std::size_t size() const { return _conns.size(); }

    // Bounded wait per poll round.
    static constexpr int kPollTimeoutMs = 1000;

private:
    void drain_messages();

    CURLM* _multi = nullptr;
    std::vector<Connection*> _conns;
    std::unordered_map<CURL*, std::size_t> _registry;  // handle -> index in _conns
};

// Single connection: synchronous perform. Several: one Multiplexer round trip,
// after which every connection carries a result or a synthesized failure.
void drive(std::vector<std::unique_ptr<Connection>>& conns);
void drive_single(Connection& c);
void drive_batch(std::vector<std::unique_ptr<Connection>>& conns);

} // namespace hd::internal
