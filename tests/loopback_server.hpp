/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace hd::test {

struct LoopbackRequest {
    std::string method;
    std::string path;
    std::string query;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    std::string header(const std::string& name) const;   // case-insensitive
    std::string query_param(const std::string& name) const;
};

using RouteHandler = std::function<void(int fd, const LoopbackRequest&)>;

// Minimal HTTP/1.1 server on 127.0.0.1 with an ephemeral port. One thread per
// connection, every response closes the connection.
class LoopbackServer {
public:
    LoopbackServer();
    ~LoopbackServer();

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    void route(const std::string& path, RouteHandler handler);

    std::uint16_t port() const { return _port; }
    std::string url(const std::string& path_and_query) const;

    void stop();

    static bool send_all(int fd, const std::string& data);
    static void send_response(int fd, int status, const std::string& content_type,
                              const std::string& body,
                              const std::vector<std::pair<std::string, std::string>>& extra = {});

    // Port nothing listens on (bound once, then released).
    static std::uint16_t closed_port();

private:
    void accept_loop();
    void serve(int fd);

    int _listen_fd = -1;
    std::uint16_t _port = 0;
    std::atomic<bool> _stop{false};
    std::thread _acceptor;

    std::mutex _mtx;
    std::map<std::string, RouteHandler> _routes;
    std::vector<std::thread> _workers;
};

} // namespace hd::test
