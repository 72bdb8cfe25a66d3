/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */
#include "loopback_server.hpp"

#include "hd/http_response.hpp"
#include "hd/internal/utils.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace hd::test {

namespace {

int create_listen_socket(std::uint16_t& port_out) {
    int srv = ::socket(AF_INET, SOCK_STREAM, 0);
    if (srv < 0) {
        throw std::runtime_error(std::string("socket() failed: ") + std::strerror(errno));
    }
    int o = 1;
    (void)::setsockopt(srv, SOL_SOCKET, SO_REUSEADDR, &o, sizeof(o));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;

    if (::bind(srv, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(srv);
        throw std::runtime_error(std::string("bind() failed: ") + std::strerror(errno));
    }
    socklen_t len = sizeof(addr);
    if (::getsockname(srv, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        ::close(srv);
        throw std::runtime_error(std::string("getsockname() failed: ") + std::strerror(errno));
    }
    port_out = ntohs(addr.sin_port);
    return srv;
}

bool recv_request(int fd, LoopbackRequest& R) {
    std::string data;
    char buf[4096];
    std::size_t hdr_end = std::string::npos;
    while ((hdr_end = data.find("\r\n\r\n")) == std::string::npos) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return false;
        data.append(buf, buf + n);
        if (data.size() > (1u << 20)) return false;
    }

    std::istringstream lines(data.substr(0, hdr_end));
    std::string line;
    if (!std::getline(lines, line)) return false;
    std::istringstream rl(line);
    std::string target, ver;
    if (!(rl >> R.method >> target >> ver)) return false;
    const std::size_t q = target.find('?');
    R.path  = target.substr(0, q);
    R.query = (q == std::string::npos) ? std::string() : target.substr(q + 1);

    while (std::getline(lines, line)) {
        const std::size_t c = line.find(':');
        if (c == std::string::npos) continue;
        std::string k = line.substr(0, c), v = line.substr(c + 1);
        hd::internal::trim_inplace(k);
        hd::internal::trim_inplace(v);
        R.headers.emplace_back(k, v);
    }

    R.body = data.substr(hdr_end + 4);
    const std::string cl = R.header("Content-Length");
    std::size_t want = 0;
    if (!cl.empty()) {
        try { want = static_cast<std::size_t>(std::stoul(cl)); } catch (const std::exception&) { return false; }
    }
    while (R.body.size() < want) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return false;
        R.body.append(buf, buf + n);
    }
    if (R.body.size() > want) R.body.resize(want);
    return true;
}

} // namespace

std::string LoopbackRequest::header(const std::string& name) const {
    for (const auto& kv : headers) {
        if (hd::internal::iequals(kv.first, name)) return kv.second;
    }
    return {};
}

std::string LoopbackRequest::query_param(const std::string& name) const {
    std::size_t p = 0;
    while (p < query.size()) {
        std::size_t amp = query.find('&', p);
        if (amp == std::string::npos) amp = query.size();
        const std::string kv = query.substr(p, amp - p);
        const std::size_t eq = kv.find('=');
        if (kv.substr(0, eq) == name) {
            return eq == std::string::npos ? std::string() : kv.substr(eq + 1);
        }
        p = amp + 1;
    }
    return {};
}

LoopbackServer::LoopbackServer() {
    _listen_fd = create_listen_socket(_port);
    if (::listen(_listen_fd, 128) < 0) {
        ::close(_listen_fd);
        throw std::runtime_error(std::string("listen() failed: ") + std::strerror(errno));
    }
    _acceptor = std::thread(&LoopbackServer::accept_loop, this);
}

LoopbackServer::~LoopbackServer() {
    stop();
}

void LoopbackServer::route(const std::string& path, RouteHandler handler) {
    std::lock_guard<std::mutex> lk(_mtx);
    _routes[path] = std::move(handler);
}

std::string LoopbackServer::url(const std::string& path_and_query) const {
    return "http://127.0.0.1:" + std::to_string(_port) + path_and_query;
}

void LoopbackServer::stop() {
    if (_stop.exchange(true)) return;
    // Wakes the blocked accept().
    (void)::shutdown(_listen_fd, SHUT_RDWR);
    if (_acceptor.joinable()) _acceptor.join();
    ::close(_listen_fd);
    _listen_fd = -1;

    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lk(_mtx);
        workers.swap(_workers);
    }
    for (auto& t : workers) {
        if (t.joinable()) t.join();
    }
}

void LoopbackServer::accept_loop() {
    while (!_stop.load(std::memory_order_relaxed)) {
        sockaddr_in peer{};
        socklen_t len = sizeof(peer);
        int fd = ::accept(_listen_fd, reinterpret_cast<sockaddr*>(&peer), &len);
        if (fd < 0) {
            if (errno == EINTR) continue;
            break;
        }
        timeval tv{5, 0};
        (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        std::lock_guard<std::mutex> lk(_mtx);
        _workers.emplace_back(&LoopbackServer::serve, this, fd);
    }
}

void LoopbackServer::serve(int fd) {
    LoopbackRequest R;
    if (recv_request(fd, R)) {
        RouteHandler handler;
        {
            std::lock_guard<std::mutex> lk(_mtx);
            auto it = _routes.find(R.path);
            if (it != _routes.end()) handler = it->second;
        }
        if (handler) {
            handler(fd, R);
        } else {
            send_response(fd, 404, "text/plain", "not found");
        }
    }
    ::close(fd);
}

bool LoopbackServer::send_all(int fd, const std::string& data) {
    std::size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

void LoopbackServer::send_response(int fd, int status, const std::string& content_type,
                                   const std::string& body,
                                   const std::vector<std::pair<std::string, std::string>>& extra) {
    std::ostringstream oss;
    const char* reason = hd::reason_phrase(status);
    oss << "HTTP/1.1 " << status << " " << (*reason ? reason : "Status") << "\r\n";
    if (!content_type.empty()) oss << "Content-Type: " << content_type << "\r\n";
    for (const auto& kv : extra) {
        oss << kv.first << ": " << kv.second << "\r\n";
    }
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "Connection: close\r\n\r\n";
    if (!send_all(fd, oss.str())) return;
    (void)send_all(fd, body);
}

std::uint16_t LoopbackServer::closed_port() {
    std::uint16_t port = 0;
    const int fd = create_listen_socket(port);
    ::close(fd);
    return port;
}

} // namespace hd::test
