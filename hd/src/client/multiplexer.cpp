/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */
#include "hd/internal/multiplexer.hpp"
#include "hd/log.hpp"

#include <string>

namespace hd::internal {

Multiplexer::Multiplexer() : _multi(curl_multi_init()) {
    if (!_multi) {
        hd::log_line("[MULTI] curl_multi_init failed");
    }
}

Multiplexer::~Multiplexer() {
    detach_all();
    if (_multi) {
        const CURLMcode mc = curl_multi_cleanup(_multi);
        if (mc != CURLM_OK) {
            hd::log_line(std::string("[MULTI] curl_multi_cleanup: ") + curl_multi_strerror(mc));
        }
        _multi = nullptr;
    }
}

bool Multiplexer::add(Connection& c) {
    if (!_multi || !c.handle()) return false;
    const CURLMcode mc = curl_multi_add_handle(_multi, c.handle());
    if (mc != CURLM_OK) {
        hd::log_line("[MULTI] curl_multi_add_handle failed for " + c.request().uri + ": " +
                     curl_multi_strerror(mc));
        return false;
    }
    _registry[c.handle()] = _conns.size();
    _conns.push_back(&c);
    return true;
}

CURLMcode Multiplexer::run() {
    if (!_multi) return CURLM_BAD_HANDLE;

    int active = 0;
    CURLMcode status = CURLM_OK;
    do {
        status = curl_multi_perform(_multi, &active);

        if (status == CURLM_OK && active > 0) {
            const CURLMcode pc = curl_multi_poll(_multi, nullptr, 0, kPollTimeoutMs, nullptr);
            if (pc != CURLM_OK) {
                status = pc;
            }
        }

        drain_messages();
    } while (active > 0 && status == CURLM_OK);

    if (status != CURLM_OK) {
        hd::log_line("[MULTI] loop stopped with " + std::to_string(active) + " active transfer(s): " +
                     curl_multi_strerror(status));
    }
    return status;
}

void Multiplexer::drain_messages() {
    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(_multi, &queued)) {
        if (msg->msg != CURLMSG_DONE) continue;
        auto it = _registry.find(msg->easy_handle);
        if (it == _registry.end()) continue;
        _conns[it->second]->set_result(msg->data.result);
    }
}

void Multiplexer::detach_all() {
    if (_multi) {
        for (Connection* c : _conns) {
            if (!c->handle()) continue;
            const CURLMcode mc = curl_multi_remove_handle(_multi, c->handle());
            if (mc != CURLM_OK) {
                hd::log_line("[MULTI] curl_multi_remove_handle failed for " + c->request().uri + ": " +
                             curl_multi_strerror(mc));
            }
        }
    }
    _conns.clear();
    _registry.clear();
}

void drive_single(Connection& c) {
    c.perform();
}

void drive_batch(std::vector<std::unique_ptr<Connection>>& conns) {
    CURLMcode status = CURLM_OK;
    {
        Multiplexer multi;
        for (auto& c : conns) {
            if (!multi.add(*c)) {
                c->fail(CURLE_FAILED_INIT, "transfer could not be registered with the multi handle");
            }
        }
        status = multi.run();
        multi.detach_all();
    }

    // A connection without a completion event is reported, not dropped.
    const std::string why = std::string("transfer not completed: ") + curl_multi_strerror(status);
    for (auto& c : conns) {
        if (!c->result() && !c->last_error()) {
            c->fail(CURLE_FAILED_INIT, why);
        }
    }
}

void drive(std::vector<std::unique_ptr<Connection>>& conns) {
    if (conns.empty()) return;
    if (conns.size() == 1) {
        drive_single(*conns.front());
        return;
    }
    drive_batch(conns);
}

} // namespace hd::internal
