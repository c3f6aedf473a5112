/*
 * Copyright 2025 Conduit Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Conduit HTTP Server - Implementation

#include "http_server.hpp"

#include <httplib.h>

#include <algorithm>
#include <chrono>
#include <thread>
#include <vector>

#include "logging.hpp"

namespace conduit::core {

namespace {

// Connection-level headers owned by httplib on the way out
bool is_managed_response_header(std::string_view name) {
    return http::header_name_equals(name, "Content-Length") ||
           http::header_name_equals(name, "Transfer-Encoding") ||
           http::header_name_equals(name, "Connection") ||
           http::header_name_equals(name, "Keep-Alive");
}

}  // namespace

// InFlightRequests implementation

uint64_t InFlightRequests::add(std::shared_ptr<gateway::CancellationToken> token, ConnectionCheck is_closed) {
    std::lock_guard lock(mutex_);
    uint64_t id = next_id_++;
    entries_.emplace(id, Entry{std::move(token), std::move(is_closed)});
    return id;
}

void InFlightRequests::remove(uint64_t id) {
    std::lock_guard lock(mutex_);
    entries_.erase(id);
}

size_t InFlightRequests::cancel_disconnected() {
    std::vector<std::shared_ptr<gateway::CancellationToken>> gone;
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, entry] : entries_) {
            if (!entry.disconnected && entry.is_closed && entry.is_closed()) {
                entry.disconnected = true;
                gone.push_back(entry.token);
            }
        }
    }
    // Callbacks stop backend clients; run them without the registry lock
    for (auto& token : gone) {
        token->cancel();
    }
    return gone.size();
}

void InFlightRequests::cancel_all() {
    std::vector<std::shared_ptr<gateway::CancellationToken>> pending;
    {
        std::lock_guard lock(mutex_);
        pending.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            pending.push_back(entry.token);
        }
    }
    for (auto& token : pending) {
        token->cancel();
    }
}

size_t InFlightRequests::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

// HttpServer implementation

HttpServer::HttpServer(control::ServerConfig config, gateway::Dispatcher& dispatcher)
    : config_(std::move(config)), dispatcher_(dispatcher), server_(std::make_unique<httplib::Server>()) {}

HttpServer::~HttpServer() {
    stop();
}

std::error_code HttpServer::run() {
    auto* logger = logging::get_logger();
    auto& svr = *server_;

    size_t pool_size = config_.worker_threads;
    if (pool_size == 0) {
        pool_size = std::max(1u, std::thread::hardware_concurrency());
    }
    svr.new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    svr.set_payload_max_length(config_.max_request_size);
    svr.set_read_timeout(std::chrono::milliseconds(config_.read_timeout));
    svr.set_write_timeout(std::chrono::milliseconds(config_.write_timeout));

    auto handler = [this](const httplib::Request& req, httplib::Response& res) { handle(req, res); };
    svr.Get(".*", handler);
    svr.Post(".*", handler);
    svr.Put(".*", handler);
    svr.Patch(".*", handler);
    svr.Delete(".*", handler);
    svr.Options(".*", handler);

    if (!svr.bind_to_port(config_.listen_address, config_.listen_port)) {
        LOG_ERROR(logger, "Failed to bind {}:{}", config_.listen_address, config_.listen_port);
        return std::make_error_code(std::errc::address_in_use);
    }

    LOG_INFO(logger, "Conduit listening on {}:{} ({} threads)", config_.listen_address,
             config_.listen_port, pool_size);

    {
        std::lock_guard lock(watcher_mutex_);
        watcher_exit_ = false;
    }
    std::thread watcher([this] { watch_disconnects(); });

    running_.store(true, std::memory_order_release);
    bool ok = svr.listen_after_bind();
    running_.store(false, std::memory_order_release);

    {
        std::lock_guard lock(watcher_mutex_);
        watcher_exit_ = true;
    }
    watcher_wake_.notify_all();
    watcher.join();

    if (!ok && !stopping_.load(std::memory_order_acquire)) {
        LOG_ERROR(logger, "Listener on {}:{} terminated unexpectedly", config_.listen_address,
                  config_.listen_port);
        return std::make_error_code(std::errc::connection_aborted);
    }

    LOG_INFO(logger, "Server stopped");
    return {};
}

void HttpServer::stop() {
    if (stopping_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    in_flight_.cancel_all();

    if (server_) {
        server_->stop();
    }
}

size_t HttpServer::in_flight() const {
    return in_flight_.size();
}

void HttpServer::watch_disconnects() {
    auto* logger = logging::get_logger();
    std::unique_lock lock(watcher_mutex_);
    while (!watcher_wake_.wait_for(lock, DISCONNECT_POLL_INTERVAL, [this] { return watcher_exit_; })) {
        lock.unlock();
        if (size_t cancelled = in_flight_.cancel_disconnected(); cancelled > 0) {
            LOG_INFO(logger, "Client disconnected, cancelled {} in-flight request(s)", cancelled);
        }
        lock.lock();
    }
}

void HttpServer::handle(const httplib::Request& req, httplib::Response& res) {
    auto token = std::make_shared<gateway::CancellationToken>();
    uint64_t id = in_flight_.add(token, req.is_connection_closed);
    if (stopping_.load(std::memory_order_acquire)) {
        token->cancel();
    }

    auto response = dispatcher_.handle(to_gateway_request(req), token);

    in_flight_.remove(id);
    apply_response(response, res);
}

gateway::GatewayRequest HttpServer::to_gateway_request(const httplib::Request& req) {
    gateway::GatewayRequest request;
    request.method = http::parse_method(req.method);
    request.path = req.path;
    request.body = req.body;
    request.client_ip = req.remote_addr;

    // Raw query string is kept for cache keys and backend forwarding
    if (auto pos = req.target.find('?'); pos != std::string::npos) {
        request.query = req.target.substr(pos + 1);
    }
    for (const auto& [name, value] : req.params) {
        request.query_params.emplace(name, value);
    }
    for (const auto& [name, value] : req.headers) {
        http::append_header(request.headers, name, value);
    }
    return request;
}

void HttpServer::apply_response(const gateway::GatewayResponse& response, httplib::Response& res) {
    res.status = response.status;
    for (const auto& [name, value] : response.headers) {
        if (!is_managed_response_header(name)) {
            res.set_header(name, value);
        }
    }
    res.body = response.body;
}

}  // namespace conduit::core
