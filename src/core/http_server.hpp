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

// Conduit HTTP Server - Header
// cpp-httplib front end feeding the dispatcher

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

#include "../control/config.hpp"
#include "../gateway/dispatcher.hpp"
#include "containers.hpp"

namespace httplib {
struct Request;
struct Response;
class Server;
}  // namespace httplib

namespace conduit::core {

/// Cancellation tokens of requests inside the dispatcher
class InFlightRequests {
public:
    /// True once the client connection is gone
    using ConnectionCheck = std::function<bool()>;

    InFlightRequests() = default;

    // Non-copyable (owns mutex)
    InFlightRequests(const InFlightRequests&) = delete;
    InFlightRequests& operator=(const InFlightRequests&) = delete;

    /// `is_closed` may be empty; it is only called while the request is registered
    [[nodiscard]] uint64_t add(std::shared_ptr<gateway::CancellationToken> token, ConnectionCheck is_closed);
    void remove(uint64_t id);

    /// Cancel requests whose client disconnected. Returns how many were cancelled.
    size_t cancel_disconnected();

    void cancel_all();

    [[nodiscard]] size_t size() const;

private:
    struct Entry {
        std::shared_ptr<gateway::CancellationToken> token;
        ConnectionCheck is_closed;
        bool disconnected = false;
    };

    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;
    fast_map<uint64_t, Entry> entries_;
};

/// Blocking HTTP server; one dispatcher call per request on the httplib thread pool
class HttpServer {
public:
    HttpServer(control::ServerConfig config, gateway::Dispatcher& dispatcher);
    ~HttpServer();

    // Non-copyable, non-movable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind and serve until stop(). Returns an error when the listener cannot bind.
    [[nodiscard]] std::error_code run();

    /// Stop accepting, cancel in-flight backend calls. Safe from any thread.
    void stop();

    /// How often in-flight requests are checked for a vanished client
    static constexpr std::chrono::milliseconds DISCONNECT_POLL_INTERVAL{100};

    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

    /// Requests currently inside the dispatcher
    [[nodiscard]] size_t in_flight() const;

    /// Conversion between httplib and gateway types
    [[nodiscard]] static gateway::GatewayRequest to_gateway_request(const httplib::Request& req);
    static void apply_response(const gateway::GatewayResponse& response, httplib::Response& res);

private:
    void handle(const httplib::Request& req, httplib::Response& res);

    /// Cancels requests of disconnected clients until the listener exits
    void watch_disconnects();

    control::ServerConfig config_;
    gateway::Dispatcher& dispatcher_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    InFlightRequests in_flight_;

    std::mutex watcher_mutex_;
    std::condition_variable watcher_wake_;
    bool watcher_exit_ = false;
};

}  // namespace conduit::core
