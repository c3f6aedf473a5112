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

// Conduit Backend Invoker - Implementation

#include "backend_invoker.hpp"

#include <httplib.h>

#include <utility>
#include <vector>

#include "../core/logging.hpp"

namespace conduit::gateway {

// CancellationToken implementation

void CancellationToken::cancel() {
    std::unique_lock lock(mutex_);
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    // One at a time, so unsubscribe() can wait for exactly the callback it owns
    while (!callbacks_.empty()) {
        auto node = callbacks_.extract(callbacks_.begin());
        running_id_ = node.key();
        lock.unlock();
        struct Finished {
            CancellationToken& token;
            ~Finished() {
                std::lock_guard relock(token.mutex_);
                token.running_id_ = 0;
                token.callback_done_.notify_all();
            }
        };
        {
            Finished finished{*this};
            node.mapped()();
        }
        lock.lock();
    }
}

uint64_t CancellationToken::subscribe(Callback callback) {
    {
        std::lock_guard lock(mutex_);
        if (!cancelled_.load(std::memory_order_acquire)) {
            uint64_t id = next_id_++;
            callbacks_.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancellationToken::unsubscribe(uint64_t id) {
    if (id == 0) {
        return;
    }
    std::unique_lock lock(mutex_);
    callbacks_.erase(id);
    callback_done_.wait(lock, [&] { return running_id_ != id; });
}

// HttpBackendInvoker implementation

namespace {

// Stops the client when the request's token fires, for the lifetime of one call
class CancelGuard {
public:
    CancelGuard(std::shared_ptr<CancellationToken> token, httplib::Client& client)
        : token_(std::move(token)) {
        if (token_) {
            id_ = token_->subscribe([&client] { client.stop(); });
        }
    }
    ~CancelGuard() {
        if (token_ && id_ != 0) {
            token_->unsubscribe(id_);
        }
    }

    CancelGuard(const CancelGuard&) = delete;
    CancelGuard& operator=(const CancelGuard&) = delete;

private:
    std::shared_ptr<CancellationToken> token_;
    uint64_t id_ = 0;
};

}  // namespace

HttpBackendInvoker::HttpBackendInvoker(control::BackendConfig config) : config_(std::move(config)) {}

std::optional<BackendResponse> HttpBackendInvoker::invoke(const BackendRequest& request,
                                                          std::string& error) {
    if (request.cancellation && request.cancellation->cancelled()) {
        error = "Request cancelled";
        return std::nullopt;
    }

    auto url = http::parse_url(request.url);
    if (!url) {
        error = "Invalid backend URL: " + request.url;
        return std::nullopt;
    }

    httplib::Client client(url->origin());
    client.set_connection_timeout(std::chrono::milliseconds(config_.connect_timeout_ms));
    client.set_read_timeout(request.timeout);
    client.set_write_timeout(request.timeout);
    client.set_follow_location(false);
    client.set_keep_alive(false);
    client.enable_server_certificate_verification(config_.verify_tls);

    httplib::Request req;
    req.method = std::string(http::to_string(request.method));
    req.path = url->path.empty() ? "/" : url->path;
    if (!url->query.empty()) {
        req.path += "?" + url->query;
    }
    for (const auto& [name, value] : request.headers) {
        req.set_header(name, value);
    }
    if (!request.body.empty() || !request.content_type.empty()) {
        req.body = request.body;
        if (!request.content_type.empty()) {
            req.set_header("Content-Type", request.content_type);
        }
    }

    auto started = std::chrono::steady_clock::now();
    httplib::Result result = [&] {
        CancelGuard guard(request.cancellation, client);
        return client.send(req);
    }();

    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now() - started)
                          .count();

    if (request.cancellation && request.cancellation->cancelled()) {
        error = "Request cancelled";
        return std::nullopt;
    }
    if (!result) {
        error = "Backend call to " + url->canonical_origin() + " failed: " +
                httplib::to_string(result.error());
        LOG_WARNING(logging::get_logger(), "Backend {} {} transport error after {}ms: {}",
                    http::to_string(request.method), request.url, elapsed_ms, error);
        return std::nullopt;
    }

    BackendResponse response;
    response.status_code = result->status;
    response.body = std::move(result->body);
    for (const auto& [name, value] : result->headers) {
        http::append_header(response.headers, name, value);
    }

    LOG_DEBUG(logging::get_logger(), "Backend {} {} -> {} in {}ms", http::to_string(request.method),
              request.url, response.status_code, elapsed_ms);
    return response;
}

}  // namespace conduit::gateway
