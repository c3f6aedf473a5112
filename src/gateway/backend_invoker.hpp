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

// Conduit Backend Invoker - Header
// Outbound HTTP calls to backend services

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../control/config.hpp"
#include "../http/http.hpp"

namespace conduit::gateway {

/// Cooperative cancellation shared by one inbound request and its backend calls
class CancellationToken {
public:
    using Callback = std::function<void()>;

    CancellationToken() = default;

    // Non-copyable (shared by pointer)
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /// Fire once; registered callbacks run one at a time on the cancelling thread
    void cancel();

    [[nodiscard]] bool cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// Run `callback` on cancel. Runs immediately (returning 0) when already cancelled.
    [[nodiscard]] uint64_t subscribe(Callback callback);

    /// Remove a callback. If cancel() is running it right now, blocks until it returns,
    /// so whatever the callback references may be destroyed afterwards.
    /// Must not be called from inside the callback itself.
    void unsubscribe(uint64_t id);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable callback_done_;
    uint64_t next_id_ = 1;
    uint64_t running_id_ = 0;  // Callback cancel() is executing, 0 if none
    std::map<uint64_t, Callback> callbacks_;
};

/// One outbound call
struct BackendRequest {
    std::string url;                          // Absolute, query included
    http::Method method = http::Method::GET;
    http::HeaderMap headers;
    std::string body;
    std::string content_type;                 // Sent with the body when non-empty
    std::chrono::milliseconds timeout{30000};
    std::shared_ptr<CancellationToken> cancellation;  // Optional
};

struct BackendResponse {
    int status_code = 0;
    http::HeaderMap headers;
    std::string body;

    [[nodiscard]] std::string_view content_type() const {
        return http::find_header(headers, "Content-Type");
    }
};

/// Backend transport interface
/// Any HTTP status is a response; nullopt with `error` means no response was
/// received (connect failure, timeout, TLS error, cancellation).
class BackendInvoker {
public:
    virtual ~BackendInvoker() = default;

    [[nodiscard]] virtual std::optional<BackendResponse> invoke(const BackendRequest& request,
                                                                std::string& error) = 0;
};

/// cpp-httplib client per call (httplib clients are not shared across threads)
class HttpBackendInvoker : public BackendInvoker {
public:
    explicit HttpBackendInvoker(control::BackendConfig config);

    [[nodiscard]] std::optional<BackendResponse> invoke(const BackendRequest& request,
                                                        std::string& error) override;

    [[nodiscard]] const control::BackendConfig& config() const noexcept { return config_; }

private:
    control::BackendConfig config_;
};

}  // namespace conduit::gateway
