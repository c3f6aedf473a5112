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

// Conduit Redis Client - Header
// Minimal RESP2 client for the shared cache and lock backends

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../control/config.hpp"

namespace conduit::core {

/// Decoded RESP2 reply
struct RedisReply {
    enum class Type : uint8_t { SimpleString, Error, Integer, BulkString, Nil, Array };

    Type type = Type::Nil;
    std::string str;                    // SimpleString, Error, BulkString
    int64_t integer = 0;                // Integer
    std::vector<RedisReply> elements;   // Array

    [[nodiscard]] bool is_nil() const noexcept { return type == Type::Nil; }
    [[nodiscard]] bool is_error() const noexcept { return type == Type::Error; }
    [[nodiscard]] bool is_ok() const noexcept { return type == Type::SimpleString && str == "OK"; }
};

enum class ParseStatus : uint8_t { Complete, Incomplete, Malformed };

/// Encode a command as a RESP array of bulk strings
[[nodiscard]] std::string encode_command(const std::vector<std::string>& args);

/// Parse one reply from the front of `buffer`; on Complete, `consumed` holds its length
[[nodiscard]] ParseStatus parse_reply(std::string_view buffer, RedisReply& out, size_t& consumed);

/// Blocking Redis client with a small pool of idle connections
/// Thread-safe: each command checks out its own connection.
class RedisClient {
public:
    explicit RedisClient(control::RedisConfig config);
    ~RedisClient();

    // Non-copyable, non-movable (owns sockets)
    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    /// Run a command. nullopt with `error` on transport or protocol failure.
    /// Redis error replies are returned as replies (type Error).
    [[nodiscard]] std::optional<RedisReply> command(const std::vector<std::string>& args,
                                                    std::string& error);

    /// Round-trip check
    [[nodiscard]] bool ping(std::string& error);

    [[nodiscard]] const control::RedisConfig& config() const noexcept { return config_; }

private:
    /// Idle connection or a new one (authenticated when a password is set); -1 on failure
    [[nodiscard]] int checkout(std::string& error);
    void checkin(int fd);

    [[nodiscard]] std::optional<RedisReply> roundtrip(int fd, const std::string& payload,
                                                      std::string& error);

    static constexpr size_t MAX_IDLE_CONNECTIONS = 16;

    control::RedisConfig config_;
    std::mutex pool_mutex_;
    std::vector<int> idle_;
};

}  // namespace conduit::core
