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

// Conduit Redis Client - Implementation

#include "redis_client.hpp"

#include <charconv>
#include <chrono>
#include <system_error>
#include <utility>

#include "socket.hpp"

namespace conduit::core {

namespace {

constexpr size_t MAX_ARRAY_DEPTH = 8;

// Position of the CRLF ending the line that starts at `pos`
size_t find_crlf(std::string_view buffer, size_t pos) {
    return buffer.find("\r\n", pos);
}

bool parse_int(std::string_view text, int64_t& value) {
    if (text.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return ec == std::errc() && ptr == text.data() + text.size();
}

ParseStatus parse_at(std::string_view buffer, size_t& pos, RedisReply& out, size_t depth) {
    if (pos >= buffer.size()) {
        return ParseStatus::Incomplete;
    }
    if (depth > MAX_ARRAY_DEPTH) {
        return ParseStatus::Malformed;
    }

    char prefix = buffer[pos];
    size_t eol = find_crlf(buffer, pos + 1);
    if (eol == std::string_view::npos) {
        return ParseStatus::Incomplete;
    }
    std::string_view line = buffer.substr(pos + 1, eol - pos - 1);
    size_t next = eol + 2;

    switch (prefix) {
        case '+':
            out.type = RedisReply::Type::SimpleString;
            out.str.assign(line);
            pos = next;
            return ParseStatus::Complete;

        case '-':
            out.type = RedisReply::Type::Error;
            out.str.assign(line);
            pos = next;
            return ParseStatus::Complete;

        case ':':
            out.type = RedisReply::Type::Integer;
            if (!parse_int(line, out.integer)) {
                return ParseStatus::Malformed;
            }
            pos = next;
            return ParseStatus::Complete;

        case '$': {
            int64_t len = 0;
            if (!parse_int(line, len) || len < -1) {
                return ParseStatus::Malformed;
            }
            if (len == -1) {
                out.type = RedisReply::Type::Nil;
                pos = next;
                return ParseStatus::Complete;
            }
            auto n = static_cast<size_t>(len);
            if (buffer.size() < next + n + 2) {
                return ParseStatus::Incomplete;
            }
            if (buffer.substr(next + n, 2) != "\r\n") {
                return ParseStatus::Malformed;
            }
            out.type = RedisReply::Type::BulkString;
            out.str.assign(buffer.substr(next, n));
            pos = next + n + 2;
            return ParseStatus::Complete;
        }

        case '*': {
            int64_t count = 0;
            if (!parse_int(line, count) || count < -1) {
                return ParseStatus::Malformed;
            }
            if (count == -1) {
                out.type = RedisReply::Type::Nil;
                pos = next;
                return ParseStatus::Complete;
            }
            out.type = RedisReply::Type::Array;
            out.elements.clear();
            size_t cursor = next;
            for (int64_t i = 0; i < count; ++i) {
                RedisReply element;
                auto status = parse_at(buffer, cursor, element, depth + 1);
                if (status != ParseStatus::Complete) {
                    return status;
                }
                out.elements.push_back(std::move(element));
            }
            pos = cursor;
            return ParseStatus::Complete;
        }

        default:
            return ParseStatus::Malformed;
    }
}

}  // namespace

std::string encode_command(const std::vector<std::string>& args) {
    std::string out;
    out.reserve(16 + args.size() * 16);
    out += '*';
    out += std::to_string(args.size());
    out += "\r\n";
    for (const auto& arg : args) {
        out += '$';
        out += std::to_string(arg.size());
        out += "\r\n";
        out += arg;
        out += "\r\n";
    }
    return out;
}

ParseStatus parse_reply(std::string_view buffer, RedisReply& out, size_t& consumed) {
    size_t pos = 0;
    auto status = parse_at(buffer, pos, out, 0);
    if (status == ParseStatus::Complete) {
        consumed = pos;
    }
    return status;
}

// RedisClient implementation

RedisClient::RedisClient(control::RedisConfig config) : config_(std::move(config)) {}

RedisClient::~RedisClient() {
    std::lock_guard lock(pool_mutex_);
    for (int fd : idle_) {
        close_fd(fd);
    }
    idle_.clear();
}

std::optional<RedisReply> RedisClient::command(const std::vector<std::string>& args,
                                               std::string& error) {
    int fd = checkout(error);
    if (fd < 0) {
        return std::nullopt;
    }

    auto reply = roundtrip(fd, encode_command(args), error);
    if (!reply) {
        close_fd(fd);  // Stream state unknown after a failure
        return std::nullopt;
    }

    checkin(fd);
    return reply;
}

bool RedisClient::ping(std::string& error) {
    auto reply = command({"PING"}, error);
    if (!reply) {
        return false;
    }
    if (reply->type != RedisReply::Type::SimpleString || reply->str != "PONG") {
        error = "Unexpected PING reply: " + reply->str;
        return false;
    }
    return true;
}

int RedisClient::checkout(std::string& error) {
    {
        std::lock_guard lock(pool_mutex_);
        if (!idle_.empty()) {
            int fd = idle_.back();
            idle_.pop_back();
            return fd;
        }
    }

    std::error_code ec;
    int fd = connect_with_timeout(config_.host, config_.port,
                                  std::chrono::milliseconds(config_.timeout_ms), ec);
    if (fd < 0) {
        error = "Redis connect to " + config_.host + ":" + std::to_string(config_.port) +
                " failed: " + ec.message();
        return -1;
    }

    if (!config_.password.empty()) {
        auto reply = roundtrip(fd, encode_command({"AUTH", config_.password}), error);
        if (!reply || !reply->is_ok()) {
            if (reply) {
                error = "Redis AUTH rejected: " + reply->str;
            }
            close_fd(fd);
            return -1;
        }
    }
    return fd;
}

void RedisClient::checkin(int fd) {
    std::lock_guard lock(pool_mutex_);
    if (idle_.size() < MAX_IDLE_CONNECTIONS) {
        idle_.push_back(fd);
    } else {
        close_fd(fd);
    }
}

std::optional<RedisReply> RedisClient::roundtrip(int fd, const std::string& payload,
                                                 std::string& error) {
    auto timeout = std::chrono::milliseconds(config_.timeout_ms);

    if (auto ec = send_all(fd, payload, timeout)) {
        error = "Redis send failed: " + ec.message();
        return std::nullopt;
    }

    // Bulk payload plus protocol framing
    size_t max_bytes = config_.max_value_bytes + 1024;
    std::string buffer;
    while (true) {
        if (auto ec = recv_some(fd, buffer, max_bytes, timeout)) {
            error = "Redis receive failed: " + ec.message();
            return std::nullopt;
        }

        RedisReply reply;
        size_t consumed = 0;
        switch (parse_reply(buffer, reply, consumed)) {
            case ParseStatus::Complete:
                return reply;
            case ParseStatus::Malformed:
                error = "Malformed Redis reply";
                return std::nullopt;
            case ParseStatus::Incomplete:
                break;
        }
    }
}

}  // namespace conduit::core
