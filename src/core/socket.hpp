// Conduit Socket Utilities - Header

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace conduit::core {

/// Open a non-blocking TCP connection, waiting at most `timeout` for it to complete.
/// Returns the connected fd, or -1 with `ec` set.
[[nodiscard]] int connect_with_timeout(std::string_view host, uint16_t port,
                                       std::chrono::milliseconds timeout, std::error_code& ec);

/// Write the whole buffer, polling for writability between partial sends
[[nodiscard]] std::error_code send_all(int fd, std::string_view data,
                                       std::chrono::milliseconds timeout);

/// Append whatever is readable (at most one read) to `out`.
/// Fails when nothing arrives within `timeout`, the peer closes, or `out` would exceed `max_bytes`.
[[nodiscard]] std::error_code recv_some(int fd, std::string& out, size_t max_bytes,
                                        std::chrono::milliseconds timeout);

[[nodiscard]] std::error_code set_nonblocking(int fd);
[[nodiscard]] std::error_code set_nodelay(int fd);

void close_fd(int fd);

} // namespace conduit::core
