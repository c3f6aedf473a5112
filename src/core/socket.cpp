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

// Conduit Socket Utilities - Implementation

#include "socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace conduit::core {

namespace {

// Wait until fd reports `events`; timeout is reported as std::errc::timed_out
[[nodiscard]] std::error_code wait_fd(int fd, short events, std::chrono::milliseconds timeout) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;

    int ret;
    do {
        ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (ret < 0 && errno == EINTR);

    if (ret < 0) {
        return std::error_code(errno, std::system_category());
    }
    if (ret == 0) {
        return std::make_error_code(std::errc::timed_out);
    }
    return {};
}

}  // namespace

int connect_with_timeout(std::string_view host, uint16_t port, std::chrono::milliseconds timeout,
                         std::error_code& ec) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    std::string host_str{host};
    std::string port_str = std::to_string(port);
    if (int rc = ::getaddrinfo(host_str.c_str(), port_str.c_str(), &hints, &result); rc != 0) {
        ec = std::make_error_code(std::errc::host_unreachable);
        return -1;
    }

    int fd = -1;
    ec = std::make_error_code(std::errc::connection_refused);

    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            ec = std::error_code(errno, std::system_category());
            continue;
        }

        if (auto nb = set_nonblocking(fd); nb) {
            ec = nb;
            close_fd(fd);
            fd = -1;
            continue;
        }

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            ec.clear();
            break;
        }

        if (errno != EINPROGRESS) {
            ec = std::error_code(errno, std::system_category());
            close_fd(fd);
            fd = -1;
            continue;
        }

        if (auto wait_ec = wait_fd(fd, POLLOUT, timeout); wait_ec) {
            ec = wait_ec;
            close_fd(fd);
            fd = -1;
            continue;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
            ec = std::error_code(so_error != 0 ? so_error : errno, std::system_category());
            close_fd(fd);
            fd = -1;
            continue;
        }

        ec.clear();
        break;
    }

    ::freeaddrinfo(result);

    if (fd >= 0) {
        // Small request/response commands, avoid Nagle delays
        (void)set_nodelay(fd);
    }
    return fd;
}

std::error_code send_all(int fd, std::string_view data, std::chrono::milliseconds timeout) {
    size_t offset = 0;
    while (offset < data.size()) {
        if (auto ec = wait_fd(fd, POLLOUT, timeout); ec) {
            return ec;
        }

        ssize_t n = ::send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            return std::error_code(errno, std::system_category());
        }
        offset += static_cast<size_t>(n);
    }
    return {};
}

std::error_code recv_some(int fd, std::string& out, size_t max_bytes,
                          std::chrono::milliseconds timeout) {
    if (auto ec = wait_fd(fd, POLLIN, timeout); ec) {
        return ec;
    }

    char buffer[4096];
    ssize_t n;
    do {
        n = ::recv(fd, buffer, sizeof(buffer), 0);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        return std::error_code(errno, std::system_category());
    }
    if (n == 0) {
        return std::make_error_code(std::errc::connection_reset);
    }
    if (out.size() + static_cast<size_t>(n) > max_bytes) {
        return std::make_error_code(std::errc::message_size);
    }

    out.append(buffer, static_cast<size_t>(n));
    return {};
}

std::error_code set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return std::error_code(errno, std::system_category());
    }

    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return std::error_code(errno, std::system_category());
    }

    return {};
}

std::error_code set_nodelay(int fd) {
    int opt = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0) {
        return std::error_code(errno, std::system_category());
    }
    return {};
}

void close_fd(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

}  // namespace conduit::core
