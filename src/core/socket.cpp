/*
 * Copyright 2025 Wren Contributors
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

// Wren Socket Utilities - Implementation

#include "socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>

namespace wren::core {

namespace {

std::error_code last_error() noexcept {
    return std::error_code(errno, std::system_category());
}

Endpoint to_endpoint(const sockaddr_in& addr) {
    char host[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &addr.sin_addr, host, sizeof(host));
    return Endpoint{host, ntohs(addr.sin_port)};
}

}  // namespace

void FileDescriptor::reset(int fd) noexcept {
    if (fd_ >= 0 && fd_ != fd) {
        close_fd(fd_);
    }
    fd_ = fd;
}

FileDescriptor create_listening_socket(std::string_view address, uint16_t port, int backlog,
                                       std::error_code& ec) {
    ec.clear();
    FileDescriptor fd(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd.valid()) {
        ec = last_error();
        return {};
    }

    // Allows binding to the same address immediately after restart
    if (ec = set_reuseaddr(fd.get()); ec) {
        return {};
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    std::string addr_str{address};
    if (inet_pton(AF_INET, addr_str.c_str(), &addr.sin_addr) <= 0) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return {};
    }

    if (bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ec = last_error();
        return {};
    }

    if (listen(fd.get(), backlog) < 0) {
        ec = last_error();
        return {};
    }

    return fd;
}

FileDescriptor accept_connection(int listen_fd, std::error_code& ec) noexcept {
    ec.clear();
    while (true) {
        int fd = accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (fd >= 0) {
            return FileDescriptor(fd);
        }
        if (errno == EINTR) {
            continue;
        }
        ec = last_error();
        return {};
    }
}

bool wait_readable(int fd, std::chrono::milliseconds timeout, std::error_code& ec) noexcept {
    ec.clear();
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;

    while (true) {
        int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            ec = last_error();
            return false;
        }
        // Hang-up and errors count as readable: the next recv reports them
        return ready > 0;
    }
}

size_t recv_some(int fd, char* buffer, size_t size, std::error_code& ec) noexcept {
    ec.clear();
    while (true) {
        ssize_t n = recv(fd, buffer, size, 0);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        ec = last_error();
        return 0;
    }
}

std::error_code send_all(int fd, std::string_view data) noexcept {
    while (!data.empty()) {
        ssize_t n = send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return last_error();
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return {};
}

std::error_code set_nodelay(int fd) {
    int opt = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0) {
        return last_error();
    }
    return {};
}

std::error_code set_reuseaddr(int fd) {
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return last_error();
    }
    return {};
}

void shutdown_fd(int fd) noexcept {
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

Endpoint local_endpoint(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return {};
    }
    return to_endpoint(addr);
}

Endpoint peer_endpoint(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return {};
    }
    return to_endpoint(addr);
}

void close_fd(int fd) noexcept {
    if (fd >= 0) {
        close(fd);
    }
}

}  // namespace wren::core
