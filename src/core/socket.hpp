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

// Wren Socket Utilities - Header

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace wren::core {

/// Host and port of one end of a connection
struct Endpoint {
    std::string host;
    uint16_t port = 0;
};

/// Owning file descriptor (closed on destruction)
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    // Non-copyable, movable
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept;

private:
    int fd_ = -1;
};

/// Create a blocking listening socket (SO_REUSEADDR, IPv4)
[[nodiscard]] FileDescriptor create_listening_socket(std::string_view address, uint16_t port,
                                                     int backlog, std::error_code& ec);

/// Accept one connection (blocking, close-on-exec); ec set on failure
[[nodiscard]] FileDescriptor accept_connection(int listen_fd, std::error_code& ec) noexcept;

/// Wait until fd is readable. Returns false on timeout; ec is set on failure.
[[nodiscard]] bool wait_readable(int fd, std::chrono::milliseconds timeout,
                                 std::error_code& ec) noexcept;

/// Receive up to size bytes. Returns 0 when the peer closed; ec set on failure.
[[nodiscard]] size_t recv_some(int fd, char* buffer, size_t size, std::error_code& ec) noexcept;

/// Write all of data (MSG_NOSIGNAL, retries on EINTR and short writes)
[[nodiscard]] std::error_code send_all(int fd, std::string_view data) noexcept;

[[nodiscard]] std::error_code set_nodelay(int fd);
[[nodiscard]] std::error_code set_reuseaddr(int fd);

/// Shut down both directions (wakes a thread blocked in accept or recv)
void shutdown_fd(int fd) noexcept;

[[nodiscard]] Endpoint local_endpoint(int fd);
[[nodiscard]] Endpoint peer_endpoint(int fd);

void close_fd(int fd) noexcept;

}  // namespace wren::core
