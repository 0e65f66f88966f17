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

// Wren Socket Transport - Header
// HTTP/1.1 transport over a connected socket (one request per connection)

#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "../http/parser.hpp"
#include "../http/transport.hpp"
#include "socket.hpp"

namespace wren::core {

/// Outcome of reading the request head
enum class HeadStatus : uint8_t {
    Ready,     // info() is populated
    Closed,    // Peer closed before a complete head
    Invalid,   // Malformed or oversized head
    TimedOut   // No complete head within the timeout
};

/// Transport over one accepted connection (the caller owns the socket).
///
/// Buffered responses (content-length set by the sender) are written as is;
/// anything else uses chunked transfer encoding on HTTP/1.1 and a
/// close-delimited body on HTTP/1.0. Every response carries
/// "connection: close".
class SocketTransport : public http::Transport {
public:
    SocketTransport(int fd, size_t recv_buffer_size, size_t max_header_size);
    ~SocketTransport() override = default;

    // Non-copyable, non-movable
    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    /// Read and parse the request line and headers
    [[nodiscard]] HeadStatus read_head(std::chrono::milliseconds timeout);

    /// Parser error after HeadStatus::Invalid
    [[nodiscard]] std::string_view head_error() const noexcept { return parser_.error_message(); }

    /// Plain-text response for requests that never reach the dispatcher
    void send_error(http::StatusCode status, std::string_view message);

    [[nodiscard]] const http::ConnectionInfo& info() const noexcept override { return info_; }

    [[nodiscard]] std::optional<http::InboundMessage> receive(
        std::chrono::milliseconds timeout) override;

    void send_start(http::StatusCode status, const http::HeaderList& headers) override;
    void send_body(std::string_view chunk, bool more_body) override;

    [[nodiscard]] int fd() const noexcept { return fd_; }

private:
    /// Pull bytes from the socket into the parser; false on timeout.
    /// Sets peer_closed_ on EOF or a socket error.
    bool read_more(std::chrono::milliseconds timeout);

    void write(std::string_view data);

    int fd_;
    http::RequestParser parser_;
    std::string buffer_;
    http::ConnectionInfo info_;

    // Reader side
    std::mutex recv_mutex_;
    bool body_done_ = false;
    bool peer_closed_ = false;

    // Writer side
    std::mutex send_mutex_;
    bool chunked_ = false;
    bool body_allowed_ = true;
};

}  // namespace wren::core
