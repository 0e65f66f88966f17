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

// Wren Socket Transport - Implementation

#include "socket_transport.hpp"

#include <fmt/format.h>

#include <algorithm>

#include "errors.hpp"

namespace wren::core {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds remaining_until(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return std::max(left, std::chrono::milliseconds{0});
}

bool status_allows_body(http::StatusCode status) noexcept {
    int code = http::to_int(status);
    return code >= 200 && code != 204 && code != 304;
}

}  // namespace

SocketTransport::SocketTransport(int fd, size_t recv_buffer_size, size_t max_header_size)
    : fd_(fd),
      parser_(max_header_size),
      buffer_(std::max<size_t>(recv_buffer_size, 512), '\0') {
    Endpoint peer = peer_endpoint(fd_);
    Endpoint local = local_endpoint(fd_);
    info_.client_host = std::move(peer.host);
    info_.client_port = peer.port;
    info_.server_host = std::move(local.host);
    info_.server_port = local.port;
}

bool SocketTransport::read_more(std::chrono::milliseconds timeout) {
    std::error_code ec;
    if (!wait_readable(fd_, timeout, ec)) {
        if (ec) {
            peer_closed_ = true;
            return true;
        }
        return false;
    }

    size_t n = recv_some(fd_, buffer_.data(), buffer_.size(), ec);
    if (ec || n == 0) {
        peer_closed_ = true;
        return true;
    }

    // Bytes after the request are not served (one request per connection)
    if (!parser_.message_complete()) {
        (void)parser_.feed(std::string_view(buffer_.data(), n));
    }
    return true;
}

HeadStatus SocketTransport::read_head(std::chrono::milliseconds timeout) {
    std::lock_guard lock(recv_mutex_);
    auto deadline = Clock::now() + timeout;

    while (!parser_.headers_complete()) {
        if (!read_more(remaining_until(deadline))) {
            return HeadStatus::TimedOut;
        }
        if (parser_.failed()) {
            return HeadStatus::Invalid;
        }
        if (peer_closed_ && !parser_.headers_complete()) {
            return HeadStatus::Closed;
        }
    }

    const http::RequestHead& head = parser_.head();
    info_.method = head.method;
    info_.path = http::url_decode(head.path);
    info_.query_string = head.query;
    info_.headers = head.headers;
    info_.http_version = head.version;
    return HeadStatus::Ready;
}

std::optional<http::InboundMessage> SocketTransport::receive(std::chrono::milliseconds timeout) {
    std::lock_guard lock(recv_mutex_);
    auto deadline = Clock::now() + timeout;

    while (true) {
        if (!body_done_ && (parser_.has_body() || parser_.message_complete())) {
            http::InboundMessage message;
            message.body = parser_.take_body();
            message.more_body = !parser_.message_complete();
            body_done_ = !message.more_body;
            return message;
        }

        if (peer_closed_) {
            http::InboundMessage message;
            message.type = http::InboundMessage::Type::Disconnect;
            return message;
        }

        if (!read_more(remaining_until(deadline))) {
            return std::nullopt;
        }

        if (parser_.failed()) {
            throw HTTPError(http::StatusCode::BadRequest,
                            fmt::format("Malformed request body: {}", parser_.error_message()));
        }
    }
}

void SocketTransport::write(std::string_view data) {
    if (auto ec = send_all(fd_, data); ec) {
        throw TransportClosed(fmt::format("send failed: {}", ec.message()));
    }
}

void SocketTransport::send_start(http::StatusCode status, const http::HeaderList& headers) {
    std::lock_guard lock(send_mutex_);

    bool has_length = std::any_of(headers.begin(), headers.end(), [](const auto& header) {
        return http::header_name_equals(header.first, "content-length");
    });

    body_allowed_ = status_allows_body(status) && info_.method != http::Method::HEAD;
    chunked_ = body_allowed_ && !has_length && info_.http_version == "1.1";

    std::string out = fmt::format("HTTP/1.1 {} {}\r\n", http::to_int(status),
                                  http::to_reason_phrase(status));
    for (const auto& [name, value] : headers) {
        if (http::header_name_equals(name, "connection") ||
            http::header_name_equals(name, "transfer-encoding")) {
            continue;
        }
        out += fmt::format("{}: {}\r\n", name, value);
    }
    if (chunked_) {
        out += "transfer-encoding: chunked\r\n";
    }
    out += "connection: close\r\n\r\n";

    write(out);
}

void SocketTransport::send_body(std::string_view chunk, bool more_body) {
    std::lock_guard lock(send_mutex_);
    if (!body_allowed_) {
        return;
    }

    if (!chunked_) {
        if (!chunk.empty()) {
            write(chunk);
        }
        return;
    }

    std::string out;
    if (!chunk.empty()) {
        out = fmt::format("{:x}\r\n", chunk.size());
        out.append(chunk);
        out += "\r\n";
    }
    if (!more_body) {
        out += "0\r\n\r\n";
    }
    if (!out.empty()) {
        write(out);
    }
}

void SocketTransport::send_error(http::StatusCode status, std::string_view message) {
    send_start(status, {{"content-type", "text/plain; charset=utf-8"},
                        {"content-length", std::to_string(message.size())}});
    send_body(message, false);
}

}  // namespace wren::core
