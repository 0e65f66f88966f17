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

// Wren Transport - Header
// Connection boundary: metadata, inbound messages, outbound start/body messages

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "http.hpp"

namespace wren::http {

/// Connection metadata decoded by the transport
struct ConnectionInfo {
    Method method = Method::UNKNOWN;
    std::string path;          // Percent-decoded, without query string
    std::string query_string;  // Raw, without '?'
    HeaderList headers;
    std::string http_version = "1.1";

    std::string client_host;
    uint16_t client_port = 0;
    std::string server_host;
    uint16_t server_port = 0;
};

/// Inbound message (body chunk or disconnect notification)
struct InboundMessage {
    enum class Type : uint8_t { Body, Disconnect };

    Type type = Type::Body;
    std::string body;
    bool more_body = false;

    [[nodiscard]] bool is_disconnect() const noexcept { return type == Type::Disconnect; }
};

/// One connection as seen by the dispatcher.
///
/// receive() may be called from a monitor thread while another thread sends,
/// so implementations must allow one concurrent reader and one writer.
/// Send failures throw core::TransportClosed.
class Transport {
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual const ConnectionInfo& info() const noexcept = 0;

    /// Next inbound message, or std::nullopt when nothing arrived within timeout
    [[nodiscard]] virtual std::optional<InboundMessage> receive(
        std::chrono::milliseconds timeout) = 0;

    /// Response start (status line and headers)
    virtual void send_start(StatusCode status, const HeaderList& headers) = 0;

    /// Response body chunk; more_body == false marks the final message
    virtual void send_body(std::string_view chunk, bool more_body) = 0;
};

/// Transport decorator enforcing exactly one start and one final body message.
///
/// finish() completes whatever the wrapped handling left undone: a connection
/// that never started gets a bare 500, a started one gets its final body.
class GuardedTransport : public Transport {
public:
    explicit GuardedTransport(Transport& inner) : inner_(inner) {}

    // Non-copyable, non-movable
    GuardedTransport(const GuardedTransport&) = delete;
    GuardedTransport& operator=(const GuardedTransport&) = delete;

    [[nodiscard]] const ConnectionInfo& info() const noexcept override { return inner_.info(); }

    [[nodiscard]] std::optional<InboundMessage> receive(
        std::chrono::milliseconds timeout) override {
        return inner_.receive(timeout);
    }

    /// Throws std::logic_error on a second start
    void send_start(StatusCode status, const HeaderList& headers) override;

    /// Throws std::logic_error before start; ignored after the final message
    void send_body(std::string_view chunk, bool more_body) override;

    [[nodiscard]] bool started() const noexcept { return started_; }
    [[nodiscard]] bool finished() const noexcept { return finished_; }

    /// Send whatever is missing; transport failures are logged, not thrown
    void finish() noexcept;

private:
    Transport& inner_;
    bool started_ = false;
    bool finished_ = false;
};

}  // namespace wren::http
