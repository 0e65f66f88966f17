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

// Wren Test Client - Header
// In-memory transport and a client that drives an App without sockets

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../http/http.hpp"
#include "../http/transport.hpp"

namespace wren::server {
class App;
}

namespace wren::testing {

/// One message the application sent
struct SentMessage {
    enum class Kind : uint8_t { Start, Body };

    Kind kind = Kind::Body;
    http::StatusCode status = http::StatusCode::OK;  // Start only
    http::HeaderList headers;                         // Start only
    std::string body;                                 // Body only
    bool more_body = false;                           // Body only
};

/// Transport that feeds a scripted request and records the response.
///
/// The request body is delivered in the given chunks. Once it is consumed,
/// receive() waits for disconnect() (or the timeout). After disconnect()
/// every send throws core::TransportClosed and is not recorded.
class MemoryTransport : public http::Transport {
public:
    using SendHook = std::function<void(MemoryTransport&, const SentMessage&)>;

    explicit MemoryTransport(http::ConnectionInfo info, std::vector<std::string> body_chunks = {});

    /// Connection info for "METHOD target" (path percent-decoded)
    [[nodiscard]] static http::ConnectionInfo make_info(http::Method method,
                                                        std::string_view target,
                                                        http::HeaderList headers = {});

    [[nodiscard]] const http::ConnectionInfo& info() const noexcept override { return info_; }

    [[nodiscard]] std::optional<http::InboundMessage> receive(
        std::chrono::milliseconds timeout) override;

    void send_start(http::StatusCode status, const http::HeaderList& headers) override;
    void send_body(std::string_view chunk, bool more_body) override;

    /// Simulate the client going away
    void disconnect();

    /// Called after each recorded message, outside the lock
    void on_send(SendHook hook) { hook_ = std::move(hook); }

    [[nodiscard]] bool disconnected() const;
    [[nodiscard]] std::vector<SentMessage> messages() const;

    /// Status of the start message, or std::nullopt before it
    [[nodiscard]] std::optional<http::StatusCode> status() const;
    [[nodiscard]] http::HeaderList headers() const;

    /// Body messages concatenated
    [[nodiscard]] std::string body() const;

    [[nodiscard]] size_t body_message_count() const;
    [[nodiscard]] bool finished() const;

private:
    http::ConnectionInfo info_;
    std::deque<std::string> body_chunks_;
    bool body_done_ = false;
    SendHook hook_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool disconnected_ = false;
    std::vector<SentMessage> messages_;
};

/// Response as observed by the test client
struct TestResponse {
    http::StatusCode status = http::StatusCode::InternalServerError;
    http::HeaderList headers;
    std::string body;
    size_t body_messages = 0;
    bool finished = false;

    [[nodiscard]] int status_code() const noexcept { return http::to_int(status); }

    /// First header with this name (case-insensitive)
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;

    /// Number of headers with this name
    [[nodiscard]] size_t header_count(std::string_view name) const;

    [[nodiscard]] nlohmann::json json() const { return nlohmann::json::parse(body); }
};

/// Runs requests through App::handle() on the calling thread
class TestClient {
public:
    explicit TestClient(server::App& app) : app_(app) {}

    TestResponse request(http::Method method, std::string_view target,
                         http::HeaderList headers = {}, std::string body = {});

    TestResponse get(std::string_view target, http::HeaderList headers = {}) {
        return request(http::Method::GET, target, std::move(headers));
    }

    TestResponse post(std::string_view target, std::string body, http::HeaderList headers = {}) {
        return request(http::Method::POST, target, std::move(headers), std::move(body));
    }

    /// Handle a caller-prepared transport and collect what it recorded
    TestResponse send(MemoryTransport& transport);

private:
    server::App& app_;
};

}  // namespace wren::testing
