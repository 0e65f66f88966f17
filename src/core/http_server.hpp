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

// Wren HTTP Server - Header
// Blocking accept loop with one thread per connection

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <system_error>

#include "../control/config.hpp"
#include "../http/transport.hpp"
#include "containers.hpp"
#include "socket.hpp"

namespace quill {
class Logger;
}

namespace wren::core {

/// Called on the connection thread once the request head is parsed
using ConnectionHandler = std::function<void(http::Transport&)>;

/// HTTP/1.1 server.
///
/// run() blocks the calling thread in the accept loop until stop(). Each
/// accepted connection gets its own thread, which adopts the logger that
/// was current on the thread calling run().
class HttpServer {
public:
    HttpServer(control::ServerConfig config, ConnectionHandler handler);
    ~HttpServer();

    // Non-copyable, non-movable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind and listen
    [[nodiscard]] std::error_code start();

    /// Accept loop; returns after stop() once every connection has finished
    void run();

    /// Request shutdown (async-signal-safe)
    void stop() noexcept { running_.store(false, std::memory_order_release); }

    [[nodiscard]] bool running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    /// Bound port (differs from the configured one when that is 0)
    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    [[nodiscard]] size_t active_connections() const;

    /// How often the accept loop checks for stop()
    static constexpr std::chrono::milliseconds kAcceptPollInterval{100};

private:
    void serve_connection(int fd, quill::Logger* logger);
    void drain();

    control::ServerConfig config_;
    ConnectionHandler handler_;

    FileDescriptor listen_fd_;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};

    mutable std::mutex connections_mutex_;
    std::condition_variable connections_cv_;
    fast_set<int> connections_;
};

}  // namespace wren::core
