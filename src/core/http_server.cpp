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

// Wren HTTP Server - Implementation

#include "http_server.hpp"

#include <memory>
#include <thread>

#include "logging.hpp"
#include "socket_transport.hpp"

namespace wren::core {

namespace {

/// Owns a connection socket and keeps it registered while it is open.
/// The fd is closed only after it left the set, so drain() never shuts
/// down a reused descriptor.
class ConnectionSlot {
public:
    ConnectionSlot(std::mutex& mutex, std::condition_variable& cv, fast_set<int>& connections,
                   FileDescriptor fd)
        : mutex_(mutex), cv_(cv), connections_(connections), fd_(std::move(fd)) {
        std::lock_guard lock(mutex_);
        connections_.insert(fd_.get());
    }

    ~ConnectionSlot() {
        // Notify under the lock: the server may be destroyed once drain() wakes
        std::lock_guard lock(mutex_);
        connections_.erase(fd_.get());
        cv_.notify_all();
    }

    ConnectionSlot(const ConnectionSlot&) = delete;
    ConnectionSlot& operator=(const ConnectionSlot&) = delete;

    [[nodiscard]] int fd() const noexcept { return fd_.get(); }

private:
    std::mutex& mutex_;
    std::condition_variable& cv_;
    fast_set<int>& connections_;
    FileDescriptor fd_;
};

}  // namespace

HttpServer::HttpServer(control::ServerConfig config, ConnectionHandler handler)
    : config_(std::move(config)), handler_(std::move(handler)) {}

HttpServer::~HttpServer() {
    stop();
    drain();
}

std::error_code HttpServer::start() {
    std::error_code ec;
    listen_fd_ = create_listening_socket(config_.listen_address, config_.listen_port,
                                         static_cast<int>(config_.backlog), ec);
    if (ec) {
        return ec;
    }

    port_ = local_endpoint(listen_fd_.get()).port;
    running_.store(true, std::memory_order_release);
    return {};
}

size_t HttpServer::active_connections() const {
    std::lock_guard lock(connections_mutex_);
    return connections_.size();
}

void HttpServer::run() {
    auto* logger = logging::get_current_logger();

    if (logger) {
        LOG_INFO(logger, "Accepting connections on {}:{}", config_.listen_address, port_);
    }

    while (running()) {
        std::error_code ec;
        if (!wait_readable(listen_fd_.get(), kAcceptPollInterval, ec)) {
            if (ec && logger) {
                LOG_ERROR(logger, "Listening socket poll failed: {}", ec.message());
            }
            continue;
        }

        FileDescriptor client = accept_connection(listen_fd_.get(), ec);
        if (ec) {
            if (logger) {
                LOG_WARNING(logger, "accept() failed: {}", ec.message());
            }
            continue;
        }

        if (auto nodelay_ec = set_nodelay(client.get()); nodelay_ec && logger) {
            LOG_DEBUG(logger, "TCP_NODELAY not set: {}", nodelay_ec.message());
        }

        // Registered before the thread starts so drain() never misses it
        auto slot = std::make_unique<ConnectionSlot>(connections_mutex_, connections_cv_,
                                                     connections_, std::move(client));
        std::thread([this, slot = std::move(slot), logger]() {
            serve_connection(slot->fd(), logger);
        }).detach();
    }

    listen_fd_.reset();
    drain();

    if (logger) {
        LOG_INFO(logger, "Server stopped");
    }
}

void HttpServer::drain() {
    std::unique_lock lock(connections_mutex_);
    if (connections_.empty()) {
        return;
    }

    if (auto* logger = logging::get_current_logger()) {
        LOG_INFO(logger, "Draining {} active connections", connections_.size());
    }

    // Shutting the sockets down fails pending reads, which cancels push streams
    for (int fd : connections_) {
        shutdown_fd(fd);
    }
    connections_cv_.wait(lock, [this] { return connections_.empty(); });
}

void HttpServer::serve_connection(int fd, quill::Logger* logger) {
    logging::set_current_logger(logger);

    SocketTransport transport(fd, config_.recv_buffer_size, config_.max_header_size);

    try {
        switch (transport.read_head(std::chrono::milliseconds(config_.header_timeout_ms))) {
            case HeadStatus::Ready:
                handler_(transport);
                break;
            case HeadStatus::Invalid:
                if (logger) {
                    LOG_WARNING(logger, "Rejecting malformed request from {}:{}: {}",
                                transport.info().client_host, transport.info().client_port,
                                transport.head_error());
                }
                transport.send_error(http::StatusCode::BadRequest, "Bad Request");
                break;
            case HeadStatus::TimedOut:
                transport.send_error(http::StatusCode::RequestTimeout, "Request Timeout");
                break;
            case HeadStatus::Closed:
                break;
        }
    } catch (const TransportClosed& e) {
        if (logger) {
            LOG_DEBUG(logger, "Connection closed early: {}", e.what());
        }
    } catch (const std::exception& e) {
        if (logger) {
            LOG_ERROR(logger, "Connection handler failed: {}", e.what());
        }
    }

    logging::set_current_logger(nullptr);
}

}  // namespace wren::core
