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

// Wren Push Engine - Implementation

#include "push_engine.hpp"

#include <fmt/format.h>

#include <thread>
#include <vector>

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace wren::realtime {

namespace {

/// Cancels and joins the stream activities on every exit path
class ActivityGuard {
public:
    explicit ActivityGuard(CancelToken& cancel) : cancel_(cancel) {}
    ~ActivityGuard() { stop(); }

    ActivityGuard(const ActivityGuard&) = delete;
    ActivityGuard& operator=(const ActivityGuard&) = delete;

    void add(std::thread thread) { threads_.push_back(std::move(thread)); }

    void stop() {
        cancel_.cancel();
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

private:
    CancelToken& cancel_;
    std::vector<std::thread> threads_;
};

std::string error_frame(std::string detail) {
    return ServerEvent{std::move(detail), "error", std::nullopt, std::nullopt}.encode();
}

}  // namespace

std::string_view to_string(PushState state) noexcept {
    switch (state) {
        case PushState::Opening:
            return "opening";
        case PushState::Streaming:
            return "streaming";
        case PushState::Closing:
            return "closing";
        case PushState::Closed:
            return "closed";
    }
    return "unknown";
}

std::string_view to_string(CloseReason reason) noexcept {
    switch (reason) {
        case CloseReason::Exhausted:
            return "exhausted";
        case CloseReason::Disconnected:
            return "disconnected";
        case CloseReason::ProducerError:
            return "producer_error";
        case CloseReason::TransportError:
            return "transport_error";
    }
    return "unknown";
}

http::HeaderList PushEngine::protocol_headers() {
    return {{"content-type", "text/event-stream"},
            {"cache-control", "no-cache"},
            {"connection", "keep-alive"},
            {"x-accel-buffering", "no"},
            {"access-control-allow-origin", "*"}};
}

PushResult PushEngine::run(const EventStream& stream) {
    if (!stream.source) {
        throw core::WrenError("EventStream has no event source");
    }

    const auto heartbeat = stream.heartbeat_interval.value_or(config_.heartbeat_interval);
    if (heartbeat.count() <= 0) {
        throw core::ConfigurationError(
            fmt::format("Heartbeat interval must be positive, got {}ms", heartbeat.count()));
    }

    PushResult result;
    auto* logger = logging::get_current_logger();

    // Opening
    state_.store(PushState::Opening, std::memory_order_release);
    try {
        transport_.send_start(http::StatusCode::OK, protocol_headers());
        if (config_.retry_ms) {
            send_frame(
                ServerEvent{"sse-retry", "wren:sse:meta", std::nullopt, config_.retry_ms}.encode());
        }
    } catch (const core::TransportClosed& e) {
        if (logger) {
            LOG_WARNING(logger, "Push stream failed to open: path={}, error={}",
                        transport_.info().path, e.what());
        }
        result.reason = CloseReason::TransportError;
        close(result);
        return result;
    }

    // Streaming
    state_.store(PushState::Streaming, std::memory_order_release);
    if (logger) {
        LOG_STREAM(logger, "opened", transport_.info().path, 0, 0);
    }

    {
        auto wake_writer = cancel_.on_cancel([this] {
            std::lock_guard lock(mutex_);
            cv_.notify_all();
        });

        ActivityGuard activities(cancel_);
        activities.add(std::thread([this, logger, source = stream.source] {
            logging::set_current_logger(logger);
            produce(*source);
        }));
        activities.add(std::thread([this, logger] {
            logging::set_current_logger(logger);
            monitor();
        }));

        try {
            while (true) {
                std::optional<Message> message;
                {
                    std::unique_lock lock(mutex_);
                    cv_.wait_for(lock, heartbeat,
                                 [this] { return slot_.has_value() || disconnected_; });
                    if (disconnected_) {
                        result.reason = CloseReason::Disconnected;
                        break;
                    }
                    if (slot_) {
                        message = std::move(slot_);
                        slot_.reset();
                    }
                }

                if (!message) {
                    send_frame(kHeartbeatFrame);
                    ++result.heartbeats_sent;
                    continue;
                }

                // Slot is free again
                cv_.notify_all();

                if (message->kind == Message::Kind::End) {
                    result.reason = CloseReason::Exhausted;
                    break;
                }

                if (message->kind == Message::Kind::Error) {
                    if (logger) {
                        LOG_ERROR(logger, "Push stream producer failed: path={}, error={}",
                                  transport_.info().path, message->error);
                    }
                    send_frame(error_frame(config_.debug ? message->error
                                                         : std::string("Internal server error")));
                    result.reason = CloseReason::ProducerError;
                    break;
                }

                // One bad item must not end the stream
                std::string frame;
                try {
                    frame = format_event(*message->item, stream.event_type, config_.renderer);
                } catch (const std::exception& e) {
                    ++result.format_errors;
                    if (logger) {
                        LOG_ERROR(logger, "Push event render failed: path={}, error={}",
                                  transport_.info().path, e.what());
                    }
                    if (config_.debug) {
                        send_frame(error_frame(e.what()));
                    }
                    continue;
                }

                send_frame(frame);
                ++result.events_sent;
            }
        } catch (const core::TransportClosed& e) {
            if (logger) {
                LOG_WARNING(logger, "Push stream write failed: path={}, error={}",
                            transport_.info().path, e.what());
            }
            result.reason = CloseReason::TransportError;
        }

        // Closing
        state_.store(PushState::Closing, std::memory_order_release);
        activities.stop();
    }

    close(result);
    return result;
}

void PushEngine::produce(EventSource& source) {
    try {
        while (true) {
            auto item = source.next(cancel_);
            if (!item) {
                post(Message{Message::Kind::End, std::nullopt, {}});
                return;
            }
            if (!post(Message{Message::Kind::Item, std::move(item), {}})) {
                return;
            }
        }
    } catch (const core::OperationCancelled&) {
        // Thrown out of a cancelled wait; a source that throws it on its own
        // just ends the stream
        if (!cancel_.cancelled()) {
            post(Message{Message::Kind::End, std::nullopt, {}});
        }
    } catch (const std::exception& e) {
        post(Message{Message::Kind::Error, std::nullopt, e.what()});
    } catch (...) {
        post(Message{Message::Kind::Error, std::nullopt, "unknown exception"});
    }
}

void PushEngine::monitor() {
    try {
        while (!cancel_.cancelled()) {
            auto message = transport_.receive(kMonitorPollInterval);
            if (message && message->is_disconnect()) {
                break;
            }
        }
    } catch (const std::exception& e) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_WARNING(logger, "Push stream receive failed, treating as disconnect: path={}, "
                        "error={}", transport_.info().path, e.what());
        }
    }

    if (cancel_.cancelled()) {
        return;
    }

    {
        std::lock_guard lock(mutex_);
        disconnected_ = true;
    }
    cv_.notify_all();

    // Wake a producer blocked in its source
    cancel_.cancel();
}

bool PushEngine::post(Message message) {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return !slot_.has_value() || cancel_.cancelled(); });
    if (cancel_.cancelled()) {
        return false;
    }
    slot_ = std::move(message);
    lock.unlock();
    cv_.notify_all();
    return true;
}

void PushEngine::close(PushResult& result) {
    auto* logger = logging::get_current_logger();
    const bool writable = result.reason == CloseReason::Exhausted ||
                          result.reason == CloseReason::ProducerError;

    try {
        if (writable && config_.close_event) {
            send_frame(
                ServerEvent{"complete", config_.close_event, std::nullopt, std::nullopt}.encode());
        }
        transport_.send_body("", false);
    } catch (const core::TransportClosed& e) {
        if (logger) {
            LOG_DEBUG(logger, "Push stream closed by peer before final message: path={}, error={}",
                      transport_.info().path, e.what());
        }
    }

    state_.store(PushState::Closed, std::memory_order_release);
    if (logger) {
        LOG_STREAM(logger, fmt::format("closed ({})", to_string(result.reason)),
                   transport_.info().path, result.events_sent, result.heartbeats_sent);
    }
}

}  // namespace wren::realtime
