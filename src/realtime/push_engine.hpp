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

// Wren Push Engine - Header
// Server-sent event streaming with heartbeats and disconnect detection

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "../http/transport.hpp"
#include "../templating/renderer.hpp"
#include "cancel.hpp"
#include "event.hpp"

namespace wren::realtime {

/// Push stream settings (app-wide defaults)
struct PushConfig {
    std::chrono::milliseconds heartbeat_interval{15000};  // Overridden per stream when set
    std::optional<int64_t> retry_ms;                       // Sent as a meta event on open
    std::optional<std::string> close_event;                // Sent before a clean close
    bool debug = false;
    const templating::TemplateRenderer* renderer = nullptr;  // For fragment items
};

/// Engine lifecycle
enum class PushState : uint8_t {
    Opening,    // Sending headers and the retry meta event
    Streaming,  // Pulling, framing and flushing events; heartbeats on idle
    Closing,    // Producer and monitor cancelled and joined
    Closed      // Terminating body message sent
};

/// Why the stream ended
enum class CloseReason : uint8_t {
    Exhausted,      // Source returned no more items
    Disconnected,   // Peer went away
    ProducerError,  // Source threw; an error event was written
    TransportError  // A write failed
};

[[nodiscard]] std::string_view to_string(PushState state) noexcept;
[[nodiscard]] std::string_view to_string(CloseReason reason) noexcept;

/// Outcome of one push stream
struct PushResult {
    CloseReason reason = CloseReason::Exhausted;
    size_t events_sent = 0;
    size_t heartbeats_sent = 0;
    size_t format_errors = 0;  // Items that failed to render
};

/// Runs one push stream over a transport.
///
/// The calling thread writes. A producer thread pulls from the event source
/// into a single-slot mailbox and a monitor thread watches the transport for
/// a disconnect. Whichever ends the stream first wins; the other is cancelled
/// through the shared CancelToken and both are joined before the closing
/// frames are written, so no frame is emitted after close began.
class PushEngine {
public:
    PushEngine(http::Transport& transport, PushConfig config)
        : transport_(transport), config_(std::move(config)) {}

    // Non-copyable, non-movable (threads reference members)
    PushEngine(const PushEngine&) = delete;
    PushEngine& operator=(const PushEngine&) = delete;

    /// Stream until exhaustion, disconnect or failure. Sends the response
    /// start and the terminating body message exactly once. Write failures
    /// end the stream; they are reported in the result, not thrown.
    PushResult run(const EventStream& stream);

    [[nodiscard]] PushState state() const noexcept { return state_.load(std::memory_order_acquire); }

    /// Response headers of every push stream
    [[nodiscard]] static http::HeaderList protocol_headers();

    /// Receive slice used by the disconnect monitor
    static constexpr std::chrono::milliseconds kMonitorPollInterval{50};

private:
    /// Producer-to-writer message
    struct Message {
        enum class Kind : uint8_t { Item, End, Error };

        Kind kind = Kind::End;
        std::optional<EventItem> item;
        std::string error;
    };

    void produce(EventSource& source);
    void monitor();

    /// Blocks until the slot is free; false once cancelled
    bool post(Message message);

    void send_frame(std::string_view frame) { transport_.send_body(frame, true); }
    void close(PushResult& result);

    http::Transport& transport_;
    PushConfig config_;
    std::atomic<PushState> state_{PushState::Opening};

    CancelToken cancel_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<Message> slot_;
    bool disconnected_ = false;
};

}  // namespace wren::realtime
