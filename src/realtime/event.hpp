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

// Wren Server Events - Header
// Outbound event values, pull-based event sources and the EventStream marker

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../templating/renderer.hpp"
#include "cancel.hpp"

namespace wren::realtime {

/// A single push-protocol event
struct ServerEvent {
    std::string data;
    std::optional<std::string> event;  // "event:" line
    std::optional<std::string> id;     // "id:" line
    std::optional<int64_t> retry;      // "retry:" line (milliseconds)

    /// Wire format: optional event/id/retry lines, one "data:" line per
    /// payload line, then a blank line
    [[nodiscard]] std::string encode() const;
};

/// Anything an event source may yield: a complete event, text, JSON data,
/// or a template fragment rendered at send time
using EventItem = std::variant<ServerEvent, std::string, nlohmann::json, templating::Fragment>;

/// Lazy, possibly infinite event sequence.
///
/// next() blocks until an item is available. It returns std::nullopt when the
/// sequence is exhausted and throws core::OperationCancelled once the token is
/// cancelled. Any other exception is a producer failure.
class EventSource {
public:
    virtual ~EventSource() = default;

    [[nodiscard]] virtual std::optional<EventItem> next(CancelToken& cancel) = 0;
};

/// Event source backed by a generator function.
/// Generators should sleep with cancel.wait_for() so a disconnect interrupts them.
class GeneratorSource : public EventSource {
public:
    using Generator = std::function<std::optional<EventItem>(CancelToken&)>;

    explicit GeneratorSource(Generator generator) : generator_(std::move(generator)) {}

    std::optional<EventItem> next(CancelToken& cancel) override;

private:
    Generator generator_;
};

/// Thread-safe queue other threads publish into (chat rooms, dashboards)
class EventChannel : public EventSource {
public:
    EventChannel() = default;

    // Non-copyable, non-movable (shared between publisher and stream)
    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    /// Queue an item; returns false once the channel is closed
    bool publish(EventItem item);

    /// Close the channel; the stream ends after queued items are drained
    void close();

    [[nodiscard]] bool closed() const;

    std::optional<EventItem> next(CancelToken& cancel) override;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<EventItem> queue_;
    bool closed_ = false;
};

/// Push-stream marker returned by handlers
struct EventStream {
    std::shared_ptr<EventSource> source;
    std::optional<std::string> event_type;  // Event name for text and JSON items
    std::optional<std::chrono::milliseconds> heartbeat_interval;  // Unset: app default

    /// Stream driven by a generator function
    [[nodiscard]] static EventStream from_generator(GeneratorSource::Generator generator);

    /// Stream of a fixed list of items
    [[nodiscard]] static EventStream from_items(std::vector<EventItem> items);

    /// Stream fed through a channel
    [[nodiscard]] static EventStream from_channel(std::shared_ptr<EventChannel> channel);

    EventStream& with_event_type(std::string type) {
        event_type = std::move(type);
        return *this;
    }

    /// Idle interval between heartbeat comments.
    /// Throws core::ConfigurationError unless positive.
    EventStream& with_heartbeat(std::chrono::milliseconds interval);
};

/// Frame one item. Text and JSON use default_event as the event name;
/// fragments render through renderer and use their target (or "fragment").
/// Throws on render failure or when a fragment arrives without a renderer.
[[nodiscard]] std::string format_event(const EventItem& item,
                                       const std::optional<std::string>& default_event,
                                       const templating::TemplateRenderer* renderer);

/// Idle keep-alive comment frame
inline constexpr std::string_view kHeartbeatFrame = ": heartbeat\n\n";

}  // namespace wren::realtime
