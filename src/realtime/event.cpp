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

// Wren Server Events - Implementation

#include "event.hpp"

#include <fmt/format.h>

#include "../core/errors.hpp"
#include "../core/string_utils.hpp"

namespace wren::realtime {

// ServerEvent

std::string ServerEvent::encode() const {
    std::string out;
    out.reserve(data.size() + 32);

    if (event && !event->empty()) {
        out += fmt::format("event: {}\n", *event);
    }
    if (id && !id->empty()) {
        out += fmt::format("id: {}\n", *id);
    }
    if (retry) {
        out += fmt::format("retry: {}\n", *retry);
    }
    for (auto line : core::split_lines(data)) {
        out += "data: ";
        out += line;
        out += '\n';
    }
    out += '\n';
    return out;
}

// GeneratorSource

std::optional<EventItem> GeneratorSource::next(CancelToken& cancel) {
    cancel.throw_if_cancelled();
    return generator_(cancel);
}

// EventChannel

bool EventChannel::publish(EventItem item) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
}

void EventChannel::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventChannel::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

std::optional<EventItem> EventChannel::next(CancelToken& cancel) {
    auto registration = cancel.on_cancel([this] {
        std::lock_guard lock(mutex_);
        cv_.notify_all();
    });

    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return cancel.cancelled() || !queue_.empty() || closed_; });

    cancel.throw_if_cancelled();
    if (queue_.empty()) {
        return std::nullopt;
    }

    EventItem item = std::move(queue_.front());
    queue_.pop_front();
    return item;
}

// EventStream

EventStream EventStream::from_generator(GeneratorSource::Generator generator) {
    EventStream stream;
    stream.source = std::make_shared<GeneratorSource>(std::move(generator));
    return stream;
}

EventStream EventStream::from_items(std::vector<EventItem> items) {
    auto remaining = std::make_shared<std::deque<EventItem>>(std::make_move_iterator(items.begin()),
                                                             std::make_move_iterator(items.end()));
    return from_generator([remaining](CancelToken&) -> std::optional<EventItem> {
        if (remaining->empty()) {
            return std::nullopt;
        }
        EventItem item = std::move(remaining->front());
        remaining->pop_front();
        return item;
    });
}

EventStream& EventStream::with_heartbeat(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        throw core::ConfigurationError(
            fmt::format("Heartbeat interval must be positive, got {}ms", interval.count()));
    }
    heartbeat_interval = interval;
    return *this;
}

EventStream EventStream::from_channel(std::shared_ptr<EventChannel> channel) {
    EventStream stream;
    stream.source = std::move(channel);
    return stream;
}

// Formatting

std::string format_event(const EventItem& item, const std::optional<std::string>& default_event,
                         const templating::TemplateRenderer* renderer) {
    if (const auto* event = std::get_if<ServerEvent>(&item)) {
        return event->encode();
    }

    if (const auto* text = std::get_if<std::string>(&item)) {
        return ServerEvent{*text, default_event, std::nullopt, std::nullopt}.encode();
    }

    if (const auto* data = std::get_if<nlohmann::json>(&item)) {
        return ServerEvent{data->dump(), default_event, std::nullopt, std::nullopt}.encode();
    }

    const auto& fragment = std::get<templating::Fragment>(item);
    if (!renderer) {
        throw core::WrenError(fmt::format(
            "Cannot render fragment '{}' of '{}': no template renderer is configured",
            fragment.block, fragment.template_name));
    }
    std::string html = renderer->render_block(fragment.template_name, fragment.block,
                                              fragment.context);
    return ServerEvent{std::move(html), fragment.target.value_or("fragment"), std::nullopt,
                       std::nullopt}
        .encode();
}

}  // namespace wren::realtime
