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

// Wren Response Sender - Implementation

#include "sender.hpp"

#include <fmt/format.h>

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace wren::server {

http::HeaderList wire_headers(std::string_view content_type, const http::HeaderList& headers) {
    http::HeaderList wire;
    wire.reserve(headers.size() + 2);

    bool has_content_type = false;
    for (const auto& [name, value] : headers) {
        if (http::header_name_equals(name, "content-type")) {
            has_content_type = true;
        }
    }
    if (!has_content_type) {
        wire.emplace_back("content-type", std::string(content_type));
    }

    for (const auto& [name, value] : headers) {
        // Framing headers are owned by the sender
        if (http::header_name_equals(name, "content-length") ||
            http::header_name_equals(name, "transfer-encoding")) {
            continue;
        }
        wire.emplace_back(http::to_lower(name), value);
    }
    return wire;
}

void send_buffered(http::Transport& transport, const http::Response& response) {
    http::HeaderList headers = wire_headers(response.content_type, response.headers);
    headers.emplace_back("content-length", std::to_string(response.body.size()));

    transport.send_start(response.status, headers);
    transport.send_body(response.body, false);
}

void send_streaming(http::Transport& transport, const http::StreamingResponse& response,
                    bool debug) {
    transport.send_start(response.status, wire_headers(response.content_type, response.headers));

    try {
        if (response.chunks) {
            while (auto chunk = response.chunks()) {
                if (!chunk->empty()) {
                    transport.send_body(*chunk, true);
                }
            }
        }
    } catch (const core::TransportClosed&) {
        throw;
    } catch (const std::exception& e) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR(logger, "Streaming response failed mid-stream: path={}, error={}",
                      transport.info().path, e.what());
        }
        std::string marker = debug ? fmt::format("<!-- wren: render error\n{}\n-->", e.what())
                                   : std::string("<!-- wren: render error -->");
        transport.send_body(marker, true);
    } catch (...) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR(logger, "Streaming response failed mid-stream: path={}, error=unknown exception",
                      transport.info().path);
        }
        transport.send_body("<!-- wren: render error -->", true);
    }

    transport.send_body("", false);
}

void send_response(http::Transport& transport, const http::AnyResponse& response,
                   const realtime::PushConfig& push) {
    if (const auto* buffered = std::get_if<http::Response>(&response)) {
        send_buffered(transport, *buffered);
    } else if (const auto* streaming = std::get_if<http::StreamingResponse>(&response)) {
        send_streaming(transport, *streaming, push.debug);
    } else {
        const auto& pushed = std::get<http::PushStreamResponse>(response);
        realtime::PushEngine engine(transport, push);
        engine.run(pushed.stream);
    }
}

}  // namespace wren::server
