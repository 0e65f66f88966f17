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

// Wren Response Sender - Header
// Translates response variants into transport start/body messages

#pragma once

#include "../http/response.hpp"
#include "../http/transport.hpp"
#include "../realtime/push_engine.hpp"

namespace wren::server {

/// Buffered response: one start message (content-type, lower-cased headers,
/// content-length) and one final body message
void send_buffered(http::Transport& transport, const http::Response& response);

/// Streaming response: start without content-length, one body message per
/// non-empty chunk, then the final empty message. A chunk source failure
/// mid-stream writes an HTML comment marker (with the error in debug mode)
/// before closing. Transport failures propagate.
void send_streaming(http::Transport& transport, const http::StreamingResponse& response,
                    bool debug);

/// Send any response variant; push streams run the PushEngine to completion
void send_response(http::Transport& transport, const http::AnyResponse& response,
                   const realtime::PushConfig& push);

/// Wire header list for a buffered or streaming response
[[nodiscard]] http::HeaderList wire_headers(std::string_view content_type,
                                            const http::HeaderList& headers);

}  // namespace wren::server
