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

// Wren Response - Header
// The three response variants: buffered, streaming and push-stream

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "../realtime/event.hpp"
#include "http.hpp"

namespace wren::http {

inline constexpr std::string_view kHtmlContentType = "text/html; charset=utf-8";
inline constexpr std::string_view kTextContentType = "text/plain; charset=utf-8";
inline constexpr std::string_view kJsonContentType = "application/json; charset=utf-8";
inline constexpr std::string_view kBinaryContentType = "application/octet-stream";
inline constexpr std::string_view kEventStreamContentType = "text/event-stream";

/// Buffered response: complete body known up front.
/// with_* return modified copies; a Response value is never changed in place.
struct Response {
    StatusCode status = StatusCode::OK;
    HeaderList headers;
    std::string body;
    std::string content_type = std::string(kHtmlContentType);

    [[nodiscard]] Response with_status(StatusCode code) const;
    [[nodiscard]] Response with_header(std::string name, std::string value) const;
    [[nodiscard]] Response with_headers(const HeaderList& extra) const;
    [[nodiscard]] Response with_content_type(std::string type) const;

    /// First header value by name (case-insensitive)
    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const noexcept;
};

/// Streaming response: body chunks pulled lazily while sending
struct StreamingResponse {
    StatusCode status = StatusCode::OK;
    HeaderList headers;
    ChunkSource chunks;
    std::string content_type = std::string(kHtmlContentType);

    [[nodiscard]] StreamingResponse with_status(StatusCode code) const;
    [[nodiscard]] StreamingResponse with_header(std::string name, std::string value) const;
    [[nodiscard]] StreamingResponse with_headers(const HeaderList& extra) const;
    [[nodiscard]] StreamingResponse with_content_type(std::string type) const;

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const noexcept;
};

/// Push-stream response. Status and headers are fixed by the push protocol,
/// so every with_* returns an unchanged copy.
struct PushStreamResponse {
    realtime::EventStream stream;

    [[nodiscard]] PushStreamResponse with_status(StatusCode) const { return *this; }
    [[nodiscard]] PushStreamResponse with_header(std::string, std::string) const { return *this; }
    [[nodiscard]] PushStreamResponse with_headers(const HeaderList&) const { return *this; }
    [[nodiscard]] PushStreamResponse with_content_type(std::string) const { return *this; }

    [[nodiscard]] std::optional<std::string_view> header(std::string_view) const noexcept {
        return std::nullopt;
    }
};

/// Exactly one of the three variants is produced per request
using AnyResponse = std::variant<Response, StreamingResponse, PushStreamResponse>;

// Variant helpers (dispatch to the matching alternative)

[[nodiscard]] StatusCode status_of(const AnyResponse& response) noexcept;
[[nodiscard]] std::string_view content_type_of(const AnyResponse& response) noexcept;
[[nodiscard]] std::optional<std::string_view> header_of(const AnyResponse& response,
                                                        std::string_view name) noexcept;
[[nodiscard]] AnyResponse with_status(const AnyResponse& response, StatusCode code);
[[nodiscard]] AnyResponse with_header(const AnyResponse& response, std::string name,
                                      std::string value);
[[nodiscard]] AnyResponse with_headers(const AnyResponse& response, const HeaderList& extra);

}  // namespace wren::http
