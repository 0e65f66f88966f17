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

// Wren Response - Implementation

#include "response.hpp"

namespace wren::http {

namespace {

std::optional<std::string_view> find_header(const HeaderList& headers,
                                            std::string_view name) noexcept {
    for (const auto& [key, value] : headers) {
        if (header_name_equals(key, name)) {
            return std::string_view(value);
        }
    }
    return std::nullopt;
}

}  // namespace

// Response

Response Response::with_status(StatusCode code) const {
    Response copy = *this;
    copy.status = code;
    return copy;
}

Response Response::with_header(std::string name, std::string value) const {
    Response copy = *this;
    copy.headers.emplace_back(std::move(name), std::move(value));
    return copy;
}

Response Response::with_headers(const HeaderList& extra) const {
    Response copy = *this;
    copy.headers.insert(copy.headers.end(), extra.begin(), extra.end());
    return copy;
}

Response Response::with_content_type(std::string type) const {
    Response copy = *this;
    copy.content_type = std::move(type);
    return copy;
}

std::optional<std::string_view> Response::header(std::string_view name) const noexcept {
    return find_header(headers, name);
}

// StreamingResponse

StreamingResponse StreamingResponse::with_status(StatusCode code) const {
    StreamingResponse copy = *this;
    copy.status = code;
    return copy;
}

StreamingResponse StreamingResponse::with_header(std::string name, std::string value) const {
    StreamingResponse copy = *this;
    copy.headers.emplace_back(std::move(name), std::move(value));
    return copy;
}

StreamingResponse StreamingResponse::with_headers(const HeaderList& extra) const {
    StreamingResponse copy = *this;
    copy.headers.insert(copy.headers.end(), extra.begin(), extra.end());
    return copy;
}

StreamingResponse StreamingResponse::with_content_type(std::string type) const {
    StreamingResponse copy = *this;
    copy.content_type = std::move(type);
    return copy;
}

std::optional<std::string_view> StreamingResponse::header(std::string_view name) const noexcept {
    return find_header(headers, name);
}

// Variant helpers

StatusCode status_of(const AnyResponse& response) noexcept {
    if (const auto* buffered = std::get_if<Response>(&response)) {
        return buffered->status;
    }
    if (const auto* streaming = std::get_if<StreamingResponse>(&response)) {
        return streaming->status;
    }
    return StatusCode::OK;
}

std::string_view content_type_of(const AnyResponse& response) noexcept {
    if (const auto* buffered = std::get_if<Response>(&response)) {
        return buffered->content_type;
    }
    if (const auto* streaming = std::get_if<StreamingResponse>(&response)) {
        return streaming->content_type;
    }
    return kEventStreamContentType;
}

std::optional<std::string_view> header_of(const AnyResponse& response,
                                          std::string_view name) noexcept {
    return std::visit([name](const auto& r) { return r.header(name); }, response);
}

AnyResponse with_status(const AnyResponse& response, StatusCode code) {
    return std::visit([code](const auto& r) -> AnyResponse { return r.with_status(code); },
                      response);
}

AnyResponse with_header(const AnyResponse& response, std::string name, std::string value) {
    return std::visit(
        [&](const auto& r) -> AnyResponse { return r.with_header(name, value); }, response);
}

AnyResponse with_headers(const AnyResponse& response, const HeaderList& extra) {
    return std::visit([&](const auto& r) -> AnyResponse { return r.with_headers(extra); },
                      response);
}

}  // namespace wren::http
