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

// Wren Request - Implementation

#include "request.hpp"

#include <fmt/format.h>

#include <charconv>

#include "../core/errors.hpp"

namespace wren::http {

namespace {

thread_local const Request* g_current_request = nullptr;

template <typename T>
std::optional<T> parse_number(std::string_view text) noexcept {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

// BodyReader

std::shared_ptr<BodyReader> BodyReader::from_string(std::string body) {
    auto reader = std::make_shared<BodyReader>(nullptr, 0, std::chrono::milliseconds{0});
    reader->pending_ = std::move(body);
    return reader;
}

void BodyReader::fail(std::exception_ptr error) {
    exhausted_ = true;
    failure_ = std::move(error);
    cache_.clear();
    std::rethrow_exception(failure_);
}

std::optional<std::string> BodyReader::next_chunk() {
    if (failure_) {
        std::rethrow_exception(failure_);
    }
    if (exhausted_) {
        return std::nullopt;
    }

    if (!transport_) {
        exhausted_ = true;
        if (!pending_ || pending_->empty()) {
            return std::nullopt;
        }
        std::string chunk = std::move(*pending_);
        pending_.reset();
        bytes_read_ += chunk.size();
        return chunk;
    }

    while (true) {
        auto message = transport_->receive(timeout_);
        if (!message) {
            fail(std::make_exception_ptr(
                core::HTTPError(StatusCode::RequestTimeout, "Timed out reading request body")));
        }
        if (message->is_disconnect()) {
            fail(std::make_exception_ptr(
                core::ClientDisconnected("Client disconnected while sending the request body")));
        }

        bytes_read_ += message->body.size();
        if (max_length_ > 0 && bytes_read_ > max_length_) {
            fail(std::make_exception_ptr(core::HTTPError(
                StatusCode::PayloadTooLarge,
                fmt::format("Request body exceeds {} bytes", max_length_))));
        }

        if (!message->more_body) {
            exhausted_ = true;
        }
        if (!message->body.empty()) {
            return std::move(message->body);
        }
        if (exhausted_) {
            return std::nullopt;
        }
    }
}

const std::string& BodyReader::read_all() {
    if (cached_) {
        return cache_;
    }
    while (auto chunk = next_chunk()) {
        cache_ += *chunk;
    }
    cached_ = true;
    return cache_;
}

// PathParams

const ParamValue* PathParams::get(std::string_view name) const noexcept {
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            return &entry.value;
        }
    }
    return nullptr;
}

std::optional<std::string_view> PathParams::raw(std::string_view name) const noexcept {
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            return std::string_view(entry.raw);
        }
    }
    return std::nullopt;
}

std::optional<int64_t> PathParams::get_int(std::string_view name) const noexcept {
    const ParamValue* value = get(name);
    if (!value) {
        return std::nullopt;
    }
    if (const auto* number = std::get_if<int64_t>(value)) {
        return *number;
    }
    if (const auto* text = std::get_if<std::string>(value)) {
        return parse_number<int64_t>(*text);
    }
    return std::nullopt;
}

std::optional<double> PathParams::get_float(std::string_view name) const noexcept {
    const ParamValue* value = get(name);
    if (!value) {
        return std::nullopt;
    }
    if (const auto* number = std::get_if<double>(value)) {
        return *number;
    }
    if (const auto* integer = std::get_if<int64_t>(value)) {
        return static_cast<double>(*integer);
    }
    return parse_number<double>(std::get<std::string>(*value));
}

// Request

Request Request::from_transport(Transport& transport, const BodyLimits& limits) {
    const ConnectionInfo& info = transport.info();

    Request request;
    request.method_ = info.method;
    request.path_ = info.path.empty() ? "/" : info.path;
    request.query_string_ = info.query_string;
    request.headers_ = Headers(info.headers);
    request.query_ = QueryParams::parse(info.query_string);
    request.http_version_ = info.http_version;
    request.client_host_ = info.client_host;
    request.client_port_ = info.client_port;
    request.server_host_ = info.server_host;
    request.server_port_ = info.server_port;
    request.body_ =
        std::make_shared<BodyReader>(&transport, limits.max_content_length, limits.read_timeout);
    return request;
}

Request Request::make(Method method, std::string_view target, HeaderList headers,
                      std::string body) {
    Request request;
    request.method_ = method;

    size_t query_pos = target.find('?');
    std::string_view path = target.substr(0, query_pos);
    request.path_ = path.empty() ? "/" : std::string(path);
    if (query_pos != std::string_view::npos) {
        request.query_string_ = std::string(target.substr(query_pos + 1));
    }
    request.query_ = QueryParams::parse(request.query_string_);
    request.headers_ = Headers(std::move(headers));
    request.body_ = BodyReader::from_string(std::move(body));
    return request;
}

std::string_view Request::content_type() const noexcept {
    return headers_.get_or("Content-Type", {});
}

std::optional<size_t> Request::content_length() const noexcept {
    auto value = headers_.get("Content-Length");
    if (!value) {
        return std::nullopt;
    }
    return parse_number<size_t>(*value);
}

bool Request::is_fragment() const noexcept {
    return headers_.get_or("HX-Request", {}) == "true";
}

std::optional<std::string> Request::next_body_chunk() const {
    return body_->next_chunk();
}

const std::string& Request::body() const {
    return body_->read_all();
}

nlohmann::json Request::json() const {
    try {
        return nlohmann::json::parse(body());
    } catch (const nlohmann::json::parse_error& e) {
        throw core::HTTPError(StatusCode::BadRequest,
                              fmt::format("Malformed JSON body: {}", e.what()));
    }
}

Request Request::with_path_params(PathParams params) const {
    Request copy = *this;
    copy.path_params_ = std::move(params);
    return copy;
}

// Current request

const Request* current_request() noexcept {
    return g_current_request;
}

RequestScope::RequestScope(const Request& request) noexcept : previous_(g_current_request) {
    g_current_request = &request;
}

RequestScope::~RequestScope() {
    g_current_request = previous_;
}

}  // namespace wren::http
