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

// Wren Content Negotiation - Header
// Maps handler return values to one of the three response variants

#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>

#include "../http/http.hpp"
#include "../http/response.hpp"
#include "../realtime/event.hpp"
#include "../templating/renderer.hpp"

namespace wren::server {

/// Redirect marker: empty buffered response with a Location header
struct Redirect {
    std::string url;
    http::StatusCode status = http::StatusCode::Found;
    http::HeaderList headers;
};

class ReturnValue;

/// Status (and header) override around another return value
struct WithStatus {
    std::shared_ptr<const ReturnValue> inner;
    http::StatusCode status = http::StatusCode::OK;
    http::HeaderList headers;
};

/// Everything a handler may return.
///
/// Implicit constructors keep handler code short: `return "hello";`,
/// `return nlohmann::json{{"id", 7}};`, `return std::make_tuple("created", 201);`.
/// Numbers, booleans and null are accepted here but rejected by negotiate().
class ReturnValue {
public:
    using Value = std::variant<std::monostate, http::Response, http::StreamingResponse,
                               http::PushStreamResponse, Redirect, std::string, http::Bytes,
                               nlohmann::json, templating::Template, templating::Fragment,
                               templating::Stream, realtime::EventStream, WithStatus>;

    ReturnValue() = default;

    ReturnValue(http::Response response) : value_(std::move(response)) {}
    ReturnValue(http::StreamingResponse response) : value_(std::move(response)) {}
    ReturnValue(http::PushStreamResponse response) : value_(std::move(response)) {}
    ReturnValue(http::AnyResponse response);
    ReturnValue(Redirect redirect) : value_(std::move(redirect)) {}

    ReturnValue(const char* text) : value_(std::string(text)) {}
    ReturnValue(std::string text) : value_(std::move(text)) {}
    ReturnValue(std::string_view text) : value_(std::string(text)) {}
    ReturnValue(http::Bytes bytes) : value_(std::move(bytes)) {}
    ReturnValue(nlohmann::json data) : value_(std::move(data)) {}

    ReturnValue(templating::Template page) : value_(std::move(page)) {}
    ReturnValue(templating::Fragment fragment) : value_(std::move(fragment)) {}
    ReturnValue(templating::Stream stream) : value_(std::move(stream)) {}
    ReturnValue(realtime::EventStream stream) : value_(std::move(stream)) {}
    ReturnValue(WithStatus wrapped) : value_(std::move(wrapped)) {}

    /// (body, status)
    template <typename T>
    ReturnValue(std::tuple<T, int> pair)
        : value_(WithStatus{std::make_shared<const ReturnValue>(std::move(std::get<0>(pair))),
                            http::to_status(std::get<1>(pair)),
                            {}}) {}

    /// (body, status, headers)
    template <typename T>
    ReturnValue(std::tuple<T, int, http::HeaderList> triple)
        : value_(WithStatus{std::make_shared<const ReturnValue>(std::move(std::get<0>(triple))),
                            http::to_status(std::get<1>(triple)),
                            std::move(std::get<2>(triple))}) {}

    [[nodiscard]] const Value& value() const noexcept { return value_; }

    /// Runtime type name used in negotiation errors ("number", "bytes", ...)
    [[nodiscard]] std::string_view type_name() const noexcept;

private:
    Value value_;
};

/// Wrap a return value with a status and extra headers
[[nodiscard]] ReturnValue with_status(ReturnValue value, int status, http::HeaderList headers = {});

/// Convert a return value into a response.
///
/// Throws core::NegotiationError for values with no response form (numbers,
/// booleans, null, no value) and core::WrenError when a template marker
/// arrives without a renderer. Renderer failures propagate unchanged.
[[nodiscard]] http::AnyResponse negotiate(const ReturnValue& value,
                                          const templating::TemplateRenderer* renderer);

}  // namespace wren::server
