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

// Wren Content Negotiation - Implementation

#include "negotiation.hpp"

#include <fmt/format.h>

#include "../core/errors.hpp"

namespace wren::server {

namespace {

const templating::TemplateRenderer& require_renderer(const templating::TemplateRenderer* renderer,
                                                     std::string_view marker) {
    if (!renderer) {
        throw core::WrenError(fmt::format(
            "{} return values need a template renderer; call App::set_renderer() first", marker));
    }
    return *renderer;
}

struct Negotiator {
    const templating::TemplateRenderer* renderer;

    http::AnyResponse operator()(const http::Response& response) const { return response; }

    http::AnyResponse operator()(const http::StreamingResponse& response) const {
        return response;
    }

    http::AnyResponse operator()(const http::PushStreamResponse& response) const {
        return response;
    }

    http::AnyResponse operator()(const WithStatus& wrapped) const {
        http::AnyResponse inner = negotiate(*wrapped.inner, renderer);
        inner = http::with_status(inner, wrapped.status);
        if (!wrapped.headers.empty()) {
            inner = http::with_headers(inner, wrapped.headers);
        }
        return inner;
    }

    http::AnyResponse operator()(const std::string& text) const {
        http::Response response;
        response.body = text;
        response.content_type = std::string(http::kHtmlContentType);
        return response;
    }

    http::AnyResponse operator()(const http::Bytes& bytes) const {
        http::Response response;
        response.body.assign(bytes.begin(), bytes.end());
        response.content_type = std::string(http::kBinaryContentType);
        return response;
    }

    http::AnyResponse operator()(const nlohmann::json& data) const {
        if (!data.is_object() && !data.is_array()) {
            throw core::NegotiationError(fmt::format(
                "Cannot convert {} to a response. Return a string, bytes, a JSON object or "
                "array, Template, Fragment, Stream, EventStream, Response or Redirect.",
                data.type_name()));
        }
        http::Response response;
        response.body = data.dump();
        response.content_type = std::string(http::kJsonContentType);
        return response;
    }

    http::AnyResponse operator()(const templating::Template& page) const {
        http::Response response;
        response.body = require_renderer(renderer, "Template").render(page.name, page.context);
        return response;
    }

    http::AnyResponse operator()(const templating::Fragment& fragment) const {
        http::Response response;
        response.body = require_renderer(renderer, "Fragment")
                            .render_block(fragment.template_name, fragment.block,
                                          fragment.context);
        return response;
    }

    http::AnyResponse operator()(const templating::Stream& stream) const {
        http::StreamingResponse response;
        response.chunks =
            require_renderer(renderer, "Stream").render_stream(stream.name, stream.context);
        return response;
    }

    http::AnyResponse operator()(const realtime::EventStream& stream) const {
        return http::PushStreamResponse{stream};
    }

    http::AnyResponse operator()(const Redirect& redirect) const {
        http::Response response;
        response.status = redirect.status;
        response.headers.emplace_back("Location", redirect.url);
        response.headers.insert(response.headers.end(), redirect.headers.begin(),
                                redirect.headers.end());
        return response;
    }

    http::AnyResponse operator()(std::monostate) const {
        throw core::NegotiationError(
            "Cannot convert no value to a response. The handler returned nothing.");
    }
};

}  // namespace

ReturnValue::ReturnValue(http::AnyResponse response) {
    std::visit([this](auto&& r) { value_ = std::move(r); }, std::move(response));
}

std::string_view ReturnValue::type_name() const noexcept {
    struct Namer {
        std::string_view operator()(std::monostate) const { return "no value"; }
        std::string_view operator()(const http::Response&) const { return "Response"; }
        std::string_view operator()(const http::StreamingResponse&) const {
            return "StreamingResponse";
        }
        std::string_view operator()(const http::PushStreamResponse&) const {
            return "PushStreamResponse";
        }
        std::string_view operator()(const Redirect&) const { return "Redirect"; }
        std::string_view operator()(const std::string&) const { return "string"; }
        std::string_view operator()(const http::Bytes&) const { return "bytes"; }
        std::string_view operator()(const nlohmann::json& data) const { return data.type_name(); }
        std::string_view operator()(const templating::Template&) const { return "Template"; }
        std::string_view operator()(const templating::Fragment&) const { return "Fragment"; }
        std::string_view operator()(const templating::Stream&) const { return "Stream"; }
        std::string_view operator()(const realtime::EventStream&) const { return "EventStream"; }
        std::string_view operator()(const WithStatus&) const { return "tuple"; }
    };
    return std::visit(Namer{}, value_);
}

ReturnValue with_status(ReturnValue value, int status, http::HeaderList headers) {
    return WithStatus{std::make_shared<const ReturnValue>(std::move(value)),
                      http::to_status(status), std::move(headers)};
}

http::AnyResponse negotiate(const ReturnValue& value,
                            const templating::TemplateRenderer* renderer) {
    return std::visit(Negotiator{renderer}, value.value());
}

}  // namespace wren::server
