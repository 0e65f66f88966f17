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

// Wren Dispatcher - Implementation

#include "dispatcher.hpp"

#include <fmt/format.h>

#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include "negotiation.hpp"
#include "sender.hpp"

namespace wren::server {

http::PathParams convert_path_params(const routing::RouteMatch& match) {
    http::PathParams params;
    for (const auto& param : match.params) {
        auto type = match.route ? match.route->param_type(param.name) : std::nullopt;
        http::ParamValue value = routing::convert_param(type.value_or(routing::ParamType::String),
                                                        param.value);
        params.add(param.name, param.value, std::move(value));
    }
    return params;
}

Dispatcher::Dispatcher(const routing::Router& router, std::vector<Handler> handlers,
                       const routing::Pipeline& pipeline, ErrorHandlerRegistry errors,
                       control::AppConfig config,
                       std::shared_ptr<const templating::TemplateRenderer> renderer)
    : router_(router),
      handlers_(std::move(handlers)),
      errors_(std::move(errors)),
      config_(std::move(config)),
      renderer_(std::move(renderer)) {
    limits_.max_content_length = config_.max_content_length;
    limits_.read_timeout = std::chrono::milliseconds(config_.body_read_timeout_ms);

    push_.heartbeat_interval = config_.heartbeat_interval();
    push_.retry_ms = config_.sse_retry_ms;
    push_.close_event = config_.sse_close_event;
    push_.debug = config_.debug;
    push_.renderer = renderer_.get();

    error_settings_.debug = config_.debug;
    error_settings_.renderer = renderer_.get();

    chain_ = pipeline.compose(
        [this](const http::Request& request) { return route_request(request); });
}

http::AnyResponse Dispatcher::route_request(const http::Request& request) const {
    routing::MatchResult result = router_.match(request.method(), request.path());

    switch (result.status) {
        case routing::MatchStatus::NotFound:
            throw core::NotFound(fmt::format("No route matches {} '{}'",
                                             http::to_string(request.method()), request.path()));
        case routing::MatchStatus::MethodNotAllowed:
            throw core::MethodNotAllowed(std::move(result.allowed_methods));
        case routing::MatchStatus::Matched:
            break;
    }

    const routing::Route& route = *result.match.route;
    const Handler& handler = handlers_.at(route.handler_id);

    http::Request routed = request.with_path_params(convert_path_params(result.match));
    http::RequestScope scope(routed);
    return negotiate(handler(routed), renderer_.get());
}

http::AnyResponse Dispatcher::respond(const http::Request& request) const {
    http::RequestScope scope(request);
    try {
        return chain_(request);
    } catch (const core::HTTPError& e) {
        return handle_http_error(e, request, errors_, error_settings_);
    } catch (const core::ClientDisconnected&) {
        throw;
    } catch (const std::exception& e) {
        return handle_internal_error(e, request, errors_, error_settings_);
    } catch (...) {
        // Thrown value is not a std::exception
        core::WrenError unknown("unknown exception");
        return handle_internal_error(unknown, request, errors_, error_settings_);
    }
}

void Dispatcher::dispatch(http::Transport& transport) const noexcept {
    http::GuardedTransport guarded(transport);
    auto* logger = logging::get_current_logger();

    try {
        http::Request request = http::Request::from_transport(guarded, limits_);
        request.context().correlation_id = logging::generate_correlation_id();

        http::AnyResponse response = respond(request);

        try {
            send_response(guarded, response, push_);
        } catch (const core::TransportClosed& e) {
            if (logger) {
                LOG_WARNING(logger, "Client went away while sending: method={}, path={}, error={}",
                            http::to_string(request.method()), request.path(), e.what());
            }
        }
    } catch (const core::ClientDisconnected& e) {
        if (logger) {
            LOG_INFO(logger, "Client disconnected before a response: path={}, error={}",
                     guarded.info().path, e.what());
        }
    } catch (const std::exception& e) {
        if (logger) {
            LOG_ERROR(logger, "Failed to dispatch request: method={}, path={}, error={}",
                      http::to_string(guarded.info().method), guarded.info().path, e.what());
        }
    } catch (...) {
        if (logger) {
            LOG_ERROR(logger, "Failed to dispatch request: method={}, path={}, error=unknown exception",
                      http::to_string(guarded.info().method), guarded.info().path);
        }
    }

    guarded.finish();
}

}  // namespace wren::server
