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

// Wren Dispatcher - Header
// Per-connection request handling: decode, route, invoke, negotiate, send

#pragma once

#include <memory>
#include <vector>

#include "../control/config.hpp"
#include "../http/request.hpp"
#include "../http/response.hpp"
#include "../http/transport.hpp"
#include "../realtime/push_engine.hpp"
#include "../routing/pipeline.hpp"
#include "../routing/router.hpp"
#include "../templating/renderer.hpp"
#include "error_pipeline.hpp"
#include "handler.hpp"

namespace wren::server {

/// Immutable request dispatcher built when the app freezes.
///
/// dispatch() may run on many connection threads at once; nothing in here is
/// mutated after construction.
class Dispatcher {
public:
    Dispatcher(const routing::Router& router, std::vector<Handler> handlers,
               const routing::Pipeline& pipeline, ErrorHandlerRegistry errors,
               control::AppConfig config,
               std::shared_ptr<const templating::TemplateRenderer> renderer);

    // Non-copyable, non-movable (the composed chain captures this)
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Handle one connection. Exactly one response start and one final body
    /// message reach the transport on every path; nothing is thrown.
    void dispatch(http::Transport& transport) const noexcept;

    /// Run the middleware chain and error pipeline for a request, without
    /// touching a transport. ClientDisconnected propagates.
    [[nodiscard]] http::AnyResponse respond(const http::Request& request) const;

    [[nodiscard]] const control::AppConfig& config() const noexcept { return config_; }
    [[nodiscard]] const realtime::PushConfig& push_config() const noexcept { return push_; }

private:
    /// Innermost chain step: route match, handler invocation, negotiation
    [[nodiscard]] http::AnyResponse route_request(const http::Request& request) const;

    const routing::Router& router_;
    std::vector<Handler> handlers_;
    ErrorHandlerRegistry errors_;
    control::AppConfig config_;
    std::shared_ptr<const templating::TemplateRenderer> renderer_;

    http::BodyLimits limits_;
    realtime::PushConfig push_;
    ErrorSettings error_settings_;
    routing::Next chain_;
};

/// Path parameters of a match, converted per the route's declared types
[[nodiscard]] http::PathParams convert_path_params(const routing::RouteMatch& match);

}  // namespace wren::server
