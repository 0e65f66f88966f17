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

// Wren Application - Implementation

#include "app.hpp"

#include <fmt/format.h>

#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include "../routing/middleware.hpp"

namespace wren::server {

App::App(control::AppConfig config) : config_(std::move(config)) {}

App::~App() = default;

void App::ensure_mutable(std::string_view what) const {
    if (frozen_.load(std::memory_order_acquire)) {
        throw core::ConfigurationError(
            fmt::format("Cannot register {} after the app has started handling requests", what));
    }
}

App& App::add_route(std::string_view pattern, BoundHandler handler,
                    const std::vector<std::string>& methods, std::string name) {
    std::lock_guard lock(mutex_);
    ensure_mutable(fmt::format("route '{}'", pattern));

    std::vector<http::Method> parsed;
    parsed.reserve(methods.size());
    for (const auto& method : methods) {
        http::Method m = http::parse_method(method);
        if (m == http::Method::UNKNOWN) {
            throw core::ConfigurationError(
                fmt::format("Route '{}' uses unknown HTTP method '{}'", pattern, method));
        }
        parsed.push_back(m);
    }

    size_t param_count = 0;
    for (const auto& segment : routing::parse_pattern(pattern)) {
        if (segment.is_param) {
            ++param_count;
        }
    }
    if (handler.path_arity > param_count) {
        throw core::ConfigurationError(fmt::format(
            "Handler for '{}' takes {} path parameters but the pattern declares {}", pattern,
            handler.path_arity, param_count));
    }

    router_.add(pattern, std::move(parsed), handlers_.size(), std::move(name));
    handlers_.push_back(std::move(handler.call));
    return *this;
}

App& App::add_status_handler(int status, ErrorHandler handler) {
    std::lock_guard lock(mutex_);
    ensure_mutable(fmt::format("error handler for status {}", status));
    if (status < 100 || status > 599) {
        throw core::ConfigurationError(
            fmt::format("Error handler status {} is not an HTTP status code", status));
    }
    errors_.add_status(status, std::move(handler));
    return *this;
}

App& App::add_type_handler(std::type_index type, ErrorHandler handler) {
    std::lock_guard lock(mutex_);
    ensure_mutable(fmt::format("error handler for {}", type.name()));
    errors_.add_type(type, std::move(handler));
    return *this;
}

App& App::use(routing::Middleware middleware, std::string name) {
    std::lock_guard lock(mutex_);
    ensure_mutable(fmt::format("middleware '{}'", name));
    pipeline_.use(std::move(middleware), std::move(name));
    return *this;
}

App& App::use_builtin_middleware(const control::Config& config) {
    if (config.logging.log_requests) {
        routing::RequestLoggingMiddleware logging_mw(config.logging);
        use(logging_mw, std::string(logging_mw.name()));
    }
    if (config.cors.enabled) {
        routing::CorsMiddleware cors(config.cors);
        use(cors, std::string(cors.name()));
    }
    if (config.security_headers.enabled) {
        routing::SecurityHeadersMiddleware security(config.security_headers);
        use(security, std::string(security.name()));
    }
    return *this;
}

App& App::set_renderer(std::shared_ptr<const templating::TemplateRenderer> renderer) {
    std::lock_guard lock(mutex_);
    ensure_mutable("a template renderer");
    renderer_ = std::move(renderer);
    return *this;
}

void App::freeze() {
    if (frozen_.load(std::memory_order_acquire)) {
        return;
    }

    std::lock_guard lock(mutex_);
    if (frozen_.load(std::memory_order_relaxed)) {
        return;
    }

    router_.compile();
    dispatcher_ = std::make_unique<Dispatcher>(router_, std::move(handlers_), pipeline_,
                                               std::move(errors_), config_, renderer_);
    frozen_.store(true, std::memory_order_release);

    if (auto* logger = logging::get_current_logger()) {
        auto stats = router_.get_stats();
        LOG_INFO(logger, "App frozen: routes={}, nodes={}, middleware={}", stats.total_routes,
                 stats.total_nodes, pipeline_.size());
    }
}

const Dispatcher& App::dispatcher() {
    freeze();
    return *dispatcher_;
}

void App::handle(http::Transport& transport) {
    dispatcher().dispatch(transport);
}

}  // namespace wren::server
