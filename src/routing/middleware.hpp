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

// Wren Middleware - Header
// Built-in middleware: CORS, security headers, request logging

#pragma once

#include <string>
#include <string_view>

#include "../control/config.hpp"
#include "pipeline.hpp"

namespace wren::routing {

/// CORS middleware.
///
/// Requests without an Origin header, or from an origin not in the allow
/// list, pass through untouched. OPTIONS requests from allowed origins are
/// answered with a 204 preflight response without reaching the handler.
class CorsMiddleware {
public:
    CorsMiddleware() = default;
    explicit CorsMiddleware(control::CorsConfig config) : config_(std::move(config)) {}

    http::AnyResponse operator()(const http::Request& request, const Next& next) const;

    [[nodiscard]] std::string_view name() const noexcept { return "CorsMiddleware"; }
    [[nodiscard]] const control::CorsConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] bool is_allowed_origin(std::string_view origin) const;
    [[nodiscard]] http::AnyResponse add_cors_headers(http::AnyResponse response,
                                                     std::string_view origin) const;
    [[nodiscard]] http::Response preflight_response(const http::Request& request,
                                                    std::string_view origin) const;

    control::CorsConfig config_;
};

/// Adds X-Frame-Options, X-Content-Type-Options, Referrer-Policy and
/// Content-Security-Policy to text/html responses that don't set them
class SecurityHeadersMiddleware {
public:
    SecurityHeadersMiddleware() = default;
    explicit SecurityHeadersMiddleware(control::SecurityHeadersConfig config)
        : config_(std::move(config)) {}

    http::AnyResponse operator()(const http::Request& request, const Next& next) const;

    [[nodiscard]] std::string_view name() const noexcept { return "SecurityHeadersMiddleware"; }

private:
    control::SecurityHeadersConfig config_;
};

/// Logs one LOG_REQUEST line per request with its status and duration.
/// Failures are logged with the status they will be answered with, then rethrown.
class RequestLoggingMiddleware {
public:
    RequestLoggingMiddleware() = default;
    explicit RequestLoggingMiddleware(control::LogConfig config) : config_(std::move(config)) {}

    http::AnyResponse operator()(const http::Request& request, const Next& next) const;

    [[nodiscard]] std::string_view name() const noexcept { return "RequestLoggingMiddleware"; }

private:
    [[nodiscard]] bool is_excluded(std::string_view path) const;

    control::LogConfig config_;
};

}  // namespace wren::routing
