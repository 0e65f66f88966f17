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

// Wren Middleware - Implementation

#include "middleware.hpp"

#include <algorithm>
#include <chrono>

#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace wren::routing {

namespace {

bool has_value(const std::vector<std::string>& values, std::string_view needle) {
    return std::find(values.begin(), values.end(), needle) != values.end();
}

}  // namespace

// CorsMiddleware implementation

bool CorsMiddleware::is_allowed_origin(std::string_view origin) const {
    return has_value(config_.allow_origins, "*") || has_value(config_.allow_origins, origin);
}

http::AnyResponse CorsMiddleware::add_cors_headers(http::AnyResponse response,
                                                   std::string_view origin) const {
    if (has_value(config_.allow_origins, "*") && !config_.allow_credentials) {
        response = http::with_header(response, "Access-Control-Allow-Origin", "*");
    } else {
        response = http::with_header(response, "Access-Control-Allow-Origin", std::string(origin));
        response = http::with_header(response, "Vary", "Origin");
    }

    if (config_.allow_credentials) {
        response = http::with_header(response, "Access-Control-Allow-Credentials", "true");
    }

    if (!config_.expose_headers.empty()) {
        response = http::with_header(response, "Access-Control-Expose-Headers",
                                     core::join(config_.expose_headers, ", "));
    }

    return response;
}

http::Response CorsMiddleware::preflight_response(const http::Request& request,
                                                  std::string_view origin) const {
    http::Response preflight;
    preflight.status = http::StatusCode::NoContent;
    preflight.content_type = std::string(http::kTextContentType);

    auto with_cors = add_cors_headers(std::move(preflight), origin);
    preflight = std::get<http::Response>(std::move(with_cors));

    if (request.headers().contains("Access-Control-Request-Method")) {
        preflight = preflight.with_header("Access-Control-Allow-Methods",
                                          core::join(config_.allow_methods, ", "));
    }

    if (has_value(config_.allow_headers, "*")) {
        // Any header allowed: echo what the browser asked for
        auto requested = request.headers().get("Access-Control-Request-Headers");
        if (requested && !requested->empty()) {
            preflight =
                preflight.with_header("Access-Control-Allow-Headers", std::string(*requested));
        }
    } else if (!config_.allow_headers.empty()) {
        preflight = preflight.with_header("Access-Control-Allow-Headers",
                                          core::join(config_.allow_headers, ", "));
    }

    return preflight.with_header("Access-Control-Max-Age", std::to_string(config_.max_age));
}

http::AnyResponse CorsMiddleware::operator()(const http::Request& request,
                                             const Next& next) const {
    auto origin = request.headers().get("Origin");

    // Not a CORS request
    if (!origin) {
        return next(request);
    }

    if (!is_allowed_origin(*origin)) {
        return next(request);
    }

    // Preflight; a plain OPTIONS request reaches its handler
    if (request.method() == http::Method::OPTIONS &&
        request.headers().contains("Access-Control-Request-Method")) {
        return preflight_response(request, *origin);
    }

    return add_cors_headers(next(request), *origin);
}

// SecurityHeadersMiddleware implementation

http::AnyResponse SecurityHeadersMiddleware::operator()(const http::Request& request,
                                                        const Next& next) const {
    http::AnyResponse response = next(request);

    // Push streams and non-HTML bodies are left alone
    if (std::holds_alternative<http::PushStreamResponse>(response) ||
        http::content_type_of(response).substr(0, 9) != "text/html") {
        return response;
    }

    auto set_if_absent = [&response](const char* name, const std::string& value) {
        if (!value.empty() && !http::header_of(response, name)) {
            response = http::with_header(response, name, value);
        }
    };

    set_if_absent("X-Frame-Options", config_.x_frame_options);
    set_if_absent("X-Content-Type-Options", config_.x_content_type_options);
    set_if_absent("Referrer-Policy", config_.referrer_policy);
    set_if_absent("Content-Security-Policy", config_.content_security_policy);
    return response;
}

// RequestLoggingMiddleware implementation

bool RequestLoggingMiddleware::is_excluded(std::string_view path) const {
    return has_value(config_.exclude_paths, path);
}

http::AnyResponse RequestLoggingMiddleware::operator()(const http::Request& request,
                                                       const Next& next) const {
    auto* logger = logging::get_current_logger();
    if (!logger || !config_.log_requests || is_excluded(request.path())) {
        return next(request);
    }

    const auto start = std::chrono::steady_clock::now();
    auto elapsed_us = [start] {
        return std::chrono::duration_cast<std::chrono::microseconds>(
                   std::chrono::steady_clock::now() - start)
            .count();
    };

    const std::string& correlation_id = request.context().correlation_id;
    const std::string_view method = http::to_string(request.method());

    try {
        http::AnyResponse response = next(request);
        LOG_REQUEST(logger, method, request.path(), http::to_int(http::status_of(response)),
                    elapsed_us(), request.client_host(), correlation_id);
        return response;
    } catch (const core::HTTPError& e) {
        LOG_REQUEST(logger, method, request.path(), http::to_int(e.status()), elapsed_us(),
                    request.client_host(), correlation_id);
        throw;
    } catch (const std::exception&) {
        LOG_REQUEST(logger, method, request.path(), 500, elapsed_us(), request.client_host(),
                    correlation_id);
        throw;
    }
}

}  // namespace wren::routing
