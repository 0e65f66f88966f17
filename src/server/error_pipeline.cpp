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

// Wren Error Pipeline - Implementation

#include "error_pipeline.hpp"

#include <fmt/format.h>

#include <optional>
#include <typeinfo>

#include "../core/logging.hpp"
#include "negotiation.hpp"

namespace wren::server {

namespace {

constexpr std::string_view kInternalServerError = "Internal Server Error";

/// htmx headers steering a fragment error into the page's error container
http::Response with_fragment_error_headers(http::Response response,
                                           const http::Request& request) {
    if (!request.is_fragment()) {
        return response;
    }
    return response.with_header("HX-Retarget", "#wren-error")
        .with_header("HX-Reswap", "innerHTML")
        .with_header("HX-Trigger", "wrenError");
}

/// Run a user error handler; std::nullopt when it throws (logged)
std::optional<http::AnyResponse> run_handler(const ErrorHandler& handler,
                                             const http::Request& request,
                                             const std::exception& error,
                                             const ErrorSettings& settings) {
    try {
        return negotiate(handler(request, error), settings.renderer);
    } catch (const std::exception& e) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR_CTX(logger, "Error handler failed", request.context().correlation_id,
                          fmt::format("{} {}", http::to_string(request.method()), request.path()),
                          e.what());
        }
        return std::nullopt;
    } catch (...) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR_CTX(logger, "Error handler failed", request.context().correlation_id,
                          fmt::format("{} {}", http::to_string(request.method()), request.path()),
                          "unknown exception");
        }
        return std::nullopt;
    }
}

}  // namespace

// ErrorHandlerRegistry implementation

void ErrorHandlerRegistry::add_status(int status, ErrorHandler handler) {
    by_status_[status] = std::move(handler);
}

void ErrorHandlerRegistry::add_type(std::type_index type, ErrorHandler handler) {
    by_type_[type] = std::move(handler);
}

const ErrorHandler* ErrorHandlerRegistry::for_status(int status) const {
    auto it = by_status_.find(status);
    return (it != by_status_.end()) ? &it->second : nullptr;
}

const ErrorHandler* ErrorHandlerRegistry::for_type(const std::exception& error) const {
    auto it = by_type_.find(std::type_index(typeid(error)));
    return (it != by_type_.end()) ? &it->second : nullptr;
}

// Error responses

std::string html_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&#x27;";
                break;
            default:
                out += c;
        }
    }
    return out;
}

std::string default_fragment_error(int status, std::string_view detail) {
    return fmt::format(R"(<div class="wren-error" data-status="{}">{}</div>)", status,
                       html_escape(detail));
}

http::AnyResponse handle_http_error(const core::HTTPError& error, const http::Request& request,
                                    const ErrorHandlerRegistry& handlers,
                                    const ErrorSettings& settings) {
    const int status = http::to_int(error.status());
    if (auto* logger = logging::get_current_logger()) {
        LOG_DEBUG(logger, "{} {} {} - {}", status, http::to_string(request.method()),
                  request.path(), error.detail());
    }

    const ErrorHandler* handler = handlers.for_type(error);
    if (!handler) {
        handler = handlers.for_status(status);
    }
    if (handler) {
        if (auto response = run_handler(*handler, request, error, settings)) {
            if (http::status_of(*response) == http::StatusCode::OK) {
                return http::with_status(*response, error.status());
            }
            return *response;
        }
    }

    std::string detail = error.detail().empty() ? fmt::format("Error {}", status) : error.detail();
    if (settings.debug && !error.detail().empty()) {
        detail = fmt::format("{}: {}", status, error.detail());
    }

    http::Response response;
    response.status = error.status();
    response.body = request.is_fragment() ? default_fragment_error(status, detail) : detail;
    response = response.with_headers(error.headers());
    return with_fragment_error_headers(std::move(response), request);
}

http::AnyResponse handle_internal_error(const std::exception& error,
                                        const http::Request& request,
                                        const ErrorHandlerRegistry& handlers,
                                        const ErrorSettings& settings) {
    if (auto* logger = logging::get_current_logger()) {
        LOG_ERROR_CTX(logger, "Unhandled exception", request.context().correlation_id,
                      fmt::format("500 {} {}", http::to_string(request.method()), request.path()),
                      error.what());
    }

    const ErrorHandler* handler = handlers.for_status(500);
    if (!handler) {
        handler = handlers.for_type(error);
    }
    if (handler) {
        if (auto response = run_handler(*handler, request, error, settings)) {
            if (http::status_of(*response) == http::StatusCode::OK) {
                return http::with_status(*response, http::StatusCode::InternalServerError);
            }
            return *response;
        }
    }

    const std::string detail =
        settings.debug ? fmt::format("500: {}", error.what()) : std::string(kInternalServerError);

    http::Response response;
    response.status = http::StatusCode::InternalServerError;
    if (request.is_fragment()) {
        response.body = default_fragment_error(500, detail);
        return with_fragment_error_headers(std::move(response), request);
    }
    response.body = detail;
    return response;
}

}  // namespace wren::server
