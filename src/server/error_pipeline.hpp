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

// Wren Error Pipeline - Header
// Maps HTTP errors and unexpected failures to responses

#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <typeindex>

#include "../core/containers.hpp"
#include "../core/errors.hpp"
#include "../http/request.hpp"
#include "../http/response.hpp"
#include "../templating/renderer.hpp"
#include "handler.hpp"

namespace wren::server {

/// Error handlers keyed by status code and by exact exception type
class ErrorHandlerRegistry {
public:
    /// Register for a status code (replaces an earlier registration)
    void add_status(int status, ErrorHandler handler);

    /// Register for an exact exception type (replaces an earlier registration)
    void add_type(std::type_index type, ErrorHandler handler);

    [[nodiscard]] const ErrorHandler* for_status(int status) const;

    /// Handler for the dynamic type of error; base-class registrations don't match
    [[nodiscard]] const ErrorHandler* for_type(const std::exception& error) const;

    [[nodiscard]] size_t size() const noexcept { return by_status_.size() + by_type_.size(); }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

private:
    core::fast_map<int, ErrorHandler> by_status_;
    core::fast_map<std::type_index, ErrorHandler> by_type_;
};

/// Settings shared by both error paths
struct ErrorSettings {
    bool debug = false;
    const templating::TemplateRenderer* renderer = nullptr;
};

/// Response for an HTTPError (NotFound, MethodNotAllowed, explicit signals).
///
/// Lookup: exact exception type, then status. A handler result negotiated to
/// 200 takes the error's status. Without a handler (or when the handler
/// throws) the default response carries the detail and the error's headers.
[[nodiscard]] http::AnyResponse handle_http_error(const core::HTTPError& error,
                                                  const http::Request& request,
                                                  const ErrorHandlerRegistry& handlers,
                                                  const ErrorSettings& settings);

/// 500 response for an unexpected exception. Lookup: status 500, then the
/// exception type. The exception text reaches the body only in debug mode.
[[nodiscard]] http::AnyResponse handle_internal_error(const std::exception& error,
                                                      const http::Request& request,
                                                      const ErrorHandlerRegistry& handlers,
                                                      const ErrorSettings& settings);

/// Fragment error snippet: <div class="wren-error" data-status="N">detail</div>
[[nodiscard]] std::string default_fragment_error(int status, std::string_view detail);

/// Minimal HTML escaping for text placed inside markup
[[nodiscard]] std::string html_escape(std::string_view text);

}  // namespace wren::server
