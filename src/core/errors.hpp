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

// Wren Errors - Header
// Exception hierarchy shared by the router, dispatcher, negotiator and push engine

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "../http/http.hpp"

namespace wren::core {

/// Root of every Wren-specific exception
class WrenError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Invalid application setup (route syntax, late registration, bad config)
/// Raised at startup and never converted into a response
class ConfigurationError : public WrenError {
public:
    using WrenError::WrenError;
};

/// "Respond with this status" signal raised by routing, middleware or handlers
class HTTPError : public WrenError {
public:
    explicit HTTPError(http::StatusCode status, std::string detail = {},
                       http::HeaderList headers = {});

    [[nodiscard]] http::StatusCode status() const noexcept { return status_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }
    [[nodiscard]] const http::HeaderList& headers() const noexcept { return headers_; }

private:
    http::StatusCode status_;
    std::string detail_;
    http::HeaderList headers_;
};

/// 404: no route matches the request path
class NotFound : public HTTPError {
public:
    explicit NotFound(std::string detail = "Not Found");
};

/// 405: the path matches but not for this method; carries the Allow header
class MethodNotAllowed : public HTTPError {
public:
    explicit MethodNotAllowed(std::vector<http::Method> allowed,
                              std::string detail = "Method Not Allowed");

    [[nodiscard]] const std::vector<http::Method>& allowed_methods() const noexcept {
        return allowed_;
    }

private:
    std::vector<http::Method> allowed_;
};

/// A handler returned a value the content negotiator cannot convert
class NegotiationError : public WrenError {
public:
    using WrenError::WrenError;
};

/// The peer went away while the request body was still being read
class ClientDisconnected : public WrenError {
public:
    using WrenError::WrenError;
};

/// Writing to the transport failed (peer closed, broken pipe)
class TransportClosed : public WrenError {
public:
    using WrenError::WrenError;
};

/// A blocking wait was interrupted by cancellation
class OperationCancelled : public WrenError {
public:
    OperationCancelled() : WrenError("operation cancelled") {}
};

/// Allow header value: method names sorted and joined with ", "
[[nodiscard]] std::string format_allow_header(const std::vector<http::Method>& methods);

}  // namespace wren::core
