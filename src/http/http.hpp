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

// Wren HTTP Protocol - Header
// Value types shared by the router, dispatcher and transports

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace wren::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE,
    UNKNOWN
};

/// HTTP status codes
/// The underlying type is wide enough for any three-digit code, so values
/// outside the named set (418, 422, ...) are carried with static_cast.
enum class StatusCode : uint16_t {
    // 1xx Informational
    Continue = 100,
    SwitchingProtocols = 101,

    // 2xx Success
    OK = 200,
    Created = 201,
    Accepted = 202,
    NoContent = 204,

    // 3xx Redirection
    MovedPermanently = 301,
    Found = 302,
    SeeOther = 303,
    NotModified = 304,
    TemporaryRedirect = 307,
    PermanentRedirect = 308,

    // 4xx Client Error
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,
    RequestTimeout = 408,
    PayloadTooLarge = 413,
    URITooLong = 414,
    UnprocessableEntity = 422,
    TooManyRequests = 429,

    // 5xx Server Error
    InternalServerError = 500,
    NotImplemented = 501,
    BadGateway = 502,
    ServiceUnavailable = 503,
    GatewayTimeout = 504,
};

/// Ordered header list as sent on the wire (name, value)
using HeaderList = std::vector<std::pair<std::string, std::string>>;

/// Raw byte payload
using Bytes = std::vector<uint8_t>;

/// Lazy body chunk sequence; std::nullopt marks exhaustion
using ChunkSource = std::function<std::optional<std::string>()>;

/// Path parameter after type conversion (raw string when conversion is impossible)
using ParamValue = std::variant<std::string, int64_t, double>;

/// Case-insensitive, multi-value header collection (immutable after construction)
class Headers {
public:
    Headers() = default;
    explicit Headers(HeaderList raw) : items_(std::move(raw)) {}

    /// First value for name (case-insensitive)
    [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;

    /// First value for name or default_value
    [[nodiscard]] std::string_view get_or(std::string_view name,
                                          std::string_view default_value) const noexcept;

    /// All values for name, in arrival order
    [[nodiscard]] std::vector<std::string_view> get_list(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const noexcept;

    [[nodiscard]] const HeaderList& items() const noexcept { return items_; }
    [[nodiscard]] size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

    [[nodiscard]] auto begin() const noexcept { return items_.begin(); }
    [[nodiscard]] auto end() const noexcept { return items_.end(); }

private:
    HeaderList items_;
};

/// Multi-value query string parameters
class QueryParams {
public:
    QueryParams() = default;

    /// Parse "a=1&b=2&a=3" (percent-decoding, '+' as space, blank values kept)
    [[nodiscard]] static QueryParams parse(std::string_view query);

    [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;
    [[nodiscard]] std::vector<std::string_view> get_list(std::string_view name) const;

    /// Integer value, or std::nullopt when missing or not an integer
    [[nodiscard]] std::optional<int64_t> get_int(std::string_view name) const noexcept;

    /// Boolean value: true/1/yes/on and false/0/no/off (case-insensitive)
    [[nodiscard]] std::optional<bool> get_bool(std::string_view name) const noexcept;

    [[nodiscard]] bool contains(std::string_view name) const noexcept;
    [[nodiscard]] size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
    [[nodiscard]] const HeaderList& items() const noexcept { return items_; }

private:
    HeaderList items_;
};

// Conversion functions

/// Convert Method to string
[[nodiscard]] std::string_view to_string(Method method) noexcept;

/// Convert string to Method
[[nodiscard]] Method parse_method(std::string_view str) noexcept;

/// Convert StatusCode to reason phrase
[[nodiscard]] std::string_view to_reason_phrase(StatusCode code) noexcept;

/// StatusCode from an integer code
[[nodiscard]] constexpr StatusCode to_status(int code) noexcept {
    return static_cast<StatusCode>(static_cast<uint16_t>(code));
}

/// Integer code from a StatusCode
[[nodiscard]] constexpr int to_int(StatusCode code) noexcept {
    return static_cast<int>(code);
}

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

/// ASCII lowercase copy
[[nodiscard]] std::string to_lower(std::string_view str);

/// Percent-decode a URL component ('+' becomes a space when plus_as_space)
[[nodiscard]] std::string url_decode(std::string_view str, bool plus_as_space = false);

}  // namespace wren::http
