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

// Wren HTTP Parser - Header
// Incremental HTTP/1.1 request parser around llhttp

#pragma once

#include <llhttp.h>

#include <cstddef>
#include <string>
#include <string_view>

#include "http.hpp"

namespace wren::http {

/// Parse result
enum class ParseResult : uint8_t {
    Incomplete,       // Need more data
    HeadersComplete,  // Request line and headers available, body may follow
    Complete,         // Request fully parsed
    Error             // Parse error (see error_message())
};

/// Request line and headers, owned
struct RequestHead {
    Method method = Method::UNKNOWN;
    std::string target;  // Raw request target as received
    std::string path;    // Target before '?', still percent-encoded
    std::string query;   // Target after '?'
    HeaderList headers;
    std::string version = "1.1";
};

/// HTTP/1.1 request parser (wraps llhttp).
///
/// Bytes are fed as they arrive; body bytes accumulate until take_body().
/// One parser handles one request; a connection that wants another must
/// create a new parser.
class RequestParser {
public:
    explicit RequestParser(size_t max_header_size = 8192);
    ~RequestParser() = default;

    // Non-copyable, non-movable (llhttp keeps a pointer to this)
    RequestParser(const RequestParser&) = delete;
    RequestParser& operator=(const RequestParser&) = delete;

    /// Feed received bytes
    [[nodiscard]] ParseResult feed(std::string_view data);

    [[nodiscard]] bool headers_complete() const noexcept { return headers_complete_; }
    [[nodiscard]] bool message_complete() const noexcept { return message_complete_; }
    [[nodiscard]] bool failed() const noexcept { return !error_.empty(); }

    [[nodiscard]] const RequestHead& head() const noexcept { return head_; }

    /// Whether unread body bytes are buffered
    [[nodiscard]] bool has_body() const noexcept { return !body_.empty(); }

    /// Move out the body bytes received so far
    [[nodiscard]] std::string take_body();

    [[nodiscard]] std::string_view error_message() const noexcept { return error_; }

private:
    static int on_url(llhttp_t* parser, const char* at, size_t length);
    static int on_header_field(llhttp_t* parser, const char* at, size_t length);
    static int on_header_field_complete(llhttp_t* parser);
    static int on_header_value(llhttp_t* parser, const char* at, size_t length);
    static int on_headers_complete(llhttp_t* parser);
    static int on_body(llhttp_t* parser, const char* at, size_t length);
    static int on_message_complete(llhttp_t* parser);

    /// Count head bytes against the limit; false once exceeded
    bool account_head(size_t length);

    llhttp_t parser_;
    llhttp_settings_t settings_;

    size_t max_header_size_;
    size_t head_bytes_ = 0;

    RequestHead head_;
    std::string body_;
    bool in_field_ = false;
    bool headers_complete_ = false;
    bool message_complete_ = false;
    std::string error_;
};

}  // namespace wren::http
