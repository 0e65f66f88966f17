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

// Wren HTTP Parser - Implementation

#include "parser.hpp"

#include <fmt/format.h>

#include <utility>

namespace wren::http {

namespace {

Method from_llhttp(uint8_t method) noexcept {
    switch (method) {
        case HTTP_GET: return Method::GET;
        case HTTP_POST: return Method::POST;
        case HTTP_PUT: return Method::PUT;
        case HTTP_DELETE: return Method::DELETE;
        case HTTP_HEAD: return Method::HEAD;
        case HTTP_OPTIONS: return Method::OPTIONS;
        case HTTP_PATCH: return Method::PATCH;
        case HTTP_CONNECT: return Method::CONNECT;
        case HTTP_TRACE: return Method::TRACE;
        default: return Method::UNKNOWN;
    }
}

RequestParser* self(llhttp_t* parser) {
    return static_cast<RequestParser*>(parser->data);
}

}  // namespace

RequestParser::RequestParser(size_t max_header_size) : max_header_size_(max_header_size) {
    llhttp_settings_init(&settings_);

    settings_.on_url = on_url;
    settings_.on_header_field = on_header_field;
    settings_.on_header_field_complete = on_header_field_complete;
    settings_.on_header_value = on_header_value;
    settings_.on_headers_complete = on_headers_complete;
    settings_.on_body = on_body;
    settings_.on_message_complete = on_message_complete;

    llhttp_init(&parser_, HTTP_REQUEST, &settings_);
    parser_.data = this;
}

ParseResult RequestParser::feed(std::string_view data) {
    if (failed()) {
        return ParseResult::Error;
    }
    if (message_complete_) {
        // Pipelined bytes belong to a request this parser will not handle
        return ParseResult::Complete;
    }

    llhttp_errno_t err = llhttp_execute(&parser_, data.data(), data.size());

    if (err != HPE_OK && err != HPE_PAUSED) {
        if (error_.empty()) {
            const char* reason = llhttp_get_error_reason(&parser_);
            error_ = fmt::format("{}: {}", llhttp_errno_name(err), reason ? reason : "");
        }
        return ParseResult::Error;
    }

    if (message_complete_) {
        return ParseResult::Complete;
    }
    return headers_complete_ ? ParseResult::HeadersComplete : ParseResult::Incomplete;
}

std::string RequestParser::take_body() {
    return std::exchange(body_, std::string{});
}

bool RequestParser::account_head(size_t length) {
    head_bytes_ += length;
    if (head_bytes_ > max_header_size_) {
        error_ = fmt::format("request head exceeds {} bytes", max_header_size_);
        return false;
    }
    return true;
}

// Callbacks (llhttp may deliver one token across several calls)

int RequestParser::on_url(llhttp_t* parser, const char* at, size_t length) {
    auto* p = self(parser);
    if (!p->account_head(length)) {
        return -1;
    }
    p->head_.target.append(at, length);
    return 0;
}

int RequestParser::on_header_field(llhttp_t* parser, const char* at, size_t length) {
    auto* p = self(parser);
    if (!p->account_head(length)) {
        return -1;
    }
    if (!p->in_field_) {
        p->head_.headers.emplace_back();
        p->in_field_ = true;
    }
    p->head_.headers.back().first.append(at, length);
    return 0;
}

int RequestParser::on_header_field_complete(llhttp_t* parser) {
    auto* p = self(parser);
    if (!p->in_field_) {
        // Empty field name
        p->head_.headers.emplace_back();
    }
    p->in_field_ = false;
    return 0;
}

int RequestParser::on_header_value(llhttp_t* parser, const char* at, size_t length) {
    auto* p = self(parser);
    if (!p->account_head(length)) {
        return -1;
    }
    if (p->head_.headers.empty()) {
        return -1;
    }
    p->head_.headers.back().second.append(at, length);
    return 0;
}

int RequestParser::on_headers_complete(llhttp_t* parser) {
    auto* p = self(parser);
    RequestHead& head = p->head_;

    head.method = from_llhttp(llhttp_get_method(parser));
    head.version = fmt::format("{}.{}", static_cast<int>(parser->http_major),
                               static_cast<int>(parser->http_minor));

    size_t query_pos = head.target.find('?');
    if (query_pos != std::string::npos) {
        head.path = head.target.substr(0, query_pos);
        head.query = head.target.substr(query_pos + 1);
    } else {
        head.path = head.target;
    }

    p->headers_complete_ = true;
    return 0;
}

int RequestParser::on_body(llhttp_t* parser, const char* at, size_t length) {
    self(parser)->body_.append(at, length);
    return 0;
}

int RequestParser::on_message_complete(llhttp_t* parser) {
    self(parser)->message_complete_ = true;
    // Stop here so trailing bytes are left unparsed
    return HPE_PAUSED;
}

}  // namespace wren::http
