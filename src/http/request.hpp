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

// Wren Request - Header
// Immutable request snapshot with a lazy body and per-request context storage

#pragma once

#include <any>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "http.hpp"
#include "transport.hpp"

namespace wren::http {

/// Request-scoped key/value storage shared by middleware and handlers
class RequestContext {
public:
    RequestContext() = default;

    // Non-copyable (one per request, shared by pointer)
    RequestContext(const RequestContext&) = delete;
    RequestContext& operator=(const RequestContext&) = delete;

    void set(std::string key, std::any value) { values_[std::move(key)] = std::move(value); }

    /// Typed lookup; nullptr when missing or of another type
    template <typename T>
    [[nodiscard]] const T* get(std::string_view key) const {
        auto it = values_.find(std::string(key));
        return (it != values_.end()) ? std::any_cast<T>(&it->second) : nullptr;
    }

    template <typename T>
    [[nodiscard]] T* get(std::string_view key) {
        auto it = values_.find(std::string(key));
        return (it != values_.end()) ? std::any_cast<T>(&it->second) : nullptr;
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        return values_.contains(std::string(key));
    }

    bool erase(std::string_view key) { return values_.erase(std::string(key)) > 0; }

    [[nodiscard]] size_t size() const noexcept { return values_.size(); }

    std::string correlation_id;

private:
    core::fast_map<std::string, std::any> values_;
};

/// Lazily pulls body chunks from the transport.
/// Once exhausted no further chunks come from the transport; read_all() keeps
/// returning the cached body.
class BodyReader {
public:
    BodyReader(Transport* transport, size_t max_length, std::chrono::milliseconds timeout)
        : transport_(transport), max_length_(max_length), timeout_(timeout) {}

    /// Reader over an in-memory body (tests, synthetic requests)
    [[nodiscard]] static std::shared_ptr<BodyReader> from_string(std::string body);

    // Non-copyable (cursor state)
    BodyReader(const BodyReader&) = delete;
    BodyReader& operator=(const BodyReader&) = delete;

    /// Next chunk, or std::nullopt once the body is complete.
    /// Throws core::HTTPError 408 on timeout and 413 past max_length,
    /// core::ClientDisconnected if the peer leaves mid-body.
    [[nodiscard]] std::optional<std::string> next_chunk();

    /// Remaining body, read fully and cached. A failed read is sticky:
    /// later calls rethrow the same error instead of a partial body.
    [[nodiscard]] const std::string& read_all();

    [[nodiscard]] bool exhausted() const noexcept { return exhausted_; }
    [[nodiscard]] size_t bytes_read() const noexcept { return bytes_read_; }

private:
    Transport* transport_ = nullptr;
    size_t max_length_ = 0;
    std::chrono::milliseconds timeout_{0};

    std::optional<std::string> pending_;  // In-memory body not yet handed out
    std::string cache_;
    bool cached_ = false;
    bool exhausted_ = false;
    size_t bytes_read_ = 0;
    std::exception_ptr failure_;

    [[noreturn]] void fail(std::exception_ptr error);
};

/// Path parameters of a matched route, converted per declared type
class PathParams {
public:
    struct Entry {
        std::string name;
        std::string raw;
        ParamValue value;
    };

    void add(std::string name, std::string raw, ParamValue value) {
        entries_.push_back(Entry{std::move(name), std::move(raw), std::move(value)});
    }

    [[nodiscard]] const ParamValue* get(std::string_view name) const noexcept;
    [[nodiscard]] std::optional<std::string_view> raw(std::string_view name) const noexcept;

    /// Integer value, parsing the raw string for untyped parameters
    [[nodiscard]] std::optional<int64_t> get_int(std::string_view name) const noexcept;

    /// Float value, parsing the raw string for untyped parameters
    [[nodiscard]] std::optional<double> get_float(std::string_view name) const noexcept;

    [[nodiscard]] bool contains(std::string_view name) const noexcept { return get(name) != nullptr; }
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] const Entry& at(size_t index) const { return entries_.at(index); }

    [[nodiscard]] auto begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] auto end() const noexcept { return entries_.end(); }

private:
    std::vector<Entry> entries_;
};

/// Body limits applied when a request is decoded from a transport
struct BodyLimits {
    size_t max_content_length = 16 * 1024 * 1024;
    std::chrono::milliseconds read_timeout{30000};
};

/// Immutable request snapshot. Copies share the body reader and context.
class Request {
public:
    Request() = default;

    /// Decode transport metadata
    [[nodiscard]] static Request from_transport(Transport& transport, const BodyLimits& limits);

    /// Synthetic request (tests, internal sub-requests)
    [[nodiscard]] static Request make(Method method, std::string_view target,
                                      HeaderList headers = {}, std::string body = {});

    [[nodiscard]] Method method() const noexcept { return method_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query_string() const noexcept { return query_string_; }
    [[nodiscard]] const Headers& headers() const noexcept { return headers_; }
    [[nodiscard]] const QueryParams& query() const noexcept { return query_; }
    [[nodiscard]] const PathParams& path_params() const noexcept { return path_params_; }
    [[nodiscard]] const std::string& http_version() const noexcept { return http_version_; }
    [[nodiscard]] const std::string& client_host() const noexcept { return client_host_; }
    [[nodiscard]] uint16_t client_port() const noexcept { return client_port_; }
    [[nodiscard]] const std::string& server_host() const noexcept { return server_host_; }
    [[nodiscard]] uint16_t server_port() const noexcept { return server_port_; }

    /// Shared request-scoped storage
    [[nodiscard]] RequestContext& context() const noexcept { return *context_; }

    /// Content-Type header value (empty when absent)
    [[nodiscard]] std::string_view content_type() const noexcept;

    /// Declared Content-Length, if present and numeric
    [[nodiscard]] std::optional<size_t> content_length() const noexcept;

    /// True for htmx fragment requests (HX-Request: true)
    [[nodiscard]] bool is_fragment() const noexcept;

    /// Next body chunk from the transport, std::nullopt when complete
    [[nodiscard]] std::optional<std::string> next_body_chunk() const;

    /// Whole body (cached)
    [[nodiscard]] const std::string& body() const;

    /// Whole body as text (same bytes as body())
    [[nodiscard]] const std::string& text() const { return body(); }

    /// Body parsed as JSON; throws core::HTTPError 400 on malformed input
    [[nodiscard]] nlohmann::json json() const;

    /// Derived copy carrying matched path parameters
    [[nodiscard]] Request with_path_params(PathParams params) const;

private:
    Method method_ = Method::UNKNOWN;
    std::string path_ = "/";
    std::string query_string_;
    Headers headers_;
    QueryParams query_;
    PathParams path_params_;
    std::string http_version_ = "1.1";
    std::string client_host_;
    uint16_t client_port_ = 0;
    std::string server_host_;
    uint16_t server_port_ = 0;

    std::shared_ptr<BodyReader> body_ = BodyReader::from_string({});
    std::shared_ptr<RequestContext> context_ = std::make_shared<RequestContext>();
};

/// Current request of the calling thread, or nullptr outside request handling
[[nodiscard]] const Request* current_request() noexcept;

/// Installs a request as the thread's current request and restores the
/// previous one on destruction, on the exception path as well
class RequestScope {
public:
    explicit RequestScope(const Request& request) noexcept;
    ~RequestScope();

    RequestScope(const RequestScope&) = delete;
    RequestScope& operator=(const RequestScope&) = delete;

private:
    const Request* previous_;
};

}  // namespace wren::http
