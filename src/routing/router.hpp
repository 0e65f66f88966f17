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

// Wren Router - Header
// Segment trie with typed path parameters and static-over-dynamic precedence

#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "../http/http.hpp"

namespace wren::routing {

/// Declared type of a path parameter
enum class ParamType : uint8_t {
    String,     // {name} or {name:string}, one segment
    Integer,    // {name:integer}, digits only
    Float,      // {name:float}, digits with optional fraction
    RestOfPath  // {name:rest-of-path}, remaining segments including '/'
};

/// One token of a compiled route pattern
struct PathSegment {
    std::string value;  // Literal text, or the raw "{name:type}" token
    bool is_param = false;
    std::string param_name;
    ParamType param_type = ParamType::String;
};

/// Route definition (immutable once the router owns it)
struct Route {
    std::string pattern;                // e.g. "/users/{id:integer}"
    std::vector<PathSegment> segments;  // Parsed pattern
    std::vector<http::Method> methods;  // Allowed methods
    size_t handler_id = 0;              // Index into the owner's handler table
    std::string name;                   // Optional route name

    /// Declared type of a parameter, if the pattern has one by that name
    [[nodiscard]] std::optional<ParamType> param_type(std::string_view param) const noexcept;
};

/// Route parameter (raw, pre-conversion value)
struct RouteParam {
    std::string name;
    std::string value;
};

/// Successful match
struct RouteMatch {
    const Route* route = nullptr;
    std::vector<RouteParam> params;

    [[nodiscard]] bool matched() const noexcept { return route != nullptr; }

    // Helper: Get parameter value by name
    [[nodiscard]] std::optional<std::string_view> get_param(std::string_view name) const noexcept;
};

/// Outcome of Router::match
enum class MatchStatus : uint8_t {
    Matched,
    NotFound,         // No pattern matches the path
    MethodNotAllowed  // A pattern matches the path, not the method
};

/// Match result from router (routing failures are data, not exceptions)
struct MatchResult {
    MatchStatus status = MatchStatus::NotFound;
    RouteMatch match;
    std::vector<http::Method> allowed_methods;  // Set when MethodNotAllowed

    [[nodiscard]] bool matched() const noexcept { return status == MatchStatus::Matched; }
};

/// Trie node (internal)
class RouteNode {
public:
    RouteNode() = default;
    ~RouteNode() = default;

    // Non-copyable, movable
    RouteNode(const RouteNode&) = delete;
    RouteNode& operator=(const RouteNode&) = delete;
    RouteNode(RouteNode&&) noexcept = default;
    RouteNode& operator=(RouteNode&&) noexcept = default;

    core::fast_map<std::string, std::unique_ptr<RouteNode>> static_children;
    std::vector<std::unique_ptr<RouteNode>> param_children;  // Tried in registration order
    std::unique_ptr<RouteNode> rest_child;

    std::string param_name;  // For parameter and rest-of-path nodes
    ParamType param_type = ParamType::String;

    std::map<http::Method, const Route*> handlers;  // Method -> Route at this node
};

/// Router: register, compile once, then match concurrently without locking
class Router {
public:
    Router();
    ~Router();

    // Non-copyable, movable
    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;
    Router(Router&&) noexcept;
    Router& operator=(Router&&) noexcept;

    /// Register a route. Throws core::ConfigurationError on invalid syntax,
    /// duplicate method+pattern, or when called after compile()
    const Route& add(std::string_view pattern, std::vector<http::Method> methods,
                     size_t handler_id, std::string name = {});

    /// Freeze the table; later add() calls fail
    void compile() noexcept { compiled_ = true; }

    [[nodiscard]] bool compiled() const noexcept { return compiled_; }

    /// Match method and path (empty segments and trailing slashes are ignored)
    [[nodiscard]] MatchResult match(http::Method method, std::string_view path) const;

    /// All registered routes, in registration order
    [[nodiscard]] const std::deque<Route>& routes() const noexcept { return routes_; }

    /// Route registered under name, or nullptr
    [[nodiscard]] const Route* find_by_name(std::string_view name) const noexcept;

    /// Get statistics
    struct Stats {
        size_t total_routes = 0;
        size_t total_nodes = 0;
        size_t max_depth = 0;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    // Search trie for the node owning the full path
    const RouteNode* search(const RouteNode* node, const std::vector<std::string_view>& parts,
                            size_t index, std::vector<RouteParam>& params) const;

    // Calculate tree statistics
    void calculate_stats(const RouteNode* node, Stats& stats, size_t depth) const;

    std::unique_ptr<RouteNode> root_;
    std::deque<Route> routes_;  // Stable addresses for RouteNode::handlers
    bool compiled_ = false;
};

// Helper functions

/// Parse a route pattern into segments; throws core::ConfigurationError
[[nodiscard]] std::vector<PathSegment> parse_pattern(std::string_view pattern);

/// Canonical name of a parameter type ("string", "integer", "float", "rest-of-path")
[[nodiscard]] std::string_view to_string(ParamType type) noexcept;

/// Parse a type tag, accepting the short aliases str, int and path
[[nodiscard]] std::optional<ParamType> parse_param_type(std::string_view tag) noexcept;

/// Check whether a single path segment is acceptable for a parameter type
[[nodiscard]] bool segment_matches(ParamType type, std::string_view segment) noexcept;

/// Convert a raw value per the declared type; the raw string is kept when
/// conversion is impossible (out of range)
[[nodiscard]] http::ParamValue convert_param(ParamType type, std::string_view raw);

}  // namespace wren::routing
