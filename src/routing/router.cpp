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

// Wren Router - Implementation

#include "router.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>

#include "../core/errors.hpp"
#include "../core/string_utils.hpp"

namespace wren::routing {

namespace {

const std::vector<std::string> kParamTypeNames = {"string", "integer", "float", "rest-of-path",
                                                  "str",    "int",     "path"};

bool is_identifier(std::string_view name) noexcept {
    if (name.empty()) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(name[0])) && name[0] != '_') {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

bool all_digits(std::string_view s) noexcept {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c));
    });
}

// "<id>" or "<int:id>" -> "id"
std::string angle_param_name(std::string_view segment) {
    std::string_view inner = segment.substr(1, segment.size() - 2);
    size_t colon = inner.rfind(':');
    if (colon != std::string_view::npos) {
        inner = inner.substr(colon + 1);
    }
    return std::string(inner);
}

PathSegment parse_param_segment(std::string_view pattern, std::string_view segment) {
    std::string_view inner = segment.substr(1, segment.size() - 2);
    std::string_view name = inner;
    std::string_view tag;

    size_t colon = inner.find(':');
    if (colon != std::string_view::npos) {
        name = inner.substr(0, colon);
        tag = inner.substr(colon + 1);
    }

    if (!is_identifier(name)) {
        throw core::ConfigurationError(fmt::format(
            "Route pattern '{}': invalid parameter name in segment '{}'", pattern, segment));
    }

    PathSegment result;
    result.value = std::string(segment);
    result.is_param = true;
    result.param_name = std::string(name);

    if (colon != std::string_view::npos) {
        auto type = parse_param_type(tag);
        if (!type) {
            auto suggestions = core::find_similar_strings(tag, kParamTypeNames, 3);
            std::string hint = suggestions.empty()
                                   ? "expected one of: string, integer, float, rest-of-path"
                                   : fmt::format("did you mean '{}'?", suggestions.front());
            throw core::ConfigurationError(fmt::format(
                "Route pattern '{}': unknown parameter type '{}' ({})", pattern, tag, hint));
        }
        result.param_type = *type;
    }

    return result;
}

}  // namespace

// Route implementation

std::optional<ParamType> Route::param_type(std::string_view param) const noexcept {
    for (const auto& segment : segments) {
        if (segment.is_param && segment.param_name == param) {
            return segment.param_type;
        }
    }
    return std::nullopt;
}

// RouteMatch implementation

std::optional<std::string_view> RouteMatch::get_param(std::string_view name) const noexcept {
    for (const auto& param : params) {
        if (param.name == name) {
            return std::string_view(param.value);
        }
    }
    return std::nullopt;
}

// Router implementation

Router::Router() : root_(std::make_unique<RouteNode>()) {}

Router::~Router() = default;

Router::Router(Router&&) noexcept = default;
Router& Router::operator=(Router&&) noexcept = default;

const Route& Router::add(std::string_view pattern, std::vector<http::Method> methods,
                         size_t handler_id, std::string name) {
    if (compiled_) {
        throw core::ConfigurationError(fmt::format(
            "Cannot register route '{}': the router is already compiled", pattern));
    }

    if (methods.empty()) {
        throw core::ConfigurationError(
            fmt::format("Route '{}' must allow at least one method", pattern));
    }
    for (auto method : methods) {
        if (method == http::Method::UNKNOWN) {
            throw core::ConfigurationError(
                fmt::format("Route '{}' declares an unknown HTTP method", pattern));
        }
    }
    std::sort(methods.begin(), methods.end(), [](http::Method a, http::Method b) {
        return http::to_string(a) < http::to_string(b);
    });
    methods.erase(std::unique(methods.begin(), methods.end()), methods.end());

    if (!name.empty() && find_by_name(name) != nullptr) {
        throw core::ConfigurationError(fmt::format("Duplicate route name '{}'", name));
    }

    auto segments = parse_pattern(pattern);

    // Nodes grown for a rejected route keep no handlers and never match
    RouteNode* node = root_.get();
    for (const auto& segment : segments) {
        if (!segment.is_param) {
            auto& child = node->static_children[segment.value];
            if (!child) {
                child = std::make_unique<RouteNode>();
            }
            node = child.get();
        } else if (segment.param_type == ParamType::RestOfPath) {
            if (!node->rest_child) {
                node->rest_child = std::make_unique<RouteNode>();
                node->rest_child->param_name = segment.param_name;
                node->rest_child->param_type = ParamType::RestOfPath;
            } else if (node->rest_child->param_name != segment.param_name) {
                throw core::ConfigurationError(fmt::format(
                    "Route pattern '{}': rest-of-path parameter '{}' conflicts with '{}' "
                    "registered at the same position",
                    pattern, segment.param_name, node->rest_child->param_name));
            }
            node = node->rest_child.get();
        } else {
            RouteNode* found = nullptr;
            for (auto& child : node->param_children) {
                if (child->param_name == segment.param_name &&
                    child->param_type == segment.param_type) {
                    found = child.get();
                    break;
                }
            }
            if (!found) {
                auto child = std::make_unique<RouteNode>();
                child->param_name = segment.param_name;
                child->param_type = segment.param_type;
                found = child.get();
                node->param_children.push_back(std::move(child));
            }
            node = found;
        }
    }

    for (auto method : methods) {
        if (node->handlers.contains(method)) {
            throw core::ConfigurationError(fmt::format("Route {} {} is already registered",
                                                       http::to_string(method), pattern));
        }
    }

    Route& route = routes_.emplace_back();
    route.pattern = std::string(pattern);
    route.segments = std::move(segments);
    route.methods = std::move(methods);
    route.handler_id = handler_id;
    route.name = std::move(name);

    for (auto method : route.methods) {
        node->handlers[method] = &route;
    }

    return route;
}

MatchResult Router::match(http::Method method, std::string_view path) const {
    // Drop the query string if a caller passed the full target
    size_t query_pos = path.find('?');
    if (query_pos != std::string_view::npos) {
        path = path.substr(0, query_pos);
    }

    auto parts = core::split_path(path);
    std::vector<RouteParam> params;

    MatchResult result;
    const RouteNode* node = search(root_.get(), parts, 0, params);
    if (!node) {
        result.status = MatchStatus::NotFound;
        return result;
    }

    auto it = node->handlers.find(method);
    if (it == node->handlers.end()) {
        result.status = MatchStatus::MethodNotAllowed;
        for (const auto& [allowed, route] : node->handlers) {
            result.allowed_methods.push_back(allowed);
        }
        std::sort(result.allowed_methods.begin(), result.allowed_methods.end(),
                  [](http::Method a, http::Method b) {
                      return http::to_string(a) < http::to_string(b);
                  });
        return result;
    }

    result.status = MatchStatus::Matched;
    result.match.route = it->second;
    result.match.params = std::move(params);
    return result;
}

const Route* Router::find_by_name(std::string_view name) const noexcept {
    if (name.empty()) {
        return nullptr;
    }
    for (const auto& route : routes_) {
        if (route.name == name) {
            return &route;
        }
    }
    return nullptr;
}

Router::Stats Router::get_stats() const {
    Stats stats;
    stats.total_routes = routes_.size();
    calculate_stats(root_.get(), stats, 0);
    return stats;
}

// Private methods

const RouteNode* Router::search(const RouteNode* node, const std::vector<std::string_view>& parts,
                                size_t index, std::vector<RouteParam>& params) const {
    if (index == parts.size()) {
        return node->handlers.empty() ? nullptr : node;
    }

    std::string_view part = parts[index];

    // 1. Static child (exact literal)
    auto static_it = node->static_children.find(std::string(part));
    if (static_it != node->static_children.end()) {
        if (const RouteNode* found = search(static_it->second.get(), parts, index + 1, params)) {
            return found;
        }
    }

    // 2. Parameter children, typed conversion gates each candidate
    for (const auto& child : node->param_children) {
        if (!segment_matches(child->param_type, part)) {
            continue;
        }
        params.push_back(RouteParam{child->param_name, std::string(part)});
        if (const RouteNode* found = search(child.get(), parts, index + 1, params)) {
            return found;
        }
        params.pop_back();
    }

    // 3. Rest-of-path consumes everything left
    if (node->rest_child && !node->rest_child->handlers.empty()) {
        std::string remaining(parts[index]);
        for (size_t i = index + 1; i < parts.size(); ++i) {
            remaining += '/';
            remaining += parts[i];
        }
        params.push_back(RouteParam{node->rest_child->param_name, std::move(remaining)});
        return node->rest_child.get();
    }

    return nullptr;
}

void Router::calculate_stats(const RouteNode* node, Stats& stats, size_t depth) const {
    if (!node) {
        return;
    }

    stats.total_nodes++;
    stats.max_depth = std::max(stats.max_depth, depth);

    for (const auto& [segment, child] : node->static_children) {
        calculate_stats(child.get(), stats, depth + 1);
    }
    for (const auto& child : node->param_children) {
        calculate_stats(child.get(), stats, depth + 1);
    }
    calculate_stats(node->rest_child.get(), stats, depth + 1);
}

// Helper functions

std::vector<PathSegment> parse_pattern(std::string_view pattern) {
    if (pattern.empty() || pattern.front() != '/') {
        throw core::ConfigurationError(
            fmt::format("Route pattern '{}' must start with '/'", pattern));
    }

    auto parts = core::split_path(pattern);
    std::vector<PathSegment> segments;
    segments.reserve(parts.size());

    for (size_t i = 0; i < parts.size(); ++i) {
        std::string_view part = parts[i];

        if (part.size() >= 2 && part.front() == '<' && part.back() == '>') {
            std::string name = angle_param_name(part);
            throw core::ConfigurationError(fmt::format(
                "Route pattern '{}' uses unsupported parameter syntax '{}'; use '{{{}}}' instead",
                pattern, part, name));
        }

        if (part.size() >= 2 && part.front() == '{' && part.back() == '}') {
            PathSegment segment = parse_param_segment(pattern, part);
            if (segment.param_type == ParamType::RestOfPath && i + 1 != parts.size()) {
                throw core::ConfigurationError(fmt::format(
                    "Route pattern '{}': rest-of-path parameter '{}' must be the final segment",
                    pattern, segment.param_name));
            }
            for (const auto& existing : segments) {
                if (existing.is_param && existing.param_name == segment.param_name) {
                    throw core::ConfigurationError(fmt::format(
                        "Route pattern '{}' declares parameter '{}' twice", pattern,
                        segment.param_name));
                }
            }
            segments.push_back(std::move(segment));
            continue;
        }

        if (part.find_first_of("{}<>") != std::string_view::npos) {
            throw core::ConfigurationError(fmt::format(
                "Route pattern '{}': malformed segment '{}' (parameters are written '{{name}}' "
                "or '{{name:type}}')",
                pattern, part));
        }

        PathSegment segment;
        segment.value = std::string(part);
        segments.push_back(std::move(segment));
    }

    return segments;
}

std::string_view to_string(ParamType type) noexcept {
    switch (type) {
        case ParamType::String:
            return "string";
        case ParamType::Integer:
            return "integer";
        case ParamType::Float:
            return "float";
        case ParamType::RestOfPath:
            return "rest-of-path";
    }
    return "string";
}

std::optional<ParamType> parse_param_type(std::string_view tag) noexcept {
    if (tag == "string" || tag == "str")
        return ParamType::String;
    if (tag == "integer" || tag == "int")
        return ParamType::Integer;
    if (tag == "float")
        return ParamType::Float;
    if (tag == "rest-of-path" || tag == "path")
        return ParamType::RestOfPath;
    return std::nullopt;
}

bool segment_matches(ParamType type, std::string_view segment) noexcept {
    switch (type) {
        case ParamType::String:
        case ParamType::RestOfPath:
            return !segment.empty() && segment.find('/') == std::string_view::npos;
        case ParamType::Integer:
            return all_digits(segment);
        case ParamType::Float: {
            size_t dot = segment.find('.');
            if (dot == std::string_view::npos) {
                return all_digits(segment);
            }
            return all_digits(segment.substr(0, dot)) && all_digits(segment.substr(dot + 1));
        }
    }
    return false;
}

http::ParamValue convert_param(ParamType type, std::string_view raw) {
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();

    if (type == ParamType::Integer) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec == std::errc{} && ptr == last) {
            return value;
        }
    } else if (type == ParamType::Float) {
        double value = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec == std::errc{} && ptr == last) {
            return value;
        }
    }
    return std::string(raw);
}

}  // namespace wren::routing
