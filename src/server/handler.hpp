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

// Wren Handler Adapters - Header
// Resolve handler arguments (request, typed path parameters) from their signature

#pragma once

#include <fmt/format.h>

#include <charconv>
#include <cstddef>
#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include "../core/errors.hpp"
#include "../http/request.hpp"
#include "negotiation.hpp"

namespace wren::server {

/// Type-erased route handler
using Handler = std::function<ReturnValue(const http::Request&)>;

/// Type-erased error handler
using ErrorHandler = std::function<ReturnValue(const http::Request&, const std::exception&)>;

/// Route handler plus the number of path parameters it consumes
struct BoundHandler {
    Handler call;
    size_t path_arity = 0;
};

namespace detail {

template <typename T>
struct callable_traits : callable_traits<decltype(&T::operator())> {};

template <typename R, typename... Args>
struct callable_traits<R (*)(Args...)> {
    using result = R;
    using args = std::tuple<Args...>;
};

template <typename R, typename... Args>
struct callable_traits<R(Args...)> : callable_traits<R (*)(Args...)> {};

template <typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...) const> : callable_traits<R (*)(Args...)> {};

template <typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...)> : callable_traits<R (*)(Args...)> {};

template <typename T>
using bare_t = std::remove_cv_t<std::remove_reference_t<T>>;

template <typename T>
inline constexpr bool is_request_v = std::is_same_v<bare_t<T>, http::Request>;

template <typename Tuple>
struct leading_request : std::false_type {};

template <typename First, typename... Rest>
struct leading_request<std::tuple<First, Rest...>> : std::bool_constant<is_request_v<First>> {};

template <typename T>
inline constexpr bool always_false_v = false;

template <typename U>
U parse_path_number(const http::PathParams::Entry& entry, std::string_view kind) {
    U value{};
    const char* first = entry.raw.data();
    const char* last = first + entry.raw.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        throw core::NotFound(fmt::format("Path parameter '{}' value '{}' is not a valid {}",
                                         entry.name, entry.raw, kind));
    }
    return value;
}

/// Convert the path parameter at index to the handler's declared type.
/// Text types get the raw segment; numbers that don't convert are a 404.
template <typename T>
bare_t<T> path_arg(const http::PathParams& params, size_t index) {
    using U = bare_t<T>;
    const auto& entry = params.at(index);

    if constexpr (std::is_same_v<U, http::ParamValue>) {
        return entry.value;
    } else if constexpr (std::is_same_v<U, std::string> || std::is_same_v<U, std::string_view>) {
        return U(entry.raw);
    } else if constexpr (std::is_same_v<U, bool>) {
        static_assert(always_false_v<U>, "bool path parameters are not supported");
    } else if constexpr (std::is_integral_v<U>) {
        if (const auto* number = std::get_if<int64_t>(&entry.value)) {
            if (std::in_range<U>(*number)) {
                return static_cast<U>(*number);
            }
        }
        return parse_path_number<U>(entry, "integer");
    } else if constexpr (std::is_floating_point_v<U>) {
        if (const auto* number = std::get_if<double>(&entry.value)) {
            return static_cast<U>(*number);
        }
        if (const auto* number = std::get_if<int64_t>(&entry.value)) {
            return static_cast<U>(*number);
        }
        return parse_path_number<U>(entry, "number");
    } else {
        static_assert(always_false_v<U>,
                      "path parameters bind to std::string, std::string_view, integers, "
                      "floating point or http::ParamValue");
    }
}

template <typename F, typename Args, size_t Offset, size_t... I>
ReturnValue invoke_route(const F& handler, const http::Request& request,
                         std::index_sequence<I...>) {
    const auto& params = request.path_params();
    if constexpr (Offset == 1) {
        return ReturnValue(
            handler(request, path_arg<std::tuple_element_t<I + 1, Args>>(params, I)...));
    } else {
        return ReturnValue(handler(path_arg<std::tuple_element_t<I, Args>>(params, I)...));
    }
}

}  // namespace detail

/// Adapt a route handler. Accepted shapes, path parameters in pattern order:
///   ()                          R(const Request&)
///   R(std::string, int64_t)     R(const Request&, double, ParamValue)
/// R is anything ReturnValue accepts.
template <typename F>
BoundHandler make_handler(F handler) {
    using traits = detail::callable_traits<std::decay_t<F>>;
    using args = typename traits::args;
    static_assert(!std::is_void_v<typename traits::result>, "route handlers must return a value");

    constexpr size_t offset = detail::leading_request<args>::value ? 1 : 0;
    constexpr size_t path_arity = std::tuple_size_v<args> - offset;

    Handler call = [handler = std::move(handler)](const http::Request& request) {
        return detail::invoke_route<std::decay_t<F>, args, offset>(
            handler, request, std::make_index_sequence<path_arity>{});
    };
    return BoundHandler{std::move(call), path_arity};
}

/// Adapt an error handler taking (), (const Request&) or
/// (const Request&, const std::exception&)
template <typename F>
ErrorHandler make_error_handler(F handler) {
    using H = std::decay_t<F>;
    if constexpr (std::is_invocable_v<const H&, const http::Request&, const std::exception&>) {
        return [handler = std::move(handler)](const http::Request& request,
                                              const std::exception& error) {
            return ReturnValue(handler(request, error));
        };
    } else if constexpr (std::is_invocable_v<const H&, const http::Request&>) {
        return [handler = std::move(handler)](const http::Request& request,
                                              const std::exception&) {
            return ReturnValue(handler(request));
        };
    } else {
        static_assert(std::is_invocable_v<const H&>,
                      "error handlers take (), (const Request&) or "
                      "(const Request&, const std::exception&)");
        return [handler = std::move(handler)](const http::Request&, const std::exception&) {
            return ReturnValue(handler());
        };
    }
}

/// Adapt an error handler for exception type E; it may take (const Request&, const E&).
/// Only called for exceptions whose dynamic type is exactly E.
template <typename E, typename F>
ErrorHandler make_exception_handler(F handler) {
    using H = std::decay_t<F>;
    if constexpr (std::is_invocable_v<const H&, const http::Request&, const E&>) {
        return [handler = std::move(handler)](const http::Request& request,
                                              const std::exception& error) {
            return ReturnValue(handler(request, dynamic_cast<const E&>(error)));
        };
    } else {
        return make_error_handler(std::move(handler));
    }
}

}  // namespace wren::server
