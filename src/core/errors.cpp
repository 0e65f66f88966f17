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

// Wren Errors - Implementation

#include "errors.hpp"

#include <fmt/format.h>

#include <algorithm>

#include "string_utils.hpp"

namespace wren::core {

namespace {

std::string describe(http::StatusCode status, const std::string& detail) {
    if (detail.empty()) {
        return fmt::format("{}", http::to_int(status));
    }
    return fmt::format("{}: {}", http::to_int(status), detail);
}

}  // namespace

HTTPError::HTTPError(http::StatusCode status, std::string detail, http::HeaderList headers)
    : WrenError(describe(status, detail)),
      status_(status),
      detail_(std::move(detail)),
      headers_(std::move(headers)) {}

NotFound::NotFound(std::string detail)
    : HTTPError(http::StatusCode::NotFound, std::move(detail)) {}

MethodNotAllowed::MethodNotAllowed(std::vector<http::Method> allowed, std::string detail)
    : HTTPError(http::StatusCode::MethodNotAllowed, std::move(detail),
                {{"Allow", format_allow_header(allowed)}}),
      allowed_(std::move(allowed)) {}

std::string format_allow_header(const std::vector<http::Method>& methods) {
    std::vector<std::string> names;
    names.reserve(methods.size());
    for (auto method : methods) {
        names.emplace_back(http::to_string(method));
    }
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    return join(names, ", ");
}

}  // namespace wren::core
