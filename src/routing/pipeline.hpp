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

// Wren Pipeline - Header
// Middleware chain composition

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "../http/request.hpp"
#include "../http/response.hpp"

namespace wren::routing {

/// Continuation handed to a middleware: runs the rest of the chain
using Next = std::function<http::AnyResponse(const http::Request&)>;

/// Middleware function signature.
///
/// A middleware may pass a rewritten request to next, short-circuit by
/// returning without calling next, or rewrite the response next returned.
using Middleware = std::function<http::AnyResponse(const http::Request&, const Next&)>;

/// Ordered middleware list. The first registered middleware is outermost:
/// requests pass M1, M2, ..., handler and responses return ..., M2, M1.
class Pipeline {
public:
    Pipeline() = default;
    ~Pipeline() = default;

    // Non-copyable, movable
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&&) noexcept = default;
    Pipeline& operator=(Pipeline&&) noexcept = default;

    /// Append a middleware (innermost so far)
    void use(Middleware middleware, std::string name = "CustomMiddleware");

    /// Wrap terminal with every middleware. The result holds copies of the
    /// middleware, so it stays valid after the pipeline is cleared or moved.
    [[nodiscard]] Next compose(Next terminal) const;

    [[nodiscard]] size_t size() const noexcept { return middleware_.size(); }
    [[nodiscard]] bool empty() const noexcept { return middleware_.empty(); }

    /// Registered names, outermost first (diagnostics)
    [[nodiscard]] std::vector<std::string_view> names() const;

    void clear() { middleware_.clear(); }

private:
    struct Entry {
        Middleware func;
        std::string name;
    };

    std::vector<Entry> middleware_;
};

/// Pipeline builder (fluent API)
class PipelineBuilder {
public:
    PipelineBuilder() = default;

    PipelineBuilder& use(Middleware middleware, std::string name = "CustomMiddleware") {
        pipeline_.use(std::move(middleware), std::move(name));
        return *this;
    }

    Pipeline build() && { return std::move(pipeline_); }

private:
    Pipeline pipeline_;
};

}  // namespace wren::routing
