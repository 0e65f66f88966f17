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

// Wren Templating - Header
// Renderable return markers and the renderer interface the core calls into

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "../http/http.hpp"

namespace wren::templating {

/// Full-page render: negotiated to a buffered text/html response
struct Template {
    std::string name;
    nlohmann::json context = nlohmann::json::object();
};

/// Named block of a template: buffered response, or an SSE "fragment" event
struct Fragment {
    std::string template_name;
    std::string block;
    nlohmann::json context = nlohmann::json::object();
    std::optional<std::string> target;  // SSE event name (defaults to "fragment")
};

/// Progressive render: negotiated to a chunked streaming response
struct Stream {
    std::string name;
    nlohmann::json context = nlohmann::json::object();
};

/// Template engine seam. The core never inspects template syntax; it only
/// calls these and wraps the result. Implementations throw on render failure.
class TemplateRenderer {
public:
    virtual ~TemplateRenderer() = default;

    [[nodiscard]] virtual std::string render(const std::string& name,
                                             const nlohmann::json& context) const = 0;

    [[nodiscard]] virtual std::string render_block(const std::string& name,
                                                   const std::string& block,
                                                   const nlohmann::json& context) const = 0;

    /// Lazy chunk sequence; chunks are produced as the response is drained
    [[nodiscard]] virtual http::ChunkSource render_stream(const std::string& name,
                                                          const nlohmann::json& context) const = 0;
};

}  // namespace wren::templating
