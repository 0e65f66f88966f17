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

// Wren Pipeline - Implementation

#include "pipeline.hpp"

#include "../core/errors.hpp"

namespace wren::routing {

void Pipeline::use(Middleware middleware, std::string name) {
    if (!middleware) {
        throw core::ConfigurationError("Middleware '" + name + "' is empty");
    }
    middleware_.push_back(Entry{std::move(middleware), std::move(name)});
}

Next Pipeline::compose(Next terminal) const {
    if (!terminal) {
        throw core::ConfigurationError("Pipeline terminal handler is empty");
    }

    // Wrap from the innermost outwards so the first entry ends up outermost
    Next chain = std::move(terminal);
    for (auto it = middleware_.rbegin(); it != middleware_.rend(); ++it) {
        chain = [middleware = it->func, next = std::move(chain)](const http::Request& request) {
            return middleware(request, next);
        };
    }
    return chain;
}

std::vector<std::string_view> Pipeline::names() const {
    std::vector<std::string_view> result;
    result.reserve(middleware_.size());
    for (const auto& entry : middleware_) {
        result.push_back(entry.name);
    }
    return result;
}

}  // namespace wren::routing
