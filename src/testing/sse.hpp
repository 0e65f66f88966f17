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

// Wren Push Stream Parsing - Header
// Splits a recorded text/event-stream body back into frames

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wren::testing {

/// One decoded event frame
struct EventFrame {
    std::optional<std::string> event;
    std::optional<std::string> id;
    std::optional<int64_t> retry;
    std::string data;  // data lines joined with '\n'
    bool has_data = false;
};

struct ParsedStream {
    std::vector<EventFrame> frames;  // Frames with at least one field line
    size_t heartbeats = 0;           // Comment-only frames

    /// Frames that carry data, optionally only those named event
    [[nodiscard]] std::vector<EventFrame> data_frames(
        std::optional<std::string_view> event = std::nullopt) const;
};

/// Parse a complete push body. Frames end at a blank line; a trailing
/// unterminated frame is ignored.
[[nodiscard]] ParsedStream parse_sse_frames(std::string_view body);

}  // namespace wren::testing
