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

// Wren Push Stream Parsing - Implementation

#include "sse.hpp"

#include <charconv>
#include <utility>

#include "../core/string_utils.hpp"

namespace wren::testing {

namespace {

/// "field: value" -> (field, value); a single space after ':' is dropped
std::pair<std::string_view, std::string_view> split_field(std::string_view line) {
    size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
        return {line, {}};
    }
    std::string_view value = line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') {
        value.remove_prefix(1);
    }
    return {line.substr(0, colon), value};
}

}  // namespace

std::vector<EventFrame> ParsedStream::data_frames(std::optional<std::string_view> event) const {
    std::vector<EventFrame> result;
    for (const auto& frame : frames) {
        if (!frame.has_data) {
            continue;
        }
        if (event && frame.event.value_or("") != *event) {
            continue;
        }
        result.push_back(frame);
    }
    return result;
}

ParsedStream parse_sse_frames(std::string_view body) {
    ParsedStream parsed;

    size_t pos = 0;
    while (pos < body.size()) {
        size_t end = body.find("\n\n", pos);
        if (end == std::string_view::npos) {
            break;
        }
        std::string_view block = body.substr(pos, end - pos);
        pos = end + 2;

        EventFrame frame;
        bool has_field = false;
        bool has_comment = false;

        for (std::string_view line : core::split_lines(block)) {
            if (line.empty()) {
                continue;
            }
            if (line.front() == ':') {
                has_comment = true;
                continue;
            }

            auto [field, value] = split_field(line);
            has_field = true;
            if (field == "data") {
                if (frame.has_data) {
                    frame.data += '\n';
                }
                frame.data.append(value);
                frame.has_data = true;
            } else if (field == "event") {
                frame.event = std::string(value);
            } else if (field == "id") {
                frame.id = std::string(value);
            } else if (field == "retry") {
                int64_t retry = 0;
                auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), retry);
                if (ec == std::errc{} && ptr == value.data() + value.size()) {
                    frame.retry = retry;
                }
            }
        }

        if (has_field) {
            parsed.frames.push_back(std::move(frame));
        } else if (has_comment) {
            ++parsed.heartbeats;
        }
    }

    return parsed;
}

}  // namespace wren::testing
