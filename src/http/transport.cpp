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

// Wren Transport - Implementation

#include "transport.hpp"

#include <stdexcept>

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace wren::http {

void GuardedTransport::send_start(StatusCode status, const HeaderList& headers) {
    if (started_) {
        throw std::logic_error("response start already sent");
    }
    started_ = true;
    inner_.send_start(status, headers);
}

void GuardedTransport::send_body(std::string_view chunk, bool more_body) {
    if (!started_) {
        throw std::logic_error("response body sent before response start");
    }
    if (finished_) {
        return;
    }
    if (!more_body) {
        finished_ = true;
    }
    inner_.send_body(chunk, more_body);
}

void GuardedTransport::finish() noexcept {
    if (finished_) {
        return;
    }

    try {
        if (!started_) {
            started_ = true;
            inner_.send_start(StatusCode::InternalServerError,
                              {{"content-type", "text/plain; charset=utf-8"},
                               {"content-length", "21"}});
            finished_ = true;
            inner_.send_body("Internal Server Error", false);
        } else {
            finished_ = true;
            inner_.send_body("", false);
        }
    } catch (const core::TransportClosed& e) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_WARNING(logger, "Connection closed before response completed: path={}, error={}",
                        inner_.info().path, e.what());
        }
    } catch (const std::exception& e) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR(logger, "Failed to complete response: path={}, error={}",
                      inner_.info().path, e.what());
        }
    }
}

}  // namespace wren::http
