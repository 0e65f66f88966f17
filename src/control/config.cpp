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

// Wren Configuration - Implementation

#include "config.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <fstream>
#include <sstream>

#include "../core/string_utils.hpp"
#include "../http/http.hpp"

namespace wren::control {

namespace {

const std::vector<std::string> kLogLevels = {"debug", "info", "warning", "error"};
const std::vector<std::string> kLogFormats = {"json", "text"};

/// "Unknown X 'value'" plus a suggestion when a known value is close
std::string unknown_value_message(std::string_view what, std::string_view value,
                                  const std::vector<std::string>& known) {
    std::string message = fmt::format("Unknown {} '{}'", what, value);
    auto similar = core::find_similar_strings(value, known, 2);
    if (!similar.empty()) {
        message += fmt::format(" (did you mean '{}'?)", similar.front());
    } else {
        message += fmt::format(" (expected one of: {})", core::join(known, ", "));
    }
    return message;
}

bool contains(const std::vector<std::string>& values, std::string_view needle) {
    for (const auto& value : values) {
        if (value == needle) {
            return true;
        }
    }
    return false;
}

void validate_app(const AppConfig& app, ValidationResult& result) {
    if (app.sse_heartbeat_interval <= 0.0) {
        result.add_error("app.sse_heartbeat_interval must be > 0 seconds");
    } else if (app.sse_heartbeat_interval < 1.0) {
        result.add_warning("app.sse_heartbeat_interval below 1 second floods idle streams");
    }

    if (app.sse_retry_ms && *app.sse_retry_ms < 0) {
        result.add_error("app.sse_retry_ms must be >= 0");
    }

    if (app.sse_close_event && app.sse_close_event->empty()) {
        result.add_error("app.sse_close_event cannot be empty");
    }

    if (app.max_content_length == 0) {
        result.add_error("app.max_content_length must be > 0");
    }

    if (app.body_read_timeout_ms == 0) {
        result.add_error("app.body_read_timeout_ms must be > 0");
    }

    if (app.debug) {
        result.add_warning("app.debug is enabled (error details are sent to clients)");
    }
}

void validate_server(const ServerConfig& server, ValidationResult& result) {
    if (server.listen_address.empty()) {
        result.add_error("server.listen_address cannot be empty");
    }

    if (server.listen_port == 0) {
        result.add_error("server.listen_port must be > 0");
    }

    if (server.backlog == 0) {
        result.add_error("server.backlog must be > 0");
    }

    if (server.max_header_size == 0) {
        result.add_error("server.max_header_size must be > 0");
    }

    if (server.recv_buffer_size == 0) {
        result.add_error("server.recv_buffer_size must be > 0");
    }

    if (server.header_timeout_ms == 0) {
        result.add_error("server.header_timeout_ms must be > 0");
    }
}

void validate_cors(const CorsConfig& cors, ValidationResult& result) {
    if (!cors.enabled) {
        return;
    }

    if (cors.allow_origins.empty()) {
        result.add_warning("cors is enabled but allow_origins is empty (no origin is allowed)");
    }

    for (const auto& method : cors.allow_methods) {
        if (http::parse_method(method) == http::Method::UNKNOWN) {
            result.add_error(fmt::format("Unknown HTTP method '{}' in cors.allow_methods", method));
        }
    }

    // Browsers reject a wildcard origin on credentialed requests
    if (cors.allow_credentials && contains(cors.allow_origins, "*")) {
        result.add_error("cors.allow_credentials cannot be combined with allow_origins '*'");
    }
}

void validate_security_headers(const SecurityHeadersConfig& headers, ValidationResult& result) {
    if (!headers.enabled) {
        return;
    }

    if (!headers.x_frame_options.empty() && headers.x_frame_options != "DENY" &&
        headers.x_frame_options != "SAMEORIGIN") {
        result.add_warning(fmt::format("security_headers.x_frame_options '{}' is not DENY or "
                                       "SAMEORIGIN",
                                       headers.x_frame_options));
    }
}

void validate_logging(const LogConfig& logging, ValidationResult& result) {
    if (!contains(kLogLevels, logging.level)) {
        result.add_error(unknown_value_message("logging level", logging.level, kLogLevels));
    }

    if (!contains(kLogFormats, logging.format)) {
        result.add_error(unknown_value_message("logging format", logging.format, kLogFormats));
    }

    if (logging.output.empty()) {
        result.add_error("logging.output cannot be empty");
    }

    if (logging.rotation.max_size_mb == 0) {
        result.add_error("logging.rotation.max_size_mb must be > 0");
    }

    if (logging.rotation.max_files == 0) {
        result.add_error("logging.rotation.max_files must be > 0");
    }
}

}  // namespace

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open config file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_json(buffer.str());
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    auto validation = validate(config);
    for (const auto& warning : validation.warnings) {
        fprintf(stderr, "Config warning: %s\n", warning.c_str());
    }
    if (validation.has_errors()) {
        for (const auto& error : validation.errors) {
            fprintf(stderr, "Config error: %s\n", error.c_str());
        }
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    validate_app(config.app, result);
    validate_server(config.server, result);
    validate_cors(config.cors, result);
    validate_security_headers(config.security_headers, result);
    validate_logging(config.logging, result);

    return result;
}

bool ConfigLoader::save_to_file(const Config& config, std::string_view path) {
    std::string json = to_json(config);
    if (json.empty()) {
        return false;
    }

    std::string path_str{path};
    std::ofstream file{path_str};
    if (!file.is_open()) {
        return false;
    }

    file << json;
    return file.good();
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON serialization error: %s\n", e.what());
        return "";
    }
}

}  // namespace wren::control
