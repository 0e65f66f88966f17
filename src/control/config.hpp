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

// Wren Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wren::control {

/// Application behavior
struct AppConfig {
    bool debug = false;  // Diagnostic detail in error responses

    // Push streams
    double sse_heartbeat_interval = 15.0;       // Seconds of idle before a heartbeat
    std::optional<int64_t> sse_retry_ms;        // Client reconnect hint sent on open
    std::optional<std::string> sse_close_event;  // Event sent before a clean close

    // Request bodies
    uint64_t max_content_length = 16 * 1024 * 1024;  // 16 MiB
    uint32_t body_read_timeout_ms = 30000;

    [[nodiscard]] std::chrono::milliseconds heartbeat_interval() const noexcept {
        return std::chrono::milliseconds(static_cast<int64_t>(sse_heartbeat_interval * 1000.0));
    }
};

/// Listening socket settings for the bundled server
struct ServerConfig {
    std::string listen_address = "127.0.0.1";
    uint16_t listen_port = 8000;
    uint32_t backlog = 128;

    // Limits
    uint32_t max_header_size = 8192;     // 8KB
    uint32_t recv_buffer_size = 8192;    // Bytes per recv()
    uint32_t header_timeout_ms = 30000;  // Request line and headers must arrive within this
};

/// CORS middleware configuration
struct CorsConfig {
    bool enabled = false;
    std::vector<std::string> allow_origins;  // "*" allows any origin
    std::vector<std::string> allow_methods = {"GET", "HEAD", "OPTIONS"};
    std::vector<std::string> allow_headers;  // "*" echoes the requested headers
    std::vector<std::string> expose_headers;
    bool allow_credentials = false;
    uint32_t max_age = 600;  // Preflight cache, seconds
};

/// Security headers middleware configuration (text/html responses only)
struct SecurityHeadersConfig {
    bool enabled = false;
    std::string x_frame_options = "DENY";
    std::string x_content_type_options = "nosniff";
    std::string referrer_policy = "strict-origin-when-cross-origin";
    std::string content_security_policy =
        "default-src 'self'; script-src 'self' 'unsafe-inline'; style-src 'self' "
        "'unsafe-inline'; img-src 'self' data:; connect-src 'self'; frame-ancestors 'none'";
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";            // debug, info, warning, error
    std::string format = "json";           // json, text
    std::string output = "/var/log/wren";  // Log directory (worker_N.log appended)
    bool log_requests = true;
    std::vector<std::string> exclude_paths;  // Don't log these paths

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Wren configuration
struct Config {
    AppConfig app;
    ServerConfig server;
    CorsConfig cors;
    SecurityHeadersConfig security_headers;
    LogConfig logging;

    // Metadata
    std::string version = "1.0";
    std::optional<std::string> description;
};

// All config types use custom from_json/to_json so partial documents keep defaults

inline void from_json(const nlohmann::json& j, AppConfig& c) {
    c.debug = j.value("debug", false);
    c.sse_heartbeat_interval = j.value("sse_heartbeat_interval", 15.0);
    if (j.contains("sse_retry_ms") && !j["sse_retry_ms"].is_null()) {
        c.sse_retry_ms = j["sse_retry_ms"].get<int64_t>();
    }
    if (j.contains("sse_close_event") && !j["sse_close_event"].is_null()) {
        c.sse_close_event = j["sse_close_event"].get<std::string>();
    }
    c.max_content_length = j.value("max_content_length", uint64_t(16 * 1024 * 1024));
    c.body_read_timeout_ms = j.value("body_read_timeout_ms", 30000u);
}

inline void to_json(nlohmann::json& j, const AppConfig& c) {
    j = nlohmann::json{{"debug", c.debug},
                       {"sse_heartbeat_interval", c.sse_heartbeat_interval},
                       {"max_content_length", c.max_content_length},
                       {"body_read_timeout_ms", c.body_read_timeout_ms}};
    if (c.sse_retry_ms) {
        j["sse_retry_ms"] = *c.sse_retry_ms;
    }
    if (c.sse_close_event) {
        j["sse_close_event"] = *c.sse_close_event;
    }
}

inline void from_json(const nlohmann::json& j, ServerConfig& s) {
    s.listen_address = j.value("listen_address", std::string("127.0.0.1"));
    s.listen_port = j.value("listen_port", uint16_t(8000));
    s.backlog = j.value("backlog", 128u);
    s.max_header_size = j.value("max_header_size", 8192u);
    s.recv_buffer_size = j.value("recv_buffer_size", 8192u);
    s.header_timeout_ms = j.value("header_timeout_ms", 30000u);
}

inline void to_json(nlohmann::json& j, const ServerConfig& s) {
    j = nlohmann::json{{"listen_address", s.listen_address},
                       {"listen_port", s.listen_port},
                       {"backlog", s.backlog},
                       {"max_header_size", s.max_header_size},
                       {"recv_buffer_size", s.recv_buffer_size},
                       {"header_timeout_ms", s.header_timeout_ms}};
}

inline void from_json(const nlohmann::json& j, CorsConfig& c) {
    c.enabled = j.value("enabled", false);
    c.allow_origins = j.value("allow_origins", std::vector<std::string>{});
    c.allow_methods =
        j.value("allow_methods", std::vector<std::string>{"GET", "HEAD", "OPTIONS"});
    c.allow_headers = j.value("allow_headers", std::vector<std::string>{});
    c.expose_headers = j.value("expose_headers", std::vector<std::string>{});
    c.allow_credentials = j.value("allow_credentials", false);
    c.max_age = j.value("max_age", 600u);
}

inline void to_json(nlohmann::json& j, const CorsConfig& c) {
    j = nlohmann::json{{"enabled", c.enabled},
                       {"allow_origins", c.allow_origins},
                       {"allow_methods", c.allow_methods},
                       {"allow_headers", c.allow_headers},
                       {"expose_headers", c.expose_headers},
                       {"allow_credentials", c.allow_credentials},
                       {"max_age", c.max_age}};
}

inline void from_json(const nlohmann::json& j, SecurityHeadersConfig& c) {
    SecurityHeadersConfig defaults;
    c.enabled = j.value("enabled", false);
    c.x_frame_options = j.value("x_frame_options", defaults.x_frame_options);
    c.x_content_type_options = j.value("x_content_type_options", defaults.x_content_type_options);
    c.referrer_policy = j.value("referrer_policy", defaults.referrer_policy);
    c.content_security_policy =
        j.value("content_security_policy", defaults.content_security_policy);
}

inline void to_json(nlohmann::json& j, const SecurityHeadersConfig& c) {
    j = nlohmann::json{{"enabled", c.enabled},
                       {"x_frame_options", c.x_frame_options},
                       {"x_content_type_options", c.x_content_type_options},
                       {"referrer_policy", c.referrer_policy},
                       {"content_security_policy", c.content_security_policy}};
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("json"));
    l.output = j.value("output", std::string("/var/log/wren"));
    l.log_requests = j.value("log_requests", true);
    l.exclude_paths = j.value("exclude_paths", std::vector<std::string>{});
    if (j.contains("rotation")) {
        l.rotation = j["rotation"].get<LogConfig::RotationConfig>();
    }
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level},
                       {"format", l.format},
                       {"output", l.output},
                       {"log_requests", l.log_requests},
                       {"exclude_paths", l.exclude_paths},
                       {"rotation", l.rotation}};
}

inline void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("app")) {
        c.app = j["app"].get<AppConfig>();
    }
    if (j.contains("server")) {
        c.server = j["server"].get<ServerConfig>();
    }
    if (j.contains("cors")) {
        c.cors = j["cors"].get<CorsConfig>();
    }
    if (j.contains("security_headers")) {
        c.security_headers = j["security_headers"].get<SecurityHeadersConfig>();
    }
    if (j.contains("logging")) {
        c.logging = j["logging"].get<LogConfig>();
    }
    c.version = j.value("version", std::string("1.0"));
    if (j.contains("description") && j["description"].is_string()) {
        c.description = j["description"].get<std::string>();
    }
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{{"app", c.app},
                       {"server", c.server},
                       {"cors", c.cors},
                       {"security_headers", c.security_headers},
                       {"logging", c.logging},
                       {"version", c.version}};
    if (c.description) {
        j["description"] = *c.description;
    }
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string (std::nullopt on parse or validation errors)
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Save configuration to JSON file
    [[nodiscard]] static bool save_to_file(const Config& config, std::string_view path);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

}  // namespace wren::control
