// Wren Configuration Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <filesystem>

#include "../../src/control/config.hpp"

using namespace wren::control;
using Catch::Matchers::ContainsSubstring;

namespace {

bool has_error_containing(const ValidationResult& result, std::string_view needle) {
    for (const auto& error : result.errors) {
        if (error.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

TEST_CASE("Config defaults from a partial document", "[config]") {
    auto config = ConfigLoader::load_from_json(R"({
        "app": {"debug": false, "sse_retry_ms": 3000},
        "server": {"listen_port": 9000}
    })");
    REQUIRE(config.has_value());

    REQUIRE(config->server.listen_port == 9000);
    REQUIRE(config->server.listen_address == "127.0.0.1");
    REQUIRE(config->server.header_timeout_ms == 30000);
    REQUIRE(config->app.sse_retry_ms == 3000);
    REQUIRE_FALSE(config->app.sse_close_event.has_value());
    REQUIRE(config->app.sse_heartbeat_interval == 15.0);
    REQUIRE(config->app.heartbeat_interval() == std::chrono::milliseconds(15000));
    REQUIRE(config->app.max_content_length == 16u * 1024 * 1024);
    REQUIRE_FALSE(config->cors.enabled);
    REQUIRE(config->logging.level == "info");
}

TEST_CASE("Config rejects malformed documents", "[config]") {
    REQUIRE_FALSE(ConfigLoader::load_from_json("{not json").has_value());
    REQUIRE_FALSE(ConfigLoader::load_from_json(R"({"server": {"listen_port": "eighty"}})")
                      .has_value());
    REQUIRE_FALSE(ConfigLoader::load_from_json(R"({"server": {"listen_port": 0}})").has_value());
}

TEST_CASE("Config validation", "[config]") {
    Config config;
    REQUIRE(ConfigLoader::validate(config).valid);

    SECTION("server limits") {
        config.server.listen_port = 0;
        config.server.header_timeout_ms = 0;
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.has_errors());
        REQUIRE(has_error_containing(result, "listen_port"));
        REQUIRE(has_error_containing(result, "header_timeout_ms"));
    }

    SECTION("push stream settings") {
        config.app.sse_heartbeat_interval = 0.0;
        config.app.sse_retry_ms = -1;
        config.app.sse_close_event = "";
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.errors.size() == 3);
    }

    SECTION("short heartbeat is only a warning") {
        config.app.sse_heartbeat_interval = 0.5;
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.valid);
        REQUIRE(result.warnings.size() == 1);
    }

    SECTION("credentialed CORS cannot use a wildcard origin") {
        config.cors.enabled = true;
        config.cors.allow_origins = {"*"};
        config.cors.allow_credentials = true;
        auto result = ConfigLoader::validate(config);
        REQUIRE(has_error_containing(result, "allow_credentials"));
    }

    SECTION("unknown CORS method") {
        config.cors.enabled = true;
        config.cors.allow_origins = {"https://app.example.com"};
        config.cors.allow_methods = {"GET", "FETCH"};
        REQUIRE(has_error_containing(ConfigLoader::validate(config), "'FETCH'"));
    }

    SECTION("log level typo suggests the right one") {
        config.logging.level = "warnig";
        auto result = ConfigLoader::validate(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE_THAT(result.errors.front(), ContainsSubstring("did you mean 'warning'"));
    }

    SECTION("unrelated log format lists the choices") {
        config.logging.format = "xml-ish-thing";
        auto result = ConfigLoader::validate(config);
        REQUIRE_THAT(result.errors.front(), ContainsSubstring("expected one of: json, text"));
    }

    SECTION("debug mode warns") {
        config.app.debug = true;
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.valid);
        REQUIRE_FALSE(result.warnings.empty());
    }
}

TEST_CASE("Config serialization", "[config]") {
    Config config;
    config.app.sse_close_event = "done";
    config.server.listen_port = 8123;
    config.cors.enabled = true;
    config.cors.allow_origins = {"https://app.example.com"};
    config.logging.exclude_paths = {"/health"};
    config.description = "test";

    std::string json = ConfigLoader::to_json(config);
    REQUIRE_THAT(json, ContainsSubstring("\"listen_port\": 8123"));

    auto parsed = ConfigLoader::load_from_json(json);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->app.sse_close_event == "done");
    REQUIRE_FALSE(parsed->app.sse_retry_ms.has_value());
    REQUIRE(parsed->cors.allow_origins == config.cors.allow_origins);
    REQUIRE(parsed->logging.exclude_paths == config.logging.exclude_paths);
    REQUIRE(parsed->description == "test");

    SECTION("file round trip") {
        auto path = std::filesystem::temp_directory_path() / "wren_config_test.json";
        REQUIRE(ConfigLoader::save_to_file(config, path.string()));

        auto loaded = ConfigLoader::load_from_file(path.string());
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->server.listen_port == 8123);
        std::filesystem::remove(path);
    }

    SECTION("missing file") {
        REQUIRE_FALSE(ConfigLoader::load_from_file("/nonexistent/wren.json").has_value());
    }
}
