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

// Wren Demo Server - Main Entry Point
#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <tuple>

#include "control/config.hpp"
#include "core/errors.hpp"
#include "core/http_server.hpp"
#include "core/logging.hpp"
#include "realtime/event.hpp"
#include "server/app.hpp"

namespace {

std::atomic<wren::core::HttpServer*> g_server{nullptr};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (auto* server = g_server.load()) {
            server->stop();
        }
    }
}

/// Clock ticks once per second; "?count=N" ends the stream after N ticks
wren::realtime::EventStream clock_stream(const wren::http::Request& request) {
    int64_t limit = -1;
    if (auto count = request.query().get("count")) {
        int64_t parsed = 0;
        auto [ptr, ec] = std::from_chars(count->data(), count->data() + count->size(), parsed);
        if (ec != std::errc{} || ptr != count->data() + count->size() || parsed < 0) {
            throw wren::core::HTTPError(wren::http::StatusCode::BadRequest,
                                        "count must be a non-negative integer");
        }
        limit = parsed;
    }

    auto tick = std::make_shared<int64_t>(0);
    return wren::realtime::EventStream::from_generator(
               [tick, limit](wren::realtime::CancelToken& cancel)
                   -> std::optional<wren::realtime::EventItem> {
                   if (limit >= 0 && *tick >= limit) {
                       return std::nullopt;
                   }
                   if (*tick > 0 && cancel.wait_for(std::chrono::seconds(1))) {
                       return std::nullopt;
                   }
                   auto now = std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch());
                   return nlohmann::json{{"tick", (*tick)++}, {"unix_time", now.count()}};
               })
        .with_event_type("tick");
}

void register_demo_routes(wren::server::App& app) {
    using wren::http::Request;

    app.route("/", [] {
        return nlohmann::json{{"service", "wren"}, {"endpoints", {"/hello/{name}", "/items/{id}",
                                                                  "/echo", "/clock"}}};
    });

    app.route("/hello/{name}", [](std::string name) { return "Hello, " + name + "!"; });

    app.route(
        "/items/{id:integer}",
        [](const Request& request, int64_t id) {
            return nlohmann::json{{"id", id}, {"correlation_id",
                                               request.context().correlation_id}};
        },
        {"GET"}, "item");

    app.route(
        "/echo",
        [](const Request& request) {
            return std::make_tuple(request.json(), 201);
        },
        {"POST"});

    app.route("/clock", clock_stream);

    app.error(404, [](const Request& request) {
        return std::make_tuple(nlohmann::json{{"error", "not found"}, {"path", request.path()}},
                               404);
    });
}

}  // namespace

int main(int argc, char* argv[]) {
    printf("Wren v0.1.0\n");

    if (argc < 3 || std::string(argv[1]) != "--config") {
        fprintf(stderr, "Usage: %s --config <config.json>\n", argv[0]);
        return EXIT_FAILURE;
    }

    std::string config_path = argv[2];
    printf("Loading configuration from %s...\n", config_path.c_str());

    auto config = wren::control::ConfigLoader::load_from_file(config_path);
    if (!config) {
        fprintf(stderr, "Failed to load configuration\n");
        return EXIT_FAILURE;
    }

    wren::logging::init_logging_system();
    wren::logging::init_worker_logger(0, config->logging);

    int exit_code = EXIT_SUCCESS;
    try {
        wren::server::App app(config->app);
        app.use_builtin_middleware(*config);
        register_demo_routes(app);
        app.freeze();

        wren::core::HttpServer server(config->server,
                                      [&app](wren::http::Transport& transport) {
                                          app.handle(transport);
                                      });

        if (auto ec = server.start(); ec) {
            fprintf(stderr, "Failed to listen on %s:%u: %s\n",
                    config->server.listen_address.c_str(), config->server.listen_port,
                    ec.message().c_str());
            exit_code = EXIT_FAILURE;
        } else {
            g_server.store(&server);
            std::signal(SIGINT, signal_handler);
            std::signal(SIGTERM, signal_handler);

            printf("Listening on %s:%u\n", config->server.listen_address.c_str(), server.port());
            server.run();

            g_server.store(nullptr);
        }
    } catch (const wren::core::ConfigurationError& e) {
        fprintf(stderr, "Invalid application setup: %s\n", e.what());
        exit_code = EXIT_FAILURE;
    } catch (const std::exception& e) {
        fprintf(stderr, "Server error: %s\n", e.what());
        exit_code = EXIT_FAILURE;
    }

    wren::logging::shutdown_logging();
    printf("Wren stopped.\n");
    return exit_code;
}
