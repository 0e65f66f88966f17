// Wren Dispatch Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "../../src/core/errors.hpp"
#include "../../src/server/app.hpp"
#include "../../src/testing/client.hpp"

using namespace wren::server;
using wren::http::Method;
using wren::http::Request;
using wren::testing::MemoryTransport;
using wren::testing::TestClient;
using Catch::Matchers::ContainsSubstring;

namespace {

struct QuotaExceeded : wren::core::HTTPError {
    QuotaExceeded() : HTTPError(wren::http::StatusCode::Forbidden, "quota exceeded") {}
};

}  // namespace

TEST_CASE("Routing outcomes", "[dispatch]") {
    App app;
    app.route("/", [] { return "home"; });
    app.route("/users/{id:int}", [](int64_t id) { return nlohmann::json{{"id", id}}; });
    app.route("/users", [] { return "created"; }, {"POST"});
    app.route("/greet/{name}", [](const Request& request, std::string name) {
        return "hello " + name + " from " + request.client_host();
    });
    TestClient client(app);

    SECTION("matched route runs its handler") {
        auto response = client.get("/");
        REQUIRE(response.status_code() == 200);
        REQUIRE(response.body == "home");
        REQUIRE(response.header("content-type") == std::string(wren::http::kHtmlContentType));
        REQUIRE(response.header("content-length") == "4");
        REQUIRE(response.finished);
    }

    SECTION("typed parameters arrive converted") {
        auto response = client.get("/users/42");
        REQUIRE(response.status_code() == 200);
        REQUIRE(response.json() == nlohmann::json{{"id", 42}});
    }

    SECTION("request and raw parameter together") {
        auto response = client.get("/greet/ada");
        REQUIRE(response.body == "hello ada from 127.0.0.1");
    }

    SECTION("percent-encoded segments are decoded before matching") {
        auto response = client.get("/greet/grace%20hopper");
        REQUIRE(response.body == "hello grace hopper from 127.0.0.1");
    }

    SECTION("type mismatch is not found") {
        REQUIRE(client.get("/users/abc").status_code() == 404);
    }

    SECTION("unknown path is 404") {
        auto response = client.get("/missing");
        REQUIRE(response.status_code() == 404);
        REQUIRE_THAT(response.body, ContainsSubstring("/missing"));
    }

    SECTION("wrong method is 405 with Allow") {
        auto response = client.request(Method::DELETE, "/users");
        REQUIRE(response.status_code() == 405);
        REQUIRE(response.header("allow") == "POST");
        REQUIRE(response.header_count("allow") == 1);
    }
}

TEST_CASE("Request bodies reach handlers", "[dispatch]") {
    App app;
    app.route("/echo", [](const Request& request) {
        return std::make_tuple(request.json(), 201);
    }, {"POST"});
    TestClient client(app);

    SECTION("JSON body") {
        auto response = client.post("/echo", R"({"name":"wren"})",
                                     {{"Content-Type", "application/json"}});
        REQUIRE(response.status_code() == 201);
        REQUIRE(response.json()["name"] == "wren");
    }

    SECTION("malformed JSON is a 400") {
        REQUIRE(client.post("/echo", "{oops").status_code() == 400);
    }

    SECTION("body split across transport messages") {
        MemoryTransport transport(MemoryTransport::make_info(Method::POST, "/echo", {}),
                                  {R"({"parts":)", "[1,2]}"});
        auto response = client.send(transport);
        REQUIRE(response.status_code() == 201);
        REQUIRE(response.json()["parts"].size() == 2);
    }
}

TEST_CASE("Body limits", "[dispatch]") {
    wren::control::AppConfig config;
    config.max_content_length = 8;
    config.body_read_timeout_ms = 50;
    App app(config);
    app.route("/upload", [](const Request& request) { return request.body(); }, {"POST"});
    TestClient client(app);

    SECTION("oversized body is 413") {
        REQUIRE(client.post("/upload", "0123456789").status_code() == 413);
    }

    SECTION("body within the limit") {
        REQUIRE(client.post("/upload", "short").body == "short");
    }

    SECTION("stalled body is 408") {
        MemoryTransport stalled(MemoryTransport::make_info(Method::POST, "/upload", {}));
        // Drain the final body message so the handler's read waits
        (void)stalled.receive(std::chrono::milliseconds(0));
        auto response = client.send(stalled);
        REQUIRE(response.status_code() == 408);
    }
}

TEST_CASE("Error handler lookup", "[dispatch]") {
    App app;
    app.route("/quota", []() -> std::string { throw QuotaExceeded(); });
    app.route("/forbidden", []() -> std::string {
        throw wren::core::HTTPError(wren::http::StatusCode::Forbidden, "no entry");
    });
    app.route("/boom", []() -> std::string { throw std::runtime_error("kaboom"); });
    app.route("/bad-return", [] { return nlohmann::json(42); });

    app.error<QuotaExceeded>([](const Request&, const QuotaExceeded& e) {
        return std::string("type handler: ") + e.detail();
    });
    app.error(403, [] { return "status handler"; });
    app.error(404, [](const Request& request) {
        return std::make_tuple(nlohmann::json{{"missing", request.path()}}, 404);
    });
    TestClient client(app);

    SECTION("exact exception type wins over status") {
        auto response = client.get("/quota");
        REQUIRE(response.status_code() == 403);
        REQUIRE(response.body == "type handler: quota exceeded");
    }

    SECTION("status handler result of 200 takes the error status") {
        auto response = client.get("/forbidden");
        REQUIRE(response.status_code() == 403);
        REQUIRE(response.body == "status handler");
    }

    SECTION("404 handler for unmatched paths") {
        auto response = client.get("/nowhere");
        REQUIRE(response.status_code() == 404);
        REQUIRE(response.json()["missing"] == "/nowhere");
    }

    SECTION("unhandled exceptions are a generic 500") {
        auto response = client.get("/boom");
        REQUIRE(response.status_code() == 500);
        REQUIRE(response.body == "Internal Server Error");
        REQUIRE_THAT(response.body, !ContainsSubstring("kaboom"));
    }

    SECTION("non-convertible return values are a 500") {
        REQUIRE(client.get("/bad-return").status_code() == 500);
    }
}

TEST_CASE("Internal error handlers", "[dispatch]") {
    App app;
    app.route("/boom", []() -> std::string { throw std::runtime_error("kaboom"); });
    app.route("/logic", []() -> std::string { throw std::logic_error("wrong"); });

    SECTION("status 500 handler is consulted first") {
        app.error(500, [](const Request&, const std::exception& e) {
            return std::string("500 handler: ") + e.what();
        });
        app.error<std::runtime_error>([] { return "type handler"; });
        TestClient client(app);

        auto response = client.get("/boom");
        REQUIRE(response.status_code() == 500);
        REQUIRE(response.body == "500 handler: kaboom");
    }

    SECTION("exception type handler without a 500 handler") {
        app.error<std::logic_error>([] { return std::make_tuple("logic", 409); });
        TestClient client(app);

        auto response = client.get("/logic");
        REQUIRE(response.status_code() == 409);
        REQUIRE(response.body == "logic");
    }

    SECTION("a failing error handler falls back to the default") {
        app.error(500, []() -> std::string { throw std::runtime_error("handler broke"); });
        TestClient client(app);

        auto response = client.get("/boom");
        REQUIRE(response.status_code() == 500);
        REQUIRE(response.body == "Internal Server Error");
    }
}

TEST_CASE("Values thrown outside std::exception", "[dispatch]") {
    App app;
    app.route("/int", []() -> std::string { throw 42; });
    app.route("/ok", [] { return "ok"; });

    SECTION("handler throw is a generic 500") {
        TestClient client(app);
        auto response = client.get("/int");
        REQUIRE(response.status_code() == 500);
        REQUIRE(response.body == "Internal Server Error");
        REQUIRE(response.finished);

        // Later requests are still served
        REQUIRE(client.get("/ok").status_code() == 200);
    }

    SECTION("500 handler sees the unknown exception") {
        app.error(500, [](const Request&, const std::exception& e) {
            return std::string("500 handler: ") + e.what();
        });
        TestClient client(app);
        REQUIRE(client.get("/int").body == "500 handler: unknown exception");
    }

    SECTION("middleware throw") {
        app.use([](const Request& request, const wren::routing::Next& next) {
            if (request.path() == "/ok") {
                throw std::string("middleware");
            }
            return next(request);
        });
        TestClient client(app);
        REQUIRE(client.get("/ok").status_code() == 500);
    }

    SECTION("error handler throw falls back to the default") {
        app.error(500, []() -> std::string { throw 7; });
        TestClient client(app);
        auto response = client.get("/int");
        REQUIRE(response.status_code() == 500);
        REQUIRE(response.body == "Internal Server Error");
    }

    SECTION("stream chunk throw ends the body with a marker") {
        app.route("/stream", [] {
            wren::http::StreamingResponse response;
            auto sent = std::make_shared<bool>(false);
            response.chunks = [sent]() -> std::optional<std::string> {
                if (*sent) {
                    throw 42;
                }
                *sent = true;
                return std::string("<p>first</p>");
            };
            return response;
        });
        TestClient client(app);
        auto response = client.get("/stream");
        REQUIRE(response.status_code() == 200);
        REQUIRE(response.finished);
        REQUIRE(response.body == "<p>first</p><!-- wren: render error -->");
    }
}

TEST_CASE("Debug mode error detail", "[dispatch]") {
    wren::control::AppConfig config;
    config.debug = true;
    App app(config);
    app.route("/boom", []() -> std::string { throw std::runtime_error("kaboom"); });
    TestClient client(app);

    auto response = client.get("/boom");
    REQUIRE(response.status_code() == 500);
    REQUIRE(response.body == "500: kaboom");
}

TEST_CASE("Fragment requests get fragment errors", "[dispatch]") {
    App app;
    app.route("/broken", []() -> std::string {
        throw wren::core::HTTPError(wren::http::StatusCode::UnprocessableEntity,
                                    "name <required>");
    });
    TestClient client(app);

    auto response = client.get("/broken", {{"HX-Request", "true"}});
    REQUIRE(response.status_code() == 422);
    REQUIRE(response.body ==
            R"(<div class="wren-error" data-status="422">name &lt;required&gt;</div>)");
    REQUIRE(response.header("hx-retarget") == "#wren-error");
    REQUIRE(response.header("hx-reswap") == "innerHTML");

    auto plain = client.get("/broken");
    REQUIRE(plain.body == "name <required>");
    REQUIRE_FALSE(plain.header("hx-retarget"));
}

TEST_CASE("Middleware sees routing errors", "[dispatch]") {
    App app;
    std::string seen;
    app.use([&seen](const Request& request, const wren::routing::Next& next) {
        try {
            return next(request);
        } catch (const wren::core::NotFound&) {
            seen = "not found";
            throw;
        }
    });
    app.route("/", [] { return "ok"; });
    TestClient client(app);

    REQUIRE(client.get("/nope").status_code() == 404);
    REQUIRE(seen == "not found");
}

TEST_CASE("Registration freezes on first request", "[dispatch]") {
    App app;
    app.route("/", [] { return "ok"; });
    TestClient client(app);

    REQUIRE_FALSE(app.frozen());
    client.get("/");
    REQUIRE(app.frozen());

    REQUIRE_THROWS_AS(app.route("/late", [] { return "late"; }), wren::core::ConfigurationError);
    REQUIRE_THROWS_AS(app.error(404, [] { return "x"; }), wren::core::ConfigurationError);
    REQUIRE_THROWS_AS(app.use([](const Request& r, const wren::routing::Next& next) {
                          return next(r);
                      }),
                      wren::core::ConfigurationError);
}

TEST_CASE("Registration validation", "[dispatch]") {
    App app;

    SECTION("unknown method") {
        REQUIRE_THROWS_AS(app.route("/", [] { return "x"; }, {"FETCH"}),
                          wren::core::ConfigurationError);
    }

    SECTION("handler wants more parameters than the pattern has") {
        REQUIRE_THROWS_WITH(app.route("/items/{id}", [](std::string, std::string) { return "x"; }),
                            ContainsSubstring("takes 2 path parameters"));
    }

    SECTION("error status out of range") {
        REQUIRE_THROWS_AS(app.error(42, [] { return "x"; }), wren::core::ConfigurationError);
    }
}
