// Wren Middleware Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "../../src/control/config.hpp"
#include "../../src/core/errors.hpp"
#include "../../src/routing/middleware.hpp"
#include "../../src/routing/pipeline.hpp"

using namespace wren::routing;
using wren::http::AnyResponse;
using wren::http::Method;
using wren::http::Request;
using wren::http::Response;
using wren::http::StatusCode;

namespace {

Response html_response(std::string body = "<p>ok</p>") {
    Response response;
    response.body = std::move(body);
    return response;
}

const Response& as_response(const AnyResponse& response) {
    return std::get<Response>(response);
}

}  // namespace

TEST_CASE("Pipeline ordering", "[middleware]") {
    std::vector<std::string> trace;

    auto recorder = [&trace](std::string label) -> Middleware {
        return [&trace, label](const Request& request, const Next& next) {
            trace.push_back(label + ":in");
            AnyResponse response = next(request);
            trace.push_back(label + ":out");
            return response;
        };
    };

    Pipeline pipeline;
    pipeline.use(recorder("M1"), "M1");
    pipeline.use(recorder("M2"), "M2");

    Next chain = pipeline.compose([&trace](const Request&) -> AnyResponse {
        trace.push_back("handler");
        return html_response();
    });

    SECTION("first registered is outermost") {
        chain(Request::make(Method::GET, "/"));
        REQUIRE(trace ==
                std::vector<std::string>{"M1:in", "M2:in", "handler", "M2:out", "M1:out"});
    }

    SECTION("order is identical on every request") {
        chain(Request::make(Method::GET, "/"));
        auto first = trace;
        trace.clear();
        chain(Request::make(Method::GET, "/"));
        REQUIRE(trace == first);
    }

    SECTION("names are reported outermost first") {
        auto names = pipeline.names();
        REQUIRE(names.size() == 2);
        REQUIRE(names[0] == "M1");
        REQUIRE(names[1] == "M2");
    }

    SECTION("composed chain survives clearing the pipeline") {
        pipeline.clear();
        REQUIRE(pipeline.empty());
        chain(Request::make(Method::GET, "/"));
        REQUIRE(trace.size() == 5);
    }
}

TEST_CASE("Pipeline middleware behaviours", "[middleware]") {
    auto terminal = [](const Request& request) -> AnyResponse {
        return html_response("path=" + request.path());
    };

    SECTION("empty pipeline calls the handler directly") {
        Pipeline pipeline;
        auto response = pipeline.compose(terminal)(Request::make(Method::GET, "/direct"));
        REQUIRE(as_response(response).body == "path=/direct");
    }

    SECTION("short-circuit skips the handler") {
        bool handler_called = false;
        Pipeline pipeline;
        pipeline.use([](const Request&, const Next&) -> AnyResponse {
            return html_response("denied").with_status(StatusCode::Forbidden);
        });

        auto chain = pipeline.compose([&handler_called](const Request&) -> AnyResponse {
            handler_called = true;
            return html_response();
        });
        auto response = chain(Request::make(Method::GET, "/"));

        REQUIRE_FALSE(handler_called);
        REQUIRE(wren::http::status_of(response) == StatusCode::Forbidden);
    }

    SECTION("middleware can rewrite the request and the response") {
        Pipeline pipeline;
        pipeline.use([](const Request& request, const Next& next) {
            request.context().set("user", std::string("ada"));
            return wren::http::with_header(next(request), "X-Seen", "1");
        });

        auto chain = pipeline.compose([](const Request& request) -> AnyResponse {
            const auto* user = request.context().get<std::string>("user");
            return html_response(user ? *user : "none");
        });
        auto response = chain(Request::make(Method::GET, "/"));

        REQUIRE(as_response(response).body == "ada");
        REQUIRE(as_response(response).header("X-Seen") == "1");
    }

    SECTION("exceptions propagate through outer middleware") {
        Pipeline pipeline;
        bool saw_error = false;
        pipeline.use([&saw_error](const Request& request, const Next& next) {
            try {
                return next(request);
            } catch (const wren::core::NotFound&) {
                saw_error = true;
                throw;
            }
        });

        auto chain = pipeline.compose(
            [](const Request&) -> AnyResponse { throw wren::core::NotFound("gone"); });
        REQUIRE_THROWS_AS(chain(Request::make(Method::GET, "/")), wren::core::NotFound);
        REQUIRE(saw_error);
    }

    SECTION("empty middleware is rejected") {
        Pipeline pipeline;
        REQUIRE_THROWS_AS(pipeline.use(Middleware{}), wren::core::ConfigurationError);
    }

    SECTION("builder produces the same ordering") {
        std::string order;
        auto pipeline = PipelineBuilder()
                            .use([&order](const Request& r, const Next& next) {
                                order += "a";
                                return next(r);
                            })
                            .use([&order](const Request& r, const Next& next) {
                                order += "b";
                                return next(r);
                            })
                            .build();
        pipeline.compose(terminal)(Request::make(Method::GET, "/"));
        REQUIRE(order == "ab");
    }
}

TEST_CASE("CORS middleware", "[middleware][cors]") {
    wren::control::CorsConfig config;
    config.enabled = true;
    config.allow_origins = {"https://app.example.com"};
    config.allow_methods = {"GET", "POST"};
    config.allow_headers = {"Content-Type"};
    config.max_age = 300;

    auto handler = [](const Request&) -> AnyResponse { return html_response(); };

    SECTION("requests without Origin pass through untouched") {
        CorsMiddleware cors(config);
        auto response = cors(Request::make(Method::GET, "/"), handler);
        REQUIRE_FALSE(as_response(response).header("Access-Control-Allow-Origin"));
    }

    SECTION("disallowed origins get no CORS headers") {
        CorsMiddleware cors(config);
        auto response =
            cors(Request::make(Method::GET, "/", {{"Origin", "https://evil.example"}}), handler);
        REQUIRE_FALSE(as_response(response).header("Access-Control-Allow-Origin"));
    }

    SECTION("allowed origin is echoed with Vary") {
        CorsMiddleware cors(config);
        auto response = cors(
            Request::make(Method::GET, "/", {{"Origin", "https://app.example.com"}}), handler);
        const auto& r = as_response(response);
        REQUIRE(r.header("Access-Control-Allow-Origin") == "https://app.example.com");
        REQUIRE(r.header("Vary") == "Origin");
    }

    SECTION("preflight answers 204 without calling the handler") {
        CorsMiddleware cors(config);
        bool called = false;
        auto response = cors(Request::make(Method::OPTIONS, "/items",
                                           {{"Origin", "https://app.example.com"},
                                            {"Access-Control-Request-Method", "POST"}}),
                             [&called](const Request&) -> AnyResponse {
                                 called = true;
                                 return html_response();
                             });
        const auto& r = as_response(response);
        REQUIRE_FALSE(called);
        REQUIRE(r.status == StatusCode::NoContent);
        REQUIRE(r.header("Access-Control-Allow-Methods") == "GET, POST");
        REQUIRE(r.header("Access-Control-Allow-Headers") == "Content-Type");
        REQUIRE(r.header("Access-Control-Max-Age") == "300");
    }

    SECTION("OPTIONS without a requested method is not a preflight") {
        CorsMiddleware cors(config);
        bool called = false;
        auto response = cors(Request::make(Method::OPTIONS, "/items",
                                           {{"Origin", "https://app.example.com"}}),
                             [&called](const Request&) -> AnyResponse {
                                 called = true;
                                 return html_response();
                             });
        const auto& r = as_response(response);
        REQUIRE(called);
        REQUIRE(r.status == StatusCode::OK);
        REQUIRE(r.header("Access-Control-Allow-Origin") == "https://app.example.com");
        REQUIRE_FALSE(r.header("Access-Control-Allow-Methods"));
    }

    SECTION("wildcard origin without credentials answers *") {
        config.allow_origins = {"*"};
        CorsMiddleware cors(config);
        auto response =
            cors(Request::make(Method::GET, "/", {{"Origin", "https://any.example"}}), handler);
        REQUIRE(as_response(response).header("Access-Control-Allow-Origin") == "*");
        REQUIRE_FALSE(as_response(response).header("Vary"));
    }

    SECTION("wildcard headers echo the requested headers") {
        config.allow_headers = {"*"};
        CorsMiddleware cors(config);
        auto response = cors(Request::make(Method::OPTIONS, "/",
                                           {{"Origin", "https://app.example.com"},
                                            {"Access-Control-Request-Method", "GET"},
                                            {"Access-Control-Request-Headers", "X-Token"}}),
                             handler);
        REQUIRE(as_response(response).header("Access-Control-Allow-Headers") == "X-Token");
    }

    SECTION("credentials add the credentials header") {
        config.allow_credentials = true;
        config.expose_headers = {"X-Request-Id"};
        CorsMiddleware cors(config);
        auto response = cors(
            Request::make(Method::GET, "/", {{"Origin", "https://app.example.com"}}), handler);
        REQUIRE(as_response(response).header("Access-Control-Allow-Credentials") == "true");
        REQUIRE(as_response(response).header("Access-Control-Expose-Headers") == "X-Request-Id");
    }
}

TEST_CASE("Security headers middleware", "[middleware]") {
    wren::control::SecurityHeadersConfig config;
    config.enabled = true;
    config.content_security_policy = "default-src 'self'";
    SecurityHeadersMiddleware security(config);

    SECTION("HTML responses get the configured headers") {
        auto response = security(Request::make(Method::GET, "/"),
                                 [](const Request&) -> AnyResponse { return html_response(); });
        const auto& r = as_response(response);
        REQUIRE(r.header("X-Frame-Options") == "DENY");
        REQUIRE(r.header("X-Content-Type-Options") == "nosniff");
        REQUIRE(r.header("Content-Security-Policy") == "default-src 'self'");
    }

    SECTION("headers set by the handler win") {
        auto response =
            security(Request::make(Method::GET, "/"), [](const Request&) -> AnyResponse {
                return html_response().with_header("X-Frame-Options", "SAMEORIGIN");
            });
        REQUIRE(as_response(response).header("X-Frame-Options") == "SAMEORIGIN");
    }

    SECTION("non-HTML responses are left alone") {
        auto response =
            security(Request::make(Method::GET, "/"), [](const Request&) -> AnyResponse {
                return html_response("{}").with_content_type(
                    std::string(wren::http::kJsonContentType));
            });
        REQUIRE_FALSE(as_response(response).header("X-Frame-Options"));
    }
}

TEST_CASE("Request logging middleware", "[middleware]") {
    wren::control::LogConfig config;
    config.exclude_paths = {"/health"};
    RequestLoggingMiddleware logging_mw(config);

    SECTION("passes the response through") {
        auto response = logging_mw(Request::make(Method::GET, "/"),
                                   [](const Request&) -> AnyResponse { return html_response(); });
        REQUIRE(as_response(response).status == StatusCode::OK);
    }

    SECTION("excluded paths still reach the handler") {
        bool called = false;
        logging_mw(Request::make(Method::GET, "/health"), [&called](const Request&) -> AnyResponse {
            called = true;
            return html_response();
        });
        REQUIRE(called);
    }

    SECTION("errors are rethrown after logging") {
        REQUIRE_THROWS_AS(logging_mw(Request::make(Method::GET, "/"),
                                     [](const Request&) -> AnyResponse {
                                         throw wren::core::HTTPError(StatusCode::UnprocessableEntity);
                                     }),
                          wren::core::HTTPError);
    }
}
