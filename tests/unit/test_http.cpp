// Wren HTTP Layer Unit Tests

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <thread>

#include "../../src/core/http_server.hpp"
#include "../../src/core/socket.hpp"
#include "../../src/core/socket_transport.hpp"
#include "../../src/http/http.hpp"
#include "../../src/http/parser.hpp"
#include "../../src/server/app.hpp"

using namespace wren::http;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using namespace std::chrono_literals;

namespace {

/// Blocking loopback client connection
wren::core::FileDescriptor connect_loopback(uint16_t port) {
    wren::core::FileDescriptor fd(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return {};
    }
    return fd;
}

/// Read until the peer closes
std::string read_to_eof(int fd) {
    std::string out;
    char buffer[4096];
    std::error_code ec;
    while (wren::core::wait_readable(fd, 2000ms, ec)) {
        size_t n = wren::core::recv_some(fd, buffer, sizeof(buffer), ec);
        if (ec || n == 0) {
            break;
        }
        out.append(buffer, n);
    }
    return out;
}

/// Connected (server side, client side) pair over loopback TCP
struct LoopbackPair {
    wren::core::FileDescriptor listener;
    wren::core::FileDescriptor server;
    wren::core::FileDescriptor client;

    LoopbackPair() {
        std::error_code ec;
        listener = wren::core::create_listening_socket("127.0.0.1", 0, 4, ec);
        REQUIRE_FALSE(ec);
        client = connect_loopback(wren::core::local_endpoint(listener.get()).port);
        REQUIRE(client.valid());
        server = wren::core::accept_connection(listener.get(), ec);
        REQUIRE_FALSE(ec);
    }

    void send(std::string_view data) { REQUIRE_FALSE(wren::core::send_all(client.get(), data)); }
};

}  // namespace

TEST_CASE("HTTP method and status helpers", "[http]") {
    REQUIRE(to_string(Method::PATCH) == "PATCH");
    REQUIRE(parse_method("DELETE") == Method::DELETE);
    REQUIRE(parse_method("get") == Method::UNKNOWN);

    REQUIRE(to_reason_phrase(StatusCode::NotFound) == "Not Found");
    REQUIRE(to_reason_phrase(to_status(599)) == "Unknown");
    REQUIRE(to_int(to_status(418)) == 418);

    REQUIRE(header_name_equals("Content-Type", "content-type"));
    REQUIRE_FALSE(header_name_equals("Content-Type", "Content-Length"));
    REQUIRE(to_lower("X-Request-ID") == "x-request-id");
}

TEST_CASE("URL decoding", "[http]") {
    REQUIRE(url_decode("/a%20b") == "/a b");
    REQUIRE(url_decode("a+b") == "a+b");
    REQUIRE(url_decode("a+b", true) == "a b");
    REQUIRE(url_decode("%E2%9C%93") == "\xE2\x9C\x93");
    // Malformed escapes are kept literally
    REQUIRE(url_decode("100%") == "100%");
    REQUIRE(url_decode("%zz") == "%zz");
}

TEST_CASE("Headers and query parameters", "[http]") {
    Headers headers({{"Accept", "text/html"}, {"X-Tag", "a"}, {"x-tag", "b"}});
    REQUIRE(headers.get("accept") == "text/html");
    REQUIRE(headers.get_or("Missing", "fallback") == "fallback");
    REQUIRE(headers.get_list("X-TAG") == std::vector<std::string_view>{"a", "b"});
    REQUIRE_FALSE(headers.contains("Cookie"));

    auto query = QueryParams::parse("q=wren+core&tag=a&tag=b&page=3&flag=on&empty=&&=x&bad%zz");
    REQUIRE(query.get("q") == "wren core");
    REQUIRE(query.get_list("tag") == std::vector<std::string_view>{"a", "b"});
    REQUIRE(query.get_int("page") == 3);
    REQUIRE_FALSE(query.get_int("q").has_value());
    REQUIRE(query.get_bool("flag") == true);
    REQUIRE(query.get("empty") == "");
    REQUIRE(query.contains("bad%zz"));
    REQUIRE_FALSE(query.contains(""));
}

TEST_CASE("Request parser", "[http][parser]") {
    RequestParser parser;

    SECTION("request delivered in pieces") {
        REQUIRE(parser.feed("POST /items?id=7 HT") == ParseResult::Incomplete);
        REQUIRE(parser.feed("TP/1.1\r\nHost: example.com\r\nX-Empty:\r\n") ==
                ParseResult::Incomplete);
        REQUIRE(parser.feed("Content-Length: 5\r\n\r\nhe") == ParseResult::HeadersComplete);

        const auto& head = parser.head();
        REQUIRE(head.method == Method::POST);
        REQUIRE(head.target == "/items?id=7");
        REQUIRE(head.path == "/items");
        REQUIRE(head.query == "id=7");
        REQUIRE(head.version == "1.1");
        REQUIRE(head.headers.size() == 3);
        REQUIRE(head.headers[1] == std::pair<std::string, std::string>{"X-Empty", ""});

        REQUIRE(parser.take_body() == "he");
        REQUIRE(parser.feed("llo") == ParseResult::Complete);
        REQUIRE(parser.take_body() == "llo");
        REQUIRE(parser.message_complete());
    }

    SECTION("chunked request body") {
        auto result = parser.feed(
            "PUT /upload HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"
            "3\r\nabc\r\n2\r\nde\r\n0\r\n\r\n");
        REQUIRE(result == ParseResult::Complete);
        REQUIRE(parser.take_body() == "abcde");
    }

    SECTION("HTTP/1.0") {
        REQUIRE(parser.feed("GET / HTTP/1.0\r\n\r\n") == ParseResult::Complete);
        REQUIRE(parser.head().version == "1.0");
    }

    SECTION("garbage is an error") {
        REQUIRE(parser.feed("NOT A REQUEST\r\n\r\n") == ParseResult::Error);
        REQUIRE(parser.failed());
        REQUIRE_FALSE(parser.error_message().empty());
        REQUIRE(parser.feed("GET / HTTP/1.1\r\n\r\n") == ParseResult::Error);
    }

    SECTION("oversized head") {
        RequestParser small(64);
        std::string request = "GET / HTTP/1.1\r\nX-Long: " + std::string(100, 'x') + "\r\n\r\n";
        REQUIRE(small.feed(request) == ParseResult::Error);
        REQUIRE_THAT(std::string(small.error_message()), ContainsSubstring("exceeds 64 bytes"));
    }
}

TEST_CASE("Socket transport", "[http][socket]") {
    LoopbackPair pair;
    wren::core::SocketTransport transport(pair.server.get(), 1024, 8192);

    SECTION("head, body and a chunked response") {
        pair.send("POST /a%20b?x=1 HTTP/1.1\r\nHost: t\r\nContent-Length: 3\r\n\r\nabc");
        REQUIRE(transport.read_head(1000ms) == wren::core::HeadStatus::Ready);

        const auto& info = transport.info();
        REQUIRE(info.method == Method::POST);
        REQUIRE(info.path == "/a b");
        REQUIRE(info.query_string == "x=1");
        REQUIRE(info.client_host == "127.0.0.1");

        auto body = transport.receive(1000ms);
        REQUIRE(body.has_value());
        REQUIRE(body->body == "abc");
        REQUIRE_FALSE(body->more_body);

        transport.send_start(StatusCode::OK, {{"content-type", "text/plain"}});
        transport.send_body("hello", true);
        transport.send_body("", false);
        shutdown(pair.server.get(), SHUT_WR);

        std::string wire = read_to_eof(pair.client.get());
        REQUIRE_THAT(wire, StartsWith("HTTP/1.1 200 OK\r\n"));
        REQUIRE_THAT(wire, ContainsSubstring("transfer-encoding: chunked\r\n"));
        REQUIRE_THAT(wire, ContainsSubstring("connection: close\r\n"));
        REQUIRE_THAT(wire, ContainsSubstring("\r\n\r\n5\r\nhello\r\n0\r\n\r\n"));
    }

    SECTION("content-length responses are not chunked") {
        pair.send("GET / HTTP/1.1\r\n\r\n");
        REQUIRE(transport.read_head(1000ms) == wren::core::HeadStatus::Ready);
        transport.send_error(StatusCode::NotFound, "nope");
        shutdown(pair.server.get(), SHUT_WR);

        std::string wire = read_to_eof(pair.client.get());
        REQUIRE_THAT(wire, StartsWith("HTTP/1.1 404 Not Found\r\n"));
        REQUIRE_THAT(wire, ContainsSubstring("content-length: 4\r\n"));
        REQUIRE_THAT(wire, !ContainsSubstring("chunked"));
        REQUIRE_THAT(wire, ContainsSubstring("\r\n\r\nnope"));
    }

    SECTION("malformed head") {
        pair.send("BOGUS\r\n\r\n");
        REQUIRE(transport.read_head(1000ms) == wren::core::HeadStatus::Invalid);
    }

    SECTION("slow head times out") {
        pair.send("GET / HT");
        REQUIRE(transport.read_head(50ms) == wren::core::HeadStatus::TimedOut);
    }

    SECTION("peer close is a disconnect") {
        pair.send("GET /events HTTP/1.1\r\n\r\n");
        REQUIRE(transport.read_head(1000ms) == wren::core::HeadStatus::Ready);
        auto body = transport.receive(1000ms);
        REQUIRE(body.has_value());
        REQUIRE_FALSE(body->is_disconnect());

        REQUIRE_FALSE(transport.receive(20ms).has_value());

        pair.client.reset();
        auto gone = transport.receive(1000ms);
        REQUIRE(gone.has_value());
        REQUIRE(gone->is_disconnect());
    }
}

TEST_CASE("HTTP server end to end", "[http][server]") {
    wren::server::App app;
    app.route("/hello/{name}", [](std::string name) { return "hello " + name; });

    wren::control::ServerConfig config;
    config.listen_port = 0;
    config.header_timeout_ms = 500;

    wren::core::HttpServer server(config, [&app](Transport& transport) { app.handle(transport); });
    REQUIRE_FALSE(server.start());
    REQUIRE(server.port() != 0);

    std::thread runner([&server] { server.run(); });

    SECTION("request is routed through the app") {
        auto client = connect_loopback(server.port());
        REQUIRE(client.valid());
        REQUIRE_FALSE(wren::core::send_all(client.get(), "GET /hello/wren HTTP/1.1\r\nHost: t\r\n\r\n"));

        std::string wire = read_to_eof(client.get());
        REQUIRE_THAT(wire, StartsWith("HTTP/1.1 200 OK\r\n"));
        REQUIRE_THAT(wire, ContainsSubstring("content-length: 10\r\n"));
        REQUIRE_THAT(wire, ContainsSubstring("\r\n\r\nhello wren"));
    }

    SECTION("malformed request is a 400") {
        auto client = connect_loopback(server.port());
        REQUIRE_FALSE(wren::core::send_all(client.get(), "NONSENSE\r\n\r\n"));
        REQUIRE_THAT(read_to_eof(client.get()), StartsWith("HTTP/1.1 400 "));
    }

    SECTION("silent client gets a 408") {
        auto client = connect_loopback(server.port());
        REQUIRE_THAT(read_to_eof(client.get()), StartsWith("HTTP/1.1 408 "));
    }

    server.stop();
    runner.join();
    REQUIRE(server.active_connections() == 0);
}
