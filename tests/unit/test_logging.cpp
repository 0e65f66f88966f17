// Wren Logging Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <set>
#include <thread>

#include "../../src/core/logging.hpp"

using namespace wren::logging;

TEST_CASE("Correlation IDs", "[logging]") {
    SECTION("uuid v4 base, '#', decimal counter") {
        std::string id = generate_correlation_id();
        REQUIRE(std::count(id.begin(), id.end(), '#') == 1);

        size_t hash = id.find('#');
        std::string base = id.substr(0, hash);
        std::string counter = id.substr(hash + 1);

        REQUIRE(base.size() == 36);
        REQUIRE(base[14] == '4');
        REQUIRE(std::string("89abAB").find(base[19]) != std::string::npos);
        REQUIRE_FALSE(counter.empty());
        REQUIRE(std::all_of(counter.begin(), counter.end(), [](char c) { return c >= '0' && c <= '9'; }));
        REQUIRE(is_valid_uuid(id));
    }

    SECTION("one base per thread, counter advances") {
        std::string first = generate_correlation_id();
        std::string second = generate_correlation_id();
        REQUIRE(first != second);
        REQUIRE(first.substr(0, first.find('#')) == second.substr(0, second.find('#')));
    }

    SECTION("threads get distinct bases") {
        std::string other;
        std::thread worker([&other] { other = generate_correlation_id(); });
        worker.join();

        std::string mine = generate_correlation_id();
        REQUIRE(is_valid_uuid(other));
        REQUIRE(other.substr(0, 36) != mine.substr(0, 36));
    }

    SECTION("no repeats across many requests") {
        std::set<std::string> seen;
        for (int i = 0; i < 200; ++i) {
            seen.insert(generate_correlation_id());
        }
        REQUIRE(seen.size() == 200);
    }
}

TEST_CASE("Correlation ID validation", "[logging]") {
    REQUIRE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#0"));
    REQUIRE(is_valid_uuid("ABCDEF12-3456-4789-ABCD-EF0123456789#42"));

    REQUIRE_FALSE(is_valid_uuid(""));
    REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000"));       // no counter
    REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#"));      // empty counter
    REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#1x"));    // bad counter
    REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#1#2"));   // two separators
    REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-31d4-a716-446655440000#0"));     // version 3
    REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-c716-446655440000#0"));     // variant c
    REQUIRE_FALSE(is_valid_uuid("550e8400e29b41d4a716446655440000#0"));         // no hyphens
    REQUIRE_FALSE(is_valid_uuid("550g8400-e29b-41d4-a716-446655440000#0"));     // non-hex
}

TEST_CASE("Thread logger adoption", "[logging]") {
    // test_main initialises worker 0 on the main thread
    quill::Logger* main_logger = get_current_logger();
    REQUIRE(main_logger != nullptr);

    quill::Logger* before = reinterpret_cast<quill::Logger*>(1);
    quill::Logger* after = nullptr;
    std::thread worker([&] {
        before = get_current_logger();
        set_current_logger(main_logger);
        after = get_current_logger();
        LOG_INFO(after, "Logging from an adopted thread");
    });
    worker.join();

    REQUIRE(before == nullptr);
    REQUIRE(after == main_logger);
}
