// Wren Unit Tests - Main Entry Point
#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>

#include "../../src/control/config.hpp"
#include "../../src/core/logging.hpp"

// Global test fixture - runs once before all tests
struct GlobalSetup {
    GlobalSetup() {
        wren::logging::init_logging_system();

        // Debug level so log statements on error paths are exercised too
        wren::control::LogConfig log_config;
        log_config.output = "/tmp/wren_tests";
        log_config.level = "debug";
        wren::logging::init_worker_logger(0, log_config);
    }

    ~GlobalSetup() { wren::logging::shutdown_logging(); }
};

static GlobalSetup g_setup;

TEST_CASE("Basic sanity test", "[smoke]") {
    REQUIRE(1 + 1 == 2);
}
