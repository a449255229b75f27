// Warden Unit Tests - Main Entry Point
#include <catch2/catch_test_macros.hpp>

#include "control/config.hpp"
#include "core/logging.hpp"

// Global test fixture - runs once before all tests
struct GlobalSetup {
    GlobalSetup() {
        warden::logging::init_logging_system();

        warden::control::LogConfig log_config;
        log_config.level = "debug";
        log_config.output = "/tmp/warden_tests";
        warden::logging::init_logger("warden_tests", log_config);
    }

    ~GlobalSetup() { warden::logging::shutdown_logging(); }
};

static GlobalSetup g_setup;

TEST_CASE("Basic sanity test", "[smoke]") {
    REQUIRE(1 + 1 == 2);
}
