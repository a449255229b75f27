// Timeout Manager Tests

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <thread>

#include "core/request_context.hpp"
#include "gateway/timeout_manager.hpp"

using namespace warden;
using namespace warden::gateway;
using namespace std::chrono_literals;

TEST_CASE("TimeoutManager per-tool timeouts", "[gateway][timeout]") {
    TimeoutManager manager(30000ms);

    REQUIRE(manager.default_timeout() == 30000ms);
    REQUIRE(manager.get_timeout("search") == 30000ms);

    manager.set_tool_timeout("search", 5000ms);
    REQUIRE(manager.get_timeout("search") == 5000ms);
    REQUIRE(manager.get_timeout("other") == 30000ms);

    SECTION("Override replaces the previous value") {
        manager.set_tool_timeout("search", 250ms);
        REQUIRE(manager.get_timeout("search") == 250ms);
    }
}

TEST_CASE("TimeoutManager derives deadline-bound contexts", "[gateway][timeout]") {
    TimeoutManager manager(5000ms);
    manager.set_tool_timeout("slow", 20ms);

    core::RequestContext parent;
    parent.set_request_id("req-1");

    SECTION("Tool timeout cancels the derived context") {
        auto ctx = manager.with_timeout(parent, "slow");
        REQUIRE(ctx.request_id() == "req-1");
        REQUIRE_FALSE(ctx.is_cancelled());

        REQUIRE_FALSE(ctx.cancellation()->wait_for(1s));
        REQUIRE(ctx.is_cancelled());
        REQUIRE(ctx.cancellation()->reason() == core::CancellationToken::kDeadlineExceeded);
        REQUIRE_FALSE(parent.is_cancelled());
    }

    SECTION("Default timeout leaves the context live") {
        auto ctx = manager.with_timeout(parent, "fast");
        std::this_thread::sleep_for(30ms);
        REQUIRE_FALSE(ctx.is_cancelled());
    }

    SECTION("Parent cancellation propagates") {
        auto ctx = manager.with_timeout(parent, "fast");
        parent.cancellation()->cancel();
        REQUIRE(ctx.is_cancelled());
        REQUIRE(ctx.cancellation()->reason() == core::CancellationToken::kCanceled);
    }
}
