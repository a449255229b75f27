// Core Utility Tests (cancellation, request context, base64, URLs, addresses)

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <thread>

#include "auth/principal.hpp"
#include "core/base64.hpp"
#include "core/cancellation.hpp"
#include "core/logging.hpp"
#include "core/request_context.hpp"
#include "core/socket.hpp"
#include "core/string_utils.hpp"
#include "http/url.hpp"

using namespace warden;
using namespace std::chrono_literals;

TEST_CASE("CancellationToken cancel propagates to children", "[core][cancellation]") {
    auto root = core::CancellationToken::create();
    auto child = core::CancellationToken::child_of(root);

    REQUIRE_FALSE(root->is_cancelled());
    REQUIRE_FALSE(child->is_cancelled());
    REQUIRE(child->reason().empty());

    SECTION("Parent cancel reaches child") {
        root->cancel();
        REQUIRE(root->is_cancelled());
        REQUIRE(child->is_cancelled());
        REQUIRE(child->reason() == core::CancellationToken::kCanceled);
    }

    SECTION("Child cancel leaves parent alone") {
        child->cancel();
        REQUIRE(child->is_cancelled());
        REQUIRE_FALSE(root->is_cancelled());
    }

    SECTION("Cancel is idempotent") {
        root->cancel();
        root->cancel();
        REQUIRE(root->reason() == core::CancellationToken::kCanceled);
    }
}

TEST_CASE("CancellationToken deadlines", "[core][cancellation]") {
    auto root = core::CancellationToken::create();

    SECTION("Deadline expiry cancels with deadline reason") {
        auto token = core::CancellationToken::with_deadline(
            root, core::CancellationToken::Clock::now() + 20ms);
        REQUIRE(token->deadline().has_value());
        std::this_thread::sleep_for(50ms);
        REQUIRE(token->is_cancelled());
        REQUIRE(token->reason() == core::CancellationToken::kDeadlineExceeded);
        REQUIRE_FALSE(root->is_cancelled());
    }

    SECTION("Child deadline is clamped to parent deadline") {
        auto parent_deadline = core::CancellationToken::Clock::now() + 100ms;
        auto parent = core::CancellationToken::with_deadline(root, parent_deadline);
        auto child = core::CancellationToken::with_deadline(
            parent, core::CancellationToken::Clock::now() + 10s);
        REQUIRE(child->deadline().has_value());
        REQUIRE(*child->deadline() <= parent_deadline);
    }

    SECTION("wait_for returns true when time elapses without cancellation") {
        REQUIRE(root->wait_for(10ms));
    }

    SECTION("wait_for returns false when cancelled from another thread") {
        std::thread canceller([&] {
            std::this_thread::sleep_for(20ms);
            root->cancel();
        });
        auto start = std::chrono::steady_clock::now();
        REQUIRE_FALSE(root->wait_for(5s));
        REQUIRE(std::chrono::steady_clock::now() - start < 4s);
        canceller.join();
    }
}

TEST_CASE("RequestContext identity and timeouts", "[core][context]") {
    core::RequestContext ctx;

    SECTION("ensure_request_id generates once") {
        REQUIRE(ctx.request_id().empty());
        std::string id = ctx.ensure_request_id();
        REQUIRE_FALSE(id.empty());
        REQUIRE(ctx.ensure_request_id() == id);
    }

    SECTION("ensure_request_id keeps an explicit id") {
        ctx.set_request_id("req-1");
        REQUIRE(ctx.ensure_request_id() == "req-1");
    }

    SECTION("AuthContext attaches once") {
        auto auth_ctx = std::make_shared<auth::AuthContext>();
        auth_ctx->principal.id = "alice";
        REQUIRE(ctx.auth() == nullptr);
        REQUIRE(ctx.attach_auth(auth_ctx));
        REQUIRE(ctx.auth() != nullptr);
        REQUIRE(ctx.auth()->principal.id == "alice");

        auto other = std::make_shared<auth::AuthContext>();
        other->principal.id = "mallory";
        REQUIRE_FALSE(ctx.attach_auth(other));
        REQUIRE(ctx.auth()->principal.id == "alice");
    }

    SECTION("with_timeout derives a deadline-bound context") {
        auto derived = ctx.with_timeout(20ms);
        REQUIRE_FALSE(derived.is_cancelled());
        std::this_thread::sleep_for(50ms);
        REQUIRE(derived.is_cancelled());
        REQUIRE_FALSE(ctx.is_cancelled());
    }

    SECTION("Cancelling the parent cancels the derived context") {
        auto derived = ctx.with_timeout(10s);
        ctx.cancellation()->cancel();
        REQUIRE(derived.is_cancelled());
    }
}

TEST_CASE("Base64url decoding", "[core][base64]") {
    REQUIRE(core::base64url_decode("aGVsbG8") == std::optional<std::string>("hello"));
    REQUIRE(core::base64url_decode("aGVsbG8=") == std::optional<std::string>("hello"));
    REQUIRE(core::base64url_decode("-_8") == std::optional<std::string>("\xfb\xff"));
    REQUIRE_FALSE(core::base64url_decode("a$b").has_value());
    REQUIRE(core::base64url_encode("hello") == "aGVsbG8");
}

TEST_CASE("Strict base64 decoding", "[core][base64]") {
    REQUIRE(core::base64_decode("aGVsbG8=") == std::optional<std::string>("hello"));
    REQUIRE_FALSE(core::base64_decode("aGVsbG8").has_value());
    REQUIRE_FALSE(core::base64_decode("aG=sbG8=").has_value());
}

TEST_CASE("String helpers", "[core][strings]") {
    REQUIRE(core::trim("  admin \t") == "admin");
    REQUIRE(core::trim("   ").empty());
    REQUIRE(core::to_lower("AdMiN") == "admin");
    REQUIRE(core::iequals("Bearer", "bearer"));
    REQUIRE_FALSE(core::iequals("Bearer", "Bearers"));

    auto parts = core::split("a..b", '.');
    REQUIRE(parts.size() == 3);
    REQUIRE(parts[1].empty());

    REQUIRE(core::join({"a", "b", "c"}, ", ") == "a, b, c");
}

TEST_CASE("URL parsing", "[http][url]") {
    SECTION("Defaults") {
        auto url = http::url::parse("https://Example.COM");
        REQUIRE(url.has_value());
        REQUIRE(url->scheme == "https");
        REQUIRE(url->host == "example.com");
        REQUIRE(url->port == 443);
        REQUIRE(url->path == "/");
    }

    SECTION("Port, path and query") {
        auto url = http::url::parse("http://10.0.0.1:9200/es/?pretty#frag");
        REQUIRE(url.has_value());
        REQUIRE(url->port == 9200);
        REQUIRE(url->path == "/es/?pretty");
        REQUIRE(url->origin() == "http://10.0.0.1:9200");
    }

    SECTION("IPv6 literal") {
        auto url = http::url::parse("http://[::1]:8080/x");
        REQUIRE(url.has_value());
        REQUIRE(url->host == "::1");
        REQUIRE(url->origin() == "http://[::1]:8080");
    }

    SECTION("Userinfo is dropped") {
        auto url = http::url::parse("http://user:pw@internal.example/");
        REQUIRE(url.has_value());
        REQUIRE(url->host == "internal.example");
    }

    SECTION("Malformed") {
        REQUIRE_FALSE(http::url::parse("no-scheme").has_value());
        REQUIRE_FALSE(http::url::parse("http://host:99999/").has_value());
        REQUIRE_FALSE(http::url::parse("http://ho st/").has_value());
    }

    SECTION("join_path") {
        REQUIRE(http::url::join_path("/", "/_bulk") == "/_bulk");
        REQUIRE(http::url::join_path("/es/", "_bulk") == "/es/_bulk");
    }
}

TEST_CASE("IpAddress parsing", "[core][socket]") {
    auto v4 = core::IpAddress::parse("192.168.1.10");
    REQUIRE(v4.has_value());
    REQUIRE_FALSE(v4->v6);
    REQUIRE(v4->to_string() == "192.168.1.10");

    auto mapped = core::IpAddress::parse("::ffff:10.0.0.1");
    REQUIRE(mapped.has_value());
    REQUIRE_FALSE(mapped->v6);
    REQUIRE(mapped->to_string() == "10.0.0.1");

    auto v6 = core::IpAddress::parse("::1");
    REQUIRE(v6.has_value());
    REQUIRE(v6->v6);

    REQUIRE_FALSE(core::IpAddress::parse("[::1]").has_value());
    REQUIRE_FALSE(core::IpAddress::parse("not-an-ip").has_value());

    std::string error;
    auto resolved = core::resolve_host("127.0.0.1", error);
    REQUIRE(resolved.has_value());
    REQUIRE(resolved->front().to_string() == "127.0.0.1");
}

TEST_CASE("Generated identifiers", "[core][logging]") {
    auto id = logging::generate_uuid();
    REQUIRE(id.size() == 36);
    REQUIRE(id[14] == '4');
    REQUIRE(logging::generate_uuid() != id);

    auto correlation = logging::generate_correlation_id();
    REQUIRE(logging::is_valid_uuid(correlation));
}
