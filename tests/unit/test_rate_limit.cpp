// Rate Limiting Tests

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "core/cancellation.hpp"
#include "gateway/rate_limit.hpp"

using namespace warden;
using namespace warden::gateway;
using namespace std::chrono_literals;

TEST_CASE("TokenBucket basic operations", "[gateway][rate_limit]") {
    SECTION("Starts full") {
        TokenBucket bucket(10.0, 5);
        REQUIRE(bucket.burst() == 5);
        REQUIRE(bucket.rate() == 10.0);
        REQUIRE(bucket.available() >= 4.99);
    }

    SECTION("Burst is exhausted") {
        TokenBucket bucket(0.001, 3);
        REQUIRE(bucket.try_consume());
        REQUIRE(bucket.try_consume());
        REQUIRE(bucket.try_consume());
        REQUIRE_FALSE(bucket.try_consume());
    }

    SECTION("Wait hint reports time to the next token") {
        TokenBucket bucket(10.0, 1);
        REQUIRE(bucket.try_consume());
        TokenBucket::Clock::duration hint{};
        REQUIRE_FALSE(bucket.try_consume(hint));
        REQUIRE(hint > TokenBucket::Clock::duration::zero());
        REQUIRE(hint <= std::chrono::duration_cast<TokenBucket::Clock::duration>(100ms));
    }

    SECTION("Reset refills") {
        TokenBucket bucket(0.001, 2);
        REQUIRE(bucket.try_consume());
        REQUIRE(bucket.try_consume());
        bucket.reset();
        REQUIRE(bucket.try_consume());
    }
}

TEST_CASE("TokenBucket refills over time", "[gateway][rate_limit]") {
    TokenBucket bucket(100.0, 1);  // One token every 10ms
    REQUIRE(bucket.try_consume());
    REQUIRE_FALSE(bucket.try_consume());

    std::this_thread::sleep_for(30ms);
    REQUIRE(bucket.try_consume());

    SECTION("Refill caps at burst") {
        std::this_thread::sleep_for(100ms);
        REQUIRE(bucket.available() <= 1.0);
    }
}

TEST_CASE("wait_for_token blocks until a token or cancellation", "[gateway][rate_limit]") {
    auto token = core::CancellationToken::create();

    SECTION("Returns once refilled") {
        TokenBucket bucket(50.0, 1);
        REQUIRE(bucket.try_consume());
        auto start = std::chrono::steady_clock::now();
        REQUIRE(wait_for_token(bucket, *token));
        REQUIRE(std::chrono::steady_clock::now() - start >= 5ms);
    }

    SECTION("Cancellation wins over a slow bucket") {
        TokenBucket bucket(0.01, 1);
        REQUIRE(bucket.try_consume());
        std::thread canceller([&] {
            std::this_thread::sleep_for(20ms);
            token->cancel();
        });
        auto status = wait_for_token(bucket, *token);
        canceller.join();
        REQUIRE_FALSE(status);
        REQUIRE(status.kind == core::ErrorKind::RateLimited);
        REQUIRE(status.error == core::CancellationToken::kCanceled);
    }

    SECTION("Already cancelled token fails immediately") {
        TokenBucket bucket(0.01, 1);
        REQUIRE(bucket.try_consume());
        token->cancel();
        REQUIRE_FALSE(wait_for_token(bucket, *token));
    }
}

TEST_CASE("RateLimiter applies global and per-client limits", "[gateway][rate_limit]") {
    SECTION("Per-client buckets are independent") {
        RateLimiter limiter(0.001, 100);
        // Global allows plenty; per-client burst equals the global burst
        for (int i = 0; i < 50; ++i) {
            REQUIRE(limiter.allow("alice"));
        }
        REQUIRE(limiter.allow("bob"));
        REQUIRE(limiter.client_count() == 2);
    }

    SECTION("Client burst is enforced") {
        RateLimiter limiter(0.001, 2);
        REQUIRE(limiter.allow("carol"));
        REQUIRE(limiter.allow("carol"));
        REQUIRE_FALSE(limiter.allow("carol"));
    }

    SECTION("Global bucket is shared across clients") {
        RateLimiter limiter(0.001, 3);
        REQUIRE(limiter.allow("a"));
        REQUIRE(limiter.allow("b"));
        REQUIRE(limiter.allow("c"));
        REQUIRE_FALSE(limiter.allow("d"));
    }

    SECTION("Reset drops a client bucket") {
        RateLimiter limiter(0.001, 100);
        REQUIRE(limiter.allow("erin"));
        limiter.reset("erin");
        REQUIRE(limiter.client_count() == 0);
    }

    SECTION("wait reports which limit was cancelled") {
        RateLimiter limiter(0.001, 1);
        REQUIRE(limiter.allow("frank"));
        auto token = core::CancellationToken::create();
        token->cancel();
        auto status = limiter.wait("frank", *token);
        REQUIRE_FALSE(status);
        REQUIRE(status.error == "global rate limit: context canceled");
    }
}

TEST_CASE("RateLimiter is safe under concurrent use", "[gateway][rate_limit]") {
    RateLimiter limiter(0.001, 40);
    std::atomic<int> allowed{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                if (limiter.allow("shared")) {
                    ++allowed;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(allowed.load() == 40);
}

TEST_CASE("RateLimiter reset races with allow and wait", "[gateway][rate_limit]") {
    RateLimiter limiter(100000.0, 1000);
    std::atomic<bool> stop{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            while (!stop.load()) {
                (void)limiter.allow("c");
            }
        });
    }
    threads.emplace_back([&] {
        auto cancel = core::CancellationToken::create();
        while (!stop.load()) {
            (void)limiter.wait("c", *cancel);
        }
    });
    threads.emplace_back([&] {
        while (!stop.load()) {
            limiter.reset("c");
        }
    });

    std::this_thread::sleep_for(200ms);
    stop = true;
    for (auto& thread : threads) {
        thread.join();
    }

    limiter.reset("c");
    REQUIRE(limiter.client_count() == 0);
    std::this_thread::sleep_for(5ms);
    REQUIRE(limiter.allow("c"));
}

TEST_CASE("ToolRateLimiter limits only configured tools", "[gateway][rate_limit]") {
    ToolRateLimiter limiter;
    limiter.set_tool_limit("search", 0.001, 2);

    REQUIRE(limiter.has_limit("search"));
    REQUIRE_FALSE(limiter.has_limit("echo"));

    REQUIRE(limiter.allow("search"));
    REQUIRE(limiter.allow("search"));
    REQUIRE_FALSE(limiter.allow("search"));

    for (int i = 0; i < 100; ++i) {
        REQUIRE(limiter.allow("echo"));
    }

    auto token = core::CancellationToken::create();
    REQUIRE(limiter.wait("echo", *token));

    SECTION("Replacing a limit resets the bucket") {
        limiter.set_tool_limit("search", 0.001, 1);
        REQUIRE(limiter.allow("search"));
        REQUIRE_FALSE(limiter.allow("search"));
    }
}
