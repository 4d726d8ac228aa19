#include <catch2/catch_test_macros.hpp>
#include "arbiter/rate_limiter.hpp"

using namespace arbiter;
using namespace std::chrono_literals;

TEST_CASE("RateLimiter allows bursts then throttles", "[rate_limiter]")
{
    RateLimiter::Config cfg{
        10.0, // tokens per second
        5.0   // burst
    };
    RateLimiter rl(cfg);
    auto t0 = RateLimiter::TimePoint{} + 1h;

    int allowed = 0;
    for (int i = 0; i < 5; ++i)
    {
        if (rl.allow("client", t0))
            ++allowed;
    }
    REQUIRE(allowed == 5);
    REQUIRE_FALSE(rl.allow("client", t0));

    // 250ms at 10/s refills two tokens
    auto t1 = t0 + 250ms;
    REQUIRE(rl.allow("client", t1));
    REQUIRE(rl.allow("client", t1));
    REQUIRE_FALSE(rl.allow("client", t1));
}

TEST_CASE("RateLimiter keeps separate buckets per client", "[rate_limiter]")
{
    RateLimiter rl(RateLimiter::Config{1.0, 1.0});
    auto now = RateLimiter::TimePoint{} + 1h;

    REQUIRE(rl.allow("a", now));
    REQUIRE_FALSE(rl.allow("a", now));
    REQUIRE(rl.allow("b", now));
    REQUIRE(rl.tracked() == 2);
}

TEST_CASE("RateLimiter never refills past the burst capacity", "[rate_limiter]")
{
    RateLimiter rl(RateLimiter::Config{100.0, 2.0});
    auto now = RateLimiter::TimePoint{} + 1h;

    REQUIRE(rl.allow("c", now));
    auto later = now + 10s;
    REQUIRE(rl.allow("c", later));
    REQUIRE(rl.allow("c", later));
    REQUIRE_FALSE(rl.allow("c", later));
}

TEST_CASE("RateLimiter drops idle clients when the table is full", "[rate_limiter]")
{
    RateLimiter::Config cfg;
    cfg.max_tracked = 2;
    cfg.idle_ttl = 60s;
    RateLimiter rl(cfg);
    auto now = RateLimiter::TimePoint{} + 1h;

    REQUIRE(rl.allow("old-1", now));
    REQUIRE(rl.allow("old-2", now + 10s));
    REQUIRE(rl.tracked() == 2);

    // old-1 has been idle past the ttl, old-2 has not
    REQUIRE(rl.allow("new", now + 65s));
    REQUIRE(rl.tracked() == 2);
}
