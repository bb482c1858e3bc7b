#include <gtest/gtest.h>

#include <speedline/net/rate_limiter.hpp>

using namespace speedline;
using namespace speedline::net;
using namespace std::chrono_literals;

namespace
{

rate_limit_config config_of(std::uint32_t max, std::chrono::milliseconds window)
{
    rate_limit_config config;
    config.max_requests = max;
    config.window = window;
    return config;
}

} // namespace

TEST(RateLimiter, AdmitsUpToTheLimit)
{
    rate_limiter limiter{config_of(3, 60s)};
    auto now = rate_limiter::clock::now();

    auto first = limiter.consume("10.0.0.1", now);
    EXPECT_TRUE(first.allowed);
    EXPECT_EQ(first.limit, 3u);
    EXPECT_EQ(first.remaining, 2u);
    EXPECT_EQ(first.window, 60s);
    EXPECT_EQ(first.reset, 60s);

    EXPECT_TRUE(limiter.consume("10.0.0.1", now).allowed);
    auto third = limiter.consume("10.0.0.1", now);
    EXPECT_TRUE(third.allowed);
    EXPECT_EQ(third.remaining, 0u);

    auto fourth = limiter.consume("10.0.0.1", now + 10s);
    EXPECT_FALSE(fourth.allowed);
    EXPECT_EQ(fourth.remaining, 0u);
    EXPECT_EQ(fourth.reset, 50s);
}

TEST(RateLimiter, ClientsAreIndependent)
{
    rate_limiter limiter{config_of(1, 60s)};
    auto now = rate_limiter::clock::now();

    EXPECT_TRUE(limiter.consume("a", now).allowed);
    EXPECT_FALSE(limiter.consume("a", now).allowed);
    EXPECT_TRUE(limiter.consume("b", now).allowed);
}

TEST(RateLimiter, WindowRollsOver)
{
    rate_limiter limiter{config_of(1, 1s)};
    auto now = rate_limiter::clock::now();

    EXPECT_TRUE(limiter.consume("a", now).allowed);
    EXPECT_FALSE(limiter.consume("a", now + 500ms).allowed);
    EXPECT_TRUE(limiter.consume("a", now + 1s).allowed);
}

TEST(RateLimiter, HugeWindowIsCappedAndStillLimits)
{
    rate_limiter limiter{config_of(1, std::chrono::milliseconds{10000000000000})};
    auto now = rate_limiter::clock::now();

    EXPECT_EQ(limiter.config().window, max_rate_limit_window);
    EXPECT_TRUE(limiter.consume("a", now).allowed);

    auto second = limiter.consume("a", now + 1s);
    EXPECT_FALSE(second.allowed);
    EXPECT_EQ(second.window, std::chrono::seconds{86400});
}

TEST(RateLimiter, ResetRoundsUp)
{
    rate_limiter limiter{config_of(5, 1500ms)};
    auto now = rate_limiter::clock::now();

    auto decision = limiter.consume("a", now);
    EXPECT_EQ(decision.window, 2s);
    EXPECT_EQ(decision.reset, 2s);
}

TEST(RateLimiter, ExpiredClientsAreSwept)
{
    rate_limiter limiter{config_of(5, 1s)};
    auto now = rate_limiter::clock::now();

    limiter.consume("a", now);
    limiter.consume("b", now);
    EXPECT_EQ(limiter.tracked_clients(), 2u);

    limiter.consume("c", now + 2s);
    EXPECT_EQ(limiter.tracked_clients(), 1u);
}
