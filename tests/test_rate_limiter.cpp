#include <gtest/gtest.h>
#include "rate_limiter.hpp"
#include <thread>

using namespace rproxy;
using namespace std::chrono_literals;

TEST(RateLimiterTest, FirstRequestIsAllowed) {
    RateLimiter limiter(1, 1s);
    EXPECT_TRUE(limiter.allow("client"));
    EXPECT_EQ(limiter.bucket_count(), 1);
}

TEST(RateLimiterTest, BurstUpToCapacity) {
    RateLimiter limiter(3, 1min);
    auto now = RateLimiter::Clock::now();

    // the creating call does not consume a token
    EXPECT_TRUE(limiter.allow_at("client", now));
    EXPECT_TRUE(limiter.allow_at("client", now));
    EXPECT_TRUE(limiter.allow_at("client", now));
    EXPECT_TRUE(limiter.allow_at("client", now));
    EXPECT_FALSE(limiter.allow_at("client", now));
}

TEST(RateLimiterTest, RefillsOverTime) {
    RateLimiter limiter(1, 1s);
    auto now = RateLimiter::Clock::now();

    EXPECT_TRUE(limiter.allow_at("client", now));
    EXPECT_TRUE(limiter.allow_at("client", now));
    EXPECT_FALSE(limiter.allow_at("client", now + 500ms));
    EXPECT_TRUE(limiter.allow_at("client", now + 1600ms));
}

TEST(RateLimiterTest, RefillIsCappedAtCapacity) {
    RateLimiter limiter(2, 1s);
    auto now = RateLimiter::Clock::now();

    EXPECT_TRUE(limiter.allow_at("client", now));
    auto later = now + 1h;
    EXPECT_TRUE(limiter.allow_at("client", later));
    EXPECT_TRUE(limiter.allow_at("client", later));
    EXPECT_FALSE(limiter.allow_at("client", later));
}

TEST(RateLimiterTest, IdentifiersAreIndependent) {
    RateLimiter limiter(1, 1min);
    auto now = RateLimiter::Clock::now();

    EXPECT_TRUE(limiter.allow_at("a", now));
    EXPECT_TRUE(limiter.allow_at("a", now));
    EXPECT_FALSE(limiter.allow_at("a", now));
    EXPECT_TRUE(limiter.allow_at("b", now));
    EXPECT_EQ(limiter.bucket_count(), 2);
}

TEST(RateLimiterTest, RealClockRecovery) {
    RateLimiter limiter(1, 1s);

    EXPECT_TRUE(limiter.allow("client"));
    EXPECT_TRUE(limiter.allow("client"));
    EXPECT_FALSE(limiter.allow("client"));

    std::this_thread::sleep_for(1100ms);
    EXPECT_TRUE(limiter.allow("client"));
}

TEST(TenantRateLimiterTest, UnknownTenantIsUnlimited) {
    TenantRateLimiter limiter;
    for (int i = 0; i < 100; ++i) {
        EXPECT_TRUE(limiter.check("nobody", "client"));
    }
}

TEST(TenantRateLimiterTest, TenantsHaveSeparateBuckets) {
    TenantRateLimiter limiter;
    limiter.set_tenant_limit("small", 1, 1min);
    limiter.set_tenant_limit("large", 100, 1min);

    EXPECT_TRUE(limiter.check("small", "client"));
    EXPECT_TRUE(limiter.check("small", "client"));
    EXPECT_FALSE(limiter.check("small", "client"));

    EXPECT_TRUE(limiter.check("large", "client"));
    EXPECT_TRUE(limiter.check("large", "client"));
}
