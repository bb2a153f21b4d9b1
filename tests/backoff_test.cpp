// ============================================================================
// Backoff Tests
// ============================================================================

#include "convq/core/backoff.hpp"

#include <gtest/gtest.h>

using namespace convq;
using namespace std::chrono_literals;

TEST(BackoffTest, DefaultScheduleThenExhaustion) {
    Backoff backoff;

    EXPECT_EQ(backoff.NextDelay(), 3000ms);
    EXPECT_EQ(backoff.NextDelay(), 6000ms);
    EXPECT_EQ(backoff.NextDelay(), 12000ms);
    EXPECT_EQ(backoff.NextDelay(), 24000ms);
    EXPECT_EQ(backoff.NextDelay(), 48000ms);
    EXPECT_TRUE(backoff.Exhausted());
    EXPECT_FALSE(backoff.NextDelay().has_value());
    EXPECT_EQ(backoff.Attempts(), 5u);
}

TEST(BackoffTest, CappedAtMaxDelay) {
    BackoffPolicy policy;
    policy.max_attempts = 10;
    policy.initial_delay = 1000ms;
    policy.max_delay = 5000ms;

    EXPECT_EQ(policy.DelayFor(3), 4000ms);
    EXPECT_EQ(policy.DelayFor(4), 5000ms);
    EXPECT_EQ(policy.DelayFor(9), 5000ms);
}

TEST(BackoffTest, ResetStartsOver) {
    BackoffPolicy policy;
    policy.max_attempts = 2;
    Backoff backoff(policy);

    backoff.NextDelay();
    backoff.NextDelay();
    EXPECT_FALSE(backoff.NextDelay().has_value());

    backoff.Reset();
    EXPECT_EQ(backoff.Attempts(), 0u);
    EXPECT_EQ(backoff.NextDelay(), policy.initial_delay);
}

TEST(BackoffTest, ZeroAttemptsNeverRetries) {
    BackoffPolicy policy;
    policy.max_attempts = 0;
    Backoff backoff(policy);

    EXPECT_TRUE(backoff.Exhausted());
    EXPECT_FALSE(backoff.NextDelay().has_value());
}

TEST(BackoffTest, JitterStaysWithinBounds) {
    BackoffPolicy policy;
    policy.max_attempts = 100;
    policy.initial_delay = 1000ms;
    policy.multiplier = 1.0;
    policy.add_jitter = true;
    Backoff backoff(policy);

    for (int i = 0; i < 100; ++i) {
        auto delay = backoff.NextDelay();
        ASSERT_TRUE(delay.has_value());
        EXPECT_GE(*delay, 500ms);
        EXPECT_LE(*delay, 1500ms);
    }
}
