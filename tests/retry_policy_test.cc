#include <core/util/retry_policy.h>
#include <gtest/gtest.h>

using namespace reup::core;
using namespace std::chrono_literals;

TEST(RetryPolicyTest, ZeroMeansUnlimited) {
    RetryPolicy policy = RetryPolicy::Fixed(0, 10ms);
    EXPECT_TRUE(policy.unlimited());
    EXPECT_TRUE(policy.ShouldRetry(1));
    EXPECT_TRUE(policy.ShouldRetry(100000));
}

TEST(RetryPolicyTest, BoundedBudgetCountsAttempts) {
    RetryPolicy policy = RetryPolicy::Fixed(3, 10ms);
    EXPECT_TRUE(policy.ShouldRetry(1));
    EXPECT_TRUE(policy.ShouldRetry(2));
    EXPECT_FALSE(policy.ShouldRetry(3));
}

TEST(RetryPolicyTest, SingleAttemptNeverRetries) {
    EXPECT_FALSE(RetryPolicy::Fixed(1, 0ms).ShouldRetry(1));
}

TEST(RetryPolicyTest, FixedDelayIsConstant) {
    RetryPolicy policy = RetryPolicy::Fixed(0, 2s);
    EXPECT_EQ(policy.DelayFor(1), 2s);
    EXPECT_EQ(policy.DelayFor(7), 2s);
}

TEST(RetryPolicyTest, ExponentialDelayDoublesUpToCap) {
    RetryPolicy policy(0, 1s, RetryBackoff::kExponential, 10s);
    EXPECT_EQ(policy.DelayFor(1), 1s);
    EXPECT_EQ(policy.DelayFor(2), 2s);
    EXPECT_EQ(policy.DelayFor(3), 4s);
    EXPECT_EQ(policy.DelayFor(4), 8s);
    EXPECT_EQ(policy.DelayFor(5), 10s);
    EXPECT_EQ(policy.DelayFor(1000), 10s);
}

TEST(RetryPolicyTest, BuiltFromSettings) {
    Settings settings;
    settings.max_retries = 4;
    settings.retry_delay = 250ms;
    RetryPolicy policy = RetryPolicy::FromSettings(settings);
    EXPECT_EQ(policy.max_attempts(), 4u);
    EXPECT_EQ(policy.DelayFor(1), 250ms);
}
