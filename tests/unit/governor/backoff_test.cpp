/// @file backoff_test.cpp
/// @brief Unit tests for computeBackoff and isThrottled.

#include <gtest/gtest.h>

#include <chrono>
#include <limits>

#include "sgov/governor/backoff.hpp"

using namespace sgov::governor;
using std::chrono::milliseconds;

TEST(BackoffTest, ZeroFailuresMeansNoDelay) {
    GovernorPolicy policy;
    EXPECT_EQ(computeBackoff(policy, 0), milliseconds::zero());
    EXPECT_EQ(computeBackoff(policy, 0, 429), milliseconds::zero());
}

TEST(BackoffTest, DoublesPerConsecutiveFailure) {
    GovernorPolicy policy;
    EXPECT_EQ(computeBackoff(policy, 1), milliseconds(1'000));
    EXPECT_EQ(computeBackoff(policy, 2), milliseconds(2'000));
    EXPECT_EQ(computeBackoff(policy, 3), milliseconds(4'000));
    EXPECT_EQ(computeBackoff(policy, 4), milliseconds(8'000));
    EXPECT_EQ(computeBackoff(policy, 6), milliseconds(32'000));
}

TEST(BackoffTest, CapsAtMaxDelay) {
    GovernorPolicy policy;
    EXPECT_EQ(computeBackoff(policy, 7), milliseconds(60'000));
    EXPECT_EQ(computeBackoff(policy, 20), milliseconds(60'000));
}

TEST(BackoffTest, HugeFailureCountSaturates) {
    GovernorPolicy policy;
    EXPECT_EQ(computeBackoff(policy, std::numeric_limits<uint32_t>::max()),
              milliseconds(60'000));
}

TEST(BackoffTest, ThrottlingTriplesDelay) {
    GovernorPolicy policy;
    EXPECT_EQ(computeBackoff(policy, 1, 429), milliseconds(3'000));
    EXPECT_EQ(computeBackoff(policy, 3, 429), milliseconds(12'000));
}

TEST(BackoffTest, ThrottleMultiplierAppliesAfterCap) {
    GovernorPolicy policy;
    EXPECT_EQ(computeBackoff(policy, 10, 429), milliseconds(180'000));
}

TEST(BackoffTest, OtherStatusCodesAreNotThrottling) {
    GovernorPolicy policy;
    EXPECT_EQ(computeBackoff(policy, 2, 500), milliseconds(2'000));
    EXPECT_EQ(computeBackoff(policy, 2, 503), milliseconds(2'000));
    EXPECT_EQ(computeBackoff(policy, 2, std::nullopt), milliseconds(2'000));
}

TEST(BackoffTest, CustomPolicy) {
    GovernorPolicy policy;
    policy.baseDelay = milliseconds(100);
    policy.maxDelay = milliseconds(500);
    policy.throttleMultiplier = 5;
    policy.throttleStatusCode = 420;

    EXPECT_EQ(computeBackoff(policy, 1), milliseconds(100));
    EXPECT_EQ(computeBackoff(policy, 3), milliseconds(400));
    EXPECT_EQ(computeBackoff(policy, 4), milliseconds(500));
    EXPECT_EQ(computeBackoff(policy, 1, 420), milliseconds(500));
    EXPECT_EQ(computeBackoff(policy, 1, 429), milliseconds(100));
}

TEST(BackoffTest, IsThrottled) {
    GovernorPolicy policy;
    EXPECT_TRUE(isThrottled(policy, 429));
    EXPECT_FALSE(isThrottled(policy, 500));
    EXPECT_FALSE(isThrottled(policy, std::nullopt));
}
