#include <gtest/gtest.h>

#include "core/RetryPolicy.h"
#include "FakeFetchClient.h"

namespace {

using std::chrono::milliseconds;

RetryPolicy makePolicy() {
    return RetryPolicy(5, milliseconds(100), milliseconds(1000), milliseconds(500));
}

TEST(RetryPolicy, BackoffDoublesAndSaturates)
{
    auto policy = makePolicy();
    auto err = fetchError(ErrorKind::Transient, "reset");

    EXPECT_EQ(milliseconds(100), policy.delay(1, err));
    EXPECT_EQ(milliseconds(200), policy.delay(2, err));
    EXPECT_EQ(milliseconds(400), policy.delay(3, err));
    EXPECT_EQ(milliseconds(800), policy.delay(4, err));
    EXPECT_EQ(milliseconds(1000), policy.delay(5, err));
    EXPECT_EQ(milliseconds(1000), policy.delay(40, err));
}

TEST(RetryPolicy, RateLimitUsesProviderHint)
{
    auto policy = makePolicy();
    EXPECT_EQ(milliseconds(7000), policy.delay(1, fetchError(ErrorKind::RateLimited, "429", milliseconds(7000))));
}

TEST(RetryPolicy, RateLimitWithoutHintUsesFloor)
{
    auto policy = makePolicy();
    EXPECT_EQ(milliseconds(500), policy.delay(3, fetchError(ErrorKind::RateLimited, "429")));
}

TEST(RetryPolicy, OnlyRecoverableKindsAreRetried)
{
    auto policy = makePolicy();
    EXPECT_TRUE(policy.shouldRetry(1, fetchError(ErrorKind::Transient, "")));
    EXPECT_TRUE(policy.shouldRetry(1, fetchError(ErrorKind::RateLimited, "")));
    EXPECT_TRUE(policy.shouldRetry(1, fetchError(ErrorKind::Corrupt, "")));
    EXPECT_FALSE(policy.shouldRetry(1, fetchError(ErrorKind::Fatal, "")));
    EXPECT_FALSE(policy.shouldRetry(1, fetchError(ErrorKind::Cancelled, "")));
}

TEST(RetryPolicy, AttemptBudgetIsFinite)
{
    auto policy = makePolicy();
    auto err = fetchError(ErrorKind::Transient, "timeout");
    EXPECT_TRUE(policy.shouldRetry(4, err));
    EXPECT_FALSE(policy.shouldRetry(5, err));
}

TEST(RetryPolicy, ScheduleRetryUpdatesPart)
{
    auto policy = makePolicy();
    Part part;
    const auto now = std::chrono::steady_clock::now();

    EXPECT_TRUE(policy.scheduleRetry(part, fetchError(ErrorKind::Transient, "reset"), now));
    EXPECT_EQ(1u, part.attempts);
    EXPECT_EQ(PartState::Pending, part.state);
    EXPECT_EQ(now + milliseconds(100), part.nextEligible);
    EXPECT_EQ("reset", part.error);

    EXPECT_FALSE(policy.scheduleRetry(part, fetchError(ErrorKind::Fatal, "403"), now));
    EXPECT_EQ(2u, part.attempts);
    EXPECT_EQ(PartState::Failed, part.state);
}

} // namespace
