#include "backoff_policy.hpp"
#include <gtest/gtest.h>

using std::chrono::milliseconds;

TEST(BackoffPolicyTest, DelayGrowsAndNeverExceedsCap) {
    for (int draw = 0; draw < 200; ++draw) {
        milliseconds previous{0};
        for (int attempt = 1; attempt <= 12; ++attempt) {
            auto delay = BackoffPolicy::compute_delay(attempt, 2.0, 60.0);
            EXPECT_GE(delay, previous) << "attempt " << attempt;
            EXPECT_LE(delay, milliseconds(60000));
            previous = delay;
        }
    }
}

TEST(BackoffPolicyTest, FirstDelayStaysWithinJitterOfBase) {
    for (int draw = 0; draw < 100; ++draw) {
        auto delay = BackoffPolicy::compute_delay(1, 2.0, 60.0, 0.2);
        EXPECT_GE(delay, milliseconds(1599));
        EXPECT_LE(delay, milliseconds(2400));
    }
}

TEST(BackoffPolicyTest, HugeAttemptSaturatesAtCap) {
    EXPECT_EQ(BackoffPolicy::compute_delay(500, 2.0, 60.0), milliseconds(60000));
    EXPECT_EQ(BackoffPolicy::compute_delay(0, 1.0, 60.0, 0.0), milliseconds(1000));
}

TEST(BackoffPolicyTest, CapacityRetriesOnSameCredential) {
    BackoffPolicy policy(0.5, 10.0, 60.0, 3, 0.0);
    auto d = policy.decide({ErrorCategory::CapacityExhausted, true}, 1);
    EXPECT_EQ(d.action, RetryAction::RetrySameCredential);
    EXPECT_EQ(d.delay, milliseconds(500));
    EXPECT_EQ(d.credential_backoff, milliseconds(0));

    d = policy.decide({ErrorCategory::Unknown, true}, 2);
    EXPECT_EQ(d.action, RetryAction::RetrySameCredential);
    EXPECT_EQ(d.delay, milliseconds(1000));
}

TEST(BackoffPolicyTest, RateLimitParksCredentialAndRotates) {
    BackoffPolicy policy(2.0, 60.0, 45.0, 3);
    auto d = policy.decide({ErrorCategory::RateLimited, true}, 1);
    EXPECT_EQ(d.action, RetryAction::RotateCredential);
    EXPECT_EQ(d.credential_backoff, milliseconds(45000));
    EXPECT_FALSE(d.disable_credential);
}

TEST(BackoffPolicyTest, AuthDisablesAndRotates) {
    BackoffPolicy policy;
    auto d = policy.decide({ErrorCategory::Authentication, false}, 1);
    EXPECT_EQ(d.action, RetryAction::DisableAndRotate);
    EXPECT_TRUE(d.disable_credential);
}

TEST(BackoffPolicyTest, QuotaFailsImmediately) {
    BackoffPolicy policy;
    auto d = policy.decide({ErrorCategory::QuotaExhausted, false}, 1);
    EXPECT_EQ(d.action, RetryAction::Fail);
}

TEST(BackoffPolicyTest, ExhaustedBudgetFailsButKeepsCredentialSideEffects) {
    BackoffPolicy policy(2.0, 60.0, 30.0, 2);

    auto d = policy.decide({ErrorCategory::CapacityExhausted, true}, 2);
    EXPECT_EQ(d.action, RetryAction::Fail);

    d = policy.decide({ErrorCategory::RateLimited, true}, 2);
    EXPECT_EQ(d.action, RetryAction::Fail);
    EXPECT_EQ(d.credential_backoff, milliseconds(30000));

    d = policy.decide({ErrorCategory::Authentication, false}, 2);
    EXPECT_EQ(d.action, RetryAction::Fail);
    EXPECT_TRUE(d.disable_credential);
}
