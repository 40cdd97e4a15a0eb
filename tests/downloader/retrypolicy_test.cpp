/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <vector>

#include <gtest/gtest.h>

#include "downloader/retrypolicy.hpp"

using namespace testing;

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class RetryPolicyTest : public ::testing::Test {
protected:
    RetryPolicy mPolicy {3, std::chrono::milliseconds(300)};
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(RetryPolicyTest, SuccessOnFirstAttempt)
{
    auto state = mPolicy.Start();

    EXPECT_EQ(state.mState, DownloadStateEnum::eAttempting);
    EXPECT_EQ(state.mAttempt, 1);

    state = mPolicy.OnAttemptFinished(state, {AttemptOutcomeEnum::eSuccess, aos::ErrorEnum::eNone});

    EXPECT_EQ(state.mState, DownloadStateEnum::eSucceeded);
    EXPECT_EQ(state.mAttempt, 1);
}

TEST_F(RetryPolicyTest, StatusErrorsExhaustAttempts)
{
    auto state = mPolicy.Start();
    auto error = aos::Error(aos::ErrorEnum::eFailed, "HTTP error: status=500");

    std::vector<std::chrono::milliseconds> delays;

    while (state.mState != DownloadStateEnum::eFailed) {
        state = mPolicy.OnAttemptFinished(state, {AttemptOutcomeEnum::eStatusError, error});

        if (state.mState == DownloadStateEnum::eRetrying) {
            delays.push_back(mPolicy.GetBackoff(state));
            state = mPolicy.OnBackoffElapsed(state);
        }
    }

    EXPECT_EQ(state.mAttempt, 3);
    EXPECT_STREQ(state.mError.Message(), "HTTP error: status=500");
    ASSERT_EQ(delays.size(), 2u);
    EXPECT_EQ(delays[0], std::chrono::milliseconds(300));
    EXPECT_EQ(delays[1], std::chrono::milliseconds(600));
}

TEST_F(RetryPolicyTest, TransportErrorThenSuccess)
{
    auto state = mPolicy.Start();

    state = mPolicy.OnAttemptFinished(
        state, {AttemptOutcomeEnum::eTransportError, aos::Error(aos::ErrorEnum::eFailed, "timeout")});
    ASSERT_EQ(state.mState, DownloadStateEnum::eRetrying);

    state = mPolicy.OnBackoffElapsed(state);
    ASSERT_EQ(state.mState, DownloadStateEnum::eAttempting);
    EXPECT_EQ(state.mAttempt, 2);

    state = mPolicy.OnAttemptFinished(state, {AttemptOutcomeEnum::eSuccess, aos::ErrorEnum::eNone});
    EXPECT_EQ(state.mState, DownloadStateEnum::eSucceeded);
    EXPECT_EQ(state.mAttempt, 2);
}

TEST_F(RetryPolicyTest, LocalErrorIsTerminal)
{
    auto state = mPolicy.OnAttemptFinished(
        mPolicy.Start(), {AttemptOutcomeEnum::eLocalError, aos::Error(aos::ErrorEnum::eFailed, "disk full")});

    EXPECT_EQ(state.mState, DownloadStateEnum::eFailed);
    EXPECT_EQ(state.mAttempt, 1);
    EXPECT_STREQ(state.mError.Message(), "disk full");
    EXPECT_EQ(mPolicy.GetBackoff(state), std::chrono::milliseconds::zero());
}

TEST_F(RetryPolicyTest, WrongStateTransitions)
{
    DownloadState succeeded {DownloadStateEnum::eSucceeded, 1, aos::ErrorEnum::eNone};

    auto state = mPolicy.OnAttemptFinished(succeeded, {AttemptOutcomeEnum::eSuccess, aos::ErrorEnum::eNone});
    EXPECT_EQ(state.mState, DownloadStateEnum::eFailed);
    EXPECT_TRUE(state.mError.Is(aos::ErrorEnum::eWrongState));

    state = mPolicy.OnBackoffElapsed(mPolicy.Start());
    EXPECT_EQ(state.mState, DownloadStateEnum::eAttempting);
    EXPECT_EQ(state.mAttempt, 1);
}

TEST_F(RetryPolicyTest, Retryable)
{
    EXPECT_TRUE(RetryPolicy::IsRetryable(AttemptOutcomeEnum::eTransportError));
    EXPECT_TRUE(RetryPolicy::IsRetryable(AttemptOutcomeEnum::eStatusError));
    EXPECT_FALSE(RetryPolicy::IsRetryable(AttemptOutcomeEnum::eLocalError));
    EXPECT_FALSE(RetryPolicy::IsRetryable(AttemptOutcomeEnum::eSuccess));
}
