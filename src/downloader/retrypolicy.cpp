/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "retrypolicy.hpp"

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetryPolicy::RetryPolicy(int maxAttempts, std::chrono::milliseconds delay)
    : mMaxAttempts(maxAttempts > 0 ? maxAttempts : 1)
    , mDelay(delay)
{
}

DownloadState RetryPolicy::Start() const
{
    return DownloadState {DownloadStateEnum::eAttempting, 1, aos::ErrorEnum::eNone};
}

DownloadState RetryPolicy::OnAttemptFinished(const DownloadState& state, const AttemptResult& result) const
{
    if (state.mState != DownloadStateEnum::eAttempting) {
        return DownloadState {
            DownloadStateEnum::eFailed, state.mAttempt, aos::Error(aos::ErrorEnum::eWrongState, "Not attempting")};
    }

    if (result.mOutcome == AttemptOutcomeEnum::eSuccess) {
        return DownloadState {DownloadStateEnum::eSucceeded, state.mAttempt, aos::ErrorEnum::eNone};
    }

    if (!IsRetryable(result.mOutcome) || state.mAttempt >= mMaxAttempts) {
        return DownloadState {DownloadStateEnum::eFailed, state.mAttempt, result.mError};
    }

    return DownloadState {DownloadStateEnum::eRetrying, state.mAttempt, result.mError};
}

DownloadState RetryPolicy::OnBackoffElapsed(const DownloadState& state) const
{
    if (state.mState != DownloadStateEnum::eRetrying) {
        return state;
    }

    return DownloadState {DownloadStateEnum::eAttempting, state.mAttempt + 1, state.mError};
}

std::chrono::milliseconds RetryPolicy::GetBackoff(const DownloadState& state) const
{
    if (state.mState != DownloadStateEnum::eRetrying) {
        return std::chrono::milliseconds::zero();
    }

    return mDelay * state.mAttempt;
}

bool RetryPolicy::IsRetryable(AttemptOutcomeEnum outcome)
{
    return outcome == AttemptOutcomeEnum::eTransportError || outcome == AttemptOutcomeEnum::eStatusError;
}
