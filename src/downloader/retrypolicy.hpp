/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef RETRYPOLICY_HPP_
#define RETRYPOLICY_HPP_

#include <chrono>

#include <aos/common/tools/error.hpp>

/**
 * Download state.
 */
enum class DownloadStateEnum {
    eAttempting,
    eRetrying,
    eSucceeded,
    eFailed,
};

/**
 * Attempt outcome.
 */
enum class AttemptOutcomeEnum {
    eSuccess,
    eTransportError,
    eStatusError,
    eLocalError,
};

/**
 * Download state machine state.
 */
struct DownloadState {
    DownloadStateEnum mState {DownloadStateEnum::eAttempting};
    int               mAttempt {1};
    aos::Error        mError;
};

/**
 * Attempt result.
 */
struct AttemptResult {
    AttemptOutcomeEnum mOutcome {AttemptOutcomeEnum::eSuccess};
    aos::Error         mError;
};

/**
 * Retry policy: bounded attempts with linear backoff.
 */
class RetryPolicy {
public:
    /**
     * Constructor.
     *
     * @param maxAttempts max number of attempts.
     * @param delay backoff base delay.
     */
    RetryPolicy(int maxAttempts, std::chrono::milliseconds delay);

    /**
     * Returns initial state.
     *
     * @return DownloadState.
     */
    DownloadState Start() const;

    /**
     * Returns state following finished attempt. Only valid in attempting state.
     *
     * @param state current state.
     * @param result attempt result.
     * @return DownloadState.
     */
    DownloadState OnAttemptFinished(const DownloadState& state, const AttemptResult& result) const;

    /**
     * Returns state following backoff. Only valid in retrying state.
     *
     * @param state current state.
     * @return DownloadState.
     */
    DownloadState OnBackoffElapsed(const DownloadState& state) const;

    /**
     * Returns delay before next attempt.
     *
     * @param state retrying state.
     * @return std::chrono::milliseconds.
     */
    std::chrono::milliseconds GetBackoff(const DownloadState& state) const;

    /**
     * Checks whether outcome may be retried.
     *
     * @param outcome attempt outcome.
     * @return bool.
     */
    static bool IsRetryable(AttemptOutcomeEnum outcome);

private:
    int                       mMaxAttempts;
    std::chrono::milliseconds mDelay;
};

#endif // RETRYPOLICY_HPP_
