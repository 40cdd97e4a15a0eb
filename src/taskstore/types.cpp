/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <tuple>

#include "types.hpp"

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

bool BatchTaskConfig::operator==(const BatchTaskConfig& other) const
{
    return std::tie(mModel, mModelType, mConcurrentLimit, mRetryAttempts, mRetryDelay, mAutoDownload, mAspectRatio,
               mSize, mQuality, mGenerateCount, mAPITimeoutMs)
        == std::tie(other.mModel, other.mModelType, other.mConcurrentLimit, other.mRetryAttempts, other.mRetryDelay,
            other.mAutoDownload, other.mAspectRatio, other.mSize, other.mQuality, other.mGenerateCount,
            other.mAPITimeoutMs);
}

bool DebugLog::operator==(const DebugLog& other) const
{
    return std::tie(mID, mTaskItemID, mTimestamp, mType, mData, mDuration)
        == std::tie(other.mID, other.mTaskItemID, other.mTimestamp, other.mType, other.mData, other.mDuration);
}

bool TaskItem::operator==(const TaskItem& other) const
{
    return std::tie(mID, mPrompt, mSourceImage, mMask, mPriority, mStatus, mAttemptCount, mCreatedAt, mProcessedAt,
               mError, mDebugLogs)
        == std::tie(other.mID, other.mPrompt, other.mSourceImage, other.mMask, other.mPriority, other.mStatus,
            other.mAttemptCount, other.mCreatedAt, other.mProcessedAt, other.mError, other.mDebugLogs);
}

bool TaskResult::operator==(const TaskResult& other) const
{
    return std::tie(mID, mTaskItemID, mImageURL, mLocalPath, mDownloaded, mCreatedAt, mDurationMs)
        == std::tie(other.mID, other.mTaskItemID, other.mImageURL, other.mLocalPath, other.mDownloaded,
            other.mCreatedAt, other.mDurationMs);
}

bool BatchTask::operator==(const BatchTask& other) const
{
    return std::tie(mID, mName, mKind, mStatus, mProgress, mTotalItems, mCompletedItems, mFailedItems, mCreatedAt,
               mStartedAt, mCompletedAt, mConfig, mItems, mResults, mError)
        == std::tie(other.mID, other.mName, other.mKind, other.mStatus, other.mProgress, other.mTotalItems,
            other.mCompletedItems, other.mFailedItems, other.mCreatedAt, other.mStartedAt, other.mCompletedAt,
            other.mConfig, other.mItems, other.mResults, other.mError);
}
