/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TASKSTORE_TYPES_HPP_
#define TASKSTORE_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * Batch task status values.
 */
namespace BatchTaskStatus {
constexpr auto cPending   = "pending";
constexpr auto cRunning   = "running";
constexpr auto cCompleted = "completed";
constexpr auto cFailed    = "failed";
constexpr auto cCancelled = "cancelled";
} // namespace BatchTaskStatus

/**
 * Generation parameters of a batch task.
 */
struct BatchTaskConfig {
    std::string         mModel;
    std::string         mModelType;
    int                 mConcurrentLimit {};
    int                 mRetryAttempts {};
    int                 mRetryDelay {};
    bool                mAutoDownload {};
    std::string         mAspectRatio;
    std::string         mSize;
    std::string         mQuality;
    std::optional<int>  mGenerateCount;
    std::optional<int>  mAPITimeoutMs;

    bool operator==(const BatchTaskConfig& other) const;
    bool operator!=(const BatchTaskConfig& other) const { return !operator==(other); }
};

/**
 * Structured diagnostic entry of a task item. Data holds a serialized JSON value.
 */
struct DebugLog {
    std::string        mID;
    std::string        mTaskItemID;
    std::string        mTimestamp;
    std::string        mType;
    std::string        mData {"null"};
    std::optional<int> mDuration;

    bool operator==(const DebugLog& other) const;
    bool operator!=(const DebugLog& other) const { return !operator==(other); }
};

/**
 * Single generation request of a batch task.
 */
struct TaskItem {
    std::string                          mID;
    std::string                          mPrompt;
    std::optional<std::string>           mSourceImage;
    std::optional<std::string>           mMask;
    int                                  mPriority {};
    std::string                          mStatus {BatchTaskStatus::cPending};
    int                                  mAttemptCount {};
    std::string                          mCreatedAt;
    std::optional<std::string>           mProcessedAt;
    std::optional<std::string>           mError;
    std::optional<std::vector<DebugLog>> mDebugLogs;

    bool operator==(const TaskItem& other) const;
    bool operator!=(const TaskItem& other) const { return !operator==(other); }
};

/**
 * Artifact produced by a task item.
 */
struct TaskResult {
    std::string                mID;
    std::string                mTaskItemID;
    std::string                mImageURL;
    std::optional<std::string> mLocalPath;
    bool                       mDownloaded {};
    std::string                mCreatedAt;
    std::optional<int>         mDurationMs;

    bool operator==(const TaskResult& other) const;
    bool operator!=(const TaskResult& other) const { return !operator==(other); }
};

/**
 * Batch task.
 */
struct BatchTask {
    std::string                mID;
    std::string                mName;
    std::string                mKind;
    std::string                mStatus {BatchTaskStatus::cPending};
    int                        mProgress {};
    int                        mTotalItems {};
    int                        mCompletedItems {};
    int                        mFailedItems {};
    std::string                mCreatedAt;
    std::optional<std::string> mStartedAt;
    std::optional<std::string> mCompletedAt;
    BatchTaskConfig            mConfig;
    std::vector<TaskItem>      mItems;
    std::vector<TaskResult>    mResults;
    std::optional<std::string> mError;

    bool operator==(const BatchTask& other) const;
    bool operator!=(const BatchTask& other) const { return !operator==(other); }
};

#endif // TASKSTORE_TYPES_HPP_
