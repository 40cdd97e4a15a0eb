/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TASKS_STUB_HPP_
#define TASKS_STUB_HPP_

#include <string>

#include "taskstore/types.hpp"

/**
 * Creates batch task with nested items, results and debug logs.
 */
inline BatchTask CreateTask(const std::string& id, const std::string& createdAt)
{
    BatchTask task;

    task.mID             = id;
    task.mName           = "Batch " + id;
    task.mKind           = "text2img";
    task.mStatus         = BatchTaskStatus::cRunning;
    task.mProgress       = 50;
    task.mTotalItems     = 2;
    task.mCompletedItems = 1;
    task.mCreatedAt      = createdAt;
    task.mStartedAt      = createdAt;

    task.mConfig.mModel           = "flux-dev";
    task.mConfig.mModelType       = "image";
    task.mConfig.mConcurrentLimit = 2;
    task.mConfig.mRetryAttempts   = 3;
    task.mConfig.mRetryDelay      = 1000;
    task.mConfig.mAutoDownload    = true;
    task.mConfig.mAspectRatio     = "16:9";
    task.mConfig.mSize            = "1024x576";
    task.mConfig.mQuality         = "hd";
    task.mConfig.mGenerateCount   = 4;

    TaskItem done;

    done.mID           = id + "-item-1";
    done.mPrompt       = "a cat on a \"red\" sofa";
    done.mSourceImage  = "data:image/png;base64,aGk=";
    done.mPriority     = 1;
    done.mStatus       = BatchTaskStatus::cCompleted;
    done.mAttemptCount = 1;
    done.mCreatedAt    = createdAt;
    done.mProcessedAt  = createdAt;
    done.mDebugLogs    = std::vector<DebugLog> {
        DebugLog {"log-1", done.mID, createdAt, "request", R"({"prompt":"cat","seed":42})", std::nullopt},
        DebugLog {"log-2", done.mID, createdAt, "response", R"({"images":["a.png"],"status":200})", 1500},
    };

    TaskItem pending;

    pending.mID        = id + "-item-2";
    pending.mPrompt    = "a dog";
    pending.mCreatedAt = createdAt;

    task.mItems = {done, pending};

    TaskResult result;

    result.mID         = id + "-result-1";
    result.mTaskItemID = done.mID;
    result.mImageURL   = "https://cdn.example.com/" + id + ".png";
    result.mLocalPath  = "/tmp/" + id + ".png";
    result.mDownloaded = true;
    result.mCreatedAt  = createdAt;
    result.mDurationMs = 1500;

    task.mResults = {result};

    return task;
}

#endif
