/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <thread>

#include "downloader.hpp"
#include "localfile/localfile.hpp"
#include "logger/logmodule.hpp"

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

static bool IsSuccessStatus(long status)
{
    return status >= 200 && status < 300;
}

static void DefaultSleep(std::chrono::milliseconds delay)
{
    std::this_thread::sleep_for(delay);
}

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Downloader::Downloader(const DownloadConfig& config, TransferClientItf& transferClient, SleepFunc sleep)
    : mConfig(config)
    , mTransferClient(transferClient)
    , mSleep(sleep ? std::move(sleep) : DefaultSleep)
    , mRetryPolicy(config.mMaxRetryCount, std::chrono::duration_cast<std::chrono::milliseconds>(config.mRetryDelay))
    , mStreamWriter(config.mChunkSize)
{
}

aos::RetWithError<std::string> Downloader::Download(const std::string& url, const std::string& filename,
    const std::string& targetDir, std::weak_ptr<ProgressObserverItf> observer)
{
    LOG_DBG() << "Downloading: url=" << url.c_str() << ",filename=" << filename.c_str();

    if (url.empty()) {
        return {"", aos::Error(aos::ErrorEnum::eInvalidArgument, "Empty URL")};
    }

    auto [outfilename, err] = GetOutFilename(filename, targetDir);
    if (!err.IsNone()) {
        return {"", err};
    }

    if (err = RetryDownload(url, outfilename, observer); !err.IsNone()) {
        return {"", err};
    }

    LOG_INF() << "File downloaded: url=" << url.c_str() << ",path=" << outfilename.c_str();

    return {outfilename, aos::ErrorEnum::eNone};
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

aos::RetWithError<std::string> Downloader::GetOutFilename(
    const std::string& filename, const std::string& targetDir) const
{
    if (filename.empty()) {
        return {"", aos::Error(aos::ErrorEnum::eInvalidArgument, "Empty file name")};
    }

    if (std::filesystem::path(filename).is_absolute()) {
        return {"", aos::Error(aos::ErrorEnum::eInvalidArgument, "File name should be relative")};
    }

    auto dir = targetDir;

    if (dir.empty()) {
        dir = mConfig.mDownloadDir;
    }

    if (dir.empty()) {
        auto ret = GetDownloadDir();
        if (!ret.mError.IsNone()) {
            return {"", ret.mError};
        }

        dir = ret.mValue;
    }

    return {(std::filesystem::path(dir) / filename).string(), aos::ErrorEnum::eNone};
}

AttemptResult Downloader::DownloadAttempt(
    const std::string& url, const std::string& outfilename, const std::weak_ptr<ProgressObserverItf>& observer)
{
    std::unique_ptr<ResponseItf> response;

    if (auto err = mTransferClient.Open(url, response); !err.IsNone()) {
        return AttemptResult {AttemptOutcomeEnum::eTransportError,
            aos::Error(err.Value(), (std::string("Request failed: ") + err.Message()).c_str())};
    }

    if (auto status = response->GetStatusCode(); !IsSuccessStatus(status)) {
        return AttemptResult {AttemptOutcomeEnum::eStatusError,
            aos::Error(aos::ErrorEnum::eFailed, ("HTTP error: status=" + std::to_string(status)).c_str())};
    }

    auto result = mStreamWriter.Write(*response, url, outfilename, observer);
    if (!result.mError.IsNone()) {
        return AttemptResult {AttemptOutcomeEnum::eLocalError, result.mError};
    }

    return AttemptResult {AttemptOutcomeEnum::eSuccess, aos::ErrorEnum::eNone};
}

aos::Error Downloader::RetryDownload(
    const std::string& url, const std::string& outfilename, const std::weak_ptr<ProgressObserverItf>& observer)
{
    auto state = mRetryPolicy.Start();

    while (true) {
        switch (state.mState) {
        case DownloadStateEnum::eAttempting: {
            LOG_DBG() << "Downloading: url=" << url.c_str() << ",attempt=" << state.mAttempt;

            state = mRetryPolicy.OnAttemptFinished(state, DownloadAttempt(url, outfilename, observer));

            break;
        }

        case DownloadStateEnum::eRetrying: {
            auto delay = mRetryPolicy.GetBackoff(state);

            LOG_ERR() << "Failed to download: error=" << state.mError.Message() << ",attempt=" << state.mAttempt
                      << ",delay=" << static_cast<int64_t>(delay.count());

            mSleep(delay);

            state = mRetryPolicy.OnBackoffElapsed(state);

            break;
        }

        case DownloadStateEnum::eSucceeded:
            return aos::ErrorEnum::eNone;

        case DownloadStateEnum::eFailed:
            LOG_ERR() << "Download failed: url=" << url.c_str() << ",error=" << state.mError.Message()
                      << ",attempts=" << state.mAttempt;

            return state.mError;
        }
    }
}
