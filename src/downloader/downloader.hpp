/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DOWNLOADER_HPP_
#define DOWNLOADER_HPP_

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <aos/common/tools/error.hpp>

#include "config/config.hpp"
#include "progress.hpp"
#include "retrypolicy.hpp"
#include "streamwriter.hpp"
#include "transferclient.hpp"

/**
 * Downloader.
 */
class Downloader {
public:
    /**
     * Sleep function.
     *
     * @param delay delay.
     */
    using SleepFunc = std::function<void(std::chrono::milliseconds)>;

    /**
     * Constructor.
     *
     * @param config download config.
     * @param transferClient transfer client.
     * @param sleep sleep function used for backoff.
     */
    Downloader(const DownloadConfig& config, TransferClientItf& transferClient, SleepFunc sleep = nullptr);

    /**
     * Downloads file synchronously.
     *
     * @param url URL.
     * @param filename file name relative to target directory.
     * @param targetDir target directory, configured or platform download directory is used if empty.
     * @param observer progress observer.
     * @return aos::RetWithError<std::string> final file path.
     */
    aos::RetWithError<std::string> Download(const std::string& url, const std::string& filename,
        const std::string& targetDir = "", std::weak_ptr<ProgressObserverItf> observer = {});

private:
    AttemptResult                  DownloadAttempt(const std::string& url, const std::string& outfilename,
                         const std::weak_ptr<ProgressObserverItf>& observer);
    aos::Error                     RetryDownload(const std::string& url, const std::string& outfilename,
                            const std::weak_ptr<ProgressObserverItf>& observer);
    aos::RetWithError<std::string> GetOutFilename(const std::string& filename, const std::string& targetDir) const;

    DownloadConfig     mConfig;
    TransferClientItf& mTransferClient;
    SleepFunc          mSleep;
    RetryPolicy        mRetryPolicy;
    StreamWriter       mStreamWriter;
};

#endif // DOWNLOADER_HPP_
