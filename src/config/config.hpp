/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONFIG_HPP_
#define CONFIG_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <aos/common/tools/error.hpp>
#include <utils/time.hpp>

/**
 * Downloader configuration.
 */
struct DownloadConfig {
    std::string                  mDownloadDir;
    int                          mMaxRetryCount {3};
    aos::common::utils::Duration mRetryDelay {std::chrono::milliseconds(300)};
    aos::common::utils::Duration mTimeout {std::chrono::seconds(60)};
    size_t                       mChunkSize {64 * 1024};
    std::string                  mUserAgent {"Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, "
                                             "like Gecko) Chrome/120 Safari/537.36"};
    std::string                  mReferer {"http://localhost"};
};

/**
 * Task store configuration.
 */
struct TaskStoreConfig {
    std::string mDBPath;
    uint64_t    mMaxTasksToKeep {100};
};

/**
 * Config instance.
 */
struct Config {
    std::string     mWorkingDir;
    DownloadConfig  mDownload;
    TaskStoreConfig mTaskStore;
};

/**
 * Returns default config.
 *
 * @return Config.
 */
Config DefaultConfig();

/**
 * Parses config from file. Keys absent from the file keep their default values.
 *
 * @param filename config file name.
 * @return aos::RetWithError<Config>.
 */
aos::RetWithError<Config> ParseConfig(const std::string& filename);

#endif // CONFIG_HPP_
