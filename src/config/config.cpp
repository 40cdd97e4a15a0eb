/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fstream>

#include <Poco/Path.h>

#include <utils/json.hpp>

#include "config.hpp"
#include "logger/logmodule.hpp"

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

static constexpr auto cDefaultAppDirName = "genassist";
static constexpr auto cDefaultDBFileName = "batch_tasks.db";

static aos::common::utils::Duration GetDuration(const aos::common::utils::CaseInsensitiveObjectWrapper& object,
    const std::string& key, aos::common::utils::Duration defaultValue)
{
    auto value = object.GetValue<std::string>(key);

    if (value.empty()) {
        return defaultValue;
    }

    auto ret = aos::common::utils::ParseDuration(value);

    if (!ret.mError.IsNone()) {
        throw std::runtime_error("Failed to parse " + key);
    }

    return ret.mValue;
}

static DownloadConfig ParseDownloader(
    const aos::common::utils::CaseInsensitiveObjectWrapper& object, const DownloadConfig& defaults)
{
    DownloadConfig config = defaults;

    config.mDownloadDir   = object.GetValue<std::string>("DownloadDir", defaults.mDownloadDir);
    config.mMaxRetryCount = object.GetValue<int>("MaxRetryCount", defaults.mMaxRetryCount);
    config.mRetryDelay    = GetDuration(object, "RetryDelay", defaults.mRetryDelay);
    config.mTimeout       = GetDuration(object, "Timeout", defaults.mTimeout);
    config.mChunkSize     = object.GetValue<size_t>("ChunkSize", defaults.mChunkSize);
    config.mUserAgent     = object.GetValue<std::string>("UserAgent", defaults.mUserAgent);
    config.mReferer       = object.GetValue<std::string>("Referer", defaults.mReferer);

    if (config.mMaxRetryCount <= 0) {
        throw std::runtime_error("MaxRetryCount should be positive");
    }

    if (config.mChunkSize == 0) {
        throw std::runtime_error("ChunkSize should be positive");
    }

    return config;
}

static TaskStoreConfig ParseTaskStore(
    const aos::common::utils::CaseInsensitiveObjectWrapper& object, const TaskStoreConfig& defaults)
{
    return TaskStoreConfig {
        object.GetValue<std::string>("DBPath", defaults.mDBPath),
        object.GetValue<uint64_t>("MaxTasksToKeep", defaults.mMaxTasksToKeep),
    };
}

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

Config DefaultConfig()
{
    Config config {};

    config.mWorkingDir        = Poco::Path(Poco::Path::dataHome()).append(cDefaultAppDirName).toString();
    config.mTaskStore.mDBPath = Poco::Path(config.mWorkingDir).append(cDefaultDBFileName).toString();

    return config;
}

aos::RetWithError<Config> ParseConfig(const std::string& filename)
{
    LOG_DBG() << "Parsing config file: filename=" << filename.c_str();

    std::ifstream file(filename);

    if (!file.is_open()) {
        return {Config {}, aos::Error(aos::ErrorEnum::eNotFound, "Failed to open file")};
    }

    auto result = aos::common::utils::ParseJson(file);
    if (!result.mError.IsNone()) {
        return {Config {}, result.mError};
    }

    Config config = DefaultConfig();

    config.mTaskStore.mDBPath.clear();

    try {
        aos::common::utils::CaseInsensitiveObjectWrapper object(result.mValue.extract<Poco::JSON::Object::Ptr>());

        config.mWorkingDir = object.GetValue<std::string>("WorkingDir", config.mWorkingDir);

        if (object.Has("Downloader")) {
            config.mDownload = ParseDownloader(object.GetObject("Downloader"), config.mDownload);
        }

        if (object.Has("TaskStore")) {
            config.mTaskStore = ParseTaskStore(object.GetObject("TaskStore"), config.mTaskStore);
        }
    } catch (const std::exception& e) {
        return {config, aos::Error(aos::ErrorEnum::eFailed, e.what())};
    }

    if (config.mTaskStore.mDBPath.empty()) {
        config.mTaskStore.mDBPath = Poco::Path(config.mWorkingDir).append(cDefaultDBFileName).toString();
    }

    return config;
}
