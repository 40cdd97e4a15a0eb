/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "commandhandler.hpp"
#include "localfile/localfile.hpp"
#include "logger/logmodule.hpp"
#include "machineid/machineid.hpp"

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

static aos::Error WrapError(const std::string& context, const aos::Error& err)
{
    return aos::Error(err.Value(), (context + ": " + err.Message()).c_str());
}

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

CommandHandler::CommandHandler(Downloader& downloader, TaskStoreItf& taskStore, uint64_t maxTasksToKeep)
    : mDownloader(downloader)
    , mTaskStore(taskStore)
    , mMaxTasksToKeep(maxTasksToKeep)
{
}

aos::RetWithError<std::string> CommandHandler::ReadLocalFile(const std::string& path)
{
    auto [content, err] = ReadFileAsDataURI(path);
    if (!err.IsNone()) {
        return {"", WrapError("failed to read file", err)};
    }

    return {content, aos::ErrorEnum::eNone};
}

aos::RetWithError<std::string> CommandHandler::GetDownloadDir()
{
    auto [dir, err] = ::GetDownloadDir();
    if (!err.IsNone()) {
        return {"", WrapError("failed to get download directory", err)};
    }

    return {dir, aos::ErrorEnum::eNone};
}

aos::RetWithError<std::string> CommandHandler::DownloadFile(const std::string& url, const std::string& filename,
    const std::string& dir, std::weak_ptr<ProgressObserverItf> observer)
{
    auto [path, err] = mDownloader.Download(url, filename, dir, std::move(observer));
    if (!err.IsNone()) {
        return {"", WrapError("failed to download file", err)};
    }

    return {path, aos::ErrorEnum::eNone};
}

aos::RetWithError<std::string> CommandHandler::GetMachineID()
{
    auto [id, err] = ComputeMachineID(CollectMachineInfo());
    if (!err.IsNone()) {
        return {"", WrapError("failed to get machine id", err)};
    }

    return {id, aos::ErrorEnum::eNone};
}

aos::RetWithError<std::vector<BatchTask>> CommandHandler::GetBatchTasks()
{
    if (auto err = mTaskStore.Initialize(); !err.IsNone()) {
        return {{}, WrapError("failed to get tasks", err)};
    }

    auto [tasks, err] = mTaskStore.GetAll();
    if (!err.IsNone()) {
        return {{}, WrapError("failed to get tasks", err)};
    }

    return {tasks, aos::ErrorEnum::eNone};
}

aos::Error CommandHandler::SaveBatchTask(const BatchTask& task)
{
    aos::Error err;

    if (err = mTaskStore.Initialize(); err.IsNone()) {
        err = mTaskStore.Upsert(task);
    }

    if (!err.IsNone()) {
        return WrapError("failed to save task", err);
    }

    return aos::ErrorEnum::eNone;
}

aos::Error CommandHandler::DeleteBatchTask(const std::string& taskID)
{
    aos::Error err;

    if (err = mTaskStore.Initialize(); err.IsNone()) {
        err = mTaskStore.Delete(taskID);
    }

    if (!err.IsNone()) {
        return WrapError("failed to delete task", err);
    }

    return aos::ErrorEnum::eNone;
}

aos::Error CommandHandler::ClearBatchTasks()
{
    aos::Error err;

    if (err = mTaskStore.Initialize(); err.IsNone()) {
        err = mTaskStore.Clear();
    }

    if (!err.IsNone()) {
        return WrapError("failed to clear tasks", err);
    }

    return aos::ErrorEnum::eNone;
}

aos::RetWithError<uint64_t> CommandHandler::GetTaskCount()
{
    if (auto err = mTaskStore.Initialize(); !err.IsNone()) {
        return {0, WrapError("failed to get task count", err)};
    }

    auto [count, err] = mTaskStore.Count();
    if (!err.IsNone()) {
        return {0, WrapError("failed to get task count", err)};
    }

    return {count, aos::ErrorEnum::eNone};
}

aos::RetWithError<uint64_t> CommandHandler::CleanupOldTasks(std::optional<uint64_t> maxTasksToKeep)
{
    if (auto err = mTaskStore.Initialize(); !err.IsNone()) {
        return {0, WrapError("failed to cleanup tasks", err)};
    }

    auto [removed, err] = mTaskStore.CleanupOld(maxTasksToKeep.value_or(mMaxTasksToKeep));
    if (!err.IsNone()) {
        return {0, WrapError("failed to cleanup tasks", err)};
    }

    return {removed, aos::ErrorEnum::eNone};
}
