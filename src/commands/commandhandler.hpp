/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COMMANDHANDLER_HPP_
#define COMMANDHANDLER_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <aos/common/tools/error.hpp>

#include "downloader/downloader.hpp"
#include "taskstore/taskstore.hpp"

/**
 * Command handler: operations available to the UI. Errors carry the operation context in their message.
 */
class CommandHandler {
public:
    /**
     * Constructor.
     *
     * @param downloader downloader.
     * @param taskStore task store.
     * @param maxTasksToKeep number of tasks kept by cleanup when caller gives none.
     */
    CommandHandler(Downloader& downloader, TaskStoreItf& taskStore, uint64_t maxTasksToKeep = cDefaultMaxTasksToKeep);

    /**
     * Reads local file as base64 data URI.
     *
     * @param path absolute file path.
     * @return aos::RetWithError<std::string>.
     */
    aos::RetWithError<std::string> ReadLocalFile(const std::string& path);

    /**
     * Returns platform download directory.
     *
     * @return aos::RetWithError<std::string>.
     */
    aos::RetWithError<std::string> GetDownloadDir();

    /**
     * Downloads file.
     *
     * @param url URL.
     * @param filename file name.
     * @param dir target directory, may be empty.
     * @param observer progress observer.
     * @return aos::RetWithError<std::string> saved file path.
     */
    aos::RetWithError<std::string> DownloadFile(const std::string& url, const std::string& filename,
        const std::string& dir, std::weak_ptr<ProgressObserverItf> observer);

    /**
     * Returns machine id.
     *
     * @return aos::RetWithError<std::string>.
     */
    aos::RetWithError<std::string> GetMachineID();

    /**
     * Returns all batch tasks, newest first.
     *
     * @return aos::RetWithError<std::vector<BatchTask>>.
     */
    aos::RetWithError<std::vector<BatchTask>> GetBatchTasks();

    /**
     * Saves batch task.
     *
     * @param task task.
     * @return aos::Error.
     */
    aos::Error SaveBatchTask(const BatchTask& task);

    /**
     * Deletes batch task.
     *
     * @param taskID task id.
     * @return aos::Error.
     */
    aos::Error DeleteBatchTask(const std::string& taskID);

    /**
     * Deletes all batch tasks.
     *
     * @return aos::Error.
     */
    aos::Error ClearBatchTasks();

    /**
     * Returns number of stored batch tasks.
     *
     * @return aos::RetWithError<uint64_t>.
     */
    aos::RetWithError<uint64_t> GetTaskCount();

    /**
     * Deletes oldest batch tasks.
     *
     * @param maxTasksToKeep number of newest tasks to keep.
     * @return aos::RetWithError<uint64_t> number of deleted tasks.
     */
    aos::RetWithError<uint64_t> CleanupOldTasks(std::optional<uint64_t> maxTasksToKeep = std::nullopt);

private:
    Downloader&   mDownloader;
    TaskStoreItf& mTaskStore;
    uint64_t      mMaxTasksToKeep;
};

#endif // COMMANDHANDLER_HPP_
