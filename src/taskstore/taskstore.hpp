/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TASKSTORE_HPP_
#define TASKSTORE_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <sqlite3.h>

#include <aos/common/tools/error.hpp>

#include "types.hpp"

/**
 * Default number of tasks kept by cleanup.
 */
constexpr uint64_t cDefaultMaxTasksToKeep = 100;

/**
 * Task store interface.
 */
class TaskStoreItf {
public:
    /**
     * Destructor.
     */
    virtual ~TaskStoreItf() = default;

    /**
     * Creates storage if it doesn't exist. Safe to call before every operation.
     *
     * @return aos::Error.
     */
    virtual aos::Error Initialize() = 0;

    /**
     * Returns all tasks, newest first.
     *
     * @return aos::RetWithError<std::vector<BatchTask>>.
     */
    virtual aos::RetWithError<std::vector<BatchTask>> GetAll() = 0;

    /**
     * Inserts task or replaces existing task with the same id.
     *
     * @param task task.
     * @return aos::Error.
     */
    virtual aos::Error Upsert(const BatchTask& task) = 0;

    /**
     * Deletes task. Deleting absent task is not an error.
     *
     * @param id task id.
     * @return aos::Error.
     */
    virtual aos::Error Delete(const std::string& id) = 0;

    /**
     * Deletes all tasks.
     *
     * @return aos::Error.
     */
    virtual aos::Error Clear() = 0;

    /**
     * Returns number of stored tasks.
     *
     * @return aos::RetWithError<uint64_t>.
     */
    virtual aos::RetWithError<uint64_t> Count() = 0;

    /**
     * Deletes all tasks except maxToKeep newest ones.
     *
     * @param maxToKeep number of newest tasks to keep.
     * @return aos::RetWithError<uint64_t> number of deleted tasks.
     */
    virtual aos::RetWithError<uint64_t> CleanupOld(uint64_t maxToKeep = cDefaultMaxTasksToKeep) = 0;
};

/**
 * SQLite task store. Each operation opens its own connection.
 */
class TaskStore : public TaskStoreItf {
public:
    /**
     * Constructor.
     *
     * @param dbPath database file path.
     */
    explicit TaskStore(const std::string& dbPath);

    aos::Error                                Initialize() override;
    aos::RetWithError<std::vector<BatchTask>> GetAll() override;
    aos::Error                                Upsert(const BatchTask& task) override;
    aos::Error                                Delete(const std::string& id) override;
    aos::Error                                Clear() override;
    aos::RetWithError<uint64_t>               Count() override;
    aos::RetWithError<uint64_t>               CleanupOld(uint64_t maxToKeep = cDefaultMaxTasksToKeep) override;

private:
    static constexpr int cBusyTimeoutMs = 5000;

    using DBPtr        = std::unique_ptr<sqlite3, decltype(&sqlite3_close)>;
    using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

    aos::Error Open(DBPtr& db) const;
    aos::Error Exec(sqlite3* db, const std::string& sql) const;
    aos::Error Prepare(sqlite3* db, const std::string& sql, StatementPtr& stmt) const;
    aos::Error ReadTask(sqlite3_stmt* stmt, BatchTask& task) const;
    aos::Error DeleteOld(sqlite3* db, uint64_t maxToKeep, std::vector<std::string>& ids) const;
    aos::Error DeleteRows(sqlite3* db, const std::vector<std::string>& ids) const;

    std::string mDBPath;
};

#endif // TASKSTORE_HPP_
