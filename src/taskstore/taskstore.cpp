/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>

#include "logger/logmodule.hpp"
#include "taskjson.hpp"
#include "taskstore.hpp"

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

static constexpr auto cCreateTableSQL = R"(
    CREATE TABLE IF NOT EXISTS batch_tasks (
        id TEXT PRIMARY KEY,
        name TEXT NOT NULL,
        type TEXT NOT NULL,
        status TEXT NOT NULL,
        progress INTEGER NOT NULL,
        total_items INTEGER NOT NULL,
        completed_items INTEGER NOT NULL,
        failed_items INTEGER NOT NULL,
        created_at TEXT NOT NULL,
        started_at TEXT,
        completed_at TEXT,
        config_json TEXT NOT NULL,
        items_json TEXT NOT NULL,
        results_json TEXT NOT NULL,
        error_text TEXT
    )
)";

static constexpr auto cSelectAllSQL = R"(
    SELECT id, name, type, status, progress, total_items, completed_items, failed_items, created_at, started_at,
           completed_at, config_json, items_json, results_json, error_text
    FROM batch_tasks ORDER BY created_at DESC, rowid DESC
)";

static constexpr auto cUpsertSQL = R"(
    INSERT OR REPLACE INTO batch_tasks
    (id, name, type, status, progress, total_items, completed_items, failed_items,
     created_at, started_at, completed_at, config_json, items_json, results_json, error_text)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
)";

static constexpr auto cSelectOldSQL = "SELECT id FROM batch_tasks ORDER BY created_at DESC, rowid DESC LIMIT -1 OFFSET ?";
static constexpr auto cDeleteSQL    = "DELETE FROM batch_tasks WHERE id = ?";
static constexpr auto cClearSQL     = "DELETE FROM batch_tasks";
static constexpr auto cCountSQL     = "SELECT COUNT(*) FROM batch_tasks";

enum Column {
    eID,
    eName,
    eType,
    eStatus,
    eProgress,
    eTotalItems,
    eCompletedItems,
    eFailedItems,
    eCreatedAt,
    eStartedAt,
    eCompletedAt,
    eConfigJSON,
    eItemsJSON,
    eResultsJSON,
    eErrorText,
};

static aos::Error DBError(sqlite3* db, const std::string& context)
{
    return aos::Error(aos::ErrorEnum::eRuntime, (context + ": " + sqlite3_errmsg(db)).c_str());
}

static std::string ColumnText(sqlite3_stmt* stmt, int column)
{
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));

    return text ? std::string(text, sqlite3_column_bytes(stmt, column)) : std::string();
}

static std::optional<std::string> ColumnOptionalText(sqlite3_stmt* stmt, int column)
{
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }

    return ColumnText(stmt, column);
}

static int BindText(sqlite3_stmt* stmt, int index, const std::string& value)
{
    return sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

static int BindOptionalText(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value)
{
    if (!value.has_value()) {
        return sqlite3_bind_null(stmt, index);
    }

    return BindText(stmt, index, *value);
}

static aos::Error ValidateTask(const BatchTask& task)
{
    if (task.mID.empty()) {
        return aos::Error(aos::ErrorEnum::eInvalidArgument, "Task id is empty");
    }

    // Retried items are counted in both counters, so the sum may exceed the total.
    if (task.mCompletedItems + task.mFailedItems > task.mTotalItems || task.mProgress > 100) {
        LOG_WRN() << "Task counters exceed total: id=" << task.mID.c_str() << ",total=" << task.mTotalItems
                  << ",completed=" << task.mCompletedItems << ",failed=" << task.mFailedItems
                  << ",progress=" << task.mProgress;
    }

    return aos::ErrorEnum::eNone;
}

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

TaskStore::TaskStore(const std::string& dbPath)
    : mDBPath(dbPath)
{
}

aos::Error TaskStore::Initialize()
{
    DBPtr db(nullptr, sqlite3_close);

    if (auto err = Open(db); !err.IsNone()) {
        return err;
    }

    return Exec(db.get(), cCreateTableSQL);
}

aos::RetWithError<std::vector<BatchTask>> TaskStore::GetAll()
{
    DBPtr db(nullptr, sqlite3_close);

    if (auto err = Open(db); !err.IsNone()) {
        return {{}, err};
    }

    StatementPtr stmt(nullptr, sqlite3_finalize);

    if (auto err = Prepare(db.get(), cSelectAllSQL, stmt); !err.IsNone()) {
        return {{}, err};
    }

    std::vector<BatchTask> tasks;
    int                    rc = SQLITE_OK;

    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        BatchTask task;

        if (auto err = ReadTask(stmt.get(), task); !err.IsNone()) {
            return {{}, err};
        }

        tasks.push_back(std::move(task));
    }

    if (rc != SQLITE_DONE) {
        return {{}, DBError(db.get(), "Failed to query tasks")};
    }

    LOG_DBG() << "Tasks loaded: count=" << static_cast<uint64_t>(tasks.size());

    return {tasks, aos::ErrorEnum::eNone};
}

aos::Error TaskStore::Upsert(const BatchTask& task)
{
    LOG_DBG() << "Save task: id=" << task.mID.c_str() << ",status=" << task.mStatus.c_str();

    if (auto err = ValidateTask(task); !err.IsNone()) {
        return err;
    }

    auto configJSON = ConfigToJSON(task.mConfig);
    if (!configJSON.mError.IsNone()) {
        return configJSON.mError;
    }

    auto itemsJSON = ItemsToJSON(task.mItems);
    if (!itemsJSON.mError.IsNone()) {
        return itemsJSON.mError;
    }

    auto resultsJSON = ResultsToJSON(task.mResults);
    if (!resultsJSON.mError.IsNone()) {
        return resultsJSON.mError;
    }

    DBPtr db(nullptr, sqlite3_close);

    if (auto err = Open(db); !err.IsNone()) {
        return err;
    }

    StatementPtr stmt(nullptr, sqlite3_finalize);

    if (auto err = Prepare(db.get(), cUpsertSQL, stmt); !err.IsNone()) {
        return err;
    }

    int rc = SQLITE_OK;

    if ((rc = BindText(stmt.get(), 1, task.mID)) != SQLITE_OK || (rc = BindText(stmt.get(), 2, task.mName)) != SQLITE_OK
        || (rc = BindText(stmt.get(), 3, task.mKind)) != SQLITE_OK
        || (rc = BindText(stmt.get(), 4, task.mStatus)) != SQLITE_OK
        || (rc = sqlite3_bind_int(stmt.get(), 5, task.mProgress)) != SQLITE_OK
        || (rc = sqlite3_bind_int(stmt.get(), 6, task.mTotalItems)) != SQLITE_OK
        || (rc = sqlite3_bind_int(stmt.get(), 7, task.mCompletedItems)) != SQLITE_OK
        || (rc = sqlite3_bind_int(stmt.get(), 8, task.mFailedItems)) != SQLITE_OK
        || (rc = BindText(stmt.get(), 9, task.mCreatedAt)) != SQLITE_OK
        || (rc = BindOptionalText(stmt.get(), 10, task.mStartedAt)) != SQLITE_OK
        || (rc = BindOptionalText(stmt.get(), 11, task.mCompletedAt)) != SQLITE_OK
        || (rc = BindText(stmt.get(), 12, configJSON.mValue)) != SQLITE_OK
        || (rc = BindText(stmt.get(), 13, itemsJSON.mValue)) != SQLITE_OK
        || (rc = BindText(stmt.get(), 14, resultsJSON.mValue)) != SQLITE_OK
        || (rc = BindOptionalText(stmt.get(), 15, task.mError)) != SQLITE_OK) {
        return DBError(db.get(), "Failed to bind task");
    }

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return DBError(db.get(), "Failed to save task");
    }

    return aos::ErrorEnum::eNone;
}

aos::Error TaskStore::Delete(const std::string& id)
{
    LOG_DBG() << "Delete task: id=" << id.c_str();

    DBPtr db(nullptr, sqlite3_close);

    if (auto err = Open(db); !err.IsNone()) {
        return err;
    }

    return DeleteRows(db.get(), {id});
}

aos::Error TaskStore::Clear()
{
    LOG_DBG() << "Clear tasks";

    DBPtr db(nullptr, sqlite3_close);

    if (auto err = Open(db); !err.IsNone()) {
        return err;
    }

    return Exec(db.get(), cClearSQL);
}

aos::RetWithError<uint64_t> TaskStore::Count()
{
    DBPtr db(nullptr, sqlite3_close);

    if (auto err = Open(db); !err.IsNone()) {
        return {0, err};
    }

    StatementPtr stmt(nullptr, sqlite3_finalize);

    if (auto err = Prepare(db.get(), cCountSQL, stmt); !err.IsNone()) {
        return {0, err};
    }

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return {0, DBError(db.get(), "Failed to count tasks")};
    }

    return {static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 0)), aos::ErrorEnum::eNone};
}

aos::RetWithError<uint64_t> TaskStore::CleanupOld(uint64_t maxToKeep)
{
    LOG_DBG() << "Cleanup old tasks: maxToKeep=" << maxToKeep;

    DBPtr db(nullptr, sqlite3_close);

    if (auto err = Open(db); !err.IsNone()) {
        return {0, err};
    }

    if (auto err = Exec(db.get(), "BEGIN IMMEDIATE"); !err.IsNone()) {
        return {0, err};
    }

    std::vector<std::string> ids;

    auto err = DeleteOld(db.get(), maxToKeep, ids);
    if (err.IsNone()) {
        err = Exec(db.get(), "COMMIT");
    }

    if (!err.IsNone()) {
        if (auto rollbackErr = Exec(db.get(), "ROLLBACK"); !rollbackErr.IsNone()) {
            LOG_ERR() << "Failed to rollback cleanup: error=" << rollbackErr.Message();
        }

        return {0, err};
    }

    if (!ids.empty()) {
        LOG_INF() << "Old tasks removed: count=" << static_cast<uint64_t>(ids.size());
    }

    return {static_cast<uint64_t>(ids.size()), aos::ErrorEnum::eNone};
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

aos::Error TaskStore::Open(DBPtr& db) const
{
    auto parent = std::filesystem::path(mDBPath).parent_path();

    if (!parent.empty()) {
        std::error_code ec;

        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return aos::Error(aos::ErrorEnum::eFailed, ("Failed to create database directory: " + ec.message()).c_str());
        }
    }

    sqlite3* raw = nullptr;
    auto     rc  = sqlite3_open_v2(
        mDBPath.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

    db.reset(raw);

    if (rc != SQLITE_OK) {
        return aos::Error(aos::ErrorEnum::eRuntime,
            ("Failed to open database: " + std::string(raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc))).c_str());
    }

    sqlite3_busy_timeout(db.get(), cBusyTimeoutMs);

    return aos::ErrorEnum::eNone;
}

aos::Error TaskStore::Exec(sqlite3* db, const std::string& sql) const
{
    char* errMsg = nullptr;

    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string message = errMsg ? errMsg : sqlite3_errmsg(db);

        sqlite3_free(errMsg);

        return aos::Error(aos::ErrorEnum::eRuntime, ("Failed to execute statement: " + message).c_str());
    }

    return aos::ErrorEnum::eNone;
}

aos::Error TaskStore::Prepare(sqlite3* db, const std::string& sql, StatementPtr& stmt) const
{
    sqlite3_stmt* raw = nullptr;

    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return DBError(db, "Failed to prepare statement");
    }

    stmt.reset(raw);

    return aos::ErrorEnum::eNone;
}

aos::Error TaskStore::ReadTask(sqlite3_stmt* stmt, BatchTask& task) const
{
    task.mID             = ColumnText(stmt, eID);
    task.mName           = ColumnText(stmt, eName);
    task.mKind           = ColumnText(stmt, eType);
    task.mStatus         = ColumnText(stmt, eStatus);
    task.mProgress       = sqlite3_column_int(stmt, eProgress);
    task.mTotalItems     = sqlite3_column_int(stmt, eTotalItems);
    task.mCompletedItems = sqlite3_column_int(stmt, eCompletedItems);
    task.mFailedItems    = sqlite3_column_int(stmt, eFailedItems);
    task.mCreatedAt      = ColumnText(stmt, eCreatedAt);
    task.mStartedAt      = ColumnOptionalText(stmt, eStartedAt);
    task.mCompletedAt    = ColumnOptionalText(stmt, eCompletedAt);
    task.mError          = ColumnOptionalText(stmt, eErrorText);

    aos::Error err;

    if (err = ConfigFromJSON(ColumnText(stmt, eConfigJSON), task.mConfig); err.IsNone()) {
        if (err = ItemsFromJSON(ColumnText(stmt, eItemsJSON), task.mItems); err.IsNone()) {
            err = ResultsFromJSON(ColumnText(stmt, eResultsJSON), task.mResults);
        }
    }

    if (!err.IsNone()) {
        LOG_ERR() << "Failed to read task: id=" << task.mID.c_str() << ",error=" << err.Message();

        return aos::Error(err.Value(), ("Failed to read task " + task.mID + ": " + err.Message()).c_str());
    }

    return aos::ErrorEnum::eNone;
}

aos::Error TaskStore::DeleteOld(sqlite3* db, uint64_t maxToKeep, std::vector<std::string>& ids) const
{
    StatementPtr stmt(nullptr, sqlite3_finalize);

    if (auto err = Prepare(db, cSelectOldSQL, stmt); !err.IsNone()) {
        return err;
    }

    if (sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(maxToKeep)) != SQLITE_OK) {
        return DBError(db, "Failed to bind offset");
    }

    int rc = SQLITE_OK;

    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        ids.push_back(ColumnText(stmt.get(), 0));
    }

    if (rc != SQLITE_DONE) {
        return DBError(db, "Failed to query old tasks");
    }

    return DeleteRows(db, ids);
}

aos::Error TaskStore::DeleteRows(sqlite3* db, const std::vector<std::string>& ids) const
{
    if (ids.empty()) {
        return aos::ErrorEnum::eNone;
    }

    StatementPtr stmt(nullptr, sqlite3_finalize);

    if (auto err = Prepare(db, cDeleteSQL, stmt); !err.IsNone()) {
        return err;
    }

    for (const auto& id : ids) {
        if (BindText(stmt.get(), 1, id) != SQLITE_OK) {
            return DBError(db, "Failed to bind task id");
        }

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            return DBError(db, "Failed to delete task");
        }

        sqlite3_reset(stmt.get());
        sqlite3_clear_bindings(stmt.get());
    }

    return aos::ErrorEnum::eNone;
}
