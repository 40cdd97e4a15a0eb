/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <sstream>

#include <Poco/JSON/Array.h>
#include <Poco/JSON/Parser.h>

#include "dispatcher.hpp"
#include "logger/logmodule.hpp"
#include "taskstore/taskjson.hpp"

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

static aos::RetWithError<std::string> GetStringArg(
    const Poco::JSON::Object::Ptr& args, const std::string& key, bool required = true)
{
    if (args.isNull() || !args->has(key) || args->isNull(key)) {
        if (required) {
            return {"", aos::Error(aos::ErrorEnum::eInvalidArgument, ("missing argument: " + key).c_str())};
        }

        return {"", aos::ErrorEnum::eNone};
    }

    auto value = args->get(key);
    if (!value.isString()) {
        return {"", aos::Error(aos::ErrorEnum::eInvalidArgument, ("argument is not a string: " + key).c_str())};
    }

    return {value.extract<std::string>(), aos::ErrorEnum::eNone};
}

static std::string Stringify(const Poco::JSON::Object& object)
{
    std::ostringstream os;

    object.stringify(os);

    return os.str();
}

static std::string ErrorResponse(const Poco::Dynamic::Var& id, const aos::Error& err)
{
    Poco::JSON::Object response;

    response.set("id", id);
    response.set("error", std::string(err.Message()));

    return Stringify(response);
}

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Dispatcher::Dispatcher(CommandHandler& handler, std::weak_ptr<ProgressObserverItf> progressObserver)
    : mHandler(handler)
    , mProgressObserver(std::move(progressObserver))
{
    using namespace std::placeholders;

    mCommands = {
        {"read-local-file", std::bind(&Dispatcher::ReadLocalFile, this, _1)},
        {"get-download-dir", std::bind(&Dispatcher::GetDownloadDir, this, _1)},
        {"download-file", std::bind(&Dispatcher::DownloadFile, this, _1)},
        {"get-machine-id", std::bind(&Dispatcher::GetMachineID, this, _1)},
        {"get-batch-tasks", std::bind(&Dispatcher::GetBatchTasks, this, _1)},
        {"save-batch-task", std::bind(&Dispatcher::SaveBatchTask, this, _1)},
        {"delete-batch-task", std::bind(&Dispatcher::DeleteBatchTask, this, _1)},
        {"clear-batch-tasks", std::bind(&Dispatcher::ClearBatchTasks, this, _1)},
        {"get-task-count", std::bind(&Dispatcher::GetTaskCount, this, _1)},
        {"cleanup-old-tasks", std::bind(&Dispatcher::CleanupOldTasks, this, _1)},
    };
}

std::string Dispatcher::Process(const std::string& request)
{
    Poco::Dynamic::Var      id;
    Poco::JSON::Object::Ptr object;
    std::string             command;

    try {
        Poco::JSON::Parser parser;

        object = parser.parse(request).extract<Poco::JSON::Object::Ptr>();
    } catch (const Poco::Exception& e) {
        LOG_ERR() << "Failed to parse request: err=" << e.displayText().c_str();

        return ErrorResponse(id, aos::Error(aos::ErrorEnum::eInvalidArgument, "malformed request"));
    }

    if (object->has("id")) {
        id = object->get("id");
    }

    if (!object->has("command") || !object->get("command").isString()) {
        return ErrorResponse(id, aos::Error(aos::ErrorEnum::eInvalidArgument, "missing command"));
    }

    command = object->getValue<std::string>("command");

    auto it = mCommands.find(command);
    if (it == mCommands.end()) {
        return ErrorResponse(id, aos::Error(aos::ErrorEnum::eNotFound, ("unknown command: " + command).c_str()));
    }

    LOG_DBG() << "Process command: command=" << command.c_str();

    Poco::JSON::Object::Ptr args;

    if (object->has("args") && !object->isNull("args")) {
        args = object->getObject("args");
        if (args.isNull()) {
            return ErrorResponse(id, aos::Error(aos::ErrorEnum::eInvalidArgument, "args is not an object"));
        }
    }

    aos::RetWithError<Poco::Dynamic::Var> result {Poco::Dynamic::Var(), aos::ErrorEnum::eNone};

    try {
        result = it->second(args);
    } catch (const Poco::Exception& e) {
        result = {{}, aos::Error(aos::ErrorEnum::eFailed, e.displayText().c_str())};
    } catch (const std::exception& e) {
        result = {{}, aos::Error(aos::ErrorEnum::eFailed, e.what())};
    }

    if (!result.mError.IsNone()) {
        LOG_ERR() << "Command failed: command=" << command.c_str() << ", err=" << result.mError;

        return ErrorResponse(id, result.mError);
    }

    Poco::JSON::Object response;

    response.set("id", id);
    response.set("result", result.mValue);

    return Stringify(response);
}

bool Dispatcher::IsLongRunning(const std::string& request) const
{
    try {
        Poco::JSON::Parser parser;

        auto object = parser.parse(request).extract<Poco::JSON::Object::Ptr>();
        if (object.isNull() || !object->has("command") || !object->get("command").isString()) {
            return false;
        }

        return object->getValue<std::string>("command") == cLongRunningCommand;
    } catch (const Poco::Exception& e) {
        LOG_DBG() << "Request is not a command object: err=" << e.displayText().c_str();
    }

    return false;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

aos::RetWithError<Poco::Dynamic::Var> Dispatcher::ReadLocalFile(const Poco::JSON::Object::Ptr& args)
{
    auto [path, err] = GetStringArg(args, "path");
    if (!err.IsNone()) {
        return {{}, err};
    }

    auto [content, readErr] = mHandler.ReadLocalFile(path);
    if (!readErr.IsNone()) {
        return {{}, readErr};
    }

    return {content, aos::ErrorEnum::eNone};
}

aos::RetWithError<Poco::Dynamic::Var> Dispatcher::GetDownloadDir(const Poco::JSON::Object::Ptr&)
{
    auto [dir, err] = mHandler.GetDownloadDir();
    if (!err.IsNone()) {
        return {{}, err};
    }

    return {dir, aos::ErrorEnum::eNone};
}

aos::RetWithError<Poco::Dynamic::Var> Dispatcher::DownloadFile(const Poco::JSON::Object::Ptr& args)
{
    auto url = GetStringArg(args, "url");
    if (!url.mError.IsNone()) {
        return {{}, url.mError};
    }

    auto filename = GetStringArg(args, "filename");
    if (!filename.mError.IsNone()) {
        return {{}, filename.mError};
    }

    auto dir = GetStringArg(args, "dir", false);
    if (!dir.mError.IsNone()) {
        return {{}, dir.mError};
    }

    auto [path, err] = mHandler.DownloadFile(url.mValue, filename.mValue, dir.mValue, mProgressObserver);
    if (!err.IsNone()) {
        return {{}, err};
    }

    return {path, aos::ErrorEnum::eNone};
}

aos::RetWithError<Poco::Dynamic::Var> Dispatcher::GetMachineID(const Poco::JSON::Object::Ptr&)
{
    auto [id, err] = mHandler.GetMachineID();
    if (!err.IsNone()) {
        return {{}, err};
    }

    return {id, aos::ErrorEnum::eNone};
}

aos::RetWithError<Poco::Dynamic::Var> Dispatcher::GetBatchTasks(const Poco::JSON::Object::Ptr&)
{
    auto [tasks, err] = mHandler.GetBatchTasks();
    if (!err.IsNone()) {
        return {{}, err};
    }

    Poco::JSON::Array::Ptr array = new Poco::JSON::Array();

    for (const auto& task : tasks) {
        Poco::JSON::Object::Ptr object;

        if (auto convertErr = TaskToJSON(task, object); !convertErr.IsNone()) {
            return {{}, convertErr};
        }

        array->add(object);
    }

    return {array, aos::ErrorEnum::eNone};
}

aos::RetWithError<Poco::Dynamic::Var> Dispatcher::SaveBatchTask(const Poco::JSON::Object::Ptr& args)
{
    if (args.isNull() || !args->has("task") || args->isNull("task")) {
        return {{}, aos::Error(aos::ErrorEnum::eInvalidArgument, "missing argument: task")};
    }

    auto object = args->getObject("task");
    if (object.isNull()) {
        return {{}, aos::Error(aos::ErrorEnum::eInvalidArgument, "argument is not an object: task")};
    }

    BatchTask task;

    if (auto err = TaskFromJSON(object, task); !err.IsNone()) {
        return {{}, err};
    }

    if (auto err = mHandler.SaveBatchTask(task); !err.IsNone()) {
        return {{}, err};
    }

    return {Poco::Dynamic::Var(), aos::ErrorEnum::eNone};
}

aos::RetWithError<Poco::Dynamic::Var> Dispatcher::DeleteBatchTask(const Poco::JSON::Object::Ptr& args)
{
    auto [taskID, err] = GetStringArg(args, "taskId");
    if (!err.IsNone()) {
        return {{}, err};
    }

    if (auto deleteErr = mHandler.DeleteBatchTask(taskID); !deleteErr.IsNone()) {
        return {{}, deleteErr};
    }

    return {Poco::Dynamic::Var(), aos::ErrorEnum::eNone};
}

aos::RetWithError<Poco::Dynamic::Var> Dispatcher::ClearBatchTasks(const Poco::JSON::Object::Ptr&)
{
    if (auto err = mHandler.ClearBatchTasks(); !err.IsNone()) {
        return {{}, err};
    }

    return {Poco::Dynamic::Var(), aos::ErrorEnum::eNone};
}

aos::RetWithError<Poco::Dynamic::Var> Dispatcher::GetTaskCount(const Poco::JSON::Object::Ptr&)
{
    auto [count, err] = mHandler.GetTaskCount();
    if (!err.IsNone()) {
        return {{}, err};
    }

    return {count, aos::ErrorEnum::eNone};
}

aos::RetWithError<Poco::Dynamic::Var> Dispatcher::CleanupOldTasks(const Poco::JSON::Object::Ptr& args)
{
    std::optional<uint64_t> maxTasksToKeep;

    if (!args.isNull() && args->has("maxTasksToKeep") && !args->isNull("maxTasksToKeep")) {
        auto value = args->get("maxTasksToKeep");

        if (!value.isInteger() || value.convert<int64_t>() < 0) {
            return {{}, aos::Error(aos::ErrorEnum::eInvalidArgument, "invalid argument: maxTasksToKeep")};
        }

        maxTasksToKeep = value.convert<uint64_t>();
    }

    auto [removed, err] = mHandler.CleanupOldTasks(maxTasksToKeep);
    if (!err.IsNone()) {
        return {{}, err};
    }

    return {removed, aos::ErrorEnum::eNone};
}
