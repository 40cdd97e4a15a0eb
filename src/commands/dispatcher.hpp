/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DISPATCHER_HPP_
#define DISPATCHER_HPP_

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <Poco/Dynamic/Var.h>
#include <Poco/JSON/Object.h>

#include <aos/common/tools/error.hpp>

#include "commandhandler.hpp"

/**
 * Dispatches JSON requests to command handler.
 *
 * Request: {"id": <any>, "command": "<name>", "args": {...}}.
 * Response: {"id": <same>, "result": <value>} or {"id": <same>, "error": "<message>"}.
 */
class Dispatcher {
public:
    /**
     * Constructor.
     *
     * @param handler command handler.
     * @param progressObserver observer of download progress.
     */
    Dispatcher(CommandHandler& handler, std::weak_ptr<ProgressObserverItf> progressObserver);

    /**
     * Processes single request.
     *
     * @param request request text.
     * @return std::string response text.
     */
    std::string Process(const std::string& request);

    /**
     * Checks whether request runs long enough to be processed off the request loop.
     *
     * Only download-file qualifies. Malformed requests are reported as short ones.
     *
     * @param request request text.
     * @return bool.
     */
    bool IsLongRunning(const std::string& request) const;

private:
    using Command = std::function<aos::RetWithError<Poco::Dynamic::Var>(const Poco::JSON::Object::Ptr&)>;

    aos::RetWithError<Poco::Dynamic::Var> ReadLocalFile(const Poco::JSON::Object::Ptr& args);
    aos::RetWithError<Poco::Dynamic::Var> GetDownloadDir(const Poco::JSON::Object::Ptr& args);
    aos::RetWithError<Poco::Dynamic::Var> DownloadFile(const Poco::JSON::Object::Ptr& args);
    aos::RetWithError<Poco::Dynamic::Var> GetMachineID(const Poco::JSON::Object::Ptr& args);
    aos::RetWithError<Poco::Dynamic::Var> GetBatchTasks(const Poco::JSON::Object::Ptr& args);
    aos::RetWithError<Poco::Dynamic::Var> SaveBatchTask(const Poco::JSON::Object::Ptr& args);
    aos::RetWithError<Poco::Dynamic::Var> DeleteBatchTask(const Poco::JSON::Object::Ptr& args);
    aos::RetWithError<Poco::Dynamic::Var> ClearBatchTasks(const Poco::JSON::Object::Ptr& args);
    aos::RetWithError<Poco::Dynamic::Var> GetTaskCount(const Poco::JSON::Object::Ptr& args);
    aos::RetWithError<Poco::Dynamic::Var> CleanupOldTasks(const Poco::JSON::Object::Ptr& args);

    static constexpr auto cLongRunningCommand = "download-file";

    CommandHandler&                    mHandler;
    std::weak_ptr<ProgressObserverItf> mProgressObserver;
    std::map<std::string, Command>     mCommands;
};

#endif // DISPATCHER_HPP_
