/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <string>

#include <Poco/Task.h>

#include "logger/logmodule.hpp"
#include "requestloop.hpp"

/***********************************************************************************************************************
 * RequestTask
 **********************************************************************************************************************/

class RequestTask : public Poco::Task {
public:
    RequestTask(Dispatcher& dispatcher, OutputChannel& output, const std::string& request)
        : Poco::Task("RequestTask")
        , mDispatcher(dispatcher)
        , mOutput(output)
        , mRequest(request)
    {
    }

    void runTask() override { mOutput.Send(mDispatcher.Process(mRequest)); }

private:
    Dispatcher&    mDispatcher;
    OutputChannel& mOutput;
    std::string    mRequest;
};

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RequestLoop::RequestLoop(Dispatcher& dispatcher, OutputChannel& output, Poco::ThreadPool& threadPool)
    : mDispatcher(dispatcher)
    , mOutput(output)
    , mTaskManager(threadPool)
{
}

void RequestLoop::Run(std::istream& in)
{
    std::string line;

    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        if (!mDispatcher.IsLongRunning(line)) {
            mOutput.Send(mDispatcher.Process(line));

            continue;
        }

        try {
            mTaskManager.start(new RequestTask(mDispatcher, mOutput, line));
        } catch (const Poco::NoThreadAvailableException& e) {
            LOG_WRN() << "No free worker, process request inline: err=" << e.displayText().c_str();

            mOutput.Send(mDispatcher.Process(line));
        }
    }

    LOG_DBG() << "Input closed, wait for running requests";

    mTaskManager.joinAll();
}

void RequestLoop::Stop()
{
    mTaskManager.cancelAll();
    mTaskManager.joinAll();
}
