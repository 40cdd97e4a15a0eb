/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef REQUESTLOOP_HPP_
#define REQUESTLOOP_HPP_

#include <istream>

#include <Poco/TaskManager.h>
#include <Poco/ThreadPool.h>

#include "dispatcher.hpp"
#include "outputchannel.hpp"

/**
 * Reads line delimited requests and writes responses to output channel.
 *
 * Downloads run on the thread pool so their responses may come out of order. All other commands run on the
 * reading thread in arrival order, so store commands for the same task are applied as they were sent.
 */
class RequestLoop {
public:
    /**
     * Constructor.
     *
     * @param dispatcher request dispatcher.
     * @param output output channel.
     * @param threadPool thread pool for long running requests.
     */
    RequestLoop(Dispatcher& dispatcher, OutputChannel& output, Poco::ThreadPool& threadPool);

    /**
     * Processes requests until input is closed and waits for pending ones.
     *
     * @param in input stream.
     */
    void Run(std::istream& in);

    /**
     * Cancels and waits for pending requests.
     */
    void Stop();

private:
    Dispatcher&       mDispatcher;
    OutputChannel&    mOutput;
    Poco::TaskManager mTaskManager;
};

#endif // REQUESTLOOP_HPP_
