/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef OUTPUTCHANNEL_HPP_
#define OUTPUTCHANNEL_HPP_

#include <mutex>
#include <ostream>
#include <string>

#include "downloader/progress.hpp"

/**
 * Line oriented output shared by command responses and progress events.
 */
class OutputChannel : public ProgressObserverItf {
public:
    /**
     * Progress event name.
     */
    static constexpr auto cProgressEvent = "download:progress";

    /**
     * Constructor.
     *
     * @param out output stream.
     */
    explicit OutputChannel(std::ostream& out);

    /**
     * Writes single line.
     *
     * @param line line.
     */
    void Send(const std::string& line);

    /**
     * Publishes progress event.
     *
     * @param event progress event.
     */
    void OnProgress(const ProgressEvent& event) override;

private:
    std::mutex    mMutex;
    std::ostream& mOut;
};

#endif // OUTPUTCHANNEL_HPP_
