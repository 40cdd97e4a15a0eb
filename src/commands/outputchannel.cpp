/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <sstream>

#include <Poco/JSON/Object.h>

#include "outputchannel.hpp"

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

OutputChannel::OutputChannel(std::ostream& out)
    : mOut(out)
{
}

void OutputChannel::Send(const std::string& line)
{
    std::lock_guard<std::mutex> lock(mMutex);

    mOut << line << std::endl;
}

void OutputChannel::OnProgress(const ProgressEvent& event)
{
    Poco::JSON::Object::Ptr payload = new Poco::JSON::Object();

    payload->set("url", event.mURL);
    payload->set("path", event.mPath);
    payload->set("downloaded", event.mDownloaded);
    payload->set("total", event.mTotal);
    payload->set("bytesPerSec", event.mBytesPerSec);

    Poco::JSON::Object message;

    message.set("event", cProgressEvent);
    message.set("payload", payload);

    std::ostringstream os;

    message.stringify(os);

    Send(os.str());
}
