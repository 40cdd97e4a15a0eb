/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef APP_HPP_
#define APP_HPP_

#include <memory>
#include <optional>
#include <ostream>

#include <Poco/ThreadPool.h>
#include <Poco/Util/ServerApplication.h>

#include <logger/logger.hpp>

#include "commands/commandhandler.hpp"
#include "commands/dispatcher.hpp"
#include "commands/fdstream.hpp"
#include "commands/outputchannel.hpp"
#include "commands/requestloop.hpp"
#include "config/config.hpp"
#include "downloader/downloader.hpp"
#include "downloader/transferclient.hpp"
#include "taskstore/taskstore.hpp"

/**
 * genassist command process.
 */
class App : public Poco::Util::ServerApplication {
public:
    /**
     * Constructor.
     */
    App();

protected:
    void initialize(Application& self) override;
    void uninitialize() override;
    void reinitialize(Application& self) override;
    int  main(const ArgVec& args) override;
    void defineOptions(Poco::Util::OptionSet& options) override;

private:
    static constexpr auto cDefaultConfigFile = "genassist.cfg";
    static constexpr auto cMinThreads        = 2;
    static constexpr auto cMaxThreads        = 16;

    void HandleHelp(const std::string& name, const std::string& value);
    void HandleVersion(const std::string& name, const std::string& value);
    void HandleJournal(const std::string& name, const std::string& value);
    void HandleLogLevel(const std::string& name, const std::string& value);
    void HandleConfigFile(const std::string& name, const std::string& value);

    void LoadConfig();

    aos::common::logger::Logger mLogger;
    bool                        mStopProcessing = false;
    bool                        mInitialized    = false;
    std::string                 mConfigFile     = cDefaultConfigFile;

    Config mConfig;

    std::optional<TransferClient>  mTransferClient;
    std::optional<Downloader>      mDownloader;
    std::optional<TaskStore>       mTaskStore;
    std::optional<CommandHandler>  mCommandHandler;
    std::unique_ptr<FDStreamBuf>   mProtocolBuf;
    std::unique_ptr<std::ostream>  mProtocolStream;
    std::shared_ptr<OutputChannel> mOutputChannel;
    std::optional<Dispatcher>      mDispatcher;

    Poco::ThreadPool           mThreadPool;
    std::optional<RequestLoop> mRequestLoop;
};

#endif
