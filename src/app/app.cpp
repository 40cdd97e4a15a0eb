/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <csignal>
#include <execinfo.h>
#include <iostream>
#include <unistd.h>

#include <curl/curl.h>

#include <Poco/Util/HelpFormatter.h>

#include <aos/common/version.hpp>
#include <utils/exception.hpp>

#include "app.hpp"
#include "logger/logmodule.hpp"
#include "version.hpp"

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

static void SegmentationHandler(int sig)
{
    static constexpr auto cBacktraceSize = 32;

    void*  array[cBacktraceSize];
    size_t size;

    LOG_ERR() << "Segmentation fault";

    size = backtrace(array, cBacktraceSize);

    backtrace_symbols_fd(array, size, STDERR_FILENO);

    raise(sig);
}

static void RegisterSegfaultSignal()
{
    struct sigaction act { };

    act.sa_handler = SegmentationHandler;
    act.sa_flags   = SA_RESETHAND;

    sigaction(SIGSEGV, &act, nullptr);
}

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

App::App()
    : mThreadPool(cMinThreads, cMaxThreads)
{
}

/***********************************************************************************************************************
 * Protected
 **********************************************************************************************************************/

void App::initialize(Application& self)
{
    if (mStopProcessing) {
        return;
    }

    RegisterSegfaultSignal();

    // Protocol lines own the original stdout, everything else written to fd 1 goes to stderr.
    auto [protocolFD, detachErr] = DetachStdout();
    AOS_ERROR_CHECK_AND_THROW("can't detach stdout", detachErr);

    mProtocolBuf    = std::make_unique<FDStreamBuf>(protocolFD);
    mProtocolStream = std::make_unique<std::ostream>(mProtocolBuf.get());

    auto err = mLogger.Init();
    AOS_ERROR_CHECK_AND_THROW("can't initialize logger", err);

    Application::initialize(self);

    LOG_INF() << "Initialize genassist: version = " << GENASSIST_VERSION;

    if (auto ret = curl_global_init(CURL_GLOBAL_DEFAULT); ret != CURLE_OK) {
        AOS_ERROR_THROW(curl_easy_strerror(ret), aos::ErrorEnum::eFailed);
    }

    LoadConfig();

    mTransferClient.emplace(mConfig.mDownload);
    mDownloader.emplace(mConfig.mDownload, *mTransferClient);
    mTaskStore.emplace(mConfig.mTaskStore.mDBPath);
    mCommandHandler.emplace(*mDownloader, *mTaskStore, mConfig.mTaskStore.mMaxTasksToKeep);

    mOutputChannel = std::make_shared<OutputChannel>(*mProtocolStream);
    mDispatcher.emplace(*mCommandHandler, mOutputChannel);
    mRequestLoop.emplace(*mDispatcher, *mOutputChannel, mThreadPool);

    mInitialized = true;
}

void App::uninitialize()
{
    if (!mInitialized) {
        return;
    }

    LOG_INF() << "Uninitialize genassist";

    mRequestLoop->Stop();

    curl_global_cleanup();

    Application::uninitialize();
}

void App::reinitialize(Application& self)
{
    LOG_INF() << "Reinitialize genassist";

    Application::reinitialize(self);
}

int App::main(const ArgVec& args)
{
    (void)args;

    if (mStopProcessing) {
        return Application::EXIT_OK;
    }

    mRequestLoop->Run(std::cin);

    return Application::EXIT_OK;
}

void App::defineOptions(Poco::Util::OptionSet& options)
{
    Application::defineOptions(options);

    options.addOption(Poco::Util::Option("help", "h", "displays help information")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleHelp)));
    options.addOption(Poco::Util::Option("version", "", "displays version information")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleVersion)));
    options.addOption(Poco::Util::Option("journal", "j", "redirects logs to systemd journal")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleJournal)));
    options.addOption(Poco::Util::Option("verbose", "v", "sets current log level")
                          .argument("${level}")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleLogLevel)));
    options.addOption(Poco::Util::Option("config", "c", "path to config file")
                          .argument("${file}")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleConfigFile)));
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

void App::HandleHelp(const std::string& name, const std::string& value)
{
    (void)name;
    (void)value;

    mStopProcessing = true;

    Poco::Util::HelpFormatter helpFormatter(options());

    helpFormatter.setCommand(commandName());
    helpFormatter.setUsage("[OPTIONS]");
    helpFormatter.setHeader("genassist download and task store service. Reads JSON requests from stdin.");
    helpFormatter.format(std::cout);

    stopOptionsProcessing();
}

void App::HandleVersion(const std::string& name, const std::string& value)
{
    (void)name;
    (void)value;

    mStopProcessing = true;

    std::cout << "genassist version:        " << GENASSIST_VERSION << std::endl;
    std::cout << "Aos core library version: " << AOS_CORE_VERSION << std::endl;

    stopOptionsProcessing();
}

void App::HandleJournal(const std::string& name, const std::string& value)
{
    (void)name;
    (void)value;

    mLogger.SetBackend(aos::common::logger::Logger::Backend::eJournald);
}

void App::HandleLogLevel(const std::string& name, const std::string& value)
{
    (void)name;

    aos::LogLevel level;

    auto err = level.FromString(aos::String(value.c_str()));
    if (!err.IsNone()) {
        throw Poco::Exception("unsupported log level", value);
    }

    mLogger.SetLogLevel(level);
}

void App::HandleConfigFile(const std::string& name, const std::string& value)
{
    (void)name;

    mConfigFile = value;
}

void App::LoadConfig()
{
    auto [config, err] = ParseConfig(mConfigFile);
    if (err.Is(aos::ErrorEnum::eNotFound)) {
        LOG_WRN() << "Config file not found, use defaults: file=" << mConfigFile.c_str();

        mConfig = DefaultConfig();

        return;
    }

    AOS_ERROR_CHECK_AND_THROW("can't parse config", err);

    mConfig = config;
}
