/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <fstream>
#include <optional>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <test/utils/log.hpp>

#include "downloader/downloader.hpp"
#include "downloader/transferclient.hpp"
#include "stubs/httpserver.hpp"
#include "stubs/progressobserver.hpp"
#include "stubs/response.hpp"

using namespace testing;

namespace fs = std::filesystem;

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

class FailingTransferClient : public TransferClientItf {
public:
    aos::Error Open(const std::string& url, std::unique_ptr<ResponseItf>& response) override
    {
        (void)url;
        (void)response;

        mOpenCount++;

        return aos::Error(aos::ErrorEnum::eFailed, "Couldn't connect to server");
    }

    int mOpenCount = 0;
};

class BrokenStreamTransferClient : public TransferClientItf {
public:
    BrokenStreamTransferClient(const std::string& body, size_t failAfter)
        : mBody(body)
        , mFailAfter(failAfter)
    {
    }

    aos::Error Open(const std::string& url, std::unique_ptr<ResponseItf>& response) override
    {
        (void)url;

        mOpenCount++;

        response = std::make_unique<ResponseStub>(mBody, mBody.size(), mFailAfter);

        return aos::ErrorEnum::eNone;
    }

    int mOpenCount = 0;

private:
    std::string mBody;
    size_t      mFailAfter;
};

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class DownloaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        aos::InitLogs();

        fs::remove_all(cTestDir);
        fs::create_directories(cTestDir);

        std::ofstream ofs(mSourceFile, std::ios::binary);

        for (int i = 0; i < 10000; i++) {
            ofs << "This is a test file line " << i << "\n";
        }

        ofs.close();

        mFileSize = fs::file_size(mSourceFile);

        mConfig.mDownloadDir = mDownloadDir;
        mConfig.mChunkSize   = 4096;
    }

    void StartServer()
    {
        mServer.emplace(mSourceFile);
        mServer->Start();
    }

    void TearDown() override
    {
        if (mServer) {
            mServer->Stop();
        }

        fs::remove_all(cTestDir);
    }

    Downloader::SleepFunc RecordSleep()
    {
        return [this](std::chrono::milliseconds delay) { mSleeps.push_back(delay); };
    }

    static constexpr auto cTestDir = "downloader_test";

    std::string                            mSourceFile  = std::string(cTestDir) + "/source.dat";
    std::string                            mDownloadDir = std::string(cTestDir) + "/download";
    uint64_t                               mFileSize {};
    DownloadConfig                         mConfig;
    std::optional<HTTPServer>              mServer;
    std::vector<std::chrono::milliseconds> mSleeps;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(DownloaderTest, DownloadSucceeds)
{
    StartServer();

    TransferClient client(mConfig);
    Downloader     downloader(mConfig, client, RecordSleep());
    auto           recorder = std::make_shared<ProgressObserverStub>();

    auto result = downloader.Download(mServer->GetURL("image.png"), "image.png", "", recorder);
    ASSERT_EQ(result.mError, aos::ErrorEnum::eNone);
    EXPECT_EQ(result.mValue, (fs::path(mDownloadDir) / "image.png").string());
    EXPECT_EQ(fs::file_size(result.mValue), mFileSize);

    auto events = recorder->GetEvents();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().mDownloaded, mFileSize);
    EXPECT_EQ(events.back().mTotal, mFileSize);
    EXPECT_EQ(events.back().mPath, result.mValue);
    EXPECT_EQ(events.back().mURL, mServer->GetURL("image.png"));

    for (size_t i = 1; i < events.size(); i++) {
        EXPECT_GT(events[i].mDownloaded, events[i - 1].mDownloaded);
    }

    EXPECT_EQ(mServer->GetHits(), 1);
    EXPECT_EQ(mServer->GetUserAgent(), mConfig.mUserAgent);
    EXPECT_EQ(mServer->GetReferer(), "http://localhost");
    EXPECT_TRUE(mSleeps.empty());
}

TEST_F(DownloaderTest, DownloadToTargetDir)
{
    StartServer();

    TransferClient client(mConfig);
    Downloader     downloader(mConfig, client, RecordSleep());
    auto           targetDir = std::string(cTestDir) + "/nested/target";

    auto result = downloader.Download(mServer->GetURL("out.bin"), "out.bin", targetDir);
    ASSERT_EQ(result.mError, aos::ErrorEnum::eNone);
    EXPECT_EQ(result.mValue, (fs::path(targetDir) / "out.bin").string());
    EXPECT_EQ(fs::file_size(result.mValue), mFileSize);
}

TEST_F(DownloaderTest, DownloadTruncatesExistingFile)
{
    StartServer();

    fs::create_directories(mDownloadDir);

    std::ofstream ofs(fs::path(mDownloadDir) / "image.png", std::ios::binary);

    ofs << std::string(mFileSize * 2, 'x');
    ofs.close();

    TransferClient client(mConfig);
    Downloader     downloader(mConfig, client, RecordSleep());

    auto result = downloader.Download(mServer->GetURL("image.png"), "image.png");
    ASSERT_EQ(result.mError, aos::ErrorEnum::eNone);
    EXPECT_EQ(fs::file_size(result.mValue), mFileSize);
}

TEST_F(DownloaderTest, StatusErrorIsRetried)
{
    StartServer();
    mServer->SetStatus(Poco::Net::HTTPResponse::HTTP_INTERNAL_SERVER_ERROR);

    TransferClient client(mConfig);
    Downloader     downloader(mConfig, client, RecordSleep());

    auto result = downloader.Download(mServer->GetURL("image.png"), "image.png");
    ASSERT_NE(result.mError, aos::ErrorEnum::eNone);
    EXPECT_THAT(std::string(result.mError.Message()), HasSubstr("500"));

    EXPECT_EQ(mServer->GetHits(), 3);
    EXPECT_THAT(mSleeps, ElementsAre(std::chrono::milliseconds(300), std::chrono::milliseconds(600)));
}

TEST_F(DownloaderTest, TransportErrorIsRetried)
{
    FailingTransferClient client;
    Downloader            downloader(mConfig, client, RecordSleep());

    auto result = downloader.Download("http://127.0.0.1:1/image.png", "image.png");
    ASSERT_NE(result.mError, aos::ErrorEnum::eNone);
    EXPECT_THAT(std::string(result.mError.Message()), HasSubstr("Couldn't connect to server"));

    EXPECT_EQ(client.mOpenCount, 3);
    EXPECT_THAT(mSleeps, ElementsAre(std::chrono::milliseconds(300), std::chrono::milliseconds(600)));
}

TEST_F(DownloaderTest, RetryCountFromConfig)
{
    mConfig.mMaxRetryCount = 5;
    mConfig.mRetryDelay    = std::chrono::milliseconds(10);

    FailingTransferClient client;
    Downloader            downloader(mConfig, client, RecordSleep());

    auto result = downloader.Download("http://127.0.0.1:1/image.png", "image.png");
    ASSERT_NE(result.mError, aos::ErrorEnum::eNone);

    EXPECT_EQ(client.mOpenCount, 5);
    EXPECT_THAT(mSleeps,
        ElementsAre(std::chrono::milliseconds(10), std::chrono::milliseconds(20), std::chrono::milliseconds(30),
            std::chrono::milliseconds(40)));
}

TEST_F(DownloaderTest, WriteErrorIsNotRetried)
{
    StartServer();

    // Regular file in place of target directory.
    auto blocker = std::string(cTestDir) + "/blocker";

    std::ofstream(blocker) << "x";

    TransferClient client(mConfig);
    Downloader     downloader(mConfig, client, RecordSleep());

    auto result = downloader.Download(mServer->GetURL("image.png"), "image.png", blocker);
    ASSERT_NE(result.mError, aos::ErrorEnum::eNone);

    EXPECT_EQ(mServer->GetHits(), 1);
    EXPECT_TRUE(mSleeps.empty());
}

TEST_F(DownloaderTest, ReadErrorIsNotRetried)
{
    BrokenStreamTransferClient client(std::string(3 * mConfig.mChunkSize, 'r'), mConfig.mChunkSize);
    Downloader                 downloader(mConfig, client, RecordSleep());
    auto                       recorder = std::make_shared<ProgressObserverStub>();

    auto result = downloader.Download("http://host/image.png", "image.png", "", recorder);
    ASSERT_NE(result.mError, aos::ErrorEnum::eNone);

    EXPECT_EQ(client.mOpenCount, 1);
    EXPECT_TRUE(mSleeps.empty());
    EXPECT_FALSE(fs::exists(fs::path(mDownloadDir) / "image.png"));

    auto events = recorder->GetEvents();

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events.front().mDownloaded, mConfig.mChunkSize);
}

TEST_F(DownloaderTest, ExpiredObserverIsSkipped)
{
    StartServer();

    TransferClient client(mConfig);
    Downloader     downloader(mConfig, client, RecordSleep());

    std::weak_ptr<ProgressObserverItf> observer;

    {
        auto recorder = std::make_shared<ProgressObserverStub>();

        observer = recorder;
    }

    auto result = downloader.Download(mServer->GetURL("image.png"), "image.png", "", observer);
    ASSERT_EQ(result.mError, aos::ErrorEnum::eNone);
    EXPECT_EQ(fs::file_size(result.mValue), mFileSize);
}

TEST_F(DownloaderTest, InvalidFileName)
{
    FailingTransferClient client;
    Downloader            downloader(mConfig, client, RecordSleep());

    auto result = downloader.Download("http://127.0.0.1:1/image.png", "");
    EXPECT_TRUE(result.mError.Is(aos::ErrorEnum::eInvalidArgument));

    result = downloader.Download("http://127.0.0.1:1/image.png", "/tmp/image.png");
    EXPECT_TRUE(result.mError.Is(aos::ErrorEnum::eInvalidArgument));

    result = downloader.Download("", "image.png");
    EXPECT_TRUE(result.mError.Is(aos::ErrorEnum::eInvalidArgument));

    EXPECT_EQ(client.mOpenCount, 0);
}
