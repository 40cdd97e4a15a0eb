/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include <test/utils/log.hpp>

#include "downloader/streamwriter.hpp"
#include "stubs/progressobserver.hpp"
#include "stubs/response.hpp"

using namespace testing;

namespace fs = std::filesystem;

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

static std::string ReadFile(const std::string& path)
{
    std::ifstream ifs(path, std::ios::binary);

    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class StreamWriterTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        aos::InitLogs();

        fs::remove_all(cTestDir);
    }

    void TearDown() override { fs::remove_all(cTestDir); }

    static constexpr auto cTestDir = "streamwriter_test";

    std::string  mPath = std::string(cTestDir) + "/a/b/out.dat";
    StreamWriter mWriter {16};
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(StreamWriterTest, WritesChunksAndReportsProgress)
{
    std::string body(100, 'z');
    auto        observer = std::make_shared<ProgressObserverStub>();

    ResponseStub response(body, body.size());

    auto result = mWriter.Write(response, "http://host/out.dat", mPath, observer);
    ASSERT_EQ(result.mError, aos::ErrorEnum::eNone);
    EXPECT_EQ(result.mBytesWritten, body.size());
    EXPECT_EQ(ReadFile(mPath), body);

    auto events = observer->GetEvents();

    // 6 full chunks and one of 4 bytes.
    ASSERT_EQ(events.size(), 7u);
    EXPECT_EQ(events.front().mDownloaded, 16u);
    EXPECT_EQ(events.back().mDownloaded, body.size());
    EXPECT_EQ(events.back().mTotal, body.size());
    EXPECT_EQ(events.back().mURL, "http://host/out.dat");
    EXPECT_EQ(events.back().mPath, mPath);
}

TEST_F(StreamWriterTest, UnknownTotalIsZero)
{
    auto observer = std::make_shared<ProgressObserverStub>();

    ResponseStub response("payload", 0);

    auto result = mWriter.Write(response, "http://host/out.dat", mPath, observer);
    ASSERT_EQ(result.mError, aos::ErrorEnum::eNone);

    auto events = observer->GetEvents();

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].mTotal, 0u);
    EXPECT_EQ(events[0].mDownloaded, 7u);
}

TEST_F(StreamWriterTest, EmptyBodyCreatesEmptyFile)
{
    auto observer = std::make_shared<ProgressObserverStub>();

    ResponseStub response("", 0);

    auto result = mWriter.Write(response, "http://host/out.dat", mPath, observer);
    ASSERT_EQ(result.mError, aos::ErrorEnum::eNone);
    EXPECT_TRUE(fs::exists(mPath));
    EXPECT_EQ(fs::file_size(mPath), 0u);
    EXPECT_TRUE(observer->GetEvents().empty());
}

TEST_F(StreamWriterTest, ReadErrorRemovesPartialFile)
{
    std::string body(100, 'z');

    ResponseStub response(body, body.size(), 32);

    auto result = mWriter.Write(response, "http://host/out.dat", mPath, {});
    EXPECT_EQ(result.mErrorSource, StreamErrorEnum::eRead);
    EXPECT_NE(result.mError, aos::ErrorEnum::eNone);
    EXPECT_EQ(result.mBytesWritten, 32u);
    EXPECT_FALSE(fs::exists(mPath));
}

TEST_F(StreamWriterTest, DirectoryErrorIsWriteError)
{
    fs::create_directories(cTestDir);

    std::ofstream(std::string(cTestDir) + "/a") << "x";

    ResponseStub response("payload", 7);

    auto result = mWriter.Write(response, "http://host/out.dat", mPath, {});
    EXPECT_EQ(result.mErrorSource, StreamErrorEnum::eWrite);
    EXPECT_NE(result.mError, aos::ErrorEnum::eNone);
}

TEST_F(StreamWriterTest, ObserverFailureDoesNotFailTransfer)
{
    std::string body(40, 'q');
    auto        observer = std::make_shared<ProgressObserverStub>();

    observer->SetThrow(true);

    ResponseStub response(body, body.size());

    auto result = mWriter.Write(response, "http://host/out.dat", mPath, observer);
    ASSERT_EQ(result.mError, aos::ErrorEnum::eNone);
    EXPECT_EQ(ReadFile(mPath), body);
    EXPECT_EQ(observer->GetEvents().size(), 3u);
}
