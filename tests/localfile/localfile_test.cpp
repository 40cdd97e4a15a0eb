/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include <test/utils/log.hpp>

#include "localfile/localfile.hpp"

using namespace testing;

namespace fs = std::filesystem;

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class LocalFileTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        aos::InitLogs();

        fs::create_directories(cTestDir);
    }

    void TearDown() override { fs::remove_all(cTestDir); }

    std::string CreateFile(const std::string& name, const std::string& content)
    {
        auto path = fs::absolute(fs::path(cTestDir) / name).string();

        std::ofstream(path, std::ios::binary) << content;

        return path;
    }

    static constexpr auto cTestDir = "localfile_test";
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(LocalFileTest, MimeTypes)
{
    EXPECT_EQ(GetMimeType("/a/b.png"), "image/png");
    EXPECT_EQ(GetMimeType("/a/b.PNG"), "image/png");
    EXPECT_EQ(GetMimeType("/a/b.jpg"), "image/jpeg");
    EXPECT_EQ(GetMimeType("/a/b.jpeg"), "image/jpeg");
    EXPECT_EQ(GetMimeType("/a/b.gif"), "image/gif");
    EXPECT_EQ(GetMimeType("/a/b.webp"), "image/webp");
    EXPECT_EQ(GetMimeType("/a/b.txt"), "application/octet-stream");
    EXPECT_EQ(GetMimeType("/a/png"), "application/octet-stream");
}

TEST_F(LocalFileTest, ReadAsDataURI)
{
    auto [uri, err] = ReadFileAsDataURI(CreateFile("image.png", "hi"));
    ASSERT_EQ(err, aos::ErrorEnum::eNone);
    EXPECT_EQ(uri, "data:image/png;base64,aGk=");
}

TEST_F(LocalFileTest, LongContentHasNoLineBreaks)
{
    auto [uri, err] = ReadFileAsDataURI(CreateFile("blob.bin", std::string(4096, '\x7f')));
    ASSERT_EQ(err, aos::ErrorEnum::eNone);
    EXPECT_EQ(uri.rfind("data:application/octet-stream;base64,", 0), 0u);
    EXPECT_EQ(uri.find('\n'), std::string::npos);
    EXPECT_EQ(uri.find('\r'), std::string::npos);
}

TEST_F(LocalFileTest, EmptyFile)
{
    auto [uri, err] = ReadFileAsDataURI(CreateFile("empty.gif", ""));
    ASSERT_EQ(err, aos::ErrorEnum::eNone);
    EXPECT_EQ(uri, "data:image/gif;base64,");
}

TEST_F(LocalFileTest, MissingFile)
{
    auto [uri, err] = ReadFileAsDataURI("/not/existing/file.png");

    EXPECT_TRUE(err.Is(aos::ErrorEnum::eNotFound));
    EXPECT_NE(std::string(err.Message()).find("/not/existing/file.png"), std::string::npos);
}

TEST_F(LocalFileTest, DownloadDirFromEnvironment)
{
    setenv("XDG_DOWNLOAD_DIR", "/srv/downloads", 1);

    auto [dir, err] = GetDownloadDir();
    EXPECT_EQ(err, aos::ErrorEnum::eNone);
    EXPECT_EQ(dir, "/srv/downloads");

    unsetenv("XDG_DOWNLOAD_DIR");

    auto ret = GetDownloadDir();
    EXPECT_EQ(ret.mError, aos::ErrorEnum::eNone);
    EXPECT_NE(ret.mValue.find("Downloads"), std::string::npos);
}
