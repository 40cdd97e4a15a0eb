/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdio>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <unistd.h>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <Poco/JSON/Parser.h>

#include <test/utils/log.hpp>

#include "commands/fdstream.hpp"
#include "commands/outputchannel.hpp"
#include "logger/logmodule.hpp"

using namespace testing;

namespace fs = std::filesystem;

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

static std::string ReadTextFile(const std::string& path)
{
    std::ifstream      file(path);
    std::ostringstream os;

    os << file.rdbuf();

    return os.str();
}

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class FDStreamTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        aos::InitLogs();

        fs::remove_all(cTestDir);
        fs::create_directories(cTestDir);
    }

    void TearDown() override { fs::remove_all(cTestDir); }

    // Runs action with fd 1 and fd 2 pointing to files. Nothing inside action may report to gtest.
    void CaptureStdStreams(const std::function<void()>& action)
    {
        std::cout.flush();
        std::fflush(stdout);
        std::fflush(stderr);

        auto savedOut = dup(STDOUT_FILENO);
        auto savedErr = dup(STDERR_FILENO);
        auto outFD    = open(StdoutPath().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        auto errFD    = open(StderrPath().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);

        ASSERT_GE(savedOut, 0);
        ASSERT_GE(savedErr, 0);
        ASSERT_GE(outFD, 0);
        ASSERT_GE(errFD, 0);

        dup2(outFD, STDOUT_FILENO);
        dup2(errFD, STDERR_FILENO);
        close(outFD);
        close(errFD);

        action();

        std::cout.flush();
        std::fflush(stdout);
        std::fflush(stderr);

        dup2(savedOut, STDOUT_FILENO);
        dup2(savedErr, STDERR_FILENO);
        close(savedOut);
        close(savedErr);
    }

    std::string StdoutPath() const { return std::string(cTestDir) + "/stdout.txt"; }
    std::string StderrPath() const { return std::string(cTestDir) + "/stderr.txt"; }

    static constexpr auto cTestDir = "fdstream_test";
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(FDStreamTest, StdoutCarriesOnlyProtocolLines)
{
    aos::Error err;

    CaptureStdStreams([&]() {
        auto [fd, detachErr] = DetachStdout();

        err = detachErr;
        if (!err.IsNone()) {
            return;
        }

        FDStreamBuf   buf(fd);
        std::ostream  out(&buf);
        OutputChannel channel(out);

        LOG_INF() << "Logger message";
        std::cout << "plain cout text" << std::endl;
        std::printf("plain printf text\n");

        channel.Send(R"({"id":1,"result":null})");
        channel.OnProgress(ProgressEvent {"http://host/a.png", "/tmp/a.png", 10, 20, 5});

        LOG_ERR() << "Another logger message";
        std::cout << "more cout text" << std::endl;

        channel.Send(R"({"id":2,"error":"failed"})");
    });

    ASSERT_TRUE(err.IsNone()) << err.Message();

    std::istringstream       protocol(ReadTextFile(StdoutPath()));
    std::string              line;
    std::vector<std::string> lines;

    while (std::getline(protocol, line)) {
        lines.push_back(line);
    }

    ASSERT_EQ(lines.size(), 3u);

    for (const auto& protocolLine : lines) {
        Poco::JSON::Parser parser;

        EXPECT_NO_THROW(parser.parse(protocolLine).extract<Poco::JSON::Object::Ptr>()) << protocolLine;
    }

    EXPECT_THAT(lines[1], HasSubstr(OutputChannel::cProgressEvent));

    auto diagnostics = ReadTextFile(StderrPath());

    EXPECT_THAT(diagnostics, HasSubstr("plain cout text"));
    EXPECT_THAT(diagnostics, HasSubstr("plain printf text"));
    EXPECT_THAT(diagnostics, HasSubstr("more cout text"));
}

TEST_F(FDStreamTest, WritesToDescriptor)
{
    auto fd = open(StdoutPath().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);

    ASSERT_GE(fd, 0);

    {
        FDStreamBuf  buf(fd);
        std::ostream out(&buf);

        out << "first" << ' ' << 42 << std::endl;
        out.write("second\n", 7);

        EXPECT_TRUE(out.good());
    }

    EXPECT_EQ(ReadTextFile(StdoutPath()), "first 42\nsecond\n");
}
