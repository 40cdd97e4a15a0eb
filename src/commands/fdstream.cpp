/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>
#include <unistd.h>

#include "fdstream.hpp"

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

static aos::Error ErrnoToError(const char* context)
{
    return aos::Error(aos::ErrorEnum::eFailed, (std::string(context) + ": " + std::strerror(errno)).c_str());
}

/***********************************************************************************************************************
 * FDStreamBuf
 **********************************************************************************************************************/

FDStreamBuf::FDStreamBuf(int fd)
    : mFD(fd)
{
}

FDStreamBuf::~FDStreamBuf()
{
    if (mFD >= 0) {
        close(mFD);
    }
}

FDStreamBuf::int_type FDStreamBuf::overflow(int_type ch)
{
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
        return traits_type::not_eof(ch);
    }

    char c = traits_type::to_char_type(ch);

    if (xsputn(&c, 1) != 1) {
        return traits_type::eof();
    }

    return ch;
}

std::streamsize FDStreamBuf::xsputn(const char* data, std::streamsize size)
{
    std::streamsize written = 0;

    while (written < size) {
        auto ret = write(mFD, data + written, size - written);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }

            break;
        }

        written += ret;
    }

    return written;
}

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

aos::RetWithError<int> DetachStdout()
{
    std::cout.flush();
    std::fflush(stdout);

    auto fd = dup(STDOUT_FILENO);
    if (fd < 0) {
        return {-1, ErrnoToError("can't duplicate stdout")};
    }

    if (dup2(STDERR_FILENO, STDOUT_FILENO) < 0) {
        auto err = ErrnoToError("can't redirect stdout");

        close(fd);

        return {-1, err};
    }

    return {fd, aos::ErrorEnum::eNone};
}
