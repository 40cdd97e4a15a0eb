/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef FDSTREAM_HPP_
#define FDSTREAM_HPP_

#include <streambuf>

#include <aos/common/tools/error.hpp>

/**
 * Unbuffered stream buffer writing to owned file descriptor.
 */
class FDStreamBuf : public std::streambuf {
public:
    /**
     * Constructor.
     *
     * @param fd file descriptor, closed on destruction.
     */
    explicit FDStreamBuf(int fd);

    /**
     * Destructor.
     */
    ~FDStreamBuf() override;

    FDStreamBuf(const FDStreamBuf&)            = delete;
    FDStreamBuf& operator=(const FDStreamBuf&) = delete;

protected:
    int_type        overflow(int_type ch) override;
    std::streamsize xsputn(const char* data, std::streamsize size) override;

private:
    int mFD;
};

/**
 * Moves process stdout to a private descriptor and points STDOUT_FILENO to stderr.
 *
 * After the call anything written to std::cout, printf or fd 1 lands on stderr, so only the
 * returned descriptor carries protocol lines.
 *
 * @return aos::RetWithError<int> descriptor of the original stdout.
 */
aos::RetWithError<int> DetachStdout();

#endif // FDSTREAM_HPP_
