/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TRANSFERCLIENT_HPP_
#define TRANSFERCLIENT_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <aos/common/tools/error.hpp>

#include "config/config.hpp"

/**
 * Response interface.
 */
class ResponseItf {
public:
    /**
     * Destructor.
     */
    virtual ~ResponseItf() = default;

    /**
     * Returns HTTP status code.
     *
     * @return long.
     */
    virtual long GetStatusCode() const = 0;

    /**
     * Returns declared body length, 0 if unknown.
     *
     * @return uint64_t.
     */
    virtual uint64_t GetContentLength() const = 0;

    /**
     * Reads next body chunk. Empty buffer means end of body.
     *
     * @param buffer buffer, resized to the number of bytes read.
     * @param maxSize max chunk size.
     * @return aos::Error.
     */
    virtual aos::Error Read(std::vector<uint8_t>& buffer, size_t maxSize) = 0;
};

/**
 * Transfer client interface.
 */
class TransferClientItf {
public:
    /**
     * Destructor.
     */
    virtual ~TransferClientItf() = default;

    /**
     * Sends request and waits for response headers.
     *
     * @param url URL.
     * @param[out] response response.
     * @return aos::Error.
     */
    virtual aos::Error Open(const std::string& url, std::unique_ptr<ResponseItf>& response) = 0;
};

/**
 * Transfer client based on libcurl.
 */
class TransferClient : public TransferClientItf {
public:
    /**
     * Constructor.
     *
     * @param config download config.
     */
    explicit TransferClient(const DownloadConfig& config);

    /**
     * Sends request and waits for response headers.
     *
     * @param url URL.
     * @param[out] response response.
     * @return aos::Error.
     */
    aos::Error Open(const std::string& url, std::unique_ptr<ResponseItf>& response) override;

private:
    DownloadConfig mConfig;
};

#endif // TRANSFERCLIENT_HPP_
