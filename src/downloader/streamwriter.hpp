/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef STREAMWRITER_HPP_
#define STREAMWRITER_HPP_

#include <cstdint>
#include <memory>
#include <string>

#include <aos/common/tools/error.hpp>

#include "progress.hpp"
#include "transferclient.hpp"

/**
 * Stream write error source.
 */
enum class StreamErrorEnum {
    eNone,
    eRead,
    eWrite,
};

/**
 * Stream write result.
 */
struct StreamResult {
    uint64_t        mBytesWritten {};
    StreamErrorEnum mErrorSource {StreamErrorEnum::eNone};
    aos::Error      mError;
};

/**
 * Copies response body to file in fixed-size chunks and reports progress.
 */
class StreamWriter {
public:
    /**
     * Constructor.
     *
     * @param chunkSize chunk size.
     */
    explicit StreamWriter(size_t chunkSize);

    /**
     * Writes response body to file. Existing file is truncated. On error the partial file is removed.
     *
     * @param response response.
     * @param url source URL, reported in progress events.
     * @param path destination path.
     * @param observer progress observer, may be expired.
     * @return StreamResult.
     */
    StreamResult Write(ResponseItf& response, const std::string& url, const std::string& path,
        const std::weak_ptr<ProgressObserverItf>& observer);

private:
    void Notify(const std::weak_ptr<ProgressObserverItf>& observer, const ProgressEvent& event);

    size_t mChunkSize;
};

#endif // STREAMWRITER_HPP_
