/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef PROGRESS_HPP_
#define PROGRESS_HPP_

#include <cstdint>
#include <string>

/**
 * Download progress event.
 */
struct ProgressEvent {
    std::string mURL;
    std::string mPath;
    uint64_t    mDownloaded {};
    uint64_t    mTotal {};
    uint64_t    mBytesPerSec {};
};

/**
 * Progress observer interface.
 */
class ProgressObserverItf {
public:
    /**
     * Destructor.
     */
    virtual ~ProgressObserverItf() = default;

    /**
     * Notifies about written chunk.
     *
     * @param event progress event.
     */
    virtual void OnProgress(const ProgressEvent& event) = 0;
};

#endif // PROGRESS_HPP_
