/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cstring>

#include <curl/curl.h>

#include "logger/logmodule.hpp"
#include "transferclient.hpp"

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

using CurlPtr      = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlMultiPtr = std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)>;
using CurlListPtr  = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

/**
 * Pull-style response: body bytes are fetched from the connection only when the reader asks for them.
 */
class CurlResponse : public ResponseItf {
public:
    CurlResponse()
        : mCurl(nullptr, curl_easy_cleanup)
        , mMulti(nullptr, curl_multi_cleanup)
        , mHeaders(nullptr, curl_slist_free_all)
    {
    }

    ~CurlResponse()
    {
        if (mMulti && mCurl) {
            curl_multi_remove_handle(mMulti.get(), mCurl.get());
        }
    }

    aos::Error Init(const std::string& url, const DownloadConfig& config)
    {
        mCurl.reset(curl_easy_init());
        if (!mCurl) {
            return aos::Error(aos::ErrorEnum::eFailed, "Failed to init curl");
        }

        mMulti.reset(curl_multi_init());
        if (!mMulti) {
            return aos::Error(aos::ErrorEnum::eFailed, "Failed to init curl multi");
        }

        auto referer = "Referer: " + config.mReferer;

        mHeaders.reset(curl_slist_append(nullptr, referer.c_str()));
        if (!mHeaders) {
            return aos::Error(aos::ErrorEnum::eFailed, "Failed to create request headers");
        }

        auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config.mTimeout).count();

        curl_easy_setopt(mCurl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(mCurl.get(), CURLOPT_USERAGENT, config.mUserAgent.c_str());
        curl_easy_setopt(mCurl.get(), CURLOPT_HTTPHEADER, mHeaders.get());
        curl_easy_setopt(mCurl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(mCurl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(mCurl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout));
        curl_easy_setopt(mCurl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(config.mChunkSize));
        curl_easy_setopt(mCurl.get(), CURLOPT_WRITEFUNCTION, WriteData);
        curl_easy_setopt(mCurl.get(), CURLOPT_WRITEDATA, this);

        if (auto code = curl_multi_add_handle(mMulti.get(), mCurl.get()); code != CURLM_OK) {
            return aos::Error(aos::ErrorEnum::eFailed, curl_multi_strerror(code));
        }

        // Headers are complete once the first body byte arrives or the transfer is over.
        while (!mBodyStarted && !mDone) {
            if (auto err = Perform(); !err.IsNone()) {
                return err;
            }
        }

        if (mDone && mResult != CURLE_OK) {
            return aos::Error(aos::ErrorEnum::eFailed, curl_easy_strerror(mResult));
        }

        curl_easy_getinfo(mCurl.get(), CURLINFO_RESPONSE_CODE, &mStatusCode);

        curl_off_t contentLength = -1;

        curl_easy_getinfo(mCurl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength);

        mContentLength = contentLength > 0 ? static_cast<uint64_t>(contentLength) : 0;

        return aos::ErrorEnum::eNone;
    }

    long GetStatusCode() const override { return mStatusCode; }

    uint64_t GetContentLength() const override { return mContentLength; }

    aos::Error Read(std::vector<uint8_t>& buffer, size_t maxSize) override
    {
        while (mOffset == mPending.size() && !mDone) {
            if (auto err = Perform(); !err.IsNone()) {
                return err;
            }
        }

        if (mOffset < mPending.size()) {
            auto size = std::min(maxSize, mPending.size() - mOffset);

            buffer.assign(mPending.begin() + mOffset, mPending.begin() + mOffset + size);
            mOffset += size;

            if (mOffset == mPending.size()) {
                mPending.clear();
                mOffset = 0;
            }

            return aos::ErrorEnum::eNone;
        }

        if (mResult != CURLE_OK) {
            return aos::Error(aos::ErrorEnum::eFailed, curl_easy_strerror(mResult));
        }

        buffer.clear();

        return aos::ErrorEnum::eNone;
    }

private:
    static constexpr int cPollTimeoutMs = 1000;

    static size_t WriteData(char* ptr, size_t size, size_t nmemb, void* userdata)
    {
        auto* self  = static_cast<CurlResponse*>(userdata);
        auto  total = size * nmemb;

        self->mPending.insert(self->mPending.end(), ptr, ptr + total);
        self->mBodyStarted = true;

        return total;
    }

    aos::Error Perform()
    {
        int running = 0;

        if (auto code = curl_multi_perform(mMulti.get(), &running); code != CURLM_OK) {
            return aos::Error(aos::ErrorEnum::eFailed, curl_multi_strerror(code));
        }

        if (running == 0) {
            int      left = 0;
            CURLMsg* msg  = nullptr;

            while ((msg = curl_multi_info_read(mMulti.get(), &left)) != nullptr) {
                if (msg->msg == CURLMSG_DONE) {
                    mResult = msg->data.result;
                }
            }

            mDone = true;

            return aos::ErrorEnum::eNone;
        }

        if (mOffset < mPending.size()) {
            return aos::ErrorEnum::eNone;
        }

        if (auto code = curl_multi_poll(mMulti.get(), nullptr, 0, cPollTimeoutMs, nullptr); code != CURLM_OK) {
            return aos::Error(aos::ErrorEnum::eFailed, curl_multi_strerror(code));
        }

        return aos::ErrorEnum::eNone;
    }

    CurlPtr              mCurl;
    CurlMultiPtr         mMulti;
    CurlListPtr          mHeaders;
    std::vector<uint8_t> mPending;
    size_t               mOffset {};
    bool                 mBodyStarted {};
    bool                 mDone {};
    CURLcode             mResult {CURLE_OK};
    long                 mStatusCode {};
    uint64_t             mContentLength {};
};

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

TransferClient::TransferClient(const DownloadConfig& config)
    : mConfig(config)
{
}

aos::Error TransferClient::Open(const std::string& url, std::unique_ptr<ResponseItf>& response)
{
    LOG_DBG() << "Open transfer: url=" << url.c_str();

    auto curlResponse = std::make_unique<CurlResponse>();

    if (auto err = curlResponse->Init(url, mConfig); !err.IsNone()) {
        return err;
    }

    LOG_DBG() << "Response received: status=" << curlResponse->GetStatusCode()
              << ",contentLength=" << curlResponse->GetContentLength();

    response = std::move(curlResponse);

    return aos::ErrorEnum::eNone;
}
