/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <chrono>
#include <filesystem>
#include <fstream>
#include <vector>

#include "logger/logmodule.hpp"
#include "streamwriter.hpp"

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

static StreamResult WriteFailed(const std::string& path, const std::string& message, uint64_t written)
{
    std::error_code ec;

    std::filesystem::remove(path, ec);

    return StreamResult {written, StreamErrorEnum::eWrite, aos::Error(aos::ErrorEnum::eFailed, message.c_str())};
}

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

StreamWriter::StreamWriter(size_t chunkSize)
    : mChunkSize(chunkSize)
{
}

StreamResult StreamWriter::Write(ResponseItf& response, const std::string& url, const std::string& path,
    const std::weak_ptr<ProgressObserverItf>& observer)
{
    LOG_DBG() << "Writing stream: path=" << path.c_str();

    auto parent = std::filesystem::path(path).parent_path();

    if (!parent.empty()) {
        std::error_code ec;

        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return StreamResult {0, StreamErrorEnum::eWrite,
                aos::Error(aos::ErrorEnum::eFailed, ("Failed to create directory: " + ec.message()).c_str())};
        }
    }

    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        return StreamResult {
            0, StreamErrorEnum::eWrite, aos::Error(aos::ErrorEnum::eFailed, ("Failed to open file: " + path).c_str())};
    }

    auto                 start   = std::chrono::steady_clock::now();
    uint64_t             written = 0;
    std::vector<uint8_t> buffer;

    buffer.reserve(mChunkSize);

    while (true) {
        if (auto err = response.Read(buffer, mChunkSize); !err.IsNone()) {
            ofs.close();

            std::error_code ec;

            std::filesystem::remove(path, ec);

            LOG_ERR() << "Failed to read stream: error=" << err.Message() << ",written=" << written;

            return StreamResult {written, StreamErrorEnum::eRead,
                aos::Error(err.Value(), (std::string("Failed to read stream: ") + err.Message()).c_str())};
        }

        if (buffer.empty()) {
            break;
        }

        if (!ofs.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()))) {
            ofs.close();

            return WriteFailed(path, "Failed to write file: " + path, written);
        }

        if (written == 0) {
            LOG_DBG() << "First chunk written: path=" << path.c_str() << ",size=" << buffer.size()
                      << ",total=" << response.GetContentLength();
        }

        written += buffer.size();

        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        Notify(observer,
            ProgressEvent {url, path, written, response.GetContentLength(),
                elapsed > 0 ? static_cast<uint64_t>(static_cast<double>(written) / elapsed) : 0});
    }

    ofs.close();

    if (ofs.fail()) {
        return WriteFailed(path, "Failed to close file: " + path, written);
    }

    LOG_DBG() << "Stream written: path=" << path.c_str() << ",size=" << written;

    return StreamResult {written, StreamErrorEnum::eNone, aos::ErrorEnum::eNone};
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

void StreamWriter::Notify(const std::weak_ptr<ProgressObserverItf>& observer, const ProgressEvent& event)
{
    auto receiver = observer.lock();
    if (!receiver) {
        return;
    }

    try {
        receiver->OnProgress(event);
    } catch (const std::exception& e) {
        LOG_WRN() << "Progress notification failed: error=" << e.what();
    }
}
