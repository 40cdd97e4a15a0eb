/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <Poco/Base64Encoder.h>
#include <Poco/Environment.h>
#include <Poco/Path.h>
#include <Poco/StreamCopier.h>

#include "localfile.hpp"
#include "logger/logmodule.hpp"

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

static constexpr auto cDefaultMimeType   = "application/octet-stream";
static constexpr auto cDownloadDirEnv    = "XDG_DOWNLOAD_DIR";
static constexpr auto cDownloadDirSubdir = "Downloads";

static bool EndsWith(const std::string& value, const std::string& suffix)
{
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

std::string GetMimeType(const std::string& path)
{
    std::string lower = path;

    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (EndsWith(lower, ".png")) {
        return "image/png";
    }

    if (EndsWith(lower, ".jpg") || EndsWith(lower, ".jpeg")) {
        return "image/jpeg";
    }

    if (EndsWith(lower, ".gif")) {
        return "image/gif";
    }

    if (EndsWith(lower, ".webp")) {
        return "image/webp";
    }

    return cDefaultMimeType;
}

aos::RetWithError<std::string> ReadFileAsDataURI(const std::string& path)
{
    LOG_DBG() << "Reading local file: path=" << path.c_str();

    if (!std::filesystem::exists(path)) {
        return {"", aos::Error(aos::ErrorEnum::eNotFound, ("File not found: " + path).c_str())};
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        return {"", aos::Error(aos::ErrorEnum::eFailed, ("Failed to open file: " + path).c_str())};
    }

    std::ostringstream os;

    os << "data:" << GetMimeType(path) << ";base64,";

    try {
        Poco::Base64Encoder encoder(os);

        encoder.rdbuf()->setLineLength(0);

        Poco::StreamCopier::copyStream(ifs, encoder);

        encoder.close();
    } catch (const std::exception& e) {
        return {"", aos::Error(aos::ErrorEnum::eFailed, e.what())};
    }

    if (ifs.bad()) {
        return {"", aos::Error(aos::ErrorEnum::eFailed, ("Failed to read file: " + path).c_str())};
    }

    return {os.str(), aos::ErrorEnum::eNone};
}

aos::RetWithError<std::string> GetDownloadDir()
{
    auto dir = Poco::Environment::get(cDownloadDirEnv, "");
    if (!dir.empty()) {
        return {dir, aos::ErrorEnum::eNone};
    }

    try {
        return {Poco::Path(Poco::Path::home()).append(cDownloadDirSubdir).toString(), aos::ErrorEnum::eNone};
    } catch (const std::exception& e) {
        return {"", aos::Error(aos::ErrorEnum::eFailed, e.what())};
    }
}
