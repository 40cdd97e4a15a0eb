/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef LOCALFILE_HPP_
#define LOCALFILE_HPP_

#include <string>

#include <aos/common/tools/error.hpp>

/**
 * Returns MIME type inferred from file extension.
 *
 * @param path file path.
 * @return std::string.
 */
std::string GetMimeType(const std::string& path);

/**
 * Reads file and encodes it as base64 data URI.
 *
 * @param path absolute file path.
 * @return aos::RetWithError<std::string>.
 */
aos::RetWithError<std::string> ReadFileAsDataURI(const std::string& path);

/**
 * Returns platform download directory.
 *
 * @return aos::RetWithError<std::string>.
 */
aos::RetWithError<std::string> GetDownloadDir();

#endif // LOCALFILE_HPP_
