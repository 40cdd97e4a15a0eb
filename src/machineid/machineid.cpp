/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <openssl/sha.h>
#include <unistd.h>

#include <Poco/Environment.h>
#include <Poco/String.h>

#include "logger/logmodule.hpp"
#include "machineid.hpp"

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

static constexpr auto   cCPUInfoPath    = "/proc/cpuinfo";
static constexpr size_t cMachineIDLen   = 16;
static constexpr auto   cFieldSeparator = '|';

static std::string GetCPUInfoField(const std::string& field)
{
    std::ifstream ifs(cCPUInfoPath);
    std::string   line;

    while (std::getline(ifs, line)) {
        auto pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }

        if (Poco::trim(line.substr(0, pos)) == field) {
            return Poco::trim(line.substr(pos + 1));
        }
    }

    return "";
}

static std::string GetCPUFrequency()
{
    auto value = GetCPUInfoField("cpu MHz");
    if (value.empty()) {
        return "";
    }

    try {
        return std::to_string(static_cast<uint64_t>(std::llround(std::stod(value))));
    } catch (const std::exception& e) {
        LOG_WRN() << "Can't parse CPU frequency: value=" << value.c_str() << ",error=" << e.what();
    }

    return "";
}

static std::string GetTotalMemory()
{
    auto pages    = sysconf(_SC_PHYS_PAGES);
    auto pageSize = sysconf(_SC_PAGE_SIZE);

    if (pages <= 0 || pageSize <= 0) {
        return "";
    }

    return std::to_string(static_cast<uint64_t>(pages) * static_cast<uint64_t>(pageSize));
}

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

MachineInfo CollectMachineInfo()
{
    MachineInfo info;

    try {
        info.mHostName  = Poco::Environment::nodeName();
        info.mOSVersion = Poco::Environment::osName() + " " + Poco::Environment::osVersion();
    } catch (const std::exception& e) {
        LOG_WRN() << "Can't get host info: error=" << e.what();
    }

    info.mCPUBrand     = GetCPUInfoField("model name");
    info.mCPUFrequency = GetCPUFrequency();
    info.mTotalMemory  = GetTotalMemory();

    return info;
}

aos::RetWithError<std::string> ComputeMachineID(const MachineInfo& info)
{
    std::ostringstream seed;

    seed << info.mHostName << cFieldSeparator << info.mOSVersion << cFieldSeparator << info.mCPUBrand
         << cFieldSeparator << info.mCPUFrequency << cFieldSeparator << info.mTotalMemory;

    auto          data = seed.str();
    unsigned char digest[SHA256_DIGEST_LENGTH];

    if (SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest) == nullptr) {
        return {"", aos::Error(aos::ErrorEnum::eFailed, "Failed to calculate digest")};
    }

    std::ostringstream hex;

    for (auto byte : digest) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }

    return {hex.str().substr(0, cMachineIDLen), aos::ErrorEnum::eNone};
}
