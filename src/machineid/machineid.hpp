/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MACHINEID_HPP_
#define MACHINEID_HPP_

#include <string>

#include <aos/common/tools/error.hpp>

/**
 * Machine snapshot used as machine id seed.
 */
struct MachineInfo {
    std::string mHostName;
    std::string mOSVersion;
    std::string mCPUBrand;
    std::string mCPUFrequency;
    std::string mTotalMemory;
};

/**
 * Collects current machine info.
 *
 * @return MachineInfo.
 */
MachineInfo CollectMachineInfo();

/**
 * Computes machine id: first 16 lowercase hex characters of SHA-256 over the snapshot.
 *
 * @param info machine info.
 * @return aos::RetWithError<std::string>.
 */
aos::RetWithError<std::string> ComputeMachineID(const MachineInfo& info);

#endif // MACHINEID_HPP_
