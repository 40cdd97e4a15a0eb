/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef LOGMODULE_HPP_
#define LOGMODULE_HPP_

#include <aos/common/tools/log.hpp>

#define LOG_DBG() LOG_MODULE_DBG(aos::LogModuleEnum::eDefault)
#define LOG_INF() LOG_MODULE_INF(aos::LogModuleEnum::eDefault)
#define LOG_WRN() LOG_MODULE_WRN(aos::LogModuleEnum::eDefault)
#define LOG_ERR() LOG_MODULE_ERR(aos::LogModuleEnum::eDefault)

#endif // LOGMODULE_HPP_
