/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TASKJSON_HPP_
#define TASKJSON_HPP_

#include <string>
#include <vector>

#include <Poco/JSON/Object.h>

#include <aos/common/tools/error.hpp>

#include "types.hpp"

/**
 * Serializes batch task config to JSON text.
 *
 * @param config config.
 * @return aos::RetWithError<std::string>.
 */
aos::RetWithError<std::string> ConfigToJSON(const BatchTaskConfig& config);

/**
 * Deserializes batch task config from JSON text.
 *
 * @param json JSON text.
 * @param[out] config config.
 * @return aos::Error.
 */
aos::Error ConfigFromJSON(const std::string& json, BatchTaskConfig& config);

/**
 * Serializes task items to JSON text.
 *
 * @param items items.
 * @return aos::RetWithError<std::string>.
 */
aos::RetWithError<std::string> ItemsToJSON(const std::vector<TaskItem>& items);

/**
 * Deserializes task items from JSON text.
 *
 * @param json JSON text.
 * @param[out] items items.
 * @return aos::Error.
 */
aos::Error ItemsFromJSON(const std::string& json, std::vector<TaskItem>& items);

/**
 * Serializes task results to JSON text.
 *
 * @param results results.
 * @return aos::RetWithError<std::string>.
 */
aos::RetWithError<std::string> ResultsToJSON(const std::vector<TaskResult>& results);

/**
 * Deserializes task results from JSON text.
 *
 * @param json JSON text.
 * @param[out] results results.
 * @return aos::Error.
 */
aos::Error ResultsFromJSON(const std::string& json, std::vector<TaskResult>& results);

/**
 * Converts batch task to JSON object.
 *
 * @param task task.
 * @param[out] object JSON object.
 * @return aos::Error.
 */
aos::Error TaskToJSON(const BatchTask& task, Poco::JSON::Object::Ptr& object);

/**
 * Converts JSON object to batch task.
 *
 * @param object JSON object.
 * @param[out] task task.
 * @return aos::Error.
 */
aos::Error TaskFromJSON(const Poco::JSON::Object::Ptr& object, BatchTask& task);

#endif // TASKJSON_HPP_
