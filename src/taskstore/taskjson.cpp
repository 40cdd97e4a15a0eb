/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <sstream>
#include <stdexcept>
#include <typeinfo>

#include <Poco/JSON/Array.h>
#include <Poco/JSON/Parser.h>
#include <Poco/JSON/Stringifier.h>

#include "taskjson.hpp"

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

static bool IsSet(const Poco::JSON::Object::Ptr& object, const std::string& key)
{
    return object->has(key) && !object->isNull(key);
}

static Poco::Dynamic::Var GetRequired(const Poco::JSON::Object::Ptr& object, const std::string& key)
{
    if (!IsSet(object, key)) {
        throw std::runtime_error("missing field " + key);
    }

    return object->get(key);
}

static std::string GetString(const Poco::JSON::Object::Ptr& object, const std::string& key)
{
    auto value = GetRequired(object, key);

    if (!value.isString()) {
        throw std::runtime_error("field " + key + " should be a string");
    }

    return value.extract<std::string>();
}

static int GetInt(const Poco::JSON::Object::Ptr& object, const std::string& key)
{
    auto value = GetRequired(object, key);

    if (!value.isInteger()) {
        throw std::runtime_error("field " + key + " should be an integer");
    }

    return value.convert<int>();
}

static bool GetBool(const Poco::JSON::Object::Ptr& object, const std::string& key)
{
    auto value = GetRequired(object, key);

    if (!value.isBoolean()) {
        throw std::runtime_error("field " + key + " should be a boolean");
    }

    return value.convert<bool>();
}

static std::optional<std::string> GetOptionalString(const Poco::JSON::Object::Ptr& object, const std::string& key)
{
    if (!IsSet(object, key)) {
        return std::nullopt;
    }

    return GetString(object, key);
}

static std::optional<int> GetOptionalInt(const Poco::JSON::Object::Ptr& object, const std::string& key)
{
    if (!IsSet(object, key)) {
        return std::nullopt;
    }

    return GetInt(object, key);
}

template <typename T>
static void SetOptional(Poco::JSON::Object::Ptr& object, const std::string& key, const std::optional<T>& value)
{
    if (value.has_value()) {
        object->set(key, *value);
    }
}

static Poco::Dynamic::Var ParseText(const std::string& json)
{
    Poco::JSON::Parser parser;

    return parser.parse(json);
}

static std::string Stringify(const Poco::Dynamic::Var& value)
{
    std::ostringstream os;

    Poco::JSON::Stringifier::condense(value, os);

    return os.str();
}

static Poco::JSON::Object::Ptr ToObject(const Poco::Dynamic::Var& value, const std::string& name)
{
    if (value.type() != typeid(Poco::JSON::Object::Ptr)) {
        throw std::runtime_error(name + " should be an object");
    }

    return value.extract<Poco::JSON::Object::Ptr>();
}

static Poco::JSON::Array::Ptr ToArray(const Poco::Dynamic::Var& value, const std::string& name)
{
    if (value.type() != typeid(Poco::JSON::Array::Ptr)) {
        throw std::runtime_error(name + " should be an array");
    }

    return value.extract<Poco::JSON::Array::Ptr>();
}

static Poco::JSON::Object::Ptr ConfigToObject(const BatchTaskConfig& config)
{
    Poco::JSON::Object::Ptr object = new Poco::JSON::Object();

    object->set("model", config.mModel);
    object->set("modelType", config.mModelType);
    object->set("concurrentLimit", config.mConcurrentLimit);
    object->set("retryAttempts", config.mRetryAttempts);
    object->set("retryDelay", config.mRetryDelay);
    object->set("autoDownload", config.mAutoDownload);
    object->set("aspectRatio", config.mAspectRatio);
    object->set("size", config.mSize);
    object->set("quality", config.mQuality);
    SetOptional(object, "generateCount", config.mGenerateCount);
    SetOptional(object, "apiTimeoutMs", config.mAPITimeoutMs);

    return object;
}

static BatchTaskConfig ConfigFromObject(const Poco::JSON::Object::Ptr& object)
{
    BatchTaskConfig config;

    config.mModel           = GetString(object, "model");
    config.mModelType       = GetString(object, "modelType");
    config.mConcurrentLimit = GetInt(object, "concurrentLimit");
    config.mRetryAttempts   = GetInt(object, "retryAttempts");
    config.mRetryDelay      = GetInt(object, "retryDelay");
    config.mAutoDownload    = GetBool(object, "autoDownload");
    config.mAspectRatio     = GetString(object, "aspectRatio");
    config.mSize            = GetString(object, "size");
    config.mQuality         = GetString(object, "quality");
    config.mGenerateCount   = GetOptionalInt(object, "generateCount");
    config.mAPITimeoutMs    = GetOptionalInt(object, "apiTimeoutMs");

    return config;
}

static Poco::JSON::Object::Ptr DebugLogToObject(const DebugLog& log)
{
    Poco::JSON::Object::Ptr object = new Poco::JSON::Object();

    object->set("id", log.mID);
    object->set("taskItemId", log.mTaskItemID);
    object->set("timestamp", log.mTimestamp);
    object->set("type", log.mType);
    object->set("data", log.mData.empty() ? Poco::Dynamic::Var() : ParseText(log.mData));
    SetOptional(object, "duration", log.mDuration);

    return object;
}

static DebugLog DebugLogFromObject(const Poco::JSON::Object::Ptr& object)
{
    DebugLog log;

    log.mID         = GetString(object, "id");
    log.mTaskItemID = GetString(object, "taskItemId");
    log.mTimestamp  = GetString(object, "timestamp");
    log.mType       = GetString(object, "type");
    log.mDuration   = GetOptionalInt(object, "duration");

    if (!object->has("data")) {
        throw std::runtime_error("missing field data");
    }

    log.mData = Stringify(object->get("data"));

    return log;
}

static Poco::JSON::Object::Ptr ItemToObject(const TaskItem& item)
{
    Poco::JSON::Object::Ptr object = new Poco::JSON::Object();

    object->set("id", item.mID);
    object->set("prompt", item.mPrompt);
    SetOptional(object, "sourceImage", item.mSourceImage);
    SetOptional(object, "mask", item.mMask);
    object->set("priority", item.mPriority);
    object->set("status", item.mStatus);
    object->set("attemptCount", item.mAttemptCount);
    object->set("createdAt", item.mCreatedAt);
    SetOptional(object, "processedAt", item.mProcessedAt);
    SetOptional(object, "error", item.mError);

    if (item.mDebugLogs.has_value()) {
        Poco::JSON::Array::Ptr logs = new Poco::JSON::Array();

        for (const auto& log : *item.mDebugLogs) {
            logs->add(DebugLogToObject(log));
        }

        object->set("debugLogs", logs);
    }

    return object;
}

static TaskItem ItemFromObject(const Poco::JSON::Object::Ptr& object)
{
    TaskItem item;

    item.mID           = GetString(object, "id");
    item.mPrompt       = GetString(object, "prompt");
    item.mSourceImage  = GetOptionalString(object, "sourceImage");
    item.mMask         = GetOptionalString(object, "mask");
    item.mPriority     = GetInt(object, "priority");
    item.mStatus       = GetString(object, "status");
    item.mAttemptCount = GetInt(object, "attemptCount");
    item.mCreatedAt    = GetString(object, "createdAt");
    item.mProcessedAt  = GetOptionalString(object, "processedAt");
    item.mError        = GetOptionalString(object, "error");

    if (IsSet(object, "debugLogs")) {
        auto logs = ToArray(object->get("debugLogs"), "debugLogs");

        item.mDebugLogs.emplace();

        for (size_t i = 0; i < logs->size(); i++) {
            item.mDebugLogs->push_back(DebugLogFromObject(ToObject(logs->get(i), "debug log")));
        }
    }

    return item;
}

static Poco::JSON::Object::Ptr ResultToObject(const TaskResult& result)
{
    Poco::JSON::Object::Ptr object = new Poco::JSON::Object();

    object->set("id", result.mID);
    object->set("taskItemId", result.mTaskItemID);
    object->set("imageUrl", result.mImageURL);
    SetOptional(object, "localPath", result.mLocalPath);
    object->set("downloaded", result.mDownloaded);
    object->set("createdAt", result.mCreatedAt);
    SetOptional(object, "durationMs", result.mDurationMs);

    return object;
}

static TaskResult ResultFromObject(const Poco::JSON::Object::Ptr& object)
{
    TaskResult result;

    result.mID         = GetString(object, "id");
    result.mTaskItemID = GetString(object, "taskItemId");
    result.mImageURL   = GetString(object, "imageUrl");
    result.mLocalPath  = GetOptionalString(object, "localPath");
    result.mDownloaded = GetBool(object, "downloaded");
    result.mCreatedAt  = GetString(object, "createdAt");
    result.mDurationMs = GetOptionalInt(object, "durationMs");

    return result;
}

static Poco::JSON::Array::Ptr ItemsToArray(const std::vector<TaskItem>& items)
{
    Poco::JSON::Array::Ptr array = new Poco::JSON::Array();

    for (const auto& item : items) {
        array->add(ItemToObject(item));
    }

    return array;
}

static std::vector<TaskItem> ItemsFromArray(const Poco::JSON::Array::Ptr& array)
{
    std::vector<TaskItem> items;

    for (size_t i = 0; i < array->size(); i++) {
        items.push_back(ItemFromObject(ToObject(array->get(i), "item")));
    }

    return items;
}

static Poco::JSON::Array::Ptr ResultsToArray(const std::vector<TaskResult>& results)
{
    Poco::JSON::Array::Ptr array = new Poco::JSON::Array();

    for (const auto& result : results) {
        array->add(ResultToObject(result));
    }

    return array;
}

static std::vector<TaskResult> ResultsFromArray(const Poco::JSON::Array::Ptr& array)
{
    std::vector<TaskResult> results;

    for (size_t i = 0; i < array->size(); i++) {
        results.push_back(ResultFromObject(ToObject(array->get(i), "result")));
    }

    return results;
}

static aos::Error ToError(const std::string& context, const std::exception& e)
{
    return aos::Error(aos::ErrorEnum::eInvalidArgument, (context + ": " + e.what()).c_str());
}

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

aos::RetWithError<std::string> ConfigToJSON(const BatchTaskConfig& config)
{
    try {
        return {Stringify(ConfigToObject(config)), aos::ErrorEnum::eNone};
    } catch (const std::exception& e) {
        return {"", ToError("Failed to serialize config", e)};
    }
}

aos::Error ConfigFromJSON(const std::string& json, BatchTaskConfig& config)
{
    try {
        config = ConfigFromObject(ToObject(ParseText(json), "config"));
    } catch (const std::exception& e) {
        return ToError("Failed to parse config", e);
    }

    return aos::ErrorEnum::eNone;
}

aos::RetWithError<std::string> ItemsToJSON(const std::vector<TaskItem>& items)
{
    try {
        return {Stringify(ItemsToArray(items)), aos::ErrorEnum::eNone};
    } catch (const std::exception& e) {
        return {"", ToError("Failed to serialize items", e)};
    }
}

aos::Error ItemsFromJSON(const std::string& json, std::vector<TaskItem>& items)
{
    try {
        items = ItemsFromArray(ToArray(ParseText(json), "items"));
    } catch (const std::exception& e) {
        return ToError("Failed to parse items", e);
    }

    return aos::ErrorEnum::eNone;
}

aos::RetWithError<std::string> ResultsToJSON(const std::vector<TaskResult>& results)
{
    try {
        return {Stringify(ResultsToArray(results)), aos::ErrorEnum::eNone};
    } catch (const std::exception& e) {
        return {"", ToError("Failed to serialize results", e)};
    }
}

aos::Error ResultsFromJSON(const std::string& json, std::vector<TaskResult>& results)
{
    try {
        results = ResultsFromArray(ToArray(ParseText(json), "results"));
    } catch (const std::exception& e) {
        return ToError("Failed to parse results", e);
    }

    return aos::ErrorEnum::eNone;
}

aos::Error TaskToJSON(const BatchTask& task, Poco::JSON::Object::Ptr& object)
{
    try {
        object = new Poco::JSON::Object();

        object->set("id", task.mID);
        object->set("name", task.mName);
        object->set("type", task.mKind);
        object->set("status", task.mStatus);
        object->set("progress", task.mProgress);
        object->set("totalItems", task.mTotalItems);
        object->set("completedItems", task.mCompletedItems);
        object->set("failedItems", task.mFailedItems);
        object->set("createdAt", task.mCreatedAt);
        SetOptional(object, "startedAt", task.mStartedAt);
        SetOptional(object, "completedAt", task.mCompletedAt);
        object->set("config", ConfigToObject(task.mConfig));
        object->set("items", ItemsToArray(task.mItems));
        object->set("results", ResultsToArray(task.mResults));
        SetOptional(object, "error", task.mError);
    } catch (const std::exception& e) {
        return ToError("Failed to serialize task", e);
    }

    return aos::ErrorEnum::eNone;
}

aos::Error TaskFromJSON(const Poco::JSON::Object::Ptr& object, BatchTask& task)
{
    if (object.isNull()) {
        return aos::Error(aos::ErrorEnum::eInvalidArgument, "Task should be an object");
    }

    try {
        BatchTask parsed;

        parsed.mID             = GetString(object, "id");
        parsed.mName           = GetString(object, "name");
        parsed.mKind           = GetString(object, "type");
        parsed.mStatus         = GetString(object, "status");
        parsed.mProgress       = GetInt(object, "progress");
        parsed.mTotalItems     = GetInt(object, "totalItems");
        parsed.mCompletedItems = GetInt(object, "completedItems");
        parsed.mFailedItems    = GetInt(object, "failedItems");
        parsed.mCreatedAt      = GetString(object, "createdAt");
        parsed.mStartedAt      = GetOptionalString(object, "startedAt");
        parsed.mCompletedAt    = GetOptionalString(object, "completedAt");
        parsed.mConfig         = ConfigFromObject(ToObject(GetRequired(object, "config"), "config"));
        parsed.mItems          = ItemsFromArray(ToArray(GetRequired(object, "items"), "items"));
        parsed.mResults        = ResultsFromArray(ToArray(GetRequired(object, "results"), "results"));
        parsed.mError          = GetOptionalString(object, "error");

        task = std::move(parsed);
    } catch (const std::exception& e) {
        return ToError("Failed to parse task", e);
    }

    return aos::ErrorEnum::eNone;
}
