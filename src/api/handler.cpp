/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file handler.cpp
 * @brief Implementation of the JSON command pipeline.
 *
 * @details
 * Request lifecycle:
 * 1. **Ingest**: Parsing the raw JSON payload.
 * 2. **Decode**: Extracting the action and its arguments.
 * 3. **Execute**: Routing the action to the manager.
 * 4. **Respond**: Formatting the result, or the error, as a JSON response.
 */

#include "nexuid/api/handler.hpp"

#include "nexuid/core/errors.hpp"
#include "nexuid/detect/format_detector.hpp"
#include "nexuid/encoding/time.hpp"
#include "nexuid/serial/json_codec.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <memory>

namespace nexuid::api {

namespace {

using JsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

std::string print(const cJSON* root)
{
    char* raw_output = cJSON_PrintUnformatted(root);
    std::string out = raw_output ? raw_output : "";
    free(raw_output);
    return out;
}

std::string error_response(const std::string& kind, const std::string& message)
{
    JsonPtr root(cJSON_CreateObject(), cJSON_Delete);
    cJSON_AddStringToObject(root.get(), "status", "error");
    cJSON_AddStringToObject(root.get(), "kind", kind.c_str());
    cJSON_AddStringToObject(root.get(), "message", message.c_str());
    return print(root.get());
}

std::optional<std::string> optional_string(const cJSON* req, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(req, key);
    if (!item || cJSON_IsNull(item)) {
        return std::nullopt;
    }
    if (!cJSON_IsString(item) || !item->valuestring) {
        throw core::ValidationError(key, "non-string", "expected a string");
    }
    return std::string(item->valuestring);
}

std::string required_string(const cJSON* req, const char* key)
{
    auto value = optional_string(req, key);
    if (!value) {
        throw core::ValidationError(key, "", std::string("missing required argument '") + key +
                                                 "'");
    }
    return *value;
}

std::optional<core::IdType> optional_type(const cJSON* req, const char* key)
{
    const auto name = optional_string(req, key);
    if (!name) {
        return std::nullopt;
    }
    const auto type = core::type_from_string(*name);
    if (!type) {
        throw core::ValidationError(key, *name, "unknown identifier type");
    }
    return type;
}

core::IdType required_type(const cJSON* req, const char* key)
{
    const auto type = optional_type(req, key);
    if (!type) {
        throw core::ValidationError(key, "", std::string("missing required argument '") + key +
                                                 "'");
    }
    return *type;
}

/// @brief Executes @p action and returns the `data` payload. Ownership passes to the caller.
cJSON* dispatch(engine::Manager& manager, const std::string& action, const cJSON* req)
{
    if (action == "generate") {
        const auto type = optional_type(req, "type");
        const auto timestamp = optional_string(req, "timestamp");
        if (timestamp) {
            return serial::JsonCodec::to_cjson(
                manager.generate_at(type, encoding::parse_iso8601(*timestamp)));
        }
        return serial::JsonCodec::to_cjson(manager.generate(type));
    }

    if (action == "parse") {
        const std::string input = required_string(req, "input");
        const auto type = optional_type(req, "type");
        return serial::JsonCodec::to_cjson(type ? manager.parse_as(input, *type)
                                                : manager.parse(input));
    }

    if (action == "validate") {
        const std::string input = required_string(req, "input");
        const auto type = optional_type(req, "type");
        JsonPtr data(cJSON_CreateObject(), cJSON_Delete);
        try {
            if (type) {
                manager.validate_as(input, *type);
            } else {
                manager.validate(input);
            }
            cJSON_AddBoolToObject(data.get(), "valid", 1);
        } catch (const core::Error& e) {
            // Reported in the payload; the request itself succeeded.
            cJSON_AddBoolToObject(data.get(), "valid", 0);
            cJSON_AddStringToObject(data.get(), "kind", e.kind().c_str());
            cJSON_AddStringToObject(data.get(), "message", e.what());
        }
        return data.release();
    }

    if (action == "convert") {
        const std::string input = required_string(req, "input");
        const core::IdType target = required_type(req, "target");
        return serial::JsonCodec::to_cjson(manager.convert(manager.parse(input), target));
    }

    if (action == "detect") {
        const detect::Detection d = detect::FormatDetector::inspect(required_string(req, "input"));
        cJSON* data = cJSON_CreateObject();
        cJSON_AddStringToObject(data, "type", core::to_string(d.type).c_str());
        cJSON_AddBoolToObject(data, "exact", d.exact ? 1 : 0);
        return data;
    }

    if (action == "types") {
        cJSON* data = cJSON_CreateArray();
        for (core::IdType type : manager.supported_types()) {
            cJSON_AddItemToArray(data, cJSON_CreateString(core::to_string(type).c_str()));
        }
        return data;
    }

    throw core::ValidationError("action", action, "unknown action");
}

} // namespace

/**
 * @details
 * Every failure is reported inside the response. Library errors keep their `kind`
 * (`validation`, `parse`, `conversion`, ...); anything else is reported as `internal`.
 */
std::string Handler::process(engine::Manager& manager, const std::string& raw_json)
{
    // [Safety Check] Short-circuit empty payloads.
    if (raw_json.empty()) {
        return error_response("request", "Empty request payload");
    }

    // 1. INGEST PHASE
    JsonPtr req(cJSON_Parse(raw_json.c_str()), cJSON_Delete);
    if (!req || !cJSON_IsObject(req.get())) {
        return error_response("request", "Invalid JSON syntax");
    }

    // 2. DECODE PHASE
    const cJSON* act = cJSON_GetObjectItemCaseSensitive(req.get(), "action");
    const std::string action = (act && cJSON_IsString(act) && act->valuestring) ? act->valuestring
                                                                                : "";
    if (action.empty()) {
        return error_response("request", "Missing required field 'action'");
    }

    // Session termination
    if (action == "exit") {
        return "{\"status\":\"goodbye\",\"message\":\"Closing session\"}";
    }

    // 3. EXECUTE PHASE
    JsonPtr data(nullptr, cJSON_Delete);
    try {
        data.reset(dispatch(manager, action, req.get()));
    } catch (const core::Error& e) {
        return error_response(e.kind(), e.what());
    } catch (const std::exception& e) {
        return error_response("internal", e.what());
    }

    // 4. RESPONSE CONSTRUCTION PHASE
    JsonPtr resp_root(cJSON_CreateObject(), cJSON_Delete);
    cJSON_AddStringToObject(resp_root.get(), "status", "ok");
    cJSON_AddItemToObject(resp_root.get(), "data", data.release());
    return print(resp_root.get());
}

} // namespace nexuid::api
