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
 * @file json_codec.cpp
 * @brief cJSON-backed encoder and decoder for the structured identifier form.
 */

#include "nexuid/serial/json_codec.hpp"

#include "nexuid/core/errors.hpp"
#include "nexuid/encoding/base64.hpp"
#include "nexuid/encoding/hex.hpp"
#include "nexuid/encoding/time.hpp"
#include "nexuid/encoding/uuid_layout.hpp"
#include "nexuid/infra/string.hpp"
#include "nexuid/provider/uuid_provider.hpp"

#include <algorithm>
#include <cJSON.h>
#include <cmath>
#include <cstdlib>
#include <memory>

namespace nexuid::serial {

namespace {

std::string required_string(const cJSON* obj, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (!item) {
        throw core::UnmarshalError(std::nullopt, std::string("missing field '") + key + "'");
    }
    if (!cJSON_IsString(item) || !item->valuestring) {
        throw core::UnmarshalError(std::nullopt, std::string("field '") + key + "' must be a string");
    }
    return item->valuestring;
}

/// @brief The leading 48 bits read as Unix milliseconds (ULID and v7 layout).
core::Timestamp leading_millis(const core::Bytes& bytes)
{
    return encoding::from_unix_millis(static_cast<std::int64_t>(encoding::read_be64(bytes, 0) >> 16));
}

/// @brief The version nibble, or nothing when it lies outside [1,7].
std::optional<int> version_from_bytes(const core::Bytes& bytes)
{
    const int nibble = (bytes[6] & 0xF0) >> 4;
    if (nibble < 1 || nibble > 7) {
        return std::nullopt;
    }
    return nibble;
}

/**
 * @brief Resolves the timestamp of a decoded document against its bytes.
 *
 * ULID values always carry the leading 48-bit millisecond count. UUID values carry the
 * timestamp of their version layout (v1, v6, v7); a UUID converted from a ULID keeps the
 * leading millisecond reading instead, so that reading is accepted as well. A document
 * timestamp matching neither is rejected.
 */
std::optional<core::Timestamp> resolve_timestamp(const core::Bytes& bytes, core::IdType type,
                                                 std::optional<int> version,
                                                 std::optional<core::Timestamp> claimed)
{
    if (!core::supports_timestamp(type)) {
        return claimed;
    }

    if (type == core::IdType::ULID) {
        const core::Timestamp expected = leading_millis(bytes);
        if (claimed && *claimed != expected) {
            throw core::UnmarshalError(type, "timestamp does not match bytes");
        }
        return expected;
    }

    const std::optional<core::Timestamp> layout =
        version ? provider::uuid_timestamp(bytes, *version) : std::nullopt;
    if (!claimed) {
        return layout;
    }
    if ((layout && *claimed == *layout) || *claimed == leading_millis(bytes)) {
        return claimed;
    }
    throw core::UnmarshalError(type, "timestamp does not match bytes");
}

} // namespace

cJSON* JsonCodec::to_cjson(const core::Identifier& value)
{
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddStringToObject(obj, "raw", value.raw().c_str());
    cJSON_AddStringToObject(obj, "canonical", value.canonical().c_str());
    cJSON_AddStringToObject(obj, "bytes", encoding::base64_encode(value.bytes()).c_str());
    cJSON_AddStringToObject(obj, "hex", value.hex().c_str());
    cJSON_AddStringToObject(obj, "type", core::to_string(value.type()).c_str());

    if (value.has_timestamp()) {
        cJSON_AddStringToObject(obj, "timestamp",
                                encoding::format_iso8601(value.timestamp()).c_str());
    }
    if (value.version()) {
        cJSON_AddNumberToObject(obj, "version", *value.version());
    }
    if (value.variant()) {
        cJSON_AddStringToObject(obj, "variant", core::to_string(*value.variant()).c_str());
    }
    return obj;
}

std::string JsonCodec::encode(const core::Identifier& value)
{
    cJSON* obj = to_cjson(value);
    char* raw_output = cJSON_PrintUnformatted(obj);
    std::string out = raw_output ? raw_output : "";

    free(raw_output);
    cJSON_Delete(obj);

    if (out.empty()) {
        throw core::MarshalError(value.type(), "JSON serialization failed");
    }
    return out;
}

/**
 * @details
 * **Decoding order:**
 * 1. `type` must name a known identifier family.
 * 2. `bytes` must be base64 of exactly 16 bytes.
 * 3. `hex` must equal the lowercase hex of those bytes.
 * 4. For UUID types, `version` and `variant` are read from the bytes; document values
 *    that disagree are rejected.
 * 5. The timestamp is read from the bytes when absent and checked against them when
 *    present.
 * 6. `Identifier::create` checks that `canonical` encodes the bytes for the type.
 *
 * Lower-level validation failures are reported as the `cause` of the UnmarshalError.
 */
core::Identifier JsonCodec::from_cjson(const cJSON* object)
{
    if (!object || !cJSON_IsObject(object)) {
        throw core::UnmarshalError(std::nullopt, "expected a JSON object");
    }

    const std::string type_name = required_string(object, "type");
    const auto type = core::type_from_string(type_name);
    if (!type) {
        throw core::UnmarshalError(std::nullopt, "unknown type '" + type_name + "'");
    }

    const std::string canonical = required_string(object, "canonical");
    const std::string hex = required_string(object, "hex");
    const std::string bytes_b64 = required_string(object, "bytes");

    std::string raw = canonical;
    if (cJSON_GetObjectItemCaseSensitive(object, "raw")) {
        raw = required_string(object, "raw");
    }

    try {
        const core::ByteBuffer buffer = encoding::base64_decode(bytes_b64);
        if (buffer.size() != core::kIdLength) {
            throw core::UnmarshalError(*type, "bytes must decode to 16 bytes, got " +
                                                  std::to_string(buffer.size()));
        }
        core::Bytes bytes{};
        std::copy(buffer.begin(), buffer.end(), bytes.begin());

        if (infra::String::to_lower(hex) != encoding::to_hex(bytes)) {
            throw core::UnmarshalError(*type, "hex does not match bytes");
        }

        std::optional<core::Timestamp> ts;
        if (cJSON_GetObjectItemCaseSensitive(object, "timestamp")) {
            ts = encoding::parse_iso8601(required_string(object, "timestamp"));
        }

        std::optional<int> version;
        const cJSON* version_item = cJSON_GetObjectItemCaseSensitive(object, "version");
        if (version_item) {
            if (!cJSON_IsNumber(version_item)) {
                throw core::UnmarshalError(*type, "field 'version' must be an integer");
            }
            const double number = version_item->valuedouble;
            if (!(number >= 1 && number <= 7) || std::floor(number) != number) {
                throw core::UnmarshalError(*type, "field 'version' must be an integer in [1,7]");
            }
            version = static_cast<int>(number);
        }

        std::optional<core::Variant> variant;
        if (cJSON_GetObjectItemCaseSensitive(object, "variant")) {
            const std::string name = required_string(object, "variant");
            variant = core::variant_from_string(name);
            if (!variant) {
                throw core::UnmarshalError(*type, "unknown variant '" + name + "'");
            }
        }

        if (core::is_uuid(*type)) {
            const std::optional<int> actual_version = version_from_bytes(bytes);
            if (version && version != actual_version) {
                throw core::UnmarshalError(*type, "version " + std::to_string(*version) +
                                                      " does not match bytes");
            }
            const core::Variant actual_variant = encoding::extract_variant(bytes);
            if (variant && *variant != actual_variant) {
                throw core::UnmarshalError(*type, "variant '" + core::to_string(*variant) +
                                                      "' does not match bytes");
            }
            version = actual_version;
            variant = actual_variant;
        }

        ts = resolve_timestamp(bytes, *type, version, ts);
        return core::Identifier::create(raw, canonical, bytes, *type, ts, version, variant);
    } catch (const core::ValidationError& e) {
        throw core::UnmarshalError(*type, "invalid identifier document", e.what());
    }
}

core::Identifier JsonCodec::decode(const std::string& json)
{
    std::unique_ptr<cJSON, decltype(&cJSON_Delete)> doc(cJSON_Parse(json.c_str()), cJSON_Delete);
    if (!doc) {
        throw core::UnmarshalError(std::nullopt, "invalid JSON syntax");
    }
    return from_cjson(doc.get());
}

} // namespace nexuid::serial
