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
 * @file json_codec.hpp
 * @brief Structured JSON form of an identifier.
 *
 * @details
 * **Document layout:**
 * @code
 * {
 *   "raw":       "01ARZ3NDEKTSV4RRFFQ69G5FAV",
 *   "canonical": "01ARZ3NDEKTSV4RRFFQ69G5FAV",
 *   "bytes":     "AVY+OrXT1nZMYe+5kwK9Ww==",
 *   "hex":       "01563e3ab5d3d6764c61efb99302bd5b",
 *   "type":      "ulid",
 *   "timestamp": "2016-07-30T23:54:10.2590000Z"
 * }
 * @endcode
 * `bytes` is standard padded base64. `timestamp` is present only when the identifier
 * carries one; `version` (number) and `variant` (string) only for UUID types.
 */

#pragma once

#include "nexuid/core/identifier.hpp"

#include <string>

struct cJSON;

namespace nexuid::serial {

class JsonCodec {
  public:
    /**
     * @brief Builds the JSON object for @p value.
     *
     * @return A new cJSON tree. The caller owns it and releases it with `cJSON_Delete`.
     */
    static cJSON* to_cjson(const core::Identifier& value);

    /// @brief Serializes @p value as compact JSON text.
    static std::string encode(const core::Identifier& value);

    /**
     * @brief Rebuilds an identifier from its JSON object.
     *
     * The decoded value keeps the exact `bytes` and `type` of the document. `hex` must
     * equal the hex of `bytes`, and `canonical` must encode `bytes` for `type`.
     *
     * @throws core::UnmarshalError naming the failing check.
     */
    static core::Identifier from_cjson(const cJSON* object);

    /// @brief Parses @p json and delegates to from_cjson().
    static core::Identifier decode(const std::string& json);
};

} // namespace nexuid::serial
