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
 * @file handler.hpp
 * @brief JSON command dispatcher in front of the identifier manager.
 *
 * @details
 * This header declares the `Handler` class, which turns one JSON request into one JSON
 * response. It is transport-agnostic: the CLI `serve` command feeds it lines from stdin,
 * and an embedding application can feed it from any channel.
 */

#pragma once

#include "nexuid/engine/manager.hpp"

#include <string>

namespace nexuid::api {

/**
 * @class Handler
 * @brief A static controller for interpreting requests and marshaling responses.
 *
 * @details
 * **Supported actions:**
 * | Action     | Arguments                                   | `data` on success              |
 * |------------|---------------------------------------------|--------------------------------|
 * | `generate` | `type`?, `timestamp`? (ISO-8601)            | identifier object              |
 * | `parse`    | `input`, `type`?                            | identifier object              |
 * | `validate` | `input`, `type`?                            | `{"valid": bool, ...}`         |
 * | `convert`  | `input`, `target`                           | identifier object              |
 * | `detect`   | `input`                                     | `{"type": ..., "exact": bool}` |
 * | `types`    | none                                        | array of type names            |
 * | `exit`     | none                                        | none (`"status": "goodbye"`)   |
 */
class Handler {
  public:
    /**
     * @brief Processes a raw request and executes it against @p manager.
     *
     * @param manager The manager that serves the request.
     * @param raw_json The raw request payload.
     *
     * @return std::string A compact JSON response. Never throws for bad input.
     *
     * **Response Formats:**
     * - **Success:** `{"status": "ok", "data": <result>}`
     * - **Error:** `{"status": "error", "kind": "<error kind>", "message": "<description>"}`
     *
     * @code
     * // Example Request Payload:
     * { "action": "generate", "type": "uuid_v7", "timestamp": "2024-01-01T00:00:00Z" }
     * @endcode
     */
    static std::string process(engine::Manager& manager, const std::string& raw_json);
};

} // namespace nexuid::api
