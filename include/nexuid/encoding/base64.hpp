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
 * @file base64.hpp
 * @brief Standard padded base64, used for the `bytes` field of the JSON form.
 */

#pragma once

#include "nexuid/core/types.hpp"

#include <string>

namespace nexuid::encoding {

std::string base64_encode(const core::ByteBuffer& bytes);

std::string base64_encode(const core::Bytes& bytes);

/**
 * @brief Decodes padded base64.
 *
 * @throws core::ValidationError (field `base64`) on malformed input.
 */
core::ByteBuffer base64_decode(const std::string& text);

} // namespace nexuid::encoding
