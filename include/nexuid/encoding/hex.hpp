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
 * @file hex.hpp
 * @brief Lowercase hexadecimal encoding of identifier bytes.
 *
 * @details
 * Hex is the universal fallback encoding: both providers accept a 32-digit hex string
 * whenever their native text format does not match.
 */

#pragma once

#include "nexuid/core/types.hpp"

#include <string>

namespace nexuid::encoding {

/// @brief Number of hex digits encoding a 16-byte identifier.
inline constexpr std::size_t kHexLength = 32;

/// @brief Encodes @p bytes as 32 lowercase hex digits.
std::string to_hex(const core::Bytes& bytes);

/// @brief Encodes an arbitrary buffer as lowercase hex digits.
std::string to_hex(const core::ByteBuffer& bytes);

/**
 * @brief Decodes a hex string of any even length.
 *
 * Hyphens are ignored and either case is accepted.
 *
 * @throws core::ValidationError (field `hex`) for odd length or non-hex characters.
 */
core::ByteBuffer hex_to_bytes(const std::string& hex);

/**
 * @brief Decodes a hex string that must describe exactly 16 bytes.
 *
 * @throws core::ValidationError for malformed hex or a length other than 16 bytes.
 */
core::Bytes hex_to_id(const std::string& hex);

} // namespace nexuid::encoding
