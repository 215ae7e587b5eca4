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
 * @file base32.hpp
 * @brief Crockford base32 codec for the 26-character ULID text form.
 *
 * @details
 * The alphabet is `0123456789ABCDEFGHJKMNPQRSTVWXYZ` (no I, L, O, U). 26 characters carry
 * 130 bits, so the first character only contributes its low 3 bits and must be in
 * `0`..`7`; anything larger would overflow 128 bits.
 *
 * Decoding is case-insensitive. Encoding always produces uppercase.
 */

#pragma once

#include "nexuid/core/types.hpp"

#include <string>
#include <string_view>

namespace nexuid::encoding {

/// @brief Length of the ULID text form.
inline constexpr std::size_t kUlidLength = 26;

/// @brief The Crockford base32 alphabet, uppercase.
inline constexpr std::string_view kCrockfordAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

/// @brief Encodes 16 bytes as 26 uppercase base32 characters.
std::string encode_ulid(const core::Bytes& bytes);

/**
 * @brief Decodes a 26-character ULID string.
 *
 * @throws core::ValidationError when validate_ulid_string() would.
 */
core::Bytes decode_ulid(const std::string& s);

/// @brief True when @p s is 26 characters of the alphabet with a first char of at most '7'.
bool is_ulid_string(std::string_view s);

/**
 * @brief Checks length, alphabet and the 128-bit ceiling.
 *
 * @throws core::ValidationError with field `length`, `character` or `overflow`.
 */
void validate_ulid_string(const std::string& s);

} // namespace nexuid::encoding
