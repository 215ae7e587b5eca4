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
 * @file uuid_layout.hpp
 * @brief Bit-level layout helpers for 128-bit UUID values.
 *
 * @details
 * Covers the hyphenated text form (`xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx`, hyphens at
 * offsets 8, 13, 18 and 23), big-endian field packing, and the version / variant fields:
 *
 * - **Version:** high nibble of byte 6, `(bytes[6] & 0xF0) >> 4`, valid range [1, 7].
 * - **Variant:** top bits of byte 8:
 *   `0xxxxxxx` reserved_ncs, `10xxxxxx` rfc4122, `110xxxxx` reserved_microsoft,
 *   `111xxxxx` reserved_future.
 */

#pragma once

#include "nexuid/core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace nexuid::encoding {

/// @brief Length of the hyphenated UUID text form.
inline constexpr std::size_t kUuidStringLength = 36;

/// @brief Renders @p bytes as 36 lowercase characters with hyphens.
std::string format_uuid(const core::Bytes& bytes);

/**
 * @brief True when @p s has the 8-4-4-4-12 layout of hex digits (either case).
 */
bool is_uuid_string(std::string_view s);

/**
 * @brief Checks the 36-character layout.
 *
 * @throws core::ValidationError with field `length` or `format`.
 */
void validate_uuid_string(const std::string& s, core::IdType type = core::IdType::UUID_V4);

/**
 * @brief Decodes a hyphenated UUID string into bytes.
 *
 * @throws core::ValidationError when the layout is invalid.
 */
core::Bytes parse_uuid_string(const std::string& s);

/**
 * @brief Extracts the version nibble.
 *
 * @throws core::ValidationError (field `version`) when outside [1, 7].
 */
int extract_version(const core::Bytes& bytes);

/// @brief Classifies the variant bits of byte 8. Every bit pattern maps to a variant.
core::Variant extract_variant(const core::Bytes& bytes);

/// @brief Overwrites the version nibble of byte 6.
void set_version(core::Bytes& bytes, int version);

/// @brief Forces the RFC-4122 variant (`10xxxxxx`) in byte 8.
void set_rfc4122_variant(core::Bytes& bytes);

/// @brief Big-endian read of 2 bytes at @p offset.
std::uint16_t read_be16(const core::Bytes& bytes, std::size_t offset);

/// @brief Big-endian read of 4 bytes at @p offset.
std::uint32_t read_be32(const core::Bytes& bytes, std::size_t offset);

/// @brief Big-endian read of 8 bytes at @p offset.
std::uint64_t read_be64(const core::Bytes& bytes, std::size_t offset);

/// @brief Big-endian write of the low @p width bytes of @p value at @p offset.
void write_be(core::Bytes& bytes, std::size_t offset, std::uint64_t value, std::size_t width);

} // namespace nexuid::encoding
