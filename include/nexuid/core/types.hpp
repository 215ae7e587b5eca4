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
 * @file types.hpp
 * @brief Fundamental vocabulary types shared by every NexUID subsystem.
 *
 * @details
 * Declares the closed set of identifier families (`IdType`), the UUID variant
 * classification, the fixed 16-byte binary payload, and the timestamp representation
 * used for embedded times. Every branch point in the engine switches over `IdType`
 * exhaustively, so adding a family is a compile-time visible change.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ratio>
#include <string>
#include <string_view>
#include <vector>

namespace nexuid::core {

/// @brief Number of bytes in every identifier payload.
inline constexpr std::size_t kIdLength = 16;

/// @brief The binary identity of an identifier. Always exactly 16 bytes.
using Bytes = std::array<std::uint8_t, kIdLength>;

/// @brief Variable-length byte buffer used at marshaling boundaries.
using ByteBuffer = std::vector<std::uint8_t>;

/**
 * @brief 100-nanosecond tick duration.
 *
 * Matches the native resolution of UUID v1/v6 timestamps and keeps the ULID maximum
 * (2^48 - 1 milliseconds, year 10889) representable in a signed 64-bit count.
 */
using Ticks = std::chrono::duration<std::int64_t, std::ratio<1, 10000000>>;

/// @brief Wall-clock time point carried by time-based identifiers.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, Ticks>;

/**
 * @enum IdType
 * @brief The identifier families supported by the engine.
 */
enum class IdType {
    ULID,    ///< 48-bit ms timestamp + 80 bits entropy, Crockford base32.
    UUID_V1, ///< Gregorian timestamp, clock sequence and node.
    UUID_V4, ///< 122 random bits.
    UUID_V6, ///< Gregorian timestamp, most-significant bits first.
    UUID_V7  ///< 48-bit Unix ms timestamp + random bits.
};

/**
 * @enum Variant
 * @brief UUID variant classification read from the top bits of byte 8.
 */
enum class Variant {
    RESERVED_NCS,       ///< 0xxxxxxx
    RFC4122,            ///< 10xxxxxx
    RESERVED_MICROSOFT, ///< 110xxxxx
    RESERVED_FUTURE     ///< 111xxxxx
};

/// @brief All identifier families, in declaration order.
inline constexpr std::array<IdType, 5> kAllTypes = {IdType::ULID, IdType::UUID_V1,
                                                    IdType::UUID_V4, IdType::UUID_V6,
                                                    IdType::UUID_V7};

/**
 * @brief Returns the wire name of a type (`"ulid"`, `"uuid_v1"`, ...).
 */
std::string to_string(IdType type);

/**
 * @brief Resolves a wire name back to its type.
 *
 * Matching is case-insensitive. Returns `std::nullopt` for unknown names.
 */
std::optional<IdType> type_from_string(std::string_view name);

/// @brief Returns the wire name of a variant (`"rfc4122"`, ...).
std::string to_string(Variant variant);

/// @brief Resolves a variant wire name, `std::nullopt` when unknown.
std::optional<Variant> variant_from_string(std::string_view name);

/// @brief True for the four UUID families.
bool is_uuid(IdType type);

/// @brief True when the family embeds a timestamp (ULID, UUID v1/v6/v7).
bool supports_timestamp(IdType type);

/**
 * @brief The UUID version number associated with a UUID family.
 *
 * @return 1, 4, 6 or 7 for UUID families; `std::nullopt` for ULID.
 */
std::optional<int> uuid_version_of(IdType type);

/**
 * @brief Maps a UUID version number to its family.
 *
 * Versions without a dedicated family (2, 3, 5) are labeled `UUID_V4`, the same
 * best-effort classification used by format detection.
 */
IdType uuid_type_for_version(int version);

} // namespace nexuid::core
