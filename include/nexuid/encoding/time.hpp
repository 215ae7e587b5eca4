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
 * @file time.hpp
 * @brief Timestamp conversions shared by the time-based identifier families.
 *
 * @details
 * Two epochs are involved:
 * - **Unix milliseconds** (ULID, UUID v7): 48-bit field, max `2^48 - 1` (year 10889).
 * - **Gregorian 100-ns ticks** (UUID v1, v6): counted from 1582-10-15T00:00:00Z in a
 *   60-bit field. The Unix epoch sits @ref kGregorianOffset ticks after it.
 *
 * Calendar math uses the proleptic Gregorian civil-date algorithms, so no `time_t` or
 * `gmtime` range limits apply.
 */

#pragma once

#include "nexuid/core/types.hpp"

#include <cstdint>
#include <string>

namespace nexuid::encoding {

/// @brief 100-ns ticks between 1582-10-15 and 1970-01-01.
inline constexpr std::int64_t kGregorianOffset = 122192928000000000LL;

/// @brief Largest value of a 48-bit millisecond field.
inline constexpr std::int64_t kMaxUnixMillis = (std::int64_t{1} << 48) - 1;

/// @brief Largest value of a 60-bit Gregorian tick field.
inline constexpr std::int64_t kMaxGregorianTicks = (std::int64_t{1} << 60) - 1;

/// @brief Current wall-clock time at tick resolution.
core::Timestamp now();

/// @brief Milliseconds since the Unix epoch, rounded toward negative infinity.
std::int64_t unix_millis(core::Timestamp ts);

core::Timestamp from_unix_millis(std::int64_t ms);

/// @brief 100-ns ticks since 1582-10-15.
std::int64_t gregorian_ticks(core::Timestamp ts);

core::Timestamp from_gregorian_ticks(std::int64_t ticks);

/// @brief Calendar year (UTC) of @p ts.
std::int64_t year_of(core::Timestamp ts);

/**
 * @brief Formats @p ts as `YYYY-MM-DDTHH:MM:SS.fffffffZ` (seven fractional digits).
 */
std::string format_iso8601(core::Timestamp ts);

/**
 * @brief Parses an ISO-8601 date-time.
 *
 * Accepts `YYYY-MM-DDTHH:MM:SS`, an optional fraction of 1 to 9 digits (truncated to
 * 100-ns ticks), and a zone of `Z` or `+HH:MM` / `-HH:MM`.
 *
 * @throws core::ValidationError (field `timestamp`) on malformed input.
 */
core::Timestamp parse_iso8601(const std::string& text);

/**
 * @brief Checks that @p ts fits the timestamp field of @p type.
 *
 * Every type rejects years before 1970. ULID and UUID v7 reject millisecond counts above
 * @ref kMaxUnixMillis; UUID v1 and v6 reject tick counts above @ref kMaxGregorianTicks.
 *
 * @throws core::ValidationError (field `timestamp`).
 */
void validate_timestamp(core::IdType type, core::Timestamp ts);

} // namespace nexuid::encoding
