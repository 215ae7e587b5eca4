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
 * @file base32.cpp
 * @brief Implementation of the Crockford base32 ULID codec.
 */

#include "nexuid/encoding/base32.hpp"

#include "nexuid/core/errors.hpp"
#include "nexuid/encoding/uuid_layout.hpp"

#include <cstdint>

namespace nexuid::encoding {

namespace {

/// @brief Maps a character to its 5-bit value, or -1 outside the alphabet.
int symbol_value(char c)
{
    if (c >= 'a' && c <= 'z') {
        c = static_cast<char>(c - 'a' + 'A');
    }
    const std::size_t pos = kCrockfordAlphabet.find(c);
    return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

} // namespace

/**
 * @details
 * The 128-bit value is held as two 64-bit halves and consumed 5 bits at a time from the
 * least significant end, filling the output right to left.
 */
std::string encode_ulid(const core::Bytes& bytes)
{
    std::uint64_t hi = read_be64(bytes, 0);
    std::uint64_t lo = read_be64(bytes, 8);

    std::string out(kUlidLength, '0');
    for (std::size_t i = kUlidLength; i-- > 0;) {
        out[i] = kCrockfordAlphabet[lo & 0x1F];
        lo = (lo >> 5) | (hi << 59);
        hi >>= 5;
    }
    return out;
}

core::Bytes decode_ulid(const std::string& s)
{
    validate_ulid_string(s);

    std::uint64_t hi = 0;
    std::uint64_t lo = 0;
    for (char c : s) {
        const auto v = static_cast<std::uint64_t>(symbol_value(c));
        hi = (hi << 5) | (lo >> 59);
        lo = (lo << 5) | v;
    }

    core::Bytes out{};
    write_be(out, 0, hi, 8);
    write_be(out, 8, lo, 8);
    return out;
}

bool is_ulid_string(std::string_view s)
{
    if (s.size() != kUlidLength) {
        return false;
    }
    for (char c : s) {
        if (symbol_value(c) < 0)
            return false;
    }
    return s[0] <= '7';
}

void validate_ulid_string(const std::string& s)
{
    if (s.size() != kUlidLength) {
        throw core::ValidationError("length", std::to_string(s.size()),
                                    "ULID must be 26 characters", core::IdType::ULID);
    }
    for (char c : s) {
        if (symbol_value(c) < 0) {
            throw core::ValidationError("character", std::string(1, c),
                                        "invalid base32 character", core::IdType::ULID);
        }
    }
    if (s[0] > '7') {
        throw core::ValidationError("overflow", s, "ULID exceeds 128 bits", core::IdType::ULID);
    }
}

} // namespace nexuid::encoding
