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
 * @file hex.cpp
 * @brief Implementation of the hexadecimal codec.
 */

#include "nexuid/encoding/hex.hpp"

#include "nexuid/core/errors.hpp"
#include "nexuid/infra/string.hpp"

#include <algorithm>

namespace nexuid::encoding {

namespace {

constexpr char kDigits[] = "0123456789abcdef";

std::uint8_t nibble(char c)
{
    if (c >= '0' && c <= '9')
        return static_cast<std::uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f')
        return static_cast<std::uint8_t>(c - 'a' + 10);
    return static_cast<std::uint8_t>(c - 'A' + 10);
}

template <typename Container> std::string encode(const Container& bytes)
{
    std::string out;
    out.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

} // namespace

std::string to_hex(const core::Bytes& bytes)
{
    return encode(bytes);
}

std::string to_hex(const core::ByteBuffer& bytes)
{
    return encode(bytes);
}

core::ByteBuffer hex_to_bytes(const std::string& hex)
{
    const std::string cleaned = infra::String::remove_all(hex, '-');

    if (cleaned.size() % 2 != 0) {
        throw core::ValidationError("hex", hex, "odd length hex string");
    }
    if (!cleaned.empty() && !infra::String::is_hex(cleaned)) {
        throw core::ValidationError("hex", hex, "invalid hex characters");
    }

    core::ByteBuffer out;
    out.reserve(cleaned.size() / 2);
    for (std::size_t i = 0; i < cleaned.size(); i += 2) {
        out.push_back(static_cast<std::uint8_t>((nibble(cleaned[i]) << 4) | nibble(cleaned[i + 1])));
    }
    return out;
}

core::Bytes hex_to_id(const std::string& hex)
{
    core::ByteBuffer buffer = hex_to_bytes(hex);
    if (buffer.size() != core::kIdLength) {
        throw core::ValidationError("hex", hex,
                                    "expected 16 bytes, got " + std::to_string(buffer.size()));
    }
    core::Bytes out{};
    std::copy(buffer.begin(), buffer.end(), out.begin());
    return out;
}

} // namespace nexuid::encoding
