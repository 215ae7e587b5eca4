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
 * @file uuid_layout.cpp
 * @brief Implementation of the UUID text layout and bit-field helpers.
 */

#include "nexuid/encoding/uuid_layout.hpp"

#include "nexuid/core/errors.hpp"
#include "nexuid/encoding/hex.hpp"
#include "nexuid/infra/string.hpp"

namespace nexuid::encoding {

namespace {

bool is_hyphen_offset(std::size_t i)
{
    return i == 8 || i == 13 || i == 18 || i == 23;
}

} // namespace

std::string format_uuid(const core::Bytes& bytes)
{
    const std::string hex = to_hex(bytes);
    std::string out;
    out.reserve(kUuidStringLength);
    out.append(hex, 0, 8).append("-");
    out.append(hex, 8, 4).append("-");
    out.append(hex, 12, 4).append("-");
    out.append(hex, 16, 4).append("-");
    out.append(hex, 20, 12);
    return out;
}

bool is_uuid_string(std::string_view s)
{
    if (s.size() != kUuidStringLength) {
        return false;
    }
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (is_hyphen_offset(i)) {
            if (s[i] != '-')
                return false;
        } else if (!infra::String::is_hex_digit(s[i])) {
            return false;
        }
    }
    return true;
}

void validate_uuid_string(const std::string& s, core::IdType type)
{
    if (s.size() != kUuidStringLength) {
        throw core::ValidationError("length", std::to_string(s.size()),
                                    "UUID string must be 36 characters", type);
    }
    if (!is_uuid_string(s)) {
        throw core::ValidationError("format", s, "invalid UUID format", type);
    }
}

core::Bytes parse_uuid_string(const std::string& s)
{
    validate_uuid_string(s);
    return hex_to_id(infra::String::remove_all(s, '-'));
}

int extract_version(const core::Bytes& bytes)
{
    const int version = (bytes[6] & 0xF0) >> 4;
    if (version < 1 || version > 7) {
        throw core::ValidationError("version", std::to_string(version), "invalid UUID version",
                                    core::IdType::UUID_V4);
    }
    return version;
}

core::Variant extract_variant(const core::Bytes& bytes)
{
    const std::uint8_t bits = bytes[8] & 0xE0;
    if ((bits & 0x80) == 0x00) {
        return core::Variant::RESERVED_NCS;
    }
    if ((bits & 0xC0) == 0x80) {
        return core::Variant::RFC4122;
    }
    if ((bits & 0xE0) == 0xC0) {
        return core::Variant::RESERVED_MICROSOFT;
    }
    return core::Variant::RESERVED_FUTURE;
}

void set_version(core::Bytes& bytes, int version)
{
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | ((version & 0x0F) << 4));
}

void set_rfc4122_variant(core::Bytes& bytes)
{
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);
}

std::uint16_t read_be16(const core::Bytes& bytes, std::size_t offset)
{
    return static_cast<std::uint16_t>((bytes[offset] << 8) | bytes[offset + 1]);
}

std::uint32_t read_be32(const core::Bytes& bytes, std::size_t offset)
{
    return (static_cast<std::uint32_t>(bytes[offset]) << 24) |
           (static_cast<std::uint32_t>(bytes[offset + 1]) << 16) |
           (static_cast<std::uint32_t>(bytes[offset + 2]) << 8) |
           static_cast<std::uint32_t>(bytes[offset + 3]);
}

std::uint64_t read_be64(const core::Bytes& bytes, std::size_t offset)
{
    return (static_cast<std::uint64_t>(read_be32(bytes, offset)) << 32) |
           read_be32(bytes, offset + 4);
}

void write_be(core::Bytes& bytes, std::size_t offset, std::uint64_t value, std::size_t width)
{
    for (std::size_t i = 0; i < width; ++i) {
        bytes[offset + width - 1 - i] = static_cast<std::uint8_t>(value & 0xFF);
        value >>= 8;
    }
}

} // namespace nexuid::encoding
