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
 * @file identifier.cpp
 * @brief Construction-time validation of identifier values.
 */

#include "nexuid/core/identifier.hpp"

#include "nexuid/core/errors.hpp"
#include "nexuid/encoding/base32.hpp"
#include "nexuid/encoding/hex.hpp"
#include "nexuid/encoding/uuid_layout.hpp"

#include <utility>

namespace nexuid::core {

Identifier Identifier::create(std::string raw, std::string canonical, const Bytes& bytes,
                              IdType type, std::optional<Timestamp> timestamp,
                              std::optional<int> version, std::optional<Variant> variant)
{
    const std::string expected =
        type == IdType::ULID ? encoding::encode_ulid(bytes) : encoding::format_uuid(bytes);
    if (canonical != expected) {
        throw ValidationError("canonical", canonical, "does not encode bytes " + expected, type);
    }

    if (timestamp && !supports_timestamp(type)) {
        throw ValidationError("timestamp", "present", "type carries no timestamp", type);
    }

    if (!is_uuid(type)) {
        if (version) {
            throw ValidationError("version", std::to_string(*version),
                                  "version is only defined for UUID types", type);
        }
        if (variant) {
            throw ValidationError("variant", to_string(*variant),
                                  "variant is only defined for UUID types", type);
        }
    } else if (version && (*version < 1 || *version > 7)) {
        throw ValidationError("version", std::to_string(*version), "invalid UUID version", type);
    }

    return Identifier(std::move(raw), std::move(canonical), bytes, type, timestamp, version,
                      variant);
}

Identifier::Identifier(std::string raw, std::string canonical, const Bytes& bytes, IdType type,
                       std::optional<Timestamp> timestamp, std::optional<int> version,
                       std::optional<Variant> variant)
    : raw_(std::move(raw)), canonical_(std::move(canonical)), bytes_(bytes),
      hex_(encoding::to_hex(bytes)), type_(type), timestamp_(timestamp), version_(version),
      variant_(variant)
{
}

Timestamp Identifier::timestamp() const
{
    if (!timestamp_) {
        throw NoTimestampError(canonical_, type_, "identifier carries no timestamp");
    }
    return *timestamp_;
}

bool Identifier::operator==(const Identifier& other) const noexcept
{
    return type_ == other.type_ && bytes_ == other.bytes_;
}

bool Identifier::operator<(const Identifier& other) const noexcept
{
    return bytes_ < other.bytes_;
}

} // namespace nexuid::core
