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
 * @file converter.cpp
 * @brief Implementation of encoding projections and type relabeling.
 */

#include "nexuid/convert/converter.hpp"

#include "nexuid/core/errors.hpp"
#include "nexuid/encoding/base32.hpp"
#include "nexuid/encoding/time.hpp"
#include "nexuid/encoding/uuid_layout.hpp"

#include <utility>

namespace nexuid::convert {

namespace {

std::optional<int> version_nibble(const core::Bytes& bytes)
{
    const int version = (bytes[6] & 0xF0) >> 4;
    if (version < 1 || version > 7) {
        return std::nullopt;
    }
    return version;
}

core::Identifier ulid_to_uuid(const core::Identifier& value, core::IdType target)
{
    std::optional<core::Timestamp> ts;
    if (core::supports_timestamp(target) && value.has_timestamp()) {
        ts = value.timestamp();
    }
    const std::string canonical = encoding::format_uuid(value.bytes());
    return core::Identifier::create(canonical, canonical, value.bytes(), target, ts,
                                    version_nibble(value.bytes()),
                                    encoding::extract_variant(value.bytes()));
}

core::Identifier uuid_to_ulid(const core::Identifier& value)
{
    const std::string canonical = encoding::encode_ulid(value.bytes());
    const auto ms = static_cast<std::int64_t>(encoding::read_be64(value.bytes(), 0) >> 16);
    return core::Identifier::create(canonical, canonical, value.bytes(), core::IdType::ULID,
                                    encoding::from_unix_millis(ms));
}

core::Identifier relabel_uuid(const core::Identifier& value, core::IdType target)
{
    std::optional<core::Timestamp> ts;
    if (core::supports_timestamp(target) && value.has_timestamp()) {
        ts = value.timestamp();
    }
    return core::Identifier::create(value.raw(), value.canonical(), value.bytes(), target, ts,
                                    value.version(), value.variant());
}

} // namespace

Converter::Converter(std::set<core::IdType> sources) : sources_(std::move(sources)) {}

bool Converter::serves(core::IdType type) const
{
    return sources_.count(type) > 0;
}

void Converter::require_served(const core::Identifier& value, const char* projection) const
{
    if (!serves(value.type())) {
        throw core::ConversionError(value.type(), std::nullopt,
                                    std::string(projection) + " projection not served by this converter");
    }
}

std::string Converter::to_canonical(const core::Identifier& value) const
{
    require_served(value, "canonical");
    return value.canonical();
}

std::string Converter::to_hex(const core::Identifier& value) const
{
    require_served(value, "hex");
    return value.hex();
}

core::ByteBuffer Converter::to_bytes(const core::Identifier& value) const
{
    require_served(value, "bytes");
    return core::ByteBuffer(value.bytes().begin(), value.bytes().end());
}

core::Identifier Converter::convert_type(const core::Identifier& value, core::IdType target) const
{
    if (!serves(value.type())) {
        throw core::ConversionError(value.type(), target, "unsupported source type");
    }
    if (value.type() == target) {
        return value;
    }

    const bool from_uuid = core::is_uuid(value.type());
    const bool to_uuid = core::is_uuid(target);

    if (!from_uuid && to_uuid) {
        return ulid_to_uuid(value, target);
    }
    if (from_uuid && !to_uuid) {
        return uuid_to_ulid(value);
    }
    return relabel_uuid(value, target);
}

std::map<core::IdType, std::vector<core::IdType>> Converter::supported_conversions() const
{
    std::map<core::IdType, std::vector<core::IdType>> out;
    for (core::IdType source : sources_) {
        out[source] = std::vector<core::IdType>(core::kAllTypes.begin(), core::kAllTypes.end());
    }
    return out;
}

} // namespace nexuid::convert
