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
 * @file provider_base.cpp
 * @brief Implementation of the shared conversion and marshaling operations.
 */

#include "nexuid/provider/provider_base.hpp"

#include "nexuid/core/errors.hpp"
#include "nexuid/serial/json_codec.hpp"

#include <utility>

namespace nexuid::provider {

ProviderBase::ProviderBase(std::set<core::IdType> served)
    : converter_(served), served_(std::move(served))
{
}

std::vector<core::IdType> ProviderBase::supported_types() const
{
    return std::vector<core::IdType>(served_.begin(), served_.end());
}

std::string ProviderBase::to_canonical(const core::Identifier& value,
                                       const core::Context& ctx) const
{
    ctx.throw_if_cancelled("to_canonical");
    return converter_.to_canonical(value);
}

std::string ProviderBase::to_hex(const core::Identifier& value, const core::Context& ctx) const
{
    ctx.throw_if_cancelled("to_hex");
    return converter_.to_hex(value);
}

core::ByteBuffer ProviderBase::to_bytes(const core::Identifier& value,
                                        const core::Context& ctx) const
{
    ctx.throw_if_cancelled("to_bytes");
    return converter_.to_bytes(value);
}

core::Identifier ProviderBase::convert_type(const core::Identifier& value, core::IdType target,
                                            const core::Context& ctx) const
{
    ctx.throw_if_cancelled("convert_type");
    return converter_.convert_type(value, target);
}

std::map<core::IdType, std::vector<core::IdType>> ProviderBase::supported_conversions() const
{
    return converter_.supported_conversions();
}

void ProviderBase::require_marshalable(const core::Identifier& value) const
{
    if (!serves(value.type())) {
        throw core::MarshalError(value.type(), "type not supported by provider '" + name() + "'");
    }
}

core::ByteBuffer ProviderBase::marshal_text(const core::Identifier& value,
                                            const core::Context& ctx) const
{
    ctx.throw_if_cancelled("marshal_text");
    require_marshalable(value);
    return core::ByteBuffer(value.canonical().begin(), value.canonical().end());
}

core::ByteBuffer ProviderBase::marshal_binary(const core::Identifier& value,
                                              const core::Context& ctx) const
{
    ctx.throw_if_cancelled("marshal_binary");
    require_marshalable(value);
    return core::ByteBuffer(value.bytes().begin(), value.bytes().end());
}

std::string ProviderBase::marshal_json(const core::Identifier& value,
                                       const core::Context& ctx) const
{
    ctx.throw_if_cancelled("marshal_json");
    require_marshalable(value);
    return serial::JsonCodec::encode(value);
}

core::Identifier ProviderBase::unmarshal_text(const core::ByteBuffer& data,
                                              const core::Context& ctx) const
{
    ctx.throw_if_cancelled("unmarshal_text");
    if (data.empty()) {
        throw core::UnmarshalError(type(), "empty text data");
    }
    return parse(std::string(data.begin(), data.end()), ctx);
}

core::Identifier ProviderBase::unmarshal_binary(const core::ByteBuffer& data,
                                                const core::Context& ctx) const
{
    ctx.throw_if_cancelled("unmarshal_binary");
    if (data.empty()) {
        throw core::UnmarshalError(type(), "empty binary data");
    }
    return parse_bytes(data, ctx);
}

core::Identifier ProviderBase::unmarshal_json(const std::string& data,
                                              const core::Context& ctx) const
{
    ctx.throw_if_cancelled("unmarshal_json");
    if (data.empty()) {
        throw core::UnmarshalError(type(), "empty JSON data");
    }
    core::Identifier value = serial::JsonCodec::decode(data);
    if (!serves(value.type())) {
        throw core::UnmarshalError(value.type(),
                                   "type not supported by provider '" + name() + "'");
    }
    return value;
}

} // namespace nexuid::provider
