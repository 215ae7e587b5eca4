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
 * @file uuid_provider.cpp
 * @brief Implementation of UUID generation, timestamp extraction and parsing.
 */

#include "nexuid/provider/uuid_provider.hpp"

#include "nexuid/core/errors.hpp"
#include "nexuid/encoding/hex.hpp"
#include "nexuid/encoding/time.hpp"
#include "nexuid/encoding/uuid_layout.hpp"
#include "nexuid/infra/logger.hpp"
#include "nexuid/infra/string.hpp"

#include <algorithm>
#include <utility>

namespace nexuid::provider {

namespace {

config::UuidConfig validated(config::UuidConfig cfg)
{
    cfg.validate();
    return cfg;
}

std::set<core::IdType> uuid_types()
{
    return {core::IdType::UUID_V1, core::IdType::UUID_V4, core::IdType::UUID_V6,
            core::IdType::UUID_V7};
}

} // namespace

std::optional<core::Timestamp> uuid_timestamp(const core::Bytes& bytes, int version)
{
    switch (version) {
    case 1: {
        const std::uint64_t time_low = encoding::read_be32(bytes, 0);
        const std::uint64_t time_mid = encoding::read_be16(bytes, 4);
        const std::uint64_t time_hi = encoding::read_be16(bytes, 6) & 0x0FFF;
        const std::uint64_t ticks = time_hi << 48 | time_mid << 32 | time_low;
        return encoding::from_gregorian_ticks(static_cast<std::int64_t>(ticks));
    }
    case 6: {
        const std::uint64_t time_high = encoding::read_be32(bytes, 0);
        const std::uint64_t time_mid = encoding::read_be16(bytes, 4);
        const std::uint64_t time_low = encoding::read_be16(bytes, 6) & 0x0FFF;
        const std::uint64_t ticks = time_high << 28 | time_mid << 12 | time_low;
        return encoding::from_gregorian_ticks(static_cast<std::int64_t>(ticks));
    }
    case 7: {
        const std::uint64_t ms = encoding::read_be64(bytes, 0) >> 16;
        return encoding::from_unix_millis(static_cast<std::int64_t>(ms));
    }
    default:
        return std::nullopt;
    }
}

UuidProvider::UuidProvider(config::UuidConfig cfg, std::shared_ptr<infra::EntropySource> entropy)
    : ProviderBase(uuid_types()), config_(validated(std::move(cfg))),
      entropy_(entropy ? std::move(entropy) : infra::make_entropy(false))
{
    infra::Logger::log(infra::LogLevel::TRACE,
                       "UuidProvider: '" + config_.name + "' ready (version=" +
                           std::to_string(config_.version) + ", entropy=" + entropy_->name() +
                           ")");
}

bool UuidProvider::supports_timestamp() const
{
    return config_.version == 1 || config_.version == 6 || config_.version == 7;
}

core::Identifier UuidProvider::generate(const core::Context& ctx)
{
    ctx.throw_if_cancelled("generate");
    switch (config_.version) {
    case 1:
    case 6:
        return generate_time_based(config_.version, encoding::now());
    case 7:
        return generate_v7(encoding::now());
    case 4:
        return generate_v4();
    default:
        throw core::ValidationError("version", std::to_string(config_.version),
                                    "UUID version cannot be generated", config_.type);
    }
}

core::Identifier UuidProvider::generate_at(core::Timestamp ts, const core::Context& ctx)
{
    ctx.throw_if_cancelled("generate_at");
    encoding::validate_timestamp(config_.type, ts);

    switch (config_.version) {
    case 1:
    case 6:
        // Explicit timestamps keep millisecond precision.
        return generate_time_based(config_.version,
                                   encoding::from_unix_millis(encoding::unix_millis(ts)));
    case 7:
        return generate_v7(ts);
    default:
        return generate(ctx);
    }
}

/**
 * @details
 * Both versions encode the same 60-bit tick count and differ only in field order:
 * - **v1:** time_low = ticks[31:0], time_mid = ticks[47:32], time_hi = ticks[59:48].
 * - **v6:** bytes 0..5 = ticks[59:12], low 12 bits of bytes 6..7 = ticks[11:0].
 */
core::Identifier UuidProvider::generate_time_based(int version, core::Timestamp ts)
{
    const auto ticks = static_cast<std::uint64_t>(encoding::gregorian_ticks(ts));

    core::Bytes bytes{};
    if (version == 1) {
        encoding::write_be(bytes, 0, ticks & 0xFFFFFFFF, 4);
        encoding::write_be(bytes, 4, (ticks >> 32) & 0xFFFF, 2);
        encoding::write_be(bytes, 6, (ticks >> 48) & 0x0FFF, 2);
    } else {
        encoding::write_be(bytes, 0, ticks >> 12, 6);
        encoding::write_be(bytes, 6, ticks & 0x0FFF, 2);
    }
    encoding::set_version(bytes, version);
    fill_clock_and_node(bytes);

    const std::string canonical = encoding::format_uuid(bytes);
    return core::Identifier::create(canonical, canonical, bytes,
                                    core::uuid_type_for_version(version),
                                    encoding::from_gregorian_ticks(static_cast<std::int64_t>(ticks)),
                                    version, encoding::extract_variant(bytes));
}

void UuidProvider::fill_clock_and_node(core::Bytes& bytes)
{
    std::uint16_t clock_seq = 0;
    if (config_.clock_sequence) {
        clock_seq = static_cast<std::uint16_t>(*config_.clock_sequence);
    } else {
        std::uint8_t raw[2];
        entropy_->fill(raw, sizeof(raw));
        clock_seq = static_cast<std::uint16_t>(((raw[0] << 8) | raw[1]) & 0x3FFF);
    }
    encoding::write_be(bytes, 8, clock_seq, 2);
    encoding::set_rfc4122_variant(bytes);

    if (config_.node_id) {
        std::copy(config_.node_id->begin(), config_.node_id->end(), bytes.begin() + 10);
    } else {
        entropy_->fill(bytes.data() + 10, 6);
        bytes[10] |= 0x01;
    }
}

core::Identifier UuidProvider::generate_v7(core::Timestamp ts)
{
    const std::int64_t ms = encoding::unix_millis(ts);

    core::Bytes bytes{};
    entropy_->fill(bytes.data() + 6, 10);
    encoding::write_be(bytes, 0, static_cast<std::uint64_t>(ms), 6);
    encoding::set_version(bytes, 7);
    encoding::set_rfc4122_variant(bytes);

    const std::string canonical = encoding::format_uuid(bytes);
    return core::Identifier::create(canonical, canonical, bytes, core::IdType::UUID_V7,
                                    encoding::from_unix_millis(ms), 7,
                                    encoding::extract_variant(bytes));
}

core::Identifier UuidProvider::generate_v4()
{
    core::Bytes bytes{};
    entropy_->fill(bytes.data(), bytes.size());
    encoding::set_version(bytes, 4);
    encoding::set_rfc4122_variant(bytes);

    const std::string canonical = encoding::format_uuid(bytes);
    return core::Identifier::create(canonical, canonical, bytes, core::IdType::UUID_V4,
                                    std::nullopt, 4, encoding::extract_variant(bytes));
}

core::Identifier UuidProvider::build(const core::Bytes& bytes, std::string raw) const
{
    int version = 0;
    try {
        version = encoding::extract_version(bytes);
    } catch (const core::ValidationError& e) {
        throw core::ParseError(raw, config_.type, "invalid UUID version", e.what());
    }

    return core::Identifier::create(std::move(raw), encoding::format_uuid(bytes), bytes,
                                    core::uuid_type_for_version(version),
                                    uuid_timestamp(bytes, version), version,
                                    encoding::extract_variant(bytes));
}

core::Identifier UuidProvider::parse(const std::string& input, const core::Context& ctx) const
{
    ctx.throw_if_cancelled("parse");
    if (input.empty()) {
        throw core::ParseError(input, config_.type, "empty input");
    }

    if (encoding::is_uuid_string(input)) {
        return build(encoding::parse_uuid_string(input), input);
    }

    const std::string compact = infra::String::remove_all(input, '-');
    if (compact.size() == encoding::kHexLength && infra::String::is_hex(compact)) {
        return build(encoding::hex_to_id(compact), input);
    }

    try {
        encoding::validate_uuid_string(input, config_.type);
    } catch (const core::ValidationError& e) {
        throw core::ParseError(input, config_.type, "not a UUID or hex string", e.what());
    }
    throw core::ParseError(input, config_.type, "not a UUID or hex string");
}

core::Identifier UuidProvider::parse_bytes(const core::ByteBuffer& bytes,
                                           const core::Context& ctx) const
{
    ctx.throw_if_cancelled("parse_bytes");
    if (bytes.size() != core::kIdLength) {
        throw core::ParseError(encoding::to_hex(bytes), config_.type,
                               "expected 16 bytes, got " + std::to_string(bytes.size()));
    }
    core::Bytes id{};
    std::copy(bytes.begin(), bytes.end(), id.begin());
    return build(id, encoding::to_hex(id));
}

void UuidProvider::validate(const std::string& input, const core::Context& ctx) const
{
    ctx.throw_if_cancelled("validate");
    encoding::validate_uuid_string(input, config_.type);
    encoding::extract_version(encoding::parse_uuid_string(input));
}

void UuidProvider::validate_bytes(const core::ByteBuffer& bytes, const core::Context& ctx) const
{
    ctx.throw_if_cancelled("validate_bytes");
    if (bytes.size() != core::kIdLength) {
        throw core::ValidationError("bytes", std::to_string(bytes.size()), "expected 16 bytes",
                                    config_.type);
    }
    core::Bytes id{};
    std::copy(bytes.begin(), bytes.end(), id.begin());
    encoding::extract_version(id);
}

core::Timestamp UuidProvider::extract_timestamp(const std::string& input,
                                                const core::Context& ctx) const
{
    ctx.throw_if_cancelled("extract_timestamp");
    const core::Identifier value = parse(input, ctx);
    if (!value.has_timestamp()) {
        throw core::NoTimestampError(input, value.type(),
                                     "no timestamp for UUID version " +
                                         std::to_string(value.version().value_or(0)));
    }
    return value.timestamp();
}

bool UuidProvider::is_valid_uuid(const std::string& input, const core::Context& ctx) const
{
    ctx.throw_if_cancelled("is_valid_uuid");
    if (!encoding::is_uuid_string(input)) {
        return false;
    }
    const char v = input[14];
    return v >= '1' && v <= '7';
}

} // namespace nexuid::provider
