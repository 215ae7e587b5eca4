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
 * @file ulid_provider.cpp
 * @brief Implementation of ULID generation, monotonic entropy and parsing.
 */

#include "nexuid/provider/ulid_provider.hpp"

#include "nexuid/core/errors.hpp"
#include "nexuid/encoding/base32.hpp"
#include "nexuid/encoding/hex.hpp"
#include "nexuid/encoding/time.hpp"
#include "nexuid/encoding/uuid_layout.hpp"
#include "nexuid/infra/logger.hpp"
#include "nexuid/infra/string.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace nexuid::provider {

namespace {

config::UlidConfig validated(config::UlidConfig cfg)
{
    cfg.validate();
    return cfg;
}

} // namespace

UlidProvider::UlidProvider(config::UlidConfig cfg, std::shared_ptr<infra::EntropySource> entropy)
    : ProviderBase(std::set<core::IdType>{core::IdType::ULID}),
      config_(validated(std::move(cfg))),
      entropy_(entropy ? std::move(entropy) : infra::make_entropy(config_.secure_entropy))
{
    infra::Logger::log(infra::LogLevel::TRACE,
                       "UlidProvider: '" + config_.name + "' ready (entropy=" +
                           entropy_->name() + ", monotonic=" +
                           (config_.monotonic ? "true" : "false") + ")");
}

core::Identifier UlidProvider::generate(const core::Context& ctx)
{
    ctx.throw_if_cancelled("generate");
    return generate_at(encoding::now(), ctx);
}

/**
 * @details
 * The timestamp is validated before the monotonic state is touched, so a rejected call
 * leaves the provider exactly as it was.
 */
core::Identifier UlidProvider::generate_at(core::Timestamp ts, const core::Context& ctx)
{
    ctx.throw_if_cancelled("generate_at");
    encoding::validate_timestamp(core::IdType::ULID, ts);

    const std::int64_t ms = encoding::unix_millis(ts);
    const Entropy entropy = config_.monotonic ? next_entropy(ms) : draw_entropy();

    core::Bytes bytes{};
    encoding::write_be(bytes, 0, static_cast<std::uint64_t>(ms), 6);
    std::copy(entropy.begin(), entropy.end(), bytes.begin() + 6);

    const std::string canonical = encoding::encode_ulid(bytes);
    return core::Identifier::create(canonical, canonical, bytes, core::IdType::ULID,
                                    encoding::from_unix_millis(ms));
}

/**
 * @details
 * `entropy_size` bytes are drawn. A shorter draw is right-aligned so the leading entropy
 * bytes stay zero; a longer one contributes only its trailing 10 bytes.
 */
UlidProvider::Entropy UlidProvider::draw_entropy()
{
    std::vector<std::uint8_t> buffer(config_.entropy_size);
    entropy_->fill(buffer.data(), buffer.size());

    Entropy out{};
    if (buffer.size() >= kUlidEntropyBytes) {
        std::copy(buffer.end() - kUlidEntropyBytes, buffer.end(), out.begin());
    } else {
        std::copy(buffer.begin(), buffer.end(), out.end() - buffer.size());
    }
    return out;
}

UlidProvider::Entropy UlidProvider::next_entropy(std::int64_t ms)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (ms != last_ms_) {
        last_entropy_ = draw_entropy();
        last_ms_ = ms;
        return last_entropy_;
    }

    // 80-bit increment, least significant byte last.
    Entropy next = last_entropy_;
    std::size_t i = next.size();
    while (i > 0) {
        --i;
        if (++next[i] != 0) {
            break;
        }
        if (i == 0) {
            throw core::ValidationError("entropy", encoding::to_hex(core::ByteBuffer(
                                                       last_entropy_.begin(), last_entropy_.end())),
                                        "monotonic entropy overflow", core::IdType::ULID);
        }
    }
    last_entropy_ = next;
    return next;
}

core::Identifier UlidProvider::build(const core::Bytes& bytes, std::string raw)
{
    const auto ms = static_cast<std::int64_t>(encoding::read_be64(bytes, 0) >> 16);
    return core::Identifier::create(std::move(raw), encoding::encode_ulid(bytes), bytes,
                                    core::IdType::ULID, encoding::from_unix_millis(ms));
}

core::Identifier UlidProvider::parse(const std::string& input, const core::Context& ctx) const
{
    ctx.throw_if_cancelled("parse");
    if (input.empty()) {
        throw core::ParseError(input, core::IdType::ULID, "empty input");
    }

    if (encoding::is_ulid_string(input)) {
        return build(encoding::decode_ulid(input), input);
    }

    const std::string compact = infra::String::remove_all(input, '-');
    if (compact.size() == encoding::kHexLength && infra::String::is_hex(compact)) {
        return build(encoding::hex_to_id(compact), input);
    }

    try {
        encoding::validate_ulid_string(input);
    } catch (const core::ValidationError& e) {
        throw core::ParseError(input, core::IdType::ULID, "not a ULID or hex string", e.what());
    }
    throw core::ParseError(input, core::IdType::ULID, "not a ULID or hex string");
}

core::Identifier UlidProvider::parse_bytes(const core::ByteBuffer& bytes,
                                           const core::Context& ctx) const
{
    ctx.throw_if_cancelled("parse_bytes");
    if (bytes.size() != core::kIdLength) {
        throw core::ParseError(encoding::to_hex(bytes), core::IdType::ULID,
                               "expected 16 bytes, got " + std::to_string(bytes.size()));
    }
    core::Bytes id{};
    std::copy(bytes.begin(), bytes.end(), id.begin());
    return build(id, encoding::to_hex(id));
}

void UlidProvider::validate(const std::string& input, const core::Context& ctx) const
{
    ctx.throw_if_cancelled("validate");
    encoding::validate_ulid_string(input);
}

void UlidProvider::validate_bytes(const core::ByteBuffer& bytes, const core::Context& ctx) const
{
    ctx.throw_if_cancelled("validate_bytes");
    if (bytes.size() != core::kIdLength) {
        throw core::ValidationError("bytes", std::to_string(bytes.size()),
                                    "expected 16 bytes", core::IdType::ULID);
    }
}

core::Timestamp UlidProvider::extract_timestamp(const std::string& input,
                                                const core::Context& ctx) const
{
    ctx.throw_if_cancelled("extract_timestamp");
    return parse(input, ctx).timestamp();
}

bool UlidProvider::is_valid_ulid(const std::string& input, const core::Context& ctx) const
{
    ctx.throw_if_cancelled("is_valid_ulid");
    if (!encoding::is_ulid_string(input)) {
        return false;
    }
    return encoding::year_of(build(encoding::decode_ulid(input), input).timestamp()) >= 1970;
}

} // namespace nexuid::provider
