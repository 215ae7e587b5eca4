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
 * @file encoding_test.cpp
 * @brief Unit tests for the textual and binary codecs.
 *
 * @details
 * Verifies Crockford base32, hex, base64, the RFC 4122 field accessors and the
 * timestamp helpers against fixed reference vectors.
 */

#include "framework.hpp"
#include "nexuid/core/errors.hpp"
#include "nexuid/encoding/base32.hpp"
#include "nexuid/encoding/base64.hpp"
#include "nexuid/encoding/hex.hpp"
#include "nexuid/encoding/time.hpp"
#include "nexuid/encoding/uuid_layout.hpp"

#include <string>

using namespace nexuid;

namespace {

const std::string kUlid = "01ARZ3NDEKTSV4RRFFQ69G5FAV";
const std::string kUlidHex = "01563e3ab5d3d6764c61efb99302bd5b";

core::Bytes sequence_bytes()
{
    core::Bytes b{};
    for (std::size_t i = 0; i < b.size(); ++i) {
        b[i] = static_cast<std::uint8_t>(i);
    }
    return b;
}

} // namespace

/**
 * @brief Decodes a well-known ULID and checks it encodes back to the same text.
 */
void test_base32_reference_vector()
{
    const core::Bytes bytes = encoding::decode_ulid(kUlid);
    ASSERT_EQ(encoding::to_hex(bytes), kUlidHex);
    ASSERT_EQ(encoding::encode_ulid(bytes), kUlid);

    // Decoding is case-insensitive; encoding is always upper case.
    const core::Bytes lower = encoding::decode_ulid("01arz3ndektsv4rrffq69g5fav");
    ASSERT_TRUE(lower == bytes);
}

void test_base32_extremes()
{
    core::Bytes max{};
    max.fill(0xFF);
    ASSERT_EQ(encoding::encode_ulid(max), std::string("7ZZZZZZZZZZZZZZZZZZZZZZZZZ"));
    ASSERT_EQ(encoding::encode_ulid(core::Bytes{}), std::string(26, '0'));
    ASSERT_TRUE(encoding::decode_ulid("7ZZZZZZZZZZZZZZZZZZZZZZZZZ") == max);
}

void test_base32_rejections()
{
    ASSERT_FALSE(encoding::is_ulid_string("8ZZZZZZZZZZZZZZZZZZZZZZZZZ"));
    ASSERT_FALSE(encoding::is_ulid_string("01ARZ3NDEKTSV4RRFFQ69G5FAU")); // 'U' is excluded
    ASSERT_FALSE(encoding::is_ulid_string("01ARZ3NDEKTSV4RRFFQ69G5FA"));

    try {
        encoding::validate_ulid_string("8ZZZZZZZZZZZZZZZZZZZZZZZZZ");
        ASSERT_TRUE(false);
    } catch (const core::ValidationError& e) {
        ASSERT_EQ(e.field(), std::string("overflow"));
    }
    try {
        encoding::validate_ulid_string("01ARZ3NDEKTSV4RRFFQ69G5FAI");
        ASSERT_TRUE(false);
    } catch (const core::ValidationError& e) {
        ASSERT_EQ(e.field(), std::string("character"));
        ASSERT_EQ(e.value(), std::string("I"));
    }
    ASSERT_THROWS(encoding::decode_ulid("short"), core::ValidationError);
}

void test_hex_codec()
{
    const core::Bytes bytes = sequence_bytes();
    ASSERT_EQ(encoding::to_hex(bytes), std::string("000102030405060708090a0b0c0d0e0f"));
    ASSERT_TRUE(encoding::hex_to_id("000102030405060708090A0B0C0D0E0F") == bytes);

    // Hyphens are ignored so the dashed UUID layout decodes directly.
    ASSERT_TRUE(encoding::hex_to_id("00010203-0405-0607-0809-0a0b0c0d0e0f") == bytes);
    ASSERT_THROWS(encoding::hex_to_id("0001"), core::ValidationError);
    ASSERT_THROWS(encoding::hex_to_bytes("zz"), core::ValidationError);
}

void test_base64_vectors()
{
    ASSERT_EQ(encoding::base64_encode(sequence_bytes()), std::string("AAECAwQFBgcICQoLDA0ODw=="));
    ASSERT_EQ(encoding::base64_encode(encoding::decode_ulid(kUlid)),
              std::string("AVY+OrXT1nZMYe+5kwK9Ww=="));

    const core::ByteBuffer two = encoding::base64_decode("//4=");
    ASSERT_EQ(two.size(), 2u);
    ASSERT_EQ(two[0], 0xFF);
    ASSERT_EQ(two[1], 0xFE);

    const core::ByteBuffer one = encoding::base64_decode("Zg==");
    ASSERT_EQ(one.size(), 1u);
    ASSERT_EQ(one[0], 'f');

    ASSERT_TRUE(encoding::base64_decode("").empty());
    ASSERT_THROWS(encoding::base64_decode("abc"), core::ValidationError);
    ASSERT_THROWS(encoding::base64_decode("ab!="), core::ValidationError);
}

/**
 * @brief Checks the version and variant accessors against the RFC 4122 bit layout.
 */
void test_uuid_layout_fields()
{
    core::Bytes b{};
    const std::uint8_t versions[] = {0x10, 0x40, 0x60, 0x70};
    const int expected[] = {1, 4, 6, 7};
    for (int i = 0; i < 4; ++i) {
        b[6] = versions[i];
        ASSERT_EQ(encoding::extract_version(b), expected[i]);
    }

    b[6] = 0x80;
    ASSERT_THROWS(encoding::extract_version(b), core::ValidationError);
    b[6] = 0x00;
    ASSERT_THROWS(encoding::extract_version(b), core::ValidationError);

    b[8] = 0x00;
    ASSERT_TRUE(encoding::extract_variant(b) == core::Variant::RESERVED_NCS);
    b[8] = 0xBF;
    ASSERT_TRUE(encoding::extract_variant(b) == core::Variant::RFC4122);
    b[8] = 0xC0;
    ASSERT_TRUE(encoding::extract_variant(b) == core::Variant::RESERVED_MICROSOFT);
    b[8] = 0xE0;
    ASSERT_TRUE(encoding::extract_variant(b) == core::Variant::RESERVED_FUTURE);

    core::Bytes fresh{};
    fresh.fill(0xFF);
    encoding::set_version(fresh, 7);
    encoding::set_rfc4122_variant(fresh);
    ASSERT_EQ(fresh[6], 0x7F);
    ASSERT_EQ(fresh[8], 0xBF);
}

void test_uuid_string_layout()
{
    const std::string text = "550e8400-e29b-41d4-a716-446655440000";
    ASSERT_TRUE(encoding::is_uuid_string(text));
    ASSERT_EQ(encoding::format_uuid(encoding::parse_uuid_string(text)), text);
    ASSERT_EQ(encoding::format_uuid(encoding::parse_uuid_string(
                  "550E8400-E29B-41D4-A716-446655440000")),
              text);

    ASSERT_FALSE(encoding::is_uuid_string("550e8400e29b41d4a716446655440000"));
    ASSERT_FALSE(encoding::is_uuid_string("550e8400-e29b-41d4-a716-44665544000g"));
    ASSERT_FALSE(encoding::is_uuid_string("550e8400-e29b41d4--a716-446655440000"));

    try {
        encoding::validate_uuid_string("550e8400");
        ASSERT_TRUE(false);
    } catch (const core::ValidationError& e) {
        ASSERT_EQ(e.field(), std::string("length"));
    }
    try {
        encoding::validate_uuid_string("550e8400+e29b-41d4-a716-446655440000");
        ASSERT_TRUE(false);
    } catch (const core::ValidationError& e) {
        ASSERT_EQ(e.field(), std::string("format"));
    }
}

void test_big_endian_helpers()
{
    core::Bytes b{};
    encoding::write_be(b, 0, 0x0102030405060708ULL, 8);
    encoding::write_be(b, 8, 0xA1B2, 2);
    ASSERT_EQ(encoding::read_be64(b, 0), 0x0102030405060708ULL);
    ASSERT_EQ(encoding::read_be32(b, 2), 0x03040506u);
    ASSERT_EQ(encoding::read_be16(b, 8), 0xA1B2);
}

/**
 * @brief Round-trips ISO-8601 text and checks zone offsets are applied.
 */
void test_iso8601()
{
    const core::Timestamp ts = encoding::from_unix_millis(1469922850259);
    ASSERT_EQ(encoding::format_iso8601(ts), std::string("2016-07-30T23:54:10.2590000Z"));
    ASSERT_TRUE(encoding::parse_iso8601("2016-07-30T23:54:10.259Z") == ts);
    ASSERT_TRUE(encoding::parse_iso8601("2016-07-31T01:54:10.259+02:00") == ts);
    ASSERT_TRUE(encoding::parse_iso8601("2016-07-30t18:54:10.259-05:00") == ts);
    ASSERT_TRUE(encoding::parse_iso8601("2016-07-30 23:54:10.259000000z") == ts);

    ASSERT_EQ(encoding::unix_millis(encoding::parse_iso8601("1970-01-01T00:00:00Z")), 0);

    ASSERT_THROWS(encoding::parse_iso8601("2016-02-30T00:00:00Z"), core::ValidationError);
    ASSERT_THROWS(encoding::parse_iso8601("2016-07-30T24:00:00Z"), core::ValidationError);
    ASSERT_THROWS(encoding::parse_iso8601("2016-07-30T23:54:10"), core::ValidationError);
    ASSERT_THROWS(encoding::parse_iso8601("2016-07-30T23:54:10.Z"), core::ValidationError);
    ASSERT_THROWS(encoding::parse_iso8601("2016-07-30T23:54:10Z junk"), core::ValidationError);
}

void test_gregorian_ticks()
{
    const core::Timestamp ts = encoding::parse_iso8601("2022-02-22T19:22:22Z");
    ASSERT_EQ(encoding::gregorian_ticks(ts), 138648505420000000LL);
    ASSERT_TRUE(encoding::from_gregorian_ticks(138648505420000000LL) == ts);
    ASSERT_EQ(encoding::gregorian_ticks(encoding::from_unix_millis(0)), encoding::kGregorianOffset);
    ASSERT_EQ(encoding::year_of(ts), 2022);
}

/**
 * @brief Validates the per-type timestamp bounds.
 */
void test_validate_timestamp_bounds()
{
    const core::Timestamp before_epoch = encoding::parse_iso8601("1969-12-31T23:59:59Z");
    for (core::IdType type : core::kAllTypes) {
        ASSERT_THROWS(encoding::validate_timestamp(type, before_epoch), core::ValidationError);
    }

    const core::Timestamp last_ms = encoding::from_unix_millis(encoding::kMaxUnixMillis);
    encoding::validate_timestamp(core::IdType::ULID, last_ms);
    encoding::validate_timestamp(core::IdType::UUID_V7, last_ms);

    const core::Timestamp past_ms = encoding::from_unix_millis(encoding::kMaxUnixMillis + 1);
    ASSERT_THROWS(encoding::validate_timestamp(core::IdType::ULID, past_ms), core::ValidationError);
    ASSERT_THROWS(encoding::validate_timestamp(core::IdType::UUID_V7, past_ms),
                  core::ValidationError);

    const core::Timestamp last_tick = encoding::from_gregorian_ticks(encoding::kMaxGregorianTicks);
    encoding::validate_timestamp(core::IdType::UUID_V1, last_tick);
    encoding::validate_timestamp(core::IdType::UUID_V6, last_tick);
    const core::Timestamp past_tick =
        encoding::from_gregorian_ticks(encoding::kMaxGregorianTicks + 1);
    ASSERT_THROWS(encoding::validate_timestamp(core::IdType::UUID_V1, past_tick),
                  core::ValidationError);

    // Random identifiers only enforce the lower bound.
    encoding::validate_timestamp(core::IdType::UUID_V4, past_ms);
}
