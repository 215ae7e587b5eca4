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
 * @file converter_test.cpp
 * @brief Unit tests for byte-preserving type conversion.
 *
 * @details
 * Conversion relabels an existing 16-byte value. These tests pin down that the bytes
 * never change and that only the metadata follows the target type.
 */

#include "framework.hpp"
#include "nexuid/config/config.hpp"
#include "nexuid/convert/converter.hpp"
#include "nexuid/core/errors.hpp"
#include "nexuid/encoding/time.hpp"
#include "nexuid/provider/ulid_provider.hpp"
#include "nexuid/provider/uuid_provider.hpp"

#include <set>
#include <string>

using namespace nexuid;

namespace {

const std::string kUlid = "01ARZ3NDEKTSV4RRFFQ69G5FAV";

} // namespace

/**
 * @brief ULID to UUID keeps the bytes and reads version and variant from them.
 */
void test_convert_ulid_to_uuid()
{
    provider::UlidProvider ulid(config::default_ulid_config());
    const core::Identifier source = ulid.parse(kUlid);

    const core::Identifier v7 = ulid.convert_type(source, core::IdType::UUID_V7);
    ASSERT_EQ(v7.type(), core::IdType::UUID_V7);
    ASSERT_TRUE(v7.bytes() == source.bytes());
    ASSERT_EQ(v7.canonical(), std::string("01563e3a-b5d3-d676-4c61-efb99302bd5b"));
    ASSERT_EQ(v7.raw(), v7.canonical());
    ASSERT_TRUE(v7.timestamp() == source.timestamp());
    // Byte 6 is 0xd6, outside 1..7, so no version is reported; the variant bits are NCS.
    ASSERT_FALSE(v7.version().has_value());
    ASSERT_TRUE(v7.variant() == core::Variant::RESERVED_NCS);

    const core::Identifier v4 = ulid.convert_type(source, core::IdType::UUID_V4);
    ASSERT_EQ(v4.type(), core::IdType::UUID_V4);
    ASSERT_FALSE(v4.has_timestamp());
}

/**
 * @brief UUID to ULID copies the bytes and reads the leading 48 bits as milliseconds.
 */
void test_convert_uuid_to_ulid()
{
    provider::UuidProvider uuid(config::default_uuid_config(7));
    const core::Identifier source = uuid.parse("017f22e2-79b0-7cc3-98c4-dc0c0c07398f");

    const core::Identifier converted = uuid.convert_type(source, core::IdType::ULID);
    ASSERT_EQ(converted.type(), core::IdType::ULID);
    ASSERT_TRUE(converted.bytes() == source.bytes());
    ASSERT_EQ(converted.canonical().size(), 26u);
    ASSERT_EQ(encoding::unix_millis(converted.timestamp()), 1645557742000);
    ASSERT_FALSE(converted.version().has_value());
    ASSERT_FALSE(converted.variant().has_value());

    // Round trip back through the ULID provider restores the original bytes.
    provider::UlidProvider ulid(config::default_ulid_config());
    const core::Identifier back = ulid.convert_type(converted, core::IdType::UUID_V7);
    ASSERT_EQ(back.canonical(), source.canonical());
}

/**
 * @brief Cross-version UUID conversion only changes the label.
 */
void test_convert_uuid_relabel()
{
    provider::UuidProvider uuid(config::default_uuid_config(4));
    const core::Identifier v1 = uuid.parse("c232ab00-9414-11ec-b3c8-9f6bdeced846");

    const core::Identifier as_v6 = uuid.convert_type(v1, core::IdType::UUID_V6);
    ASSERT_EQ(as_v6.type(), core::IdType::UUID_V6);
    ASSERT_EQ(as_v6.canonical(), v1.canonical());
    ASSERT_EQ(as_v6.version().value_or(0), 1);
    ASSERT_TRUE(as_v6.timestamp() == v1.timestamp());

    const core::Identifier as_v4 = uuid.convert_type(v1, core::IdType::UUID_V4);
    ASSERT_FALSE(as_v4.has_timestamp());
    ASSERT_TRUE(as_v4.bytes() == v1.bytes());

    ASSERT_TRUE(uuid.convert_type(v1, core::IdType::UUID_V1) == v1);
}

void test_convert_unsupported_source()
{
    provider::UlidProvider ulid(config::default_ulid_config());
    provider::UuidProvider uuid(config::default_uuid_config(4));
    const core::Identifier v4 = uuid.generate();

    try {
        ulid.convert_type(v4, core::IdType::ULID);
        ASSERT_TRUE(false);
    } catch (const core::ConversionError& e) {
        ASSERT_EQ(e.source(), core::IdType::UUID_V4);
        ASSERT_EQ(e.target(), core::IdType::ULID);
        ASSERT_EQ(e.kind(), std::string("conversion"));
    }

    ASSERT_THROWS(ulid.to_canonical(v4), core::ConversionError);
    ASSERT_THROWS(ulid.to_hex(v4), core::ConversionError);
    ASSERT_THROWS(uuid.to_bytes(ulid.generate()), core::ConversionError);

    // A projection names only the source and the projection asked for.
    try {
        ulid.to_hex(v4);
        ASSERT_TRUE(false);
    } catch (const core::ConversionError& e) {
        ASSERT_EQ(e.source(), core::IdType::UUID_V4);
        ASSERT_FALSE(e.target().has_value());
        ASSERT_EQ(std::string(e.what()),
                  std::string("conversion failed for uuid_v4: hex projection not served by this converter"));
    }
}

void test_convert_encodings()
{
    convert::Converter converter(std::set<core::IdType>{core::IdType::ULID});
    provider::UlidProvider ulid(config::default_ulid_config());
    const core::Identifier id = ulid.parse(kUlid);

    ASSERT_EQ(converter.to_canonical(id), kUlid);
    ASSERT_EQ(converter.to_hex(id), std::string("01563e3ab5d3d6764c61efb99302bd5b"));
    ASSERT_EQ(converter.to_bytes(id).size(), 16u);
    ASSERT_EQ(converter.to_bytes(id)[0], 0x01);
}

void test_supported_conversions()
{
    provider::UuidProvider uuid(config::default_uuid_config(4));
    const auto table = uuid.supported_conversions();

    ASSERT_EQ(table.size(), 4u);
    ASSERT_EQ(table.count(core::IdType::ULID), 0u);
    ASSERT_EQ(table.at(core::IdType::UUID_V1).size(), 5u);

    convert::Converter converter(std::set<core::IdType>{core::IdType::ULID});
    ASSERT_TRUE(converter.serves(core::IdType::ULID));
    ASSERT_FALSE(converter.serves(core::IdType::UUID_V7));
}
