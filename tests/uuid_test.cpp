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
 * @file uuid_test.cpp
 * @brief Unit tests for the UUID provider (versions 1, 4, 6 and 7).
 */

#include "framework.hpp"
#include "nexuid/config/config.hpp"
#include "nexuid/core/errors.hpp"
#include "nexuid/encoding/time.hpp"
#include "nexuid/encoding/uuid_layout.hpp"
#include "nexuid/provider/uuid_provider.hpp"

#include <string>

using namespace nexuid;

namespace {

const std::string kV1 = "c232ab00-9414-11ec-b3c8-9f6bdeced846";
const std::string kV6 = "1ec9414c-232a-6b00-b3c8-9f6bdeced846";
const std::string kV7 = "017f22e2-79b0-7cc3-98c4-dc0c0c07398f";

core::Timestamp reference_time()
{
    return encoding::parse_iso8601("2022-02-22T19:22:22Z");
}

/// @brief Pins clock sequence and node to the values embedded in the reference vectors.
config::UuidConfig pinned_config(int version)
{
    config::UuidConfig cfg = config::default_uuid_config(version);
    cfg.clock_sequence = 0x33C8;
    cfg.node_id = core::ByteBuffer{0x9f, 0x6b, 0xde, 0xce, 0xd8, 0x46};
    return cfg;
}

} // namespace

/**
 * @brief Every generated version carries its version nibble and the RFC 4122 variant.
 */
void test_uuid_generate_each_version()
{
    for (int version : {1, 4, 6, 7}) {
        provider::UuidProvider uuid(config::default_uuid_config(version));
        const core::Identifier id = uuid.generate();

        ASSERT_EQ(id.type(), core::uuid_type_for_version(version));
        ASSERT_EQ(id.version().value_or(0), version);
        ASSERT_TRUE(id.variant() == core::Variant::RFC4122);
        ASSERT_EQ(encoding::extract_version(id.bytes()), version);
        ASSERT_EQ(id.canonical().size(), 36u);
        ASSERT_EQ(id.canonical()[14], static_cast<char>('0' + version));
        ASSERT_EQ(id.has_timestamp(), version != 4);
        ASSERT_TRUE(uuid.parse(id.canonical()) == id);
        ASSERT_TRUE(uuid.is_valid_uuid(id.canonical()));
    }
}

/**
 * @brief Decodes the embedded timestamp of published reference values.
 */
void test_uuid_reference_timestamps()
{
    provider::UuidProvider uuid(config::default_uuid_config(4));

    ASSERT_TRUE(uuid.extract_timestamp(kV1) == reference_time());
    ASSERT_TRUE(uuid.extract_timestamp(kV6) == reference_time());
    ASSERT_EQ(encoding::unix_millis(uuid.extract_timestamp(kV7)), 1645557742000);

    const core::Identifier v1 = uuid.parse(kV1);
    ASSERT_EQ(v1.type(), core::IdType::UUID_V1);
    ASSERT_EQ(encoding::gregorian_ticks(v1.timestamp()), 138648505420000000LL);

    ASSERT_EQ(uuid.parse(kV6).type(), core::IdType::UUID_V6);
    ASSERT_EQ(uuid.parse(kV7).type(), core::IdType::UUID_V7);
}

/**
 * @brief With a pinned clock sequence and node, time-based generation is reproducible.
 */
void test_uuid_time_based_layout()
{
    provider::UuidProvider v1(pinned_config(1));
    ASSERT_EQ(v1.generate_at(reference_time()).canonical(), kV1);

    provider::UuidProvider v6(pinned_config(6));
    ASSERT_EQ(v6.generate_at(reference_time()).canonical(), kV6);
}

void test_uuid_v7_layout()
{
    provider::UuidProvider v7(config::default_uuid_config(7));
    const core::Identifier id = v7.generate_at(reference_time());

    ASSERT_EQ(id.canonical().substr(0, 13), std::string("017f22e2-79b0"));
    ASSERT_EQ(encoding::unix_millis(id.timestamp()), 1645557742000);
}

/**
 * @brief Generating at T and extracting returns T for every time-based version.
 */
void test_uuid_timestamp_fidelity()
{
    const core::Timestamp t = encoding::parse_iso8601("2031-05-17T08:15:42.987Z");
    for (int version : {1, 6, 7}) {
        provider::UuidProvider uuid(config::default_uuid_config(version));
        const core::Identifier id = uuid.generate_at(t);
        ASSERT_TRUE(id.timestamp() == t);
        ASSERT_TRUE(uuid.extract_timestamp(id.canonical()) == t);
    }
}

/**
 * @brief A sub-millisecond T comes back truncated to the millisecond for every version.
 */
void test_uuid_timestamp_truncates_to_millis()
{
    const core::Timestamp t = encoding::parse_iso8601("2031-05-17T08:15:42.9876543Z");
    const core::Timestamp truncated = encoding::parse_iso8601("2031-05-17T08:15:42.987Z");
    for (int version : {1, 6, 7}) {
        provider::UuidProvider uuid(config::default_uuid_config(version));
        const core::Identifier id = uuid.generate_at(t);
        ASSERT_TRUE(id.timestamp() == truncated);
        ASSERT_TRUE(uuid.extract_timestamp(id.canonical()) == truncated);
    }
}

void test_uuid_v4_has_no_timestamp()
{
    provider::UuidProvider uuid(config::default_uuid_config(4));
    const core::Identifier id = uuid.generate();

    ASSERT_FALSE(id.has_timestamp());
    ASSERT_THROWS(id.timestamp(), core::NoTimestampError);
    ASSERT_THROWS(uuid.extract_timestamp(id.canonical()), core::NoTimestampError);
    ASSERT_FALSE(uuid.supports_timestamp());

    // The timestamp is checked, then ignored.
    ASSERT_THROWS(uuid.generate_at(encoding::parse_iso8601("1969-06-01T00:00:00Z")),
                  core::ValidationError);
    ASSERT_FALSE(uuid.generate_at(reference_time()).has_timestamp());

    try {
        uuid.extract_timestamp(id.canonical());
        ASSERT_TRUE(false);
    } catch (const core::NoTimestampError& e) {
        ASSERT_EQ(e.kind(), std::string("no_timestamp"));
    }
}

/**
 * @brief Versions outside 1..7 are rejected; 2, 3 and 5 parse under the v4 family.
 */
void test_uuid_parse_versions()
{
    provider::UuidProvider uuid(config::default_uuid_config(4));

    ASSERT_THROWS(uuid.parse("550e8400-e29b-81d4-a716-446655440000"), core::ParseError);
    ASSERT_THROWS(uuid.parse("550e8400-e29b-01d4-a716-446655440000"), core::ParseError);
    ASSERT_THROWS(uuid.validate("550e8400-e29b-81d4-a716-446655440000"), core::ValidationError);
    ASSERT_FALSE(uuid.is_valid_uuid("550e8400-e29b-81d4-a716-446655440000"));

    const core::Identifier v3 = uuid.parse("6fa459ea-ee8a-3ca4-894e-db77e160355e");
    ASSERT_EQ(v3.type(), core::IdType::UUID_V4);
    ASSERT_EQ(v3.version().value_or(0), 3);
    ASSERT_FALSE(v3.has_timestamp());
}

void test_uuid_parse_forms()
{
    provider::UuidProvider uuid(config::default_uuid_config(4));
    const std::string canonical = "550e8400-e29b-41d4-a716-446655440000";

    const core::Identifier upper = uuid.parse("550E8400-E29B-41D4-A716-446655440000");
    ASSERT_EQ(upper.canonical(), canonical);
    ASSERT_EQ(upper.raw(), std::string("550E8400-E29B-41D4-A716-446655440000"));

    const core::Identifier compact = uuid.parse("550e8400e29b41d4a716446655440000");
    ASSERT_EQ(compact.canonical(), canonical);
    ASSERT_EQ(compact.hex(), std::string("550e8400e29b41d4a716446655440000"));

    ASSERT_THROWS(uuid.parse(""), core::ParseError);
    ASSERT_THROWS(uuid.parse("550e8400-e29b-41d4-a716"), core::ParseError);
    ASSERT_THROWS(uuid.parse_bytes(core::ByteBuffer(8, 0)), core::ParseError);
    ASSERT_THROWS(uuid.validate_bytes(core::ByteBuffer(16, 0)), core::ValidationError);
    ASSERT_THROWS(uuid.validate("550e8400e29b41d4a716446655440000"), core::ValidationError);
}

/**
 * @brief Configured node and clock sequence are written verbatim; a random node has
 * the multicast bit set.
 */
void test_uuid_node_and_clock_sequence()
{
    config::UuidConfig cfg = config::default_uuid_config(1);
    cfg.node_id = core::ByteBuffer{0x01, 0x23, 0x45, 0x67, 0x89, 0xab};
    cfg.clock_sequence = 0x1234;
    provider::UuidProvider pinned(cfg);

    const std::string text = pinned.generate().canonical();
    ASSERT_EQ(text.substr(19, 4), std::string("9234"));
    ASSERT_EQ(text.substr(24), std::string("0123456789ab"));

    provider::UuidProvider random(config::default_uuid_config(6));
    for (int i = 0; i < 16; ++i) {
        ASSERT_EQ(random.generate().bytes()[10] & 0x01, 1);
    }
}

void test_uuid_config_rejections()
{
    config::UuidConfig bad_node = config::default_uuid_config(1);
    bad_node.node_id = core::ByteBuffer{0x01, 0x02, 0x03};
    ASSERT_THROWS(provider::UuidProvider(bad_node), core::ValidationError);

    config::UuidConfig bad_clock = config::default_uuid_config(1);
    bad_clock.clock_sequence = 16384;
    ASSERT_THROWS(provider::UuidProvider(bad_clock), core::ValidationError);

    config::UuidConfig mismatch = config::default_uuid_config(1);
    mismatch.version = 7;
    ASSERT_THROWS(provider::UuidProvider(mismatch), core::ValidationError);

    ASSERT_THROWS(config::default_uuid_config(8), core::ValidationError);
}

/**
 * @brief A valid version without a generator (3) is accepted by configuration but
 * refused at generation.
 */
void test_uuid_unsupported_generation()
{
    config::UuidConfig cfg = config::default_uuid_config(4);
    cfg.version = 3;
    provider::UuidProvider uuid(cfg);
    ASSERT_THROWS(uuid.generate(), core::ValidationError);
}

void test_uuid_timestamp_bounds()
{
    provider::UuidProvider v1(config::default_uuid_config(1));
    ASSERT_THROWS(v1.generate_at(encoding::from_gregorian_ticks(encoding::kMaxGregorianTicks + 1)),
                  core::ValidationError);
    ASSERT_THROWS(v1.generate_at(encoding::from_unix_millis(-1)), core::ValidationError);

    const core::Timestamp max_ts = encoding::from_gregorian_ticks(encoding::kMaxGregorianTicks);
    const core::Identifier last = v1.generate_at(max_ts);
    ASSERT_TRUE(last.timestamp() == encoding::from_unix_millis(encoding::unix_millis(max_ts)));

    provider::UuidProvider v7(config::default_uuid_config(7));
    ASSERT_THROWS(v7.generate_at(encoding::from_unix_millis(encoding::kMaxUnixMillis + 1)),
                  core::ValidationError);
}

void test_uuid_provider_metadata()
{
    provider::UuidProvider v6(config::default_uuid_config(6));
    ASSERT_EQ(v6.type(), core::IdType::UUID_V6);
    ASSERT_EQ(v6.name(), std::string("uuid_v6-provider"));
    ASSERT_TRUE(v6.supports_timestamp());
    ASSERT_TRUE(v6.is_thread_safe());
    ASSERT_EQ(v6.supported_types().size(), 4u);

    core::Bytes bytes = encoding::parse_uuid_string(kV1);
    ASSERT_TRUE(provider::uuid_timestamp(bytes, 1) == reference_time());
    ASSERT_FALSE(provider::uuid_timestamp(bytes, 4).has_value());
}
