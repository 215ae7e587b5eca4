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
 * @file config_test.cpp
 * @brief Unit tests for configuration defaults, validation and JSON loading.
 */

#include "framework.hpp"
#include "nexuid/config/config.hpp"
#include "nexuid/core/errors.hpp"

#include <cstdio>
#include <fstream>
#include <string>

using namespace nexuid;

void test_config_defaults()
{
    const config::FactoryConfig cfg = config::default_factory_config();
    ASSERT_EQ(cfg.default_type, core::IdType::ULID);
    ASSERT_TRUE(cfg.enable_caching);
    ASSERT_EQ(cfg.max_cache_size, 100u);
    ASSERT_FALSE(cfg.ulid.has_value());
    ASSERT_TRUE(cfg.uuid.empty());

    const config::UlidConfig ulid = config::default_ulid_config();
    ASSERT_EQ(ulid.name, std::string("ulid-provider"));
    ASSERT_TRUE(ulid.monotonic);
    ASSERT_FALSE(ulid.secure_entropy);
    ASSERT_EQ(ulid.entropy_size, config::kDefaultEntropySize);

    const config::UuidConfig v7 = config::default_uuid_config(7);
    ASSERT_EQ(v7.type, core::IdType::UUID_V7);
    ASSERT_EQ(v7.version, 7);
    ASSERT_EQ(v7.name, std::string("uuid_v7-provider"));
}

/**
 * @brief Checks the inclusive bounds of every validated field.
 */
void test_config_boundaries()
{
    config::UlidConfig ulid = config::default_ulid_config();
    ulid.entropy_size = 1;
    ulid.validate();
    ulid.entropy_size = 16;
    ulid.validate();
    ulid.entropy_size = 17;
    ASSERT_THROWS(ulid.validate(), core::ValidationError);

    config::UlidConfig unnamed = config::default_ulid_config();
    unnamed.name.clear();
    ASSERT_THROWS(unnamed.validate(), core::ValidationError);

    config::UuidConfig uuid = config::default_uuid_config(1);
    uuid.clock_sequence = 0;
    uuid.validate();
    uuid.clock_sequence = config::kMaxClockSequence;
    uuid.validate();
    uuid.clock_sequence = -1;
    ASSERT_THROWS(uuid.validate(), core::ValidationError);

    config::UuidConfig node = config::default_uuid_config(6);
    node.node_id = core::ByteBuffer(6, 0xAA);
    node.validate();
    node.node_id = core::ByteBuffer(7, 0xAA);
    ASSERT_THROWS(node.validate(), core::ValidationError);

    config::UuidConfig version = config::default_uuid_config(4);
    version.version = 0;
    ASSERT_THROWS(version.validate(), core::ValidationError);
    version.version = 8;
    ASSERT_THROWS(version.validate(), core::ValidationError);

    config::FactoryConfig factory = config::default_factory_config();
    factory.max_cache_size = 0;
    ASSERT_THROWS(factory.validate(), core::ValidationError);
    factory.enable_caching = false;
    factory.validate();
}

void test_config_override_must_match_key()
{
    config::FactoryConfig cfg = config::default_factory_config();
    cfg.uuid[core::IdType::UUID_V1] = config::default_uuid_config(7);
    ASSERT_THROWS(cfg.validate(), core::ValidationError);
}

/**
 * @brief Loads a complete document and checks every key lands in the right field.
 */
void test_config_load_json()
{
    const config::FactoryConfig cfg = config::load_factory_config(R"({
        "default_type": "uuid_v7",
        "enable_caching": true,
        "max_cache_size": 3,
        "log_level": "debug",
        "providers": {
            "ulid":    { "name": "orders", "monotonic": false, "secure_entropy": true,
                         "entropy_size": 12 },
            "uuid_v1": { "node_id": "0123456789ab", "clock_sequence": 42,
                         "thread_safe": false }
        }
    })");

    ASSERT_EQ(cfg.default_type, core::IdType::UUID_V7);
    ASSERT_EQ(cfg.max_cache_size, 3u);
    ASSERT_TRUE(cfg.log_level == infra::LogLevel::DEBUG);

    ASSERT_TRUE(cfg.ulid.has_value());
    ASSERT_EQ(cfg.ulid->name, std::string("orders"));
    ASSERT_FALSE(cfg.ulid->monotonic);
    ASSERT_TRUE(cfg.ulid->secure_entropy);
    ASSERT_EQ(cfg.ulid->entropy_size, 12u);

    const config::UuidConfig& v1 = cfg.uuid.at(core::IdType::UUID_V1);
    ASSERT_EQ(v1.version, 1);
    ASSERT_EQ(v1.name, std::string("uuid_v1-provider"));
    ASSERT_EQ(v1.clock_sequence.value_or(-1), 42);
    ASSERT_EQ(v1.node_id->size(), 6u);
    ASSERT_EQ((*v1.node_id)[5], 0xAB);
    ASSERT_FALSE(v1.thread_safe);
}

void test_config_load_rejections()
{
    ASSERT_THROWS(config::load_factory_config("not json"), core::ValidationError);
    ASSERT_THROWS(config::load_factory_config(R"({"default_type":"snowflake"})"),
                  core::ValidationError);
    ASSERT_THROWS(config::load_factory_config(R"({"providers":{"uuid_v9":{}}})"),
                  core::ValidationError);
    ASSERT_THROWS(config::load_factory_config(R"({"max_cache_size":1.5})"), core::ValidationError);
    ASSERT_THROWS(config::load_factory_config(R"({"enable_caching":"yes"})"),
                  core::ValidationError);
    ASSERT_THROWS(config::load_factory_config(R"({"log_level":"loud"})"), core::ValidationError);
    ASSERT_THROWS(config::load_factory_config(R"({"providers":{"ulid":{"entropy_size":0}}})"),
                  core::ValidationError);
    ASSERT_THROWS(config::load_factory_config(R"({"providers":{"uuid_v4":{"version":7}}})"),
                  core::ValidationError);
    ASSERT_THROWS(config::load_factory_config_file("/nonexistent/nexuid.json"),
                  core::ValidationError);
}

/**
 * @brief Integers beyond the range of `int` fail instead of wrapping into a valid value.
 */
void test_config_load_rejects_oversized_integers()
{
    // 4294967338 would wrap to clock sequence 42.
    ASSERT_THROWS(config::load_factory_config(
                      R"({"providers":{"uuid_v1":{"clock_sequence":4294967338}}})"),
                  core::ValidationError);
    ASSERT_THROWS(config::load_factory_config(R"({"providers":{"uuid_v1":{"version":4294967297}}})"),
                  core::ValidationError);
    ASSERT_THROWS(config::load_factory_config(R"({"max_cache_size":1e300})"), core::ValidationError);
    ASSERT_THROWS(config::load_factory_config(R"({"providers":{"ulid":{"entropy_size":-1e300}}})"),
                  core::ValidationError);

    const config::FactoryConfig cfg =
        config::load_factory_config(R"({"providers":{"uuid_v1":{"clock_sequence":16383}}})");
    ASSERT_EQ(cfg.uuid.at(core::IdType::UUID_V1).clock_sequence.value_or(-1), 16383);
}

void test_config_load_file()
{
    const std::string path = "nexuid_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"default_type":"uuid_v4","enable_caching":false})";
    }
    const config::FactoryConfig cfg = config::load_factory_config_file(path);
    std::remove(path.c_str());

    ASSERT_EQ(cfg.default_type, core::IdType::UUID_V4);
    ASSERT_FALSE(cfg.enable_caching);
}
