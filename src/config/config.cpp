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
 * @file config.cpp
 * @brief Defaults, validation and JSON loading of configurations.
 */

#include "nexuid/config/config.hpp"

#include "nexuid/core/errors.hpp"
#include "nexuid/encoding/hex.hpp"

#include <cJSON.h>
#include <climits>
#include <cmath>
#include <fstream>
#include <memory>
#include <sstream>

namespace nexuid::config {

namespace {

using JsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

[[noreturn]] void reject(const std::string& field, const std::string& value,
                         const std::string& reason)
{
    throw core::ValidationError(field, value, reason);
}

bool read_bool(const cJSON* obj, const char* key, bool fallback)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (!item) {
        return fallback;
    }
    if (!cJSON_IsBool(item)) {
        reject(key, "non-boolean", "expected a boolean");
    }
    return cJSON_IsTrue(item);
}

/// @brief Reads an integer field; values outside the range of `int` are rejected before narrowing.
std::optional<int> read_integer(const cJSON* obj, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (!item) {
        return std::nullopt;
    }
    if (!cJSON_IsNumber(item) || std::floor(item->valuedouble) != item->valuedouble) {
        reject(key, "non-integer", "expected an integer");
    }
    const double value = item->valuedouble;
    if (value < static_cast<double>(INT_MIN) || value > static_cast<double>(INT_MAX)) {
        std::ostringstream shown;
        shown.precision(17);
        shown << value;
        reject(key, shown.str(), "integer out of range");
    }
    return static_cast<int>(value);
}

std::optional<std::string> read_string(const cJSON* obj, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (!item) {
        return std::nullopt;
    }
    if (!cJSON_IsString(item) || !item->valuestring) {
        reject(key, "non-string", "expected a string");
    }
    return std::string(item->valuestring);
}

core::IdType read_type(const std::string& field, const std::string& name)
{
    const auto type = core::type_from_string(name);
    if (!type) {
        reject(field, name, "unknown identifier type");
    }
    return *type;
}

void apply_common(const cJSON* obj, ProviderConfig& cfg)
{
    if (auto name = read_string(obj, "name")) {
        cfg.name = *name;
    }
    cfg.thread_safe = read_bool(obj, "thread_safe", cfg.thread_safe);
}

UlidConfig load_ulid(const cJSON* obj)
{
    UlidConfig cfg = default_ulid_config();
    apply_common(obj, cfg);
    cfg.monotonic = read_bool(obj, "monotonic", cfg.monotonic);
    cfg.secure_entropy = read_bool(obj, "secure_entropy", cfg.secure_entropy);
    if (auto size = read_integer(obj, "entropy_size")) {
        if (*size < 0) {
            reject("entropy_size", std::to_string(*size), "must be between 1 and 16 bytes");
        }
        cfg.entropy_size = static_cast<std::size_t>(*size);
    }
    return cfg;
}

UuidConfig load_uuid(core::IdType type, const cJSON* obj)
{
    UuidConfig cfg = default_uuid_config(*core::uuid_version_of(type));
    apply_common(obj, cfg);
    if (auto version = read_integer(obj, "version")) {
        cfg.version = *version;
    }
    if (auto node = read_string(obj, "node_id")) {
        cfg.node_id = encoding::hex_to_bytes(*node);
    }
    if (auto seq = read_integer(obj, "clock_sequence")) {
        cfg.clock_sequence = *seq;
    }
    return cfg;
}

} // namespace

void ProviderConfig::validate() const
{
    if (name.empty()) {
        throw core::ValidationError("name", name, "provider name must not be empty", type);
    }
}

void UlidConfig::validate() const
{
    ProviderConfig::validate();
    if (type != core::IdType::ULID) {
        throw core::ValidationError("type", core::to_string(type), "ULID config requires type ulid",
                                    type);
    }
    if (entropy_size < 1 || entropy_size > 16) {
        throw core::ValidationError("entropy_size", std::to_string(entropy_size),
                                    "must be between 1 and 16 bytes", type);
    }
}

void UuidConfig::validate() const
{
    ProviderConfig::validate();
    if (!core::is_uuid(type)) {
        throw core::ValidationError("type", core::to_string(type),
                                    "UUID config requires a UUID type", type);
    }
    if (version < 1 || version > 7) {
        throw core::ValidationError("version", std::to_string(version),
                                    "UUID version must be between 1 and 7", type);
    }
    if (core::uuid_version_of(core::uuid_type_for_version(version)) == version &&
        core::uuid_type_for_version(version) != type) {
        throw core::ValidationError("version", std::to_string(version),
                                    "version does not match type " + core::to_string(type), type);
    }
    if (node_id && node_id->size() != 6) {
        throw core::ValidationError("node_id", encoding::to_hex(*node_id),
                                    "node id must be exactly 6 bytes", type);
    }
    if (clock_sequence && (*clock_sequence < 0 || *clock_sequence > kMaxClockSequence)) {
        throw core::ValidationError("clock_sequence", std::to_string(*clock_sequence),
                                    "clock sequence must be between 0 and 16383", type);
    }
}

void FactoryConfig::validate() const
{
    if (enable_caching && max_cache_size < 1) {
        throw core::ValidationError("max_cache_size", std::to_string(max_cache_size),
                                    "must be at least 1 when caching is enabled");
    }
    if (ulid) {
        ulid->validate();
    }
    for (const auto& [type, cfg] : uuid) {
        if (cfg.type != type) {
            throw core::ValidationError("providers", core::to_string(type),
                                        "override registered under a different type", type);
        }
        cfg.validate();
    }
}

UlidConfig default_ulid_config()
{
    UlidConfig cfg;
    cfg.type = core::IdType::ULID;
    cfg.name = "ulid-provider";
    return cfg;
}

UuidConfig default_uuid_config(int version)
{
    if (version < 1 || version > 7) {
        throw core::ValidationError("version", std::to_string(version),
                                    "UUID version must be between 1 and 7");
    }
    UuidConfig cfg;
    cfg.type = core::uuid_type_for_version(version);
    cfg.version = version;
    cfg.name = core::to_string(cfg.type) + "-provider";
    return cfg;
}

FactoryConfig default_factory_config()
{
    return FactoryConfig{};
}

/**
 * @details
 * The document is decoded into a copy of default_factory_config(), so any key that is
 * missing keeps its default. The finished configuration is validated before it is
 * returned; a partially applied configuration never escapes.
 */
FactoryConfig load_factory_config(const std::string& json_text)
{
    JsonPtr doc(cJSON_Parse(json_text.c_str()), cJSON_Delete);
    if (!doc || !cJSON_IsObject(doc.get())) {
        reject("config", json_text, "invalid JSON document");
    }
    const cJSON* root = doc.get();

    FactoryConfig cfg = default_factory_config();

    if (auto name = read_string(root, "default_type")) {
        cfg.default_type = read_type("default_type", *name);
    }
    cfg.enable_caching = read_bool(root, "enable_caching", cfg.enable_caching);
    if (auto size = read_integer(root, "max_cache_size")) {
        if (*size < 0) {
            reject("max_cache_size", std::to_string(*size), "must not be negative");
        }
        cfg.max_cache_size = static_cast<std::size_t>(*size);
    }
    if (auto level = read_string(root, "log_level")) {
        const auto parsed = infra::Logger::parse_level(*level);
        if (!parsed) {
            reject("log_level", *level, "unknown log level");
        }
        cfg.log_level = *parsed;
    }

    const cJSON* providers = cJSON_GetObjectItemCaseSensitive(root, "providers");
    if (providers) {
        if (!cJSON_IsObject(providers)) {
            reject("providers", "non-object", "expected an object keyed by type");
        }
        const cJSON* entry = nullptr;
        cJSON_ArrayForEach(entry, providers)
        {
            if (!cJSON_IsObject(entry)) {
                reject("providers", entry->string ? entry->string : "", "expected an object");
            }
            const core::IdType type = read_type("providers", entry->string ? entry->string : "");
            if (type == core::IdType::ULID) {
                cfg.ulid = load_ulid(entry);
            } else {
                cfg.uuid[type] = load_uuid(type, entry);
            }
        }
    }

    cfg.validate();
    return cfg;
}

FactoryConfig load_factory_config_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        reject("config", path, "cannot open configuration file");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return load_factory_config(buffer.str());
}

} // namespace nexuid::config
