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
 * @file config.hpp
 * @brief Provider and factory configuration.
 *
 * @details
 * Configurations are plain aggregates. They are validated once, when a provider (or a
 * factory) is constructed from them, and are treated as immutable afterwards.
 *
 * **JSON document accepted by `load_factory_config()`:**
 * @code
 * {
 *   "default_type": "uuid_v7",
 *   "enable_caching": true,
 *   "max_cache_size": 8,
 *   "log_level": "info",
 *   "providers": {
 *     "ulid":    { "monotonic": true, "secure_entropy": false, "entropy_size": 10 },
 *     "uuid_v1": { "node_id": "0a0b0c0d0e0f", "clock_sequence": 42 }
 *   }
 * }
 * @endcode
 * Every key is optional; absent keys keep their defaults.
 */

#pragma once

#include "nexuid/core/types.hpp"
#include "nexuid/infra/logger.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace nexuid::config {

/// @brief Default number of random bytes drawn per ULID.
inline constexpr std::size_t kDefaultEntropySize = 10;

/// @brief Largest clock sequence that fits the 14-bit field.
inline constexpr int kMaxClockSequence = 16383;

/// @brief Fields shared by every provider configuration.
struct ProviderConfig {
    core::IdType type = core::IdType::ULID;
    std::string name;
    bool thread_safe = true;

    /// @throws core::ValidationError when @ref name is empty.
    void validate() const;
};

struct UlidConfig : ProviderConfig {
    /// @brief Same-millisecond IDs increment the previous entropy instead of redrawing.
    bool monotonic = true;

    /// @brief Draw entropy from OpenSSL instead of the thread-local Mersenne Twister.
    bool secure_entropy = false;

    /// @brief Random bytes drawn per identifier, in [1, 16].
    std::size_t entropy_size = kDefaultEntropySize;

    void validate() const;
};

struct UuidConfig : ProviderConfig {
    /// @brief Generation version, in [1, 7]. Only 1, 4, 6 and 7 can be generated.
    int version = 4;

    /// @brief Fixed node for v1 / v6. Exactly 6 bytes when set; random otherwise.
    std::optional<core::ByteBuffer> node_id;

    /// @brief Fixed clock sequence for v1 / v6, in [0, 16383]; random otherwise.
    std::optional<int> clock_sequence;

    void validate() const;
};

struct FactoryConfig {
    core::IdType default_type = core::IdType::ULID;
    bool enable_caching = true;
    std::size_t max_cache_size = 100;
    infra::LogLevel log_level = infra::LogLevel::INFO;

    /// @brief Replaces default_ulid_config() when set.
    std::optional<UlidConfig> ulid;

    /// @brief Per-type replacements for default_uuid_config(), keyed by UUID type.
    std::map<core::IdType, UuidConfig> uuid;

    /**
     * @brief Validates the factory settings and every override.
     *
     * @throws core::ValidationError for a zero cache size with caching enabled, an override
     * keyed under a type other than its own, or any invalid override.
     */
    void validate() const;
};

UlidConfig default_ulid_config();

/**
 * @brief Default UUID configuration for @p version, named `"<type>-provider"`.
 *
 * @throws core::ValidationError when @p version is outside [1, 7].
 */
UuidConfig default_uuid_config(int version);

FactoryConfig default_factory_config();

/**
 * @brief Builds a validated factory configuration from a JSON document.
 *
 * @throws core::ValidationError for malformed JSON, unknown type names, mistyped values or
 * values that fail validation.
 */
FactoryConfig load_factory_config(const std::string& json_text);

/**
 * @brief Reads @p path and delegates to load_factory_config().
 *
 * @throws core::ValidationError when the file cannot be read.
 */
FactoryConfig load_factory_config_file(const std::string& path);

} // namespace nexuid::config
