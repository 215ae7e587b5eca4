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
 * @file factory.hpp
 * @brief Resolves identifier types to configured, cached provider instances.
 *
 * @details
 * The factory owns provider lifecycles. With caching enabled, every request for a type
 * returns the same instance, so provider state (notably the ULID monotonic counter) is
 * shared by all callers of that factory.
 *
 * **Concurrency Model:**
 * - Cache hits take a shared lock and may proceed in parallel.
 * - Misses, insertions and clears take the exclusive lock. A miss re-checks the cache
 *   after acquiring it, so racing misses for one type end up with a single instance.
 *
 * **Eviction Policy:**
 * When an insertion finds the cache already holding `max_cache_size` entries, the whole
 * cache is cleared first. There is no LRU ordering.
 */

#pragma once

#include "nexuid/config/config.hpp"
#include "nexuid/provider/capabilities.hpp"

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace nexuid::engine {

class Factory {
  public:
    /**
     * @brief Validates @p cfg and constructs an empty factory.
     *
     * @throws core::ValidationError when @p cfg is invalid.
     */
    explicit Factory(config::FactoryConfig cfg = config::default_factory_config());

    Factory(const Factory&) = delete;
    Factory& operator=(const Factory&) = delete;

    /**
     * @brief Returns the provider for @p type, creating it on a cache miss.
     *
     * @param type Requested type. When empty, the configured default type is used.
     *
     * @throws core::ValidationError when the provider configuration is invalid.
     */
    std::shared_ptr<provider::Provider> create_provider(std::optional<core::IdType> type = std::nullopt);

    /// @brief All five identifier families.
    std::vector<core::IdType> supported_types() const;

    core::IdType default_type() const;

    /// @brief Number of cached providers. Always 0 with caching disabled.
    std::size_t cache_size() const;

    void clear_cache();

    /**
     * @brief Replaces the configuration.
     *
     * Already cached providers are kept unless caching is now disabled, in which case the
     * cache is cleared.
     *
     * @throws core::ValidationError when @p cfg is invalid; the old configuration stays.
     */
    void set_configuration(config::FactoryConfig cfg);

    /// @brief Copy of the current configuration.
    config::FactoryConfig configuration() const;

    const std::string& name() const { return name_; }
    std::string version() const { return "1.0.0"; }

  private:
    static std::shared_ptr<provider::Provider> build(core::IdType type,
                                                     const config::FactoryConfig& cfg);

    std::string name_ = "nexuid-factory";

    config::FactoryConfig config_;
    std::map<core::IdType, std::shared_ptr<provider::Provider>> cache_;

    /// @brief Guards @ref config_ and @ref cache_.
    mutable std::shared_mutex rw_lock_;
};

} // namespace nexuid::engine
