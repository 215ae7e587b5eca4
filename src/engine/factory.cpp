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
 * @file factory.cpp
 * @brief Implementation of provider resolution and the provider cache.
 */

#include "nexuid/engine/factory.hpp"

#include "nexuid/infra/logger.hpp"
#include "nexuid/provider/ulid_provider.hpp"
#include "nexuid/provider/uuid_provider.hpp"

#include <mutex>
#include <utility>

namespace nexuid::engine {

namespace {

config::FactoryConfig validated(config::FactoryConfig cfg)
{
    cfg.validate();
    return cfg;
}

} // namespace

Factory::Factory(config::FactoryConfig cfg) : config_(validated(std::move(cfg)))
{
    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Factory: initialized (default=" + core::to_string(config_.default_type) +
                           ", caching=" + (config_.enable_caching ? "on" : "off") +
                           ", max_cache_size=" + std::to_string(config_.max_cache_size) + ")");
}

std::shared_ptr<provider::Provider> Factory::build(core::IdType type,
                                                   const config::FactoryConfig& cfg)
{
    if (type == core::IdType::ULID) {
        return std::make_shared<provider::UlidProvider>(cfg.ulid ? *cfg.ulid
                                                                 : config::default_ulid_config());
    }

    const auto it = cfg.uuid.find(type);
    if (it != cfg.uuid.end()) {
        return std::make_shared<provider::UuidProvider>(it->second);
    }
    return std::make_shared<provider::UuidProvider>(
        config::default_uuid_config(*core::uuid_version_of(type)));
}

/**
 * @details
 * **Resolution Steps:**
 * 1. **Fast path:** shared lock, return the cached instance if present.
 * 2. **Uncached mode:** build and return a fresh provider; nothing is stored.
 * 3. **Slow path:** exclusive lock, re-check, build, apply the full-clear policy, insert.
 *
 * Building happens before anything is inserted, so an invalid configuration leaves the
 * cache untouched.
 */
std::shared_ptr<provider::Provider> Factory::create_provider(std::optional<core::IdType> type)
{
    config::FactoryConfig snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(rw_lock_);
        const core::IdType resolved = type.value_or(config_.default_type);
        if (config_.enable_caching) {
            const auto it = cache_.find(resolved);
            if (it != cache_.end()) {
                infra::Logger::log(infra::LogLevel::TRACE,
                                   "Factory: cache hit for '" + core::to_string(resolved) + "'");
                return it->second;
            }
        }
        snapshot = config_;
    }

    const core::IdType resolved = type.value_or(snapshot.default_type);
    if (!snapshot.enable_caching) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Factory: created uncached provider '" + core::to_string(resolved) +
                               "'");
        return build(resolved, snapshot);
    }

    std::unique_lock<std::shared_mutex> lock(rw_lock_);
    const auto it = cache_.find(resolved);
    if (it != cache_.end()) {
        return it->second;
    }

    std::shared_ptr<provider::Provider> created = build(resolved, config_);

    if (cache_.size() >= config_.max_cache_size) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Factory: cache full (" + std::to_string(cache_.size()) +
                               " entries), clearing");
        cache_.clear();
    }
    cache_.emplace(resolved, created);

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Factory: created provider '" + created->name() + "' for '" +
                           core::to_string(resolved) + "'");
    return created;
}

std::vector<core::IdType> Factory::supported_types() const
{
    return std::vector<core::IdType>(core::kAllTypes.begin(), core::kAllTypes.end());
}

core::IdType Factory::default_type() const
{
    std::shared_lock<std::shared_mutex> lock(rw_lock_);
    return config_.default_type;
}

std::size_t Factory::cache_size() const
{
    std::shared_lock<std::shared_mutex> lock(rw_lock_);
    return cache_.size();
}

void Factory::clear_cache()
{
    std::unique_lock<std::shared_mutex> lock(rw_lock_);
    if (!cache_.empty()) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Factory: clearing " + std::to_string(cache_.size()) +
                               " cached providers");
    }
    cache_.clear();
}

void Factory::set_configuration(config::FactoryConfig cfg)
{
    cfg.validate();

    std::unique_lock<std::shared_mutex> lock(rw_lock_);
    config_ = std::move(cfg);
    if (!config_.enable_caching) {
        cache_.clear();
    }
    infra::Logger::log(infra::LogLevel::DEBUG, "Factory: configuration replaced");
}

config::FactoryConfig Factory::configuration() const
{
    std::shared_lock<std::shared_mutex> lock(rw_lock_);
    return config_;
}

} // namespace nexuid::engine
