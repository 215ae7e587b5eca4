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
 * @file manager.cpp
 * @brief Implementation of the manager facade.
 */

#include "nexuid/engine/manager.hpp"

#include "nexuid/core/errors.hpp"
#include "nexuid/detect/format_detector.hpp"
#include "nexuid/infra/string.hpp"

#include <utility>

namespace nexuid::engine {

namespace {

/// @brief The detector accepts ULIDs with surrounding whitespace; the provider does not.
std::string normalize(const std::string& input, core::IdType detected)
{
    return detected == core::IdType::ULID ? infra::String::trim(input) : input;
}

} // namespace

Manager::Manager(config::FactoryConfig cfg) : factory_(std::make_shared<Factory>(std::move(cfg))) {}

Manager::Manager(std::shared_ptr<Factory> factory) : factory_(std::move(factory))
{
    if (!factory_) {
        throw core::ValidationError("factory", "null", "manager requires a factory");
    }
}

core::Identifier Manager::generate(std::optional<core::IdType> type, const core::Context& ctx)
{
    return factory_->create_provider(type)->generate(ctx);
}

core::Identifier Manager::generate_at(std::optional<core::IdType> type, core::Timestamp ts,
                                      const core::Context& ctx)
{
    return factory_->create_provider(type)->generate_at(ts, ctx);
}

core::Identifier Manager::generate_default(const core::Context& ctx)
{
    return generate(factory_->default_type(), ctx);
}

core::Identifier Manager::parse(const std::string& input, const core::Context& ctx)
{
    const core::IdType detected = detect::FormatDetector::detect(input);
    return factory_->create_provider(detected)->parse(normalize(input, detected), ctx);
}

core::Identifier Manager::parse_as(const std::string& input, core::IdType type,
                                   const core::Context& ctx)
{
    return factory_->create_provider(type)->parse(input, ctx);
}

void Manager::validate(const std::string& input, const core::Context& ctx)
{
    const core::IdType detected = detect::FormatDetector::detect(input);
    factory_->create_provider(detected)->validate(normalize(input, detected), ctx);
}

void Manager::validate_as(const std::string& input, core::IdType type, const core::Context& ctx)
{
    factory_->create_provider(type)->validate(input, ctx);
}

core::Identifier Manager::convert(const core::Identifier& value, core::IdType target,
                                  const core::Context& ctx)
{
    return factory_->create_provider(value.type())->convert_type(value, target, ctx);
}

core::IdType Manager::detect(const std::string& input) const
{
    return detect::FormatDetector::detect(input);
}

core::Timestamp Manager::extract_timestamp(const std::string& input, const core::Context& ctx)
{
    const core::IdType detected = detect::FormatDetector::detect(input);
    return factory_->create_provider(detected)->extract_timestamp(normalize(input, detected), ctx);
}

std::vector<core::IdType> Manager::supported_types() const
{
    return factory_->supported_types();
}

} // namespace nexuid::engine
