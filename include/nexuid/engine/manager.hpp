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
 * @file manager.hpp
 * @brief Single entry point for identifier operations across all families.
 *
 * @details
 * The manager detects the family of untyped input with `detect::FormatDetector`, then
 * resolves the matching provider through its `Factory`. Callers construct and own the
 * manager; there is no process-wide default instance.
 *
 * @code
 * nexuid::engine::Manager manager;
 * auto id = manager.generate(nexuid::core::IdType::UUID_V7);
 * auto same = manager.parse(id.canonical());
 * @endcode
 */

#pragma once

#include "nexuid/engine/factory.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nexuid::engine {

class Manager {
  public:
    /// @brief Creates a manager with its own factory built from @p cfg.
    explicit Manager(config::FactoryConfig cfg = config::default_factory_config());

    /// @brief Creates a manager sharing an existing factory.
    explicit Manager(std::shared_ptr<Factory> factory);

    /// @brief Generates an identifier of @p type (the default type when empty).
    core::Identifier generate(std::optional<core::IdType> type = std::nullopt,
                              const core::Context& ctx = core::Context::background());

    /// @brief Generates an identifier of @p type embedding @p ts.
    core::Identifier generate_at(std::optional<core::IdType> type, core::Timestamp ts,
                                 const core::Context& ctx = core::Context::background());

    core::Identifier generate_default(const core::Context& ctx = core::Context::background());

    /**
     * @brief Detects the family of @p input and parses it.
     *
     * @throws core::ValidationError when the format cannot be detected.
     * @throws core::ParseError when the detected provider rejects the input.
     */
    core::Identifier parse(const std::string& input,
                           const core::Context& ctx = core::Context::background());

    /// @brief Parses @p input as @p type, skipping detection.
    core::Identifier parse_as(const std::string& input, core::IdType type,
                              const core::Context& ctx = core::Context::background());

    /// @brief Detects the family of @p input and validates it.
    void validate(const std::string& input, const core::Context& ctx = core::Context::background());

    void validate_as(const std::string& input, core::IdType type,
                     const core::Context& ctx = core::Context::background());

    /**
     * @brief Relabels @p value as @p target using the provider of the value's own type.
     *
     * @throws core::ConversionError when the relabeling is not supported.
     */
    core::Identifier convert(const core::Identifier& value, core::IdType target,
                             const core::Context& ctx = core::Context::background());

    /// @throws core::ValidationError for empty or unrecognized input.
    core::IdType detect(const std::string& input) const;

    /// @brief Detects, parses, and returns the embedded timestamp.
    core::Timestamp extract_timestamp(const std::string& input,
                                      const core::Context& ctx = core::Context::background());

    std::vector<core::IdType> supported_types() const;

    Factory& factory() { return *factory_; }

  private:
    std::shared_ptr<Factory> factory_;
};

} // namespace nexuid::engine
